#pragma once
#include <filesystem>
#include <string>
#include <vector>

struct ResolveResult
{
    std::vector<std::string> files;      // 정렬, 중복 제거된 일반 파일 목록
    std::vector<std::string> warnings;   // 존재하지 않는 include 경로 등
};

// include / exclude 규칙을 실제 검사 대상 파일 목록으로 전개
//
// - 디렉토리는 재귀 순회하되 디렉토리를 가리키는 심볼릭 링크는 따라가지 않는다.
// - 일반 파일을 가리키는 심볼릭 링크는 링크 경로로 기록하고 대상 내용을 해시한다.
// - exclude는 경로 구성요소 단위로 "같거나 하위"일 때 적용되며 include보다 우선한다.
class PathResolver
{
public:
    PathResolver(const std::vector<std::string>& includePaths,
                 const std::vector<std::string>& excludePaths);

    ResolveResult Resolve() const;

    bool IsExcluded(const std::filesystem::path& path) const;

    // 절대 경로 + 정규화 + 끝 구분자 제거
    static std::filesystem::path Normalize(const std::string& path);

    // path가 base와 같거나 base의 하위 경로인지 (구성요소 단위 비교)
    static bool IsDescendantOrEqual(const std::filesystem::path& path,
                                    const std::filesystem::path& base);

private:
    void walkDirectory(const std::filesystem::path& root,
                       std::vector<std::string>& files,
                       std::vector<std::string>& warnings) const;

    std::vector<std::filesystem::path> mIncludePaths;
    std::vector<std::filesystem::path> mExcludePaths;
};
