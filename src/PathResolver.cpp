#include "PathResolver.h"

#include <algorithm>
#include <set>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

PathResolver::PathResolver(const std::vector<std::string>& includePaths,
                           const std::vector<std::string>& excludePaths)
{
    for (const auto& p : includePaths)
    {
        mIncludePaths.push_back(Normalize(p));
    }
    for (const auto& p : excludePaths)
    {
        mExcludePaths.push_back(Normalize(p));
    }
}

fs::path PathResolver::Normalize(const std::string& path)
{
    fs::path normalized = fs::absolute(fs::path(path)).lexically_normal();

    // "/a/b/" → "/a/b" (루트는 유지)
    if (!normalized.has_filename() && normalized != normalized.root_path())
    {
        normalized = normalized.parent_path();
    }
    return normalized;
}

bool PathResolver::IsDescendantOrEqual(const fs::path& path, const fs::path& base)
{
    auto pathIt = path.begin();
    for (auto baseIt = base.begin(); baseIt != base.end(); ++baseIt, ++pathIt)
    {
        // base 끝의 빈 구성요소("/a/b/")는 무시
        if (baseIt->empty())
        {
            continue;
        }
        if (pathIt == path.end() || *pathIt != *baseIt)
        {
            return false;
        }
    }
    return true;
}

bool PathResolver::IsExcluded(const fs::path& path) const
{
    for (const auto& ex : mExcludePaths)
    {
        if (IsDescendantOrEqual(path, ex))
        {
            return true;
        }
    }
    return false;
}

ResolveResult PathResolver::Resolve() const
{
    ResolveResult result;
    std::vector<std::string> files;

    for (const auto& include : mIncludePaths)
    {
        std::error_code ec;
        fs::file_status st = fs::status(include, ec);

        if (ec || !fs::exists(st))
        {
            std::string msg = "include 경로가 존재하지 않음: " + include.string();
            spdlog::warn(msg);
            result.warnings.push_back(msg);
            continue;
        }

        if (IsExcluded(include))
        {
            spdlog::debug("include 경로 전체가 exclude 대상: {}", include.string());
            continue;
        }

        if (fs::is_regular_file(st))
        {
            files.push_back(include.string());
        }
        else if (fs::is_directory(st))
        {
            walkDirectory(include, files, result.warnings);
        }
        else
        {
            spdlog::debug("일반 파일/디렉토리가 아닌 include 경로 무시: {}", include.string());
        }
    }

    std::set<std::string> unique(files.begin(), files.end());
    result.files.assign(unique.begin(), unique.end());

    spdlog::info("검사 대상 파일 {}개 확정", result.files.size());
    return result;
}

void PathResolver::walkDirectory(const fs::path& root,
                                 std::vector<std::string>& files,
                                 std::vector<std::string>& warnings) const
{
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        std::string msg = "디렉토리 열기 실패: " + root.string() + " (" + ec.message() + ")";
        spdlog::warn(msg);
        warnings.push_back(msg);
        return;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec))
    {
        const fs::directory_entry& entry = *it;
        const fs::path& path = entry.path();
        std::error_code entryEc;

        if (entry.is_symlink(entryEc))
        {
            // 링크 대상이 일반 파일일 때만 포함, 디렉토리 링크는 따라가지 않음
            if (IsExcluded(path))
            {
                continue;
            }
            if (fs::is_regular_file(fs::status(path, entryEc)) && !entryEc)
            {
                files.push_back(path.string());
            }
            else
            {
                spdlog::debug("심볼릭 링크 무시: {}", path.string());
            }
            continue;
        }

        if (entry.is_directory(entryEc))
        {
            if (IsExcluded(path))
            {
                it.disable_recursion_pending();
                continue;
            }
            if (access(path.c_str(), R_OK | X_OK) != 0)
            {
                std::string msg = "디렉토리 접근 불가, 건너뜀: " + path.string();
                spdlog::warn(msg);
                warnings.push_back(msg);
                it.disable_recursion_pending();
            }
            continue;
        }

        if (entry.is_regular_file(entryEc) && !IsExcluded(path))
        {
            files.push_back(path.string());
        }
    }

    // increment() 실패 시 반복자는 end가 되므로 루프 밖에서 확인
    if (ec)
    {
        std::string msg = "디렉토리 순회 중 오류: " + root.string() + " (" + ec.message() + ")";
        spdlog::warn(msg);
        warnings.push_back(msg);
    }
}
