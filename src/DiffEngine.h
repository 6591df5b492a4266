#pragma once
#include <unordered_map>
#include <vector>

#include "FimConfig.h"
#include "FimTypes.h"

// 베이스라인과 새 Snapshot을 비교해 경로별 변경 내역을 만든다
class DiffEngine
{
public:
    explicit DiffEngine(MetadataPolicy policy = MetadataPolicy::ContentOnly);

    // 경로 사전순으로 정렬된 ChangeRecord 목록
    // 같은 경로의 해시 알고리즘이 다르면 AlgorithmMismatchError
    std::vector<ChangeRecord> Diff(const std::unordered_map<std::string, FileRecord>& baseline,
                                   const Snapshot& snapshot) const;

    static ChangeSummary Summarize(const std::vector<ChangeRecord>& changes);

    // 크기, 수정시간, 권한 차이 비트
    static std::uint32_t CompareMetadata(const FileRecord& previous, const FileRecord& current);

private:
    ChangeRecord compareRecords(const FileRecord& previous, const FileRecord& current) const;

    MetadataPolicy mPolicy;
};
