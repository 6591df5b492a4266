#include "DiffEngine.h"
#include "FimErrors.h"

#include <algorithm>
#include <spdlog/spdlog.h>

DiffEngine::DiffEngine(MetadataPolicy policy)
    : mPolicy(policy)
{}

std::uint32_t DiffEngine::CompareMetadata(const FileRecord& previous, const FileRecord& current)
{
    std::uint32_t drift = DRIFT_NONE;
    if (previous.size != current.size)               drift |= DRIFT_SIZE;
    if (previous.mtime != current.mtime)             drift |= DRIFT_MTIME;
    if (previous.permissions != current.permissions) drift |= DRIFT_PERMISSIONS;
    return drift;
}

ChangeRecord DiffEngine::compareRecords(const FileRecord& previous, const FileRecord& current) const
{
    if (previous.algorithm != current.algorithm)
    {
        throw AlgorithmMismatchError(
            "해시 알고리즘 불일치 (" + current.path + "): 베이스라인 " +
            ToString(previous.algorithm) + ", 현재 " + ToString(current.algorithm) +
            ". 'init --force'로 베이스라인을 다시 생성하십시오.");
    }

    ChangeRecord change;
    change.path = current.path;
    change.previous = previous;
    change.current = current;
    change.drift = CompareMetadata(previous, current);

    if (previous.digest != current.digest)
    {
        change.kind = ChangeKind::Modified;
    }
    else if (change.drift != DRIFT_NONE && mPolicy == MetadataPolicy::Strict)
    {
        change.kind = ChangeKind::Modified;
    }
    else
    {
        change.kind = ChangeKind::Unchanged;
    }
    return change;
}

std::vector<ChangeRecord> DiffEngine::Diff(const std::unordered_map<std::string, FileRecord>& baseline,
                                           const Snapshot& snapshot) const
{
    std::vector<ChangeRecord> changes;
    changes.reserve(baseline.size() + snapshot.records.size() + snapshot.failures.size());

    // 읽기 실패 경로 (NotFound는 경로가 없는 것으로 취급)
    std::unordered_map<std::string, const ScanFailure*> failures;
    for (const auto& f : snapshot.failures)
    {
        if (f.reason != FailureReason::NotFound)
        {
            failures.emplace(f.path, &f);
        }
    }

    for (const auto& [path, previous] : baseline)
    {
        auto current = snapshot.records.find(path);
        if (current != snapshot.records.end())
        {
            changes.push_back(compareRecords(previous, current->second));
            continue;
        }

        ChangeRecord change;
        change.path = path;
        change.previous = previous;

        auto failed = failures.find(path);
        if (failed != failures.end())
        {
            change.kind = ChangeKind::Unreadable;
            change.failure = *failed->second;
        }
        else
        {
            change.kind = ChangeKind::Removed;
        }
        changes.push_back(std::move(change));
    }

    for (const auto& [path, current] : snapshot.records)
    {
        if (baseline.find(path) == baseline.end())
        {
            ChangeRecord change;
            change.path = path;
            change.kind = ChangeKind::Added;
            change.current = current;
            changes.push_back(std::move(change));
        }
    }

    // 베이스라인에 없던 경로의 읽기 실패도 누락하지 않는다
    for (const auto& [path, failure] : failures)
    {
        if (baseline.find(path) == baseline.end() &&
            snapshot.records.find(path) == snapshot.records.end())
        {
            ChangeRecord change;
            change.path = path;
            change.kind = ChangeKind::Unreadable;
            change.failure = *failure;
            changes.push_back(std::move(change));
        }
    }

    std::sort(changes.begin(), changes.end(),
              [](const ChangeRecord& a, const ChangeRecord& b) { return a.path < b.path; });

    for (const auto& c : changes)
    {
        switch (c.kind)
        {
        case ChangeKind::Added:
            spdlog::info("[ADDED] {}", c.path);
            break;
        case ChangeKind::Removed:
            spdlog::warn("[REMOVED] {}", c.path);
            break;
        case ChangeKind::Modified:
            spdlog::warn("[MODIFIED] {}", c.path);
            break;
        case ChangeKind::Unreadable:
            spdlog::warn("[UNREADABLE] {} ({})", c.path, c.failure ? c.failure->message : "");
            break;
        case ChangeKind::Unchanged:
            if (c.drift != DRIFT_NONE)
            {
                spdlog::info("[DRIFT] 내용은 같으나 메타데이터 변경: {}", c.path);
            }
            break;
        }
    }

    return changes;
}

ChangeSummary DiffEngine::Summarize(const std::vector<ChangeRecord>& changes)
{
    ChangeSummary summary;
    for (const auto& c : changes)
    {
        switch (c.kind)
        {
        case ChangeKind::Added:      ++summary.added;      break;
        case ChangeKind::Removed:    ++summary.removed;    break;
        case ChangeKind::Modified:   ++summary.modified;   break;
        case ChangeKind::Unchanged:  ++summary.unchanged;  break;
        case ChangeKind::Unreadable: ++summary.unreadable; break;
        }
        // 변조로 판정된 항목의 메타데이터 차이는 drift로 세지 않는다
        if (c.kind == ChangeKind::Unchanged && c.drift != DRIFT_NONE)
        {
            ++summary.drifted;
        }
    }
    return summary;
}
