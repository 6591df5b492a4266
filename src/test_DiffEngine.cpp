#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "DiffEngine.h"
#include "FimErrors.h"

namespace {

using RecordMap = std::unordered_map<std::string, FileRecord>;

FileRecord makeRecord(const std::string& path, const std::string& content,
                      HashAlgorithm algorithm = HashAlgorithm::SHA256)
{
    FileRecord r;
    r.path = path;
    r.size = content.size();
    r.mtime = 1700000000000000000LL;
    r.permissions = 0644;
    r.digest.assign(content.begin(), content.end());
    r.algorithm = algorithm;
    return r;
}

Snapshot makeSnapshot(const std::vector<FileRecord>& records)
{
    Snapshot s;
    for (const auto& r : records)
    {
        s.records.emplace(r.path, r);
    }
    return s;
}

const ChangeRecord& find(const std::vector<ChangeRecord>& changes, const std::string& path)
{
    auto it = std::find_if(changes.begin(), changes.end(),
                           [&](const ChangeRecord& c) { return c.path == path; });
    assert(it != changes.end());
    return *it;
}

// 같은 상태끼리 비교하면 전부 Unchanged
void test_reflexive()
{
    Snapshot snapshot = makeSnapshot({ makeRecord("/a", "1"), makeRecord("/b", "2") });
    DiffEngine engine;
    auto changes = engine.Diff(snapshot.records, snapshot);

    assert(changes.size() == 2);
    for (const auto& c : changes)
    {
        assert(c.kind == ChangeKind::Unchanged);
        assert(c.drift == DRIFT_NONE);
    }
    assert(!DiffEngine::Summarize(changes).HasViolations());
}

void test_added_removed_modified()
{
    RecordMap baseline;
    baseline.emplace("/A", makeRecord("/A", "x"));
    baseline.emplace("/B", makeRecord("/B", "y"));

    Snapshot snapshot = makeSnapshot({ makeRecord("/A", "x2"), makeRecord("/C", "z") });

    DiffEngine engine;
    auto changes = engine.Diff(baseline, snapshot);

    assert(changes.size() == 3);
    assert(changes[0].path == "/A" && changes[0].kind == ChangeKind::Modified);
    assert(changes[1].path == "/B" && changes[1].kind == ChangeKind::Removed);
    assert(changes[2].path == "/C" && changes[2].kind == ChangeKind::Added);

    assert(changes[0].previous && changes[0].current);
    assert(changes[1].previous && !changes[1].current);
    assert(!changes[2].previous && changes[2].current);

    ChangeSummary summary = DiffEngine::Summarize(changes);
    assert(summary.added == 1);
    assert(summary.removed == 1);
    assert(summary.modified == 1);
    assert(summary.unchanged == 0);
    assert(summary.HasViolations());
}

// 양쪽에 나타난 모든 경로가 정확히 한 번씩 나온다
void test_every_path_once()
{
    RecordMap baseline;
    for (const char* p : { "/k1", "/k2", "/k3", "/gone" })
    {
        baseline.emplace(p, makeRecord(p, p));
    }
    Snapshot snapshot = makeSnapshot({ makeRecord("/k1", "/k1"), makeRecord("/k2", "changed"),
                                       makeRecord("/k3", "/k3"), makeRecord("/new", "n") });
    snapshot.failures.push_back({ "/locked", FailureReason::PermissionDenied, "denied" });

    DiffEngine engine;
    auto changes = engine.Diff(baseline, snapshot);

    std::set<std::string> expected = { "/k1", "/k2", "/k3", "/gone", "/new", "/locked" };
    std::set<std::string> seen;
    for (const auto& c : changes)
    {
        assert(seen.insert(c.path).second);
    }
    assert(seen == expected);
}

void test_metadata_drift_policy()
{
    RecordMap baseline;
    baseline.emplace("/etc/conf", makeRecord("/etc/conf", "same"));

    FileRecord touched = makeRecord("/etc/conf", "same");
    touched.mtime += 5;
    touched.permissions = 0600;
    Snapshot snapshot = makeSnapshot({ touched });

    auto content = DiffEngine(MetadataPolicy::ContentOnly).Diff(baseline, snapshot);
    assert(content.size() == 1);
    assert(content[0].kind == ChangeKind::Unchanged);
    assert(content[0].drift == (DRIFT_MTIME | DRIFT_PERMISSIONS));
    ChangeSummary summary = DiffEngine::Summarize(content);
    assert(summary.drifted == 1);
    assert(!summary.HasViolations());

    auto strict = DiffEngine(MetadataPolicy::Strict).Diff(baseline, snapshot);
    assert(strict[0].kind == ChangeKind::Modified);
    assert(strict[0].drift == (DRIFT_MTIME | DRIFT_PERMISSIONS));
    ChangeSummary strictSummary = DiffEngine::Summarize(strict);
    assert(strictSummary.modified == 1);
    assert(strictSummary.drifted == 0);

    // 내용까지 바뀐 항목은 drift 집계에 포함하지 않는다
    FileRecord rewritten = makeRecord("/etc/conf", "other");
    rewritten.permissions = 0600;
    auto modified = DiffEngine().Diff(baseline, makeSnapshot({ rewritten }));
    assert(modified[0].kind == ChangeKind::Modified);
    assert(modified[0].drift != DRIFT_NONE);
    assert(DiffEngine::Summarize(modified).drifted == 0);
}

void test_algorithm_mismatch()
{
    RecordMap baseline;
    baseline.emplace("/a", makeRecord("/a", "1", HashAlgorithm::MD5));
    Snapshot snapshot = makeSnapshot({ makeRecord("/a", "1", HashAlgorithm::SHA256) });

    bool bThrown = false;
    try
    {
        DiffEngine().Diff(baseline, snapshot);
    }
    catch (const AlgorithmMismatchError&)
    {
        bThrown = true;
    }
    assert(bThrown);
}

// 읽기 실패는 Unreadable, NotFound는 없는 것으로 취급
void test_failures()
{
    RecordMap baseline;
    baseline.emplace("/denied", makeRecord("/denied", "d"));
    baseline.emplace("/raced", makeRecord("/raced", "r"));

    Snapshot snapshot;
    snapshot.failures.push_back({ "/denied", FailureReason::PermissionDenied, "permission denied" });
    snapshot.failures.push_back({ "/raced", FailureReason::NotFound, "not found" });
    snapshot.failures.push_back({ "/vanished", FailureReason::NotFound, "not found" });
    snapshot.failures.push_back({ "/big", FailureReason::Oversized, "too big" });

    auto changes = DiffEngine().Diff(baseline, snapshot);
    assert(changes.size() == 3);

    const ChangeRecord& denied = find(changes, "/denied");
    assert(denied.kind == ChangeKind::Unreadable);
    assert(denied.previous);
    assert(denied.failure && denied.failure->reason == FailureReason::PermissionDenied);

    assert(find(changes, "/raced").kind == ChangeKind::Removed);

    const ChangeRecord& big = find(changes, "/big");
    assert(big.kind == ChangeKind::Unreadable);
    assert(!big.previous);

    ChangeSummary summary = DiffEngine::Summarize(changes);
    assert(summary.unreadable == 2);
    assert(summary.removed == 1);
    assert(summary.HasViolations());
}

void test_empty_snapshot_all_removed()
{
    RecordMap baseline;
    baseline.emplace("/x", makeRecord("/x", "x"));
    baseline.emplace("/y", makeRecord("/y", "y"));

    auto changes = DiffEngine().Diff(baseline, Snapshot{});
    assert(changes.size() == 2);
    for (const auto& c : changes)
    {
        assert(c.kind == ChangeKind::Removed);
    }
}

void test_ordering()
{
    RecordMap baseline;
    baseline.emplace("/z/last", makeRecord("/z/last", "1"));
    baseline.emplace("/b", makeRecord("/b", "1"));
    Snapshot snapshot = makeSnapshot({ makeRecord("/a/first", "1"), makeRecord("/m", "1"),
                                       makeRecord("/b", "1") });

    auto changes = DiffEngine().Diff(baseline, snapshot);
    assert(std::is_sorted(changes.begin(), changes.end(),
                          [](const ChangeRecord& a, const ChangeRecord& b) { return a.path < b.path; }));
    assert(changes.front().path == "/a/first");
    assert(changes.back().path == "/z/last");
}

void test_compare_metadata()
{
    FileRecord a = makeRecord("/f", "abc");
    FileRecord b = a;
    assert(DiffEngine::CompareMetadata(a, b) == DRIFT_NONE);
    b.size = 10;
    assert(DiffEngine::CompareMetadata(a, b) == DRIFT_SIZE);
}

} // namespace

int main()
{
    test_reflexive();
    test_added_removed_modified();
    test_every_path_once();
    test_metadata_drift_policy();
    test_algorithm_mismatch();
    test_failures();
    test_empty_snapshot_all_removed();
    test_ordering();
    test_compare_metadata();

    std::cout << "test_DiffEngine: all tests passed" << std::endl;
    return 0;
}
