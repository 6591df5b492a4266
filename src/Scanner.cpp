#include "Scanner.h"
#include "ScanQueue.h"

#include <algorithm>
#include <mutex>
#include <thread>
#include <spdlog/spdlog.h>

namespace
{
    // 워커 1개가 단독으로 쓰는 결과 버퍼
    struct WorkerResult
    {
        std::vector<FileRecord> records;
        std::vector<ScanFailure> failures;
        bool bInterrupted = false;
    };
}

Scanner::Scanner(const Fingerprinter& fingerprinter, unsigned int workers)
    : mFingerprinter(fingerprinter),
      mWorkers(workers),
      mpShouldRun(nullptr)
{}

bool Scanner::shouldRun() const
{
    return mpShouldRun == nullptr || mpShouldRun->load();
}

Snapshot Scanner::Scan(const std::vector<std::string>& paths)
{
    Snapshot snapshot;
    snapshot.algorithm = mFingerprinter.GetAlgorithm();

    if (paths.empty())
    {
        spdlog::info("검사 대상 파일이 없습니다.");
        return snapshot;
    }

    unsigned int workerCount = mWorkers;
    if (workerCount == 0)
    {
        workerCount = std::max(1u, std::thread::hardware_concurrency());
    }
    workerCount = static_cast<unsigned int>(std::min<size_t>(workerCount, paths.size()));

    ScanQueue queue;
    for (const auto& path : paths)
    {
        queue.Push(path);
    }
    queue.Close();

    std::vector<WorkerResult> results(workerCount);
    std::mutex progressMutex;
    size_t processed = 0;
    const size_t total = paths.size();

    auto worker = [&](WorkerResult& out)
    {
        std::string path;
        while (queue.Pop(path))
        {
            if (!shouldRun())
            {
                out.bInterrupted = true;
                queue.Cancel();
                break;
            }

            FingerprintResult result = mFingerprinter.Fingerprint(path);
            if (auto* record = std::get_if<FileRecord>(&result))
            {
                out.records.push_back(std::move(*record));
            }
            else
            {
                ScanFailure& failure = std::get<ScanFailure>(result);
                if (failure.reason == FailureReason::Cancelled)
                {
                    out.bInterrupted = true;
                    queue.Cancel();
                    break;
                }
                out.failures.push_back(std::move(failure));
            }

            std::lock_guard<std::mutex> lock(progressMutex);
            ++processed;
            if (mProgress)
            {
                mProgress(processed, total, path);
            }
        }
    };

    spdlog::info("검사 시작: 파일 {}개, 워커 {}개, 알고리즘 {}",
                 total, workerCount, ToString(snapshot.algorithm));

    std::vector<std::thread> threads;
    threads.reserve(workerCount);
    for (unsigned int i = 0; i < workerCount; ++i)
    {
        threads.emplace_back(worker, std::ref(results[i]));
    }
    for (auto& t : threads)
    {
        if (t.joinable())
        {
            t.join();
        }
    }

    // 모든 워커 종료 후 단일 지점에서 병합
    bool bInterrupted = false;
    for (auto& r : results)
    {
        bInterrupted = bInterrupted || r.bInterrupted;
        for (auto& record : r.records)
        {
            std::string key = record.path;
            snapshot.records.emplace(std::move(key), std::move(record));
        }
        for (auto& failure : r.failures)
        {
            snapshot.failures.push_back(std::move(failure));
        }
    }

    std::sort(snapshot.failures.begin(), snapshot.failures.end(),
              [](const ScanFailure& a, const ScanFailure& b) { return a.path < b.path; });

    snapshot.complete = !bInterrupted && processed == total;
    if (!snapshot.complete)
    {
        spdlog::warn("검사 중단됨: {}/{} 처리", processed, total);
    }
    else
    {
        spdlog::info("검사 완료: 성공 {}개, 실패 {}개",
                     snapshot.records.size(), snapshot.failures.size());
    }
    return snapshot;
}
