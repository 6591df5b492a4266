#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <vector>

#include "FimTypes.h"
#include "Fingerprinter.h"

// 전개된 경로 목록 전체에 대해 지문을 수집해 Snapshot을 만든다
class Scanner
{
public:
    // (처리 완료 수, 전체 수, 방금 처리한 경로)
    using ProgressFunc = std::function<void(size_t, size_t, const std::string&)>;

    // workers == 0 이면 hardware_concurrency 사용
    Scanner(const Fingerprinter& fingerprinter, unsigned int workers);

    // 중단 플래그: false가 되면 새 작업 배분을 멈춘다
    void SetRunFlag(const std::atomic<bool>* pShouldRun) { mpShouldRun = pShouldRun; }
    void SetProgressCallback(ProgressFunc progress) { mProgress = std::move(progress); }

    Snapshot Scan(const std::vector<std::string>& paths);

private:
    bool shouldRun() const;

    const Fingerprinter& mFingerprinter;
    unsigned int mWorkers;
    const std::atomic<bool>* mpShouldRun;
    ProgressFunc mProgress;
};
