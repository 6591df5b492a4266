#pragma once
#include <atomic>
#include <string>
#include <vector>

#include "BaselineStore.h"
#include "FimConfig.h"
#include "Scanner.h"

// 설정된 경로를 검사한 결과와 경로 전개 경고
struct ScanRun
{
    Snapshot snapshot;
    std::vector<std::string> warnings;
};

class BaselineGenerator
{
public:
    // 설정과 저장소 핸들을 전달받아 보관
    BaselineGenerator(const FimConfig& config, IBaselineStore& store);

    void SetRunFlag(const std::atomic<bool>* pShouldRun) { mpShouldRun = pShouldRun; }
    void SetProgressCallback(Scanner::ProgressFunc progress) { mProgress = std::move(progress); }

    // include/exclude 전개 → 병렬 지문 수집
    ScanRun TakeSnapshot() const;

    // 검사가 끝까지 완료된 경우에만 저장하고 true 반환
    // 중단되면 기존 베이스라인을 건드리지 않고 false 반환
    bool GenerateAndStore(ScanRun& outRun);

private:
    const FimConfig& mConfig;
    IBaselineStore& mStore;
    const std::atomic<bool>* mpShouldRun;
    Scanner::ProgressFunc mProgress;
};
