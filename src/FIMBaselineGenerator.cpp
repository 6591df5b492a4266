#include "FIMBaselineGenerator.h"
#include "Fingerprinter.h"
#include "PathResolver.h"

#include <spdlog/spdlog.h>

BaselineGenerator::BaselineGenerator(const FimConfig& config, IBaselineStore& store)
    : mConfig(config),
      mStore(store),
      mpShouldRun(nullptr)
{}

ScanRun BaselineGenerator::TakeSnapshot() const
{
    ScanRun run;

    PathResolver resolver(mConfig.includePaths, mConfig.excludePaths);
    ResolveResult resolved = resolver.Resolve();
    run.warnings = std::move(resolved.warnings);

    Fingerprinter fingerprinter(mConfig.hashAlgorithm, mConfig.maxFileSize, mConfig.readTimeout);
    fingerprinter.SetRunFlag(mpShouldRun);

    Scanner scanner(fingerprinter, mConfig.workers);
    scanner.SetRunFlag(mpShouldRun);
    if (mProgress)
    {
        scanner.SetProgressCallback(mProgress);
    }

    run.snapshot = scanner.Scan(resolved.files);
    return run;
}

bool BaselineGenerator::GenerateAndStore(ScanRun& outRun)
{
    spdlog::info("새 FIM 베이스라인 생성 시작");

    outRun = TakeSnapshot();
    if (!outRun.snapshot.complete)
    {
        spdlog::warn("검사가 중단되어 베이스라인을 저장하지 않습니다.");
        return false;
    }

    mStore.Save(outRun.snapshot);

    spdlog::info("베이스라인 생성 완료: {}개 파일, 읽기 실패 {}개",
                 outRun.snapshot.records.size(), outRun.snapshot.failures.size());
    return true;
}
