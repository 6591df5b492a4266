#include "FIMIntegScan.h"
#include "DiffEngine.h"
#include "FIMBaselineGenerator.h"
#include "FimErrors.h"

#include <spdlog/spdlog.h>

IntegScanResult CompareWithBaseline(const FimConfig& config,
                                    IBaselineStore& store,
                                    const std::atomic<bool>* pShouldRun,
                                    Scanner::ProgressFunc progress)
{
    IntegScanResult result;

    std::optional<Baseline> baseline = store.Load();
    if (!baseline)
    {
        throw StoreError("베이스라인이 없습니다. 먼저 'init'을 실행하십시오.");
    }

    // 알고리즘이 바뀌었으면 비교 자체를 거부 (전부 변조로 보이거나 무시되는 것을 방지)
    if (baseline->info.algorithm != config.hashAlgorithm)
    {
        throw AlgorithmMismatchError(
            std::string("해시 알고리즘 불일치: 베이스라인 ") + ToString(baseline->info.algorithm) +
            ", 설정 " + ToString(config.hashAlgorithm) +
            ". 'init --force'로 베이스라인을 다시 생성하십시오.");
    }

    // BaselineGenerator는 검사만 사용 (저장 없음)
    BaselineGenerator generator(config, store);
    generator.SetRunFlag(pShouldRun);
    if (progress)
    {
        generator.SetProgressCallback(std::move(progress));
    }

    ScanRun run = generator.TakeSnapshot();
    result.warnings = std::move(run.warnings);

    if (!run.snapshot.complete)
    {
        spdlog::warn("검사가 중단되어 비교를 수행하지 않습니다.");
        result.complete = false;
        return result;
    }

    DiffEngine engine(config.metadataPolicy);
    result.changes = engine.Diff(baseline->records, run.snapshot);
    result.summary = DiffEngine::Summarize(result.changes);

    spdlog::info("무결성 검사 완료: 정상 {}, 추가 {}, 삭제 {}, 변조 {}, 검증 불가 {}",
                 result.summary.unchanged, result.summary.added, result.summary.removed,
                 result.summary.modified, result.summary.unreadable);
    return result;
}
