#pragma once
#include <atomic>
#include <string>
#include <vector>

#include "BaselineStore.h"
#include "FimConfig.h"
#include "Scanner.h"

struct IntegScanResult
{
    std::vector<ChangeRecord> changes;
    ChangeSummary summary;
    std::vector<std::string> warnings;
    bool complete = true;
};

// 저장된 베이스라인과 현재 파일 상태를 비교하여 무결성 검사 수행
// 베이스라인이 없으면 StoreError, 알고리즘이 다르면 AlgorithmMismatchError
// 저장소는 읽기만 한다
IntegScanResult CompareWithBaseline(const FimConfig& config,
                                    IBaselineStore& store,
                                    const std::atomic<bool>* pShouldRun,
                                    Scanner::ProgressFunc progress);
