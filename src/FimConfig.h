#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "FimTypes.h"

// 내용은 같고 메타데이터만 바뀐 경우의 판정 정책
enum class MetadataPolicy
{
    ContentOnly,   // Unchanged + drift 표시 (기본값)
    Strict         // Modified
};

struct FimConfig
{
    std::vector<std::string> includePaths;
    std::vector<std::string> excludePaths;
    HashAlgorithm hashAlgorithm = HashAlgorithm::SHA256;
    std::string logLevel = "info";
    bool bVerboseConsoleOutput = true;
    MetadataPolicy metadataPolicy = MetadataPolicy::ContentOnly;
    std::uint64_t maxFileSize = 1024ULL * 1024 * 1024;   // 0이면 제한 없음
    std::chrono::seconds readTimeout{60};                // 0이면 제한 없음
    unsigned int workers = 0;                            // 0이면 hardware_concurrency
};

// YAML 설정 파일 로드. 파일 누락, 형식 오류, 잘못된 값은 ConfigError
FimConfig LoadFimConfig(const std::string& configPath);

// 환경변수가 있으면 그 값을, 없으면 기본 경로를 반환
std::string ResolveConfigPath();
std::string ResolveDatabasePath();
std::string ResolveLogPath();
