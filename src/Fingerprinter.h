#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

#include "FimTypes.h"
#include "Hasher.h"

// 파일 1개에 대한 결과: 지문 또는 실패
using FingerprintResult = std::variant<FileRecord, ScanFailure>;

class Fingerprinter
{
public:
    static constexpr size_t CHUNK_SIZE = 64 * 1024;

    // maxFileSize == 0 또는 readTimeout == 0 이면 해당 제한 없음
    Fingerprinter(HashAlgorithm algorithm,
                  std::uint64_t maxFileSize,
                  std::chrono::nanoseconds readTimeout);

    // 외부 중단 플래그 (false가 되면 진행 중인 읽기를 다음 청크에서 중단)
    void SetRunFlag(const std::atomic<bool>* pShouldRun) { mpShouldRun = pShouldRun; }

    FingerprintResult Fingerprint(const std::string& path) const;

    HashAlgorithm GetAlgorithm() const { return mFactory.GetAlgorithm(); }

private:
    ScanFailure makeFailure(const std::string& path, int err) const;

    DigestFactory mFactory;
    std::uint64_t mMaxFileSize;
    std::chrono::nanoseconds mReadTimeout;
    const std::atomic<bool>* mpShouldRun;
};
