#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "FimTypes.h"

// 증분 해시 인터페이스
class IDigest
{
public:
    virtual ~IDigest() = default;

    virtual void Update(const void* data, size_t len) = 0;
    virtual std::vector<std::uint8_t> Final() = 0;
};

// OpenSSL EVP 기반 구현
class EvpDigest : public IDigest
{
public:
    explicit EvpDigest(HashAlgorithm algorithm);
    ~EvpDigest() override;

    EvpDigest(const EvpDigest&) = delete;
    EvpDigest& operator=(const EvpDigest&) = delete;

    void Update(const void* data, size_t len) override;
    std::vector<std::uint8_t> Final() override;

private:
    struct CtxDeleter
    {
        void operator()(void* ctx) const;
    };

    std::unique_ptr<void, CtxDeleter> mCtx;
    bool mbFinalized;
};

// 설정 로드 시 한 번 선택된 알고리즘으로 파일마다 새 해시 객체를 만든다
class DigestFactory
{
public:
    explicit DigestFactory(HashAlgorithm algorithm);

    std::unique_ptr<IDigest> Create() const;
    HashAlgorithm GetAlgorithm() const { return mAlgorithm; }

private:
    HashAlgorithm mAlgorithm;
};

// "sha256" 등 설정 문자열 → 열거형 (실패 시 ConfigError)
HashAlgorithm ParseHashAlgorithm(const std::string& name);

// 알고리즘별 다이제스트 길이 (바이트)
size_t DigestLength(HashAlgorithm algorithm);
