#include "Hasher.h"
#include "FimErrors.h"
#include "StringUtils.h"

#include <openssl/evp.h>
#include <stdexcept>

namespace
{
    const EVP_MD* selectMd(HashAlgorithm algorithm)
    {
        switch (algorithm)
        {
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA512: return EVP_sha512();
        case HashAlgorithm::MD5:    return EVP_md5();
        case HashAlgorithm::SHA1:   return EVP_sha1();
        }
        throw std::invalid_argument("알 수 없는 해시 알고리즘");
    }
}

void EvpDigest::CtxDeleter::operator()(void* ctx) const
{
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx));
}

EvpDigest::EvpDigest(HashAlgorithm algorithm)
    : mCtx(EVP_MD_CTX_new()),
      mbFinalized(false)
{
    if (!mCtx)
    {
        throw std::runtime_error("EVP_MD_CTX_new 실패");
    }

    if (1 != EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(mCtx.get()), selectMd(algorithm), nullptr))
    {
        throw std::runtime_error(std::string("EVP_DigestInit_ex 실패: ") + ToString(algorithm));
    }
}

EvpDigest::~EvpDigest() = default;

void EvpDigest::Update(const void* data, size_t len)
{
    if (mbFinalized)
    {
        throw std::logic_error("Final() 이후 Update() 호출");
    }
    if (1 != EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(mCtx.get()), data, len))
    {
        throw std::runtime_error("EVP_DigestUpdate 실패");
    }
}

std::vector<std::uint8_t> EvpDigest::Final()
{
    if (mbFinalized)
    {
        throw std::logic_error("Final() 중복 호출");
    }

    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int resultLen = 0;
    if (1 != EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(mCtx.get()), result, &resultLen))
    {
        throw std::runtime_error("EVP_DigestFinal_ex 실패");
    }
    mbFinalized = true;

    return std::vector<std::uint8_t>(result, result + resultLen);
}

DigestFactory::DigestFactory(HashAlgorithm algorithm)
    : mAlgorithm(algorithm)
{}

std::unique_ptr<IDigest> DigestFactory::Create() const
{
    return std::make_unique<EvpDigest>(mAlgorithm);
}

HashAlgorithm ParseHashAlgorithm(const std::string& name)
{
    const std::string key = fimguard::utils::toLower(fimguard::utils::trim(name));

    if (key == "sha256") return HashAlgorithm::SHA256;
    if (key == "sha512") return HashAlgorithm::SHA512;
    if (key == "md5")    return HashAlgorithm::MD5;
    if (key == "sha1")   return HashAlgorithm::SHA1;

    throw ConfigError("지원하지 않는 해시 알고리즘: '" + name + "' (sha256|sha512|md5|sha1)");
}

size_t DigestLength(HashAlgorithm algorithm)
{
    return static_cast<size_t>(EVP_MD_size(selectMd(algorithm)));
}
