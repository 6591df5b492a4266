#include "Fingerprinter.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>
#include <spdlog/spdlog.h>

namespace
{
    // fd 자동 해제
    class FdGuard
    {
    public:
        explicit FdGuard(int fd) : mFd(fd) {}
        ~FdGuard()
        {
            if (mFd >= 0)
            {
                close(mFd);
            }
        }
        FdGuard(const FdGuard&) = delete;
        FdGuard& operator=(const FdGuard&) = delete;

        int Get() const { return mFd; }

    private:
        int mFd;
    };

    ScanFailure failure(const std::string& path, FailureReason reason, const std::string& message)
    {
        return ScanFailure{ path, reason, message };
    }
}

Fingerprinter::Fingerprinter(HashAlgorithm algorithm,
                             std::uint64_t maxFileSize,
                             std::chrono::nanoseconds readTimeout)
    : mFactory(algorithm),
      mMaxFileSize(maxFileSize),
      mReadTimeout(readTimeout),
      mpShouldRun(nullptr)
{}

ScanFailure Fingerprinter::makeFailure(const std::string& path, int err) const
{
    FailureReason reason = FailureReason::IoError;
    if (err == EACCES || err == EPERM)
    {
        reason = FailureReason::PermissionDenied;
    }
    else if (err == ENOENT || err == ENOTDIR)
    {
        reason = FailureReason::NotFound;
    }
    return failure(path, reason, std::strerror(err));
}

FingerprintResult Fingerprinter::Fingerprint(const std::string& path) const
{
    // O_NONBLOCK: 검사 사이에 FIFO로 바뀐 경우에도 open()에서 멈추지 않도록
    FdGuard fd(open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
    if (fd.Get() < 0)
    {
        int err = errno;
        ScanFailure f = makeFailure(path, err);
        if (f.reason == FailureReason::NotFound)
        {
            spdlog::warn("열거 이후 파일이 사라짐: {}", path);
        }
        else
        {
            spdlog::warn("파일 열기 실패: {} ({})", path, f.message);
        }
        return f;
    }

    // 읽는 대상과 같은 inode의 메타데이터를 한 번의 fstat으로 수집
    struct stat statBuf;
    if (fstat(fd.Get(), &statBuf) != 0)
    {
        int err = errno;
        spdlog::warn("fstat 실패: {} ({})", path, std::strerror(err));
        return makeFailure(path, err);
    }

    if (!S_ISREG(statBuf.st_mode))
    {
        spdlog::warn("일반 파일이 아님: {}", path);
        return failure(path, FailureReason::NotRegular, "not a regular file");
    }

    // 일반 파일이므로 블로킹 모드로 복귀
    int flags = fcntl(fd.Get(), F_GETFL);
    if (flags >= 0)
    {
        fcntl(fd.Get(), F_SETFL, flags & ~O_NONBLOCK);
    }

    std::unique_ptr<IDigest> digest = mFactory.Create();
    std::vector<char> buffer(CHUNK_SIZE);
    std::uint64_t totalRead = 0;

    const auto deadline = std::chrono::steady_clock::now() + mReadTimeout;

    while (true)
    {
        if (mpShouldRun != nullptr && !mpShouldRun->load())
        {
            return failure(path, FailureReason::Cancelled, "scan interrupted");
        }

        ssize_t n = read(fd.Get(), buffer.data(), buffer.size());
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            int err = errno;
            spdlog::warn("파일 읽기 실패: {} ({})", path, std::strerror(err));
            return makeFailure(path, err);
        }
        if (n == 0)
        {
            break;
        }

        digest->Update(buffer.data(), static_cast<size_t>(n));
        totalRead += static_cast<std::uint64_t>(n);

        if (mMaxFileSize > 0 && totalRead > mMaxFileSize)
        {
            spdlog::warn("파일 크기 제한 초과: {} (> {} bytes)", path, mMaxFileSize);
            return failure(path, FailureReason::Oversized,
                           "exceeds " + std::to_string(mMaxFileSize) + " bytes");
        }
        if (mReadTimeout.count() > 0 && std::chrono::steady_clock::now() > deadline)
        {
            auto limitMs = std::chrono::duration_cast<std::chrono::milliseconds>(mReadTimeout).count();
            spdlog::warn("파일 읽기 시간 초과: {} ({}ms)", path, limitMs);
            return failure(path, FailureReason::TimedOut,
                           "exceeded " + std::to_string(limitMs) + "ms");
        }
    }

    FileRecord record;
    record.path = path;
    record.size = static_cast<std::uint64_t>(statBuf.st_size);
    record.mtime = static_cast<std::int64_t>(statBuf.st_mtim.tv_sec) * 1000000000LL
                 + static_cast<std::int64_t>(statBuf.st_mtim.tv_nsec);
    record.permissions = static_cast<std::uint32_t>(statBuf.st_mode & 07777);
    record.digest = digest->Final();
    record.algorithm = mFactory.GetAlgorithm();

    spdlog::debug("해시 생성 완료: {}", path);
    return record;
}
