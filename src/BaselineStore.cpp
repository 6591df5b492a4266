#include "BaselineStore.h"
#include "FimErrors.h"
#include "Hasher.h"
#include "StringUtils.h"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/file.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace
{
    const int META_ID = 1;

    BaselineEntry toEntry(const FileRecord& record)
    {
        return BaselineEntry{
            record.path,
            fimguard::utils::toHex(record.digest),
            ToString(record.algorithm),
            static_cast<std::int64_t>(record.size),
            record.mtime,
            static_cast<int>(record.permissions)
        };
    }

    FileRecord toRecord(const BaselineEntry& entry)
    {
        FileRecord record;
        record.path = entry.path;
        record.size = static_cast<std::uint64_t>(entry.size);
        record.mtime = entry.mtime;
        record.permissions = static_cast<std::uint32_t>(entry.permissions);
        record.digest = fimguard::utils::fromHex(entry.digest);
        record.algorithm = ParseHashAlgorithm(entry.algorithm);
        return record;
    }
}

SqliteBaselineStore::SqliteBaselineStore(const std::string& dbPath)
    : mDbPath(dbPath)
{}

bool SqliteBaselineStore::Exists() const
{
    std::error_code ec;
    return fs::exists(mDbPath, ec);
}

std::optional<BaselineMeta> SqliteBaselineStore::readMeta(StorageBaseline& storage) const
{
    auto metas = storage.get_all<BaselineMeta>();
    if (metas.empty())
    {
        return std::nullopt;
    }
    return metas.front();
}

std::optional<BaselineInfo> SqliteBaselineStore::Info()
{
    if (!Exists())
    {
        return std::nullopt;
    }

    try
    {
        auto storage = MakeBaselineStorage(mDbPath);
        auto meta = readMeta(storage);
        if (!meta)
        {
            throw StoreError("베이스라인 메타데이터 없음 (손상된 DB): " + mDbPath);
        }

        BaselineInfo info;
        info.createdAt = meta->createdAt;
        info.algorithm = ParseHashAlgorithm(meta->algorithm);
        info.fileCount = static_cast<std::uint64_t>(meta->fileCount);
        return info;
    }
    catch (const StoreError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw StoreError("베이스라인 DB 조회 실패 (" + mDbPath + "): " + e.what());
    }
}

std::optional<Baseline> SqliteBaselineStore::Load()
{
    if (!Exists())
    {
        spdlog::info("베이스라인 DB 없음: {}", mDbPath);
        return std::nullopt;
    }

    try
    {
        auto storage = MakeBaselineStorage(mDbPath);
        auto meta = readMeta(storage);
        if (!meta)
        {
            throw StoreError("베이스라인 메타데이터 없음 (손상된 DB): " + mDbPath);
        }

        Baseline baseline;
        baseline.info.createdAt = meta->createdAt;
        baseline.info.algorithm = ParseHashAlgorithm(meta->algorithm);
        baseline.info.fileCount = static_cast<std::uint64_t>(meta->fileCount);

        for (const auto& entry : storage.get_all<BaselineEntry>())
        {
            FileRecord record = toRecord(entry);
            baseline.records.emplace(record.path, std::move(record));
        }

        if (baseline.records.size() != baseline.info.fileCount)
        {
            throw StoreError("베이스라인 항목 수 불일치 (손상된 DB): " + mDbPath);
        }

        spdlog::info("베이스라인 로드 완료: {}개 항목", baseline.records.size());
        return baseline;
    }
    catch (const StoreError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw StoreError("베이스라인 DB 조회 실패 (" + mDbPath + "): " + e.what());
    }
}

void SqliteBaselineStore::Save(const Snapshot& snapshot)
{
    if (!snapshot.complete)
    {
        throw StoreError("중단된 검사 결과는 베이스라인으로 저장할 수 없습니다.");
    }

    const std::string tmpPath = mDbPath + ".tmp";

    try
    {
        fs::path dbDir = fs::path(mDbPath).parent_path();
        if (!dbDir.empty())
        {
            fs::create_directories(dbDir);
        }
        fs::remove(tmpPath);

        {
            auto storage = MakeBaselineStorage(tmpPath);
            storage.sync_schema();

            storage.transaction([&]() {
                for (const auto& [path, record] : snapshot.records)
                {
                    storage.replace(toEntry(record));
                }

                auto now = std::chrono::system_clock::now();
                storage.replace(BaselineMeta{
                    META_ID,
                    static_cast<std::int64_t>(std::chrono::system_clock::to_time_t(now)),
                    ToString(snapshot.algorithm),
                    static_cast<std::int64_t>(snapshot.records.size())
                });
                return true;
            });
        }

        if (std::rename(tmpPath.c_str(), mDbPath.c_str()) != 0)
        {
            throw StoreError("베이스라인 교체 실패 (rename): " + std::string(std::strerror(errno)));
        }
    }
    catch (const std::exception& e)
    {
        std::error_code ec;
        fs::remove(tmpPath, ec);

        if (dynamic_cast<const StoreError*>(&e) != nullptr)
        {
            throw;
        }
        throw StoreError("베이스라인 저장 실패 (" + mDbPath + "): " + e.what());
    }

    spdlog::info("베이스라인 저장 완료: {} ({}개 항목)", mDbPath, snapshot.records.size());
}

BaselineLock::BaselineLock(const std::string& dbPath, bool bExclusive)
    : mFd(-1)
{
    const std::string lockPath = dbPath + ".lock";

    if (!bExclusive)
    {
        // 읽기 전용 명령은 잠금 파일을 만들지 않는다
        mFd = open(lockPath.c_str(), O_RDONLY | O_CLOEXEC);
        if (mFd < 0 && (errno == ENOENT || errno == EACCES))
        {
            spdlog::warn("잠금 파일을 열 수 없어 잠금 없이 읽습니다: {} ({})", lockPath, std::strerror(errno));
            return;
        }
    }
    else
    {
        mFd = open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    }

    if (mFd < 0)
    {
        throw StoreError("잠금 파일 열기 실패: " + lockPath + " (" + std::strerror(errno) + ")");
    }

    // 다른 실행이 사용 중이면 기다리지 않고 실패
    if (flock(mFd, (bExclusive ? LOCK_EX : LOCK_SH) | LOCK_NB) != 0)
    {
        int err = errno;
        close(mFd);
        mFd = -1;
        if (err == EWOULDBLOCK)
        {
            throw StoreError("다른 FimGuard 실행이 베이스라인을 사용 중입니다: " + dbPath);
        }
        throw StoreError("베이스라인 잠금 실패: " + lockPath + " (" + std::strerror(err) + ")");
    }
    spdlog::debug("베이스라인 잠금 획득 ({}): {}", bExclusive ? "배타" : "공유", lockPath);
}

BaselineLock::~BaselineLock()
{
    if (mFd >= 0)
    {
        flock(mFd, LOCK_UN);
        close(mFd);
    }
}
