#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <sqlite_orm/sqlite_orm.h>

#include "FimTypes.h"

// 베이스라인 파일 테이블 구조
struct BaselineEntry
{
    std::string path;
    std::string digest;        // 16진수
    std::string algorithm;
    std::int64_t size;
    std::int64_t mtime;        // 나노초
    int permissions;
};

// 베이스라인 생성 정보 테이블 구조 (행 1개)
struct BaselineMeta
{
    int id;
    std::int64_t createdAt;
    std::string algorithm;
    std::int64_t fileCount;
};

inline auto MakeBaselineStorage(const std::string& dbPath)
{
    return sqlite_orm::make_storage(dbPath,
        sqlite_orm::make_table("monitored_files",
            sqlite_orm::make_column("file_path",         &BaselineEntry::path, sqlite_orm::primary_key()),
            sqlite_orm::make_column("file_hash",         &BaselineEntry::digest),
            sqlite_orm::make_column("hash_algorithm",    &BaselineEntry::algorithm),
            sqlite_orm::make_column("file_size",         &BaselineEntry::size),
            sqlite_orm::make_column("modification_time", &BaselineEntry::mtime),
            sqlite_orm::make_column("permissions",       &BaselineEntry::permissions)),
        sqlite_orm::make_table("baseline_meta",
            sqlite_orm::make_column("id",             &BaselineMeta::id, sqlite_orm::primary_key()),
            sqlite_orm::make_column("created_at",     &BaselineMeta::createdAt),
            sqlite_orm::make_column("hash_algorithm", &BaselineMeta::algorithm),
            sqlite_orm::make_column("file_count",     &BaselineMeta::fileCount)));
}

// 베이스라인 DB에 대한 storage 타입 정의
using StorageBaseline = decltype(MakeBaselineStorage(""));

// 베이스라인 저장소 계약
class IBaselineStore
{
public:
    virtual ~IBaselineStore() = default;

    // 베이스라인이 없으면 nullopt, 손상 시 StoreError
    virtual std::optional<Baseline> Load() = 0;

    // 완전한 Snapshot만 저장. 기존 베이스라인은 원자적으로 교체된다
    virtual void Save(const Snapshot& snapshot) = 0;

    virtual bool Exists() const = 0;

    virtual std::optional<BaselineInfo> Info() = 0;
};

// SQLite 파일 기반 구현
// 새 베이스라인은 "<db>.tmp"에 기록한 뒤 rename()으로 교체한다
class SqliteBaselineStore : public IBaselineStore
{
public:
    explicit SqliteBaselineStore(const std::string& dbPath);

    std::optional<Baseline> Load() override;
    void Save(const Snapshot& snapshot) override;
    bool Exists() const override;
    std::optional<BaselineInfo> Info() override;

    const std::string& GetPath() const { return mDbPath; }

private:
    std::optional<BaselineMeta> readMeta(StorageBaseline& storage) const;

    std::string mDbPath;
};

// "<db>.lock" 파일에 대한 flock 기반 권고 잠금
// check/status는 공유 잠금, init은 배타 잠금
// 공유 잠금은 잠금 파일이 없거나 열 수 없으면 경고 후 잠금 없이 진행
class BaselineLock
{
public:
    BaselineLock(const std::string& dbPath, bool bExclusive);
    ~BaselineLock();

    BaselineLock(const BaselineLock&) = delete;
    BaselineLock& operator=(const BaselineLock&) = delete;

private:
    int mFd;
};
