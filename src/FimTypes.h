#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// 지원 해시 알고리즘
enum class HashAlgorithm
{
    SHA256,
    SHA512,
    MD5,
    SHA1
};

// 파일 1개의 지문 (내용 해시 + 메타데이터)
struct FileRecord
{
    std::string path;                 // 절대 경로 (정규화)
    std::uint64_t size = 0;
    std::int64_t mtime = 0;           // epoch 기준 나노초
    std::uint32_t permissions = 0;    // st_mode & 07777
    std::vector<std::uint8_t> digest;
    HashAlgorithm algorithm = HashAlgorithm::SHA256;
};

// 파일 단위 검사 실패 원인
enum class FailureReason
{
    PermissionDenied,
    NotFound,
    Oversized,
    TimedOut,
    NotRegular,
    IoError,
    Cancelled
};

struct ScanFailure
{
    std::string path;
    FailureReason reason = FailureReason::IoError;
    std::string message;
};

// 한 번의 검사로 얻은 전체 상태
struct Snapshot
{
    std::unordered_map<std::string, FileRecord> records;
    std::vector<ScanFailure> failures;
    HashAlgorithm algorithm = HashAlgorithm::SHA256;
    bool complete = true;    // 중단된 검사는 false, 저장 금지
};

// 저장된 베이스라인 요약 정보
struct BaselineInfo
{
    std::int64_t createdAt = 0;   // epoch 기준 초
    HashAlgorithm algorithm = HashAlgorithm::SHA256;
    std::uint64_t fileCount = 0;
};

struct Baseline
{
    BaselineInfo info;
    std::unordered_map<std::string, FileRecord> records;
};

enum class ChangeKind
{
    Added,
    Removed,
    Modified,
    Unchanged,
    Unreadable
};

// 내용은 같지만 메타데이터가 바뀐 항목 표시용 비트
enum MetadataDrift : std::uint32_t
{
    DRIFT_NONE        = 0,
    DRIFT_SIZE        = 1 << 0,
    DRIFT_MTIME       = 1 << 1,
    DRIFT_PERMISSIONS = 1 << 2
};

struct ChangeRecord
{
    std::string path;
    ChangeKind kind = ChangeKind::Unchanged;
    std::optional<FileRecord> previous;
    std::optional<FileRecord> current;
    std::uint32_t drift = DRIFT_NONE;
    std::optional<ScanFailure> failure;
};

// 종류별 집계
struct ChangeSummary
{
    size_t added = 0;
    size_t removed = 0;
    size_t modified = 0;
    size_t unchanged = 0;
    size_t unreadable = 0;
    size_t drifted = 0;      // 내용은 같고 메타데이터만 바뀐 Unchanged 항목

    bool HasViolations() const
    {
        return added + removed + modified + unreadable > 0;
    }
};

const char* ToString(HashAlgorithm algorithm);
const char* ToString(ChangeKind kind);
const char* ToString(FailureReason reason);
