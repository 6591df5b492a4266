#include "FimTypes.h"

const char* ToString(HashAlgorithm algorithm)
{
    switch (algorithm)
    {
    case HashAlgorithm::SHA256: return "sha256";
    case HashAlgorithm::SHA512: return "sha512";
    case HashAlgorithm::MD5:    return "md5";
    case HashAlgorithm::SHA1:   return "sha1";
    }
    return "unknown";
}

const char* ToString(ChangeKind kind)
{
    switch (kind)
    {
    case ChangeKind::Added:      return "ADDED";
    case ChangeKind::Removed:    return "REMOVED";
    case ChangeKind::Modified:   return "MODIFIED";
    case ChangeKind::Unchanged:  return "UNCHANGED";
    case ChangeKind::Unreadable: return "UNREADABLE";
    }
    return "UNKNOWN";
}

const char* ToString(FailureReason reason)
{
    switch (reason)
    {
    case FailureReason::PermissionDenied: return "permission denied";
    case FailureReason::NotFound:         return "not found";
    case FailureReason::Oversized:        return "size limit exceeded";
    case FailureReason::TimedOut:         return "read timed out";
    case FailureReason::NotRegular:       return "not a regular file";
    case FailureReason::IoError:          return "I/O error";
    case FailureReason::Cancelled:        return "cancelled";
    }
    return "unknown";
}
