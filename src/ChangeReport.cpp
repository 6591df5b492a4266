#include "ChangeReport.h"
#include "StringUtils.h"

namespace fimguard {

using utils::formatMode;
using utils::formatTime;
using utils::toHex;

void ChangeReport::Write(std::ostream& out,
                         const std::vector<ChangeRecord>& changes,
                         const ChangeSummary& summary)
{
    out << "\n--- File Integrity Check Results ---\n";

    if (!summary.HasViolations())
    {
        out << "[+] 무결성 위반 없음. 모든 감시 파일이 변경되지 않았습니다.\n";
    }
    else
    {
        writeSection(out, changes, ChangeKind::Modified,   "[!!!] Modified Files:");
        writeSection(out, changes, ChangeKind::Added,      "[!!!] Added Files:");
        writeSection(out, changes, ChangeKind::Removed,    "[!!!] Removed Files:");
        writeSection(out, changes, ChangeKind::Unreadable, "[???] Unreadable Files (검증 불가):");
    }

    // 내용은 같지만 메타데이터만 바뀐 항목은 별도 표시
    bool bDriftHeader = false;
    for (const auto& c : changes)
    {
        if (c.kind == ChangeKind::Unchanged && c.drift != DRIFT_NONE)
        {
            if (!bDriftHeader)
            {
                out << "\n[i] Metadata drift (content unchanged):\n";
                bDriftHeader = true;
            }
            out << "  - " << c.path << "\n";
            writeDetail(out, c);
        }
    }

    out << "\n"
        << "확인된 정상: " << summary.unchanged
        << ", 변경: " << (summary.added + summary.removed + summary.modified)
        << " (추가 " << summary.added
        << ", 삭제 " << summary.removed
        << ", 변조 " << summary.modified << ")"
        << ", 검증 불가: " << summary.unreadable
        << ", 메타데이터 변경: " << summary.drifted << "\n";
    out << "------------------------------------\n";
}

void ChangeReport::writeSection(std::ostream& out,
                                const std::vector<ChangeRecord>& changes,
                                ChangeKind kind,
                                const char* title)
{
    bool bHeader = false;
    for (const auto& c : changes)
    {
        if (c.kind != kind)
        {
            continue;
        }
        if (!bHeader)
        {
            out << "\n" << title << "\n";
            bHeader = true;
        }
        out << "  - " << c.path << "\n";
        writeDetail(out, c);
    }
}

void ChangeReport::writeDetail(std::ostream& out, const ChangeRecord& change)
{
    if (change.failure)
    {
        out << "      원인: " << ToString(change.failure->reason);
        if (!change.failure->message.empty())
        {
            out << " (" << change.failure->message << ")";
        }
        out << "\n";
    }

    if (!change.previous || !change.current)
    {
        return;
    }

    const FileRecord& old = *change.previous;
    const FileRecord& curr = *change.current;

    if (old.digest != curr.digest)
    {
        out << "      해시:   " << toHex(old.digest) << " → " << toHex(curr.digest) << "\n";
    }
    if (change.drift & DRIFT_PERMISSIONS)
    {
        out << "      권한:   " << formatMode(old.permissions) << " → " << formatMode(curr.permissions) << "\n";
    }
    if (change.drift & DRIFT_MTIME)
    {
        out << "      수정시간: " << formatTime(old.mtime) << " → " << formatTime(curr.mtime) << "\n";
    }
    if (change.drift & DRIFT_SIZE)
    {
        out << "      크기:   " << old.size << " → " << curr.size << " bytes\n";
    }
}

} // namespace fimguard
