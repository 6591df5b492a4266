#pragma once

#include <ostream>
#include <vector>

#include "FimTypes.h"

namespace fimguard {

// check 결과를 사람이 읽을 수 있는 텍스트로 출력하는 클래스입니다.
// 확인된 정상 / 확인된 변경 / 검증 불가 항목을 구분해 보여줍니다.
class ChangeReport final {
public:
    static void Write(std::ostream& out,
                      const std::vector<ChangeRecord>& changes,
                      const ChangeSummary& summary);

private:
    static void writeSection(std::ostream& out,
                             const std::vector<ChangeRecord>& changes,
                             ChangeKind kind,
                             const char* title);

    static void writeDetail(std::ostream& out, const ChangeRecord& change);

    ChangeReport() = delete;
};

} // namespace fimguard
