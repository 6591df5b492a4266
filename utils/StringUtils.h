#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace fimguard::utils {

    // 문자열 양끝 공백 제거 함수
    std::string trim(const std::string& s);

    // 소문자 변환
    std::string toLower(const std::string& s);

    // 바이트열 <-> 16진수 문자열
    std::string toHex(const std::vector<std::uint8_t>& bytes);
    std::vector<std::uint8_t> fromHex(const std::string& hex);

    // 나노초 타임스탬프를 "YYYY-MM-DD HH:MM:SS" 로컬 시간 문자열로 변환
    std::string formatTime(std::int64_t nanos);

    // 8진수 권한 표기 (예: 0644)
    std::string formatMode(std::uint32_t mode);
}
