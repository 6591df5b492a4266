#include "StringUtils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fimguard::utils {

std::string trim(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

std::string toLower(const std::string& s)
{
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string toHex(const std::vector<std::uint8_t>& bytes)
{
    std::ostringstream oss;
    for (std::uint8_t b : bytes)
    {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(b);
    }
    return oss.str();
}

std::vector<std::uint8_t> fromHex(const std::string& hex)
{
    if (hex.size() % 2 != 0)
    {
        throw std::invalid_argument("홀수 길이의 16진수 문자열: " + hex);
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        size_t consumed = 0;
        int value = std::stoi(hex.substr(i, 2), &consumed, 16);
        if (consumed != 2)
        {
            throw std::invalid_argument("잘못된 16진수 문자열: " + hex);
        }
        bytes.push_back(static_cast<std::uint8_t>(value));
    }
    return bytes;
}

std::string formatTime(std::int64_t nanos)
{
    std::time_t t = static_cast<std::time_t>(nanos / 1000000000LL);
    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string formatMode(std::uint32_t mode)
{
    std::ostringstream oss;
    oss << '0' << std::oct << std::setw(3) << std::setfill('0') << mode;
    return oss.str();
}

}
