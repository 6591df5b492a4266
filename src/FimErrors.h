#pragma once
#include <stdexcept>
#include <string>

// 설정 파일 누락/형식 오류, 지원하지 않는 알고리즘 등
// 검사 시작 전에 발생하며 명령 전체를 중단시킨다.
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

// 베이스라인과 현재 설정의 해시 알고리즘이 다를 때
class AlgorithmMismatchError : public ConfigError
{
public:
    explicit AlgorithmMismatchError(const std::string& msg)
        : ConfigError(msg)
    {}
};

// 베이스라인 DB 읽기/쓰기 실패
class StoreError : public std::runtime_error
{
public:
    explicit StoreError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};
