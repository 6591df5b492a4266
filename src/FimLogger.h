#pragma once
#include <string>

// 기본 로거 초기화 (회전 파일 싱크, 실패 시 stderr)
void InitLogger(const std::string& logPath);

// 설정 로드 후 로그 레벨과 콘솔 출력 여부 반영
void ApplyLogSettings(const std::string& logLevel, bool bVerboseConsoleOutput);
