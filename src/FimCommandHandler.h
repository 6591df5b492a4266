#pragma once
#include <atomic>
#include <ostream>
#include <string>
#include <vector>

#include "CommandHandler.h"
#include "FimConfig.h"

class CommandBus;

// 종료 코드
enum FimExitCode : int
{
    FIM_EXIT_CLEAN       = 0,     // 모든 파일 정상
    FIM_EXIT_CHANGES     = 1,     // 추가/삭제/변조/검증 불가 항목 존재
    FIM_EXIT_FATAL       = 2,     // 설정/저장소 오류, 잘못된 사용법
    FIM_EXIT_INTERRUPTED = 130    // 시그널로 중단
};

class FimCommandHandler
{
public:
    explicit FimCommandHandler(const std::atomic<bool>& shouldRun);

    int Init(const CommandOptions& options, std::ostream& out);
    int Check(const CommandOptions& options, std::ostream& out);
    int Status(const CommandOptions& options, std::ostream& out);

    // init / check / status 명령을 버스에 등록
    void RegisterCommands(CommandBus& bus);

private:
    FimConfig loadConfig(const std::string& configPath) const;
    void printWarnings(const std::vector<std::string>& warnings, std::ostream& out) const;

    const std::atomic<bool>& mShouldRun;
};
