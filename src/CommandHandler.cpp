#include "CommandHandler.h"
#include "FimConfig.h"

#include <getopt.h>
#include <stdexcept>
#include <unistd.h>

CommandHandler::CommandHandler(int argc, char** argv)
    : mArgc(argc)
    , mArgv(argv)
{
    mOptions.configPath = ResolveConfigPath();
    mOptions.dbPath = ResolveDatabasePath();
}

void CommandHandler::Init()
{
    parseOptions();
    validateCommand();
}

// ------------------------------------------------------------
// CommandHandler::parseOptions()
// CLI 옵션을 getopt_long()으로 파싱하여 mOptions에 저장합니다.
//
// [사용법 및 확장 규칙]
// • 새 옵션을 추가하려면 아래 3개만 수정하면 됩니다:
//   ① longOptions[] : "이름", 인자유형, nullptr, '단문자'
//   ② optString     : 단문자를 나열, 인자 필요 시 ':' 추가
//   ③ switch-case   : 각 옵션에 대한 처리 로직 추가
// ------------------------------------------------------------
void CommandHandler::parseOptions()
{
    optind = 0;
    opterr = 0;
    int optionChar;
    int optionIndex = 0;

    static struct option longOptions[] =
    {
        {"config",   required_argument, nullptr, 'c'},
        {"database", required_argument, nullptr, 'd'},
        {"force",    no_argument,       nullptr, 'f'},
        {"help",     no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    const char* optString = "c:d:fh";

    while ((optionChar = getopt_long(mArgc,
                                     mArgv,
                                     optString,
                                     longOptions,
                                     &optionIndex)) != -1)
    {
        switch (optionChar)
        {
        case 'c':
            mOptions.configPath = optarg;
            mbConfigGiven = true;
            break;
        case 'd':
            mOptions.dbPath = optarg;
            break;
        case 'f':
            mOptions.bForce = true;
            break;
        case 'h':
            mOptions.command = "help";
            return;
        default:
            // main.cpp의 catch문으로 전송
            throw std::invalid_argument("Unknown or malformed command-line option");
        }
    }

    // 옵션 뒤에 남은 위치 인자를 저장
    for (int i = optind; i < mArgc; ++i)
    {
        mArgs.emplace_back(mArgv[i]);
    }

    if (mArgs.empty())
    {
        throw std::invalid_argument("No command provided");
    }
    if (mArgs.size() > 1)
    {
        throw std::invalid_argument("Unexpected argument: " + mArgs[1]);
    }

    mOptions.command = mArgs[0];
}

void CommandHandler::validateCommand() const
{
    const std::string& command = mOptions.command;

    if (command == "help" || command == "init")
    {
        return;
    }
    if (command == "check")
    {
        if (mOptions.bForce)
        {
            throw std::invalid_argument("--force is only valid for init");
        }
        return;
    }
    if (command == "status")
    {
        if (mOptions.bForce || mbConfigGiven)
        {
            throw std::invalid_argument("status accepts only --database");
        }
        return;
    }

    throw std::invalid_argument("Unknown command: " + command);
}
