#pragma once

#include <string>
#include <vector>

// 명령행에서 해석된 실행 옵션
struct CommandOptions
{
    std::string command;       // init | check | status | help
    std::string configPath;
    std::string dbPath;
    bool bForce = false;
};

class CommandHandler
{
public:
    CommandHandler(int argc, char** argv);

    // 잘못된 옵션/명령은 std::invalid_argument
    void Init();

    const CommandOptions& GetOptions() const { return mOptions; }

private:
    void parseOptions();
    void validateCommand() const;

    int mArgc;
    char** mArgv;

    std::vector<std::string> mArgs;
    CommandOptions mOptions;
    bool mbConfigGiven = false;
};
