#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <unordered_map>

#include "CommandHandler.h"

class CommandBus
{
public:
    using HandlerFunc = std::function<int(const CommandOptions&, std::ostream&)>;

    void Register(const std::string& command, HandlerFunc handler);

    // 핸들러의 종료 코드를 반환, 알 수 없는 명령은 FIM_EXIT_FATAL
    int Dispatch(const CommandOptions& options, std::ostream& out);

private:
    std::unordered_map<std::string, HandlerFunc> mHandlers;
};
