#include "CommandBus.h"
#include "FimCommandHandler.h"

#include <spdlog/spdlog.h>

void CommandBus::Register(const std::string& command, HandlerFunc handler)
{
    mHandlers[command] = std::move(handler);
}

int CommandBus::Dispatch(const CommandOptions& options, std::ostream& out)
{
    const std::string& cmd = options.command;
    auto it = mHandlers.find(cmd);
    if (it != mHandlers.end())
    {
        spdlog::info("명령어 실행 요청: {}", cmd);
        return it->second(options, out);
    }

    out << "[!] 알 수 없는 명령입니다: " << cmd << "\n";
    spdlog::warn("알 수 없는 명령 수신됨: {}", cmd);
    return FIM_EXIT_FATAL;
}
