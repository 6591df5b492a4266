#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "CommandBus.h"
#include "CommandHandler.h"
#include "FimCommandHandler.h"
#include "FimConfig.h"
#include "FimLogger.h"

namespace
{
    std::atomic<bool> sbShouldRun(true);

    void printUsage()
    {
        std::cout << "Usage:\n"
                  << "  fimguard init   [--config FILE] [--database FILE] [--force]   # Create baseline\n"
                  << "  fimguard check  [--config FILE] [--database FILE]             # Compare with baseline\n"
                  << "  fimguard status [--database FILE]                             # Show baseline status\n\n"
                  << "Exit codes (check): 0 = clean, 1 = changes found, 2 = fatal error, 130 = interrupted\n";
    }
}

int main(int argc, char* argv[])
{
    InitLogger(ResolveLogPath());

    // SIGTERM, SIGINT: 새 작업 배분 중단 → 부분 결과는 저장하지 않고 종료
    std::signal(SIGTERM, [](int) { sbShouldRun = false; });
    std::signal(SIGINT,  [](int) { sbShouldRun = false; });

    CommandOptions options;
    try
    {
        CommandHandler handler(argc, argv);
        handler.Init();
        options = handler.GetOptions();
    }
    catch (const std::exception& e)
    {
        std::cerr << "\033[1;31m[!] " << e.what() << "\033[0m\n\n";
        printUsage();
        return FIM_EXIT_FATAL;
    }

    if (options.command == "help")
    {
        printUsage();
        return FIM_EXIT_CLEAN;
    }

    FimCommandHandler fimHandler(sbShouldRun);
    CommandBus bus;
    fimHandler.RegisterCommands(bus);

    int exitCode = bus.Dispatch(options, std::cout);

    spdlog::info("FimGuard 종료 (exit code {})", exitCode);
    spdlog::shutdown();
    return exitCode;
}
