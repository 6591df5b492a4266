#include "FimLogger.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace
{
    const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [tid : %t] [%^%l%$] %v";
    const char* LOGGER_NAME = "fimguard_logger";
}

void InitLogger(const std::string& logPath)
{
    std::vector<spdlog::sink_ptr> sinks;

    try
    {
        fs::path logDir = fs::path(logPath).parent_path();
        if (!logDir.empty())
        {
            fs::create_directories(logDir);
        }

        // 최대 5MB, 최대 3개 파일 보관
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath,
            1024 * 1024 * 5,
            3));
    }
    catch (const std::exception& e)
    {
        // 로그 파일을 열 수 없으면 stderr만 사용
        std::cerr << "[WARN] 로그 파일 열기 실패 (" << logPath << "): " << e.what() << "\n";
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(LOG_PATTERN);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);
}

void ApplyLogSettings(const std::string& logLevel, bool bVerboseConsoleOutput)
{
    auto logger = spdlog::default_logger();

    spdlog::level::level_enum level = spdlog::level::from_str(logLevel == "warning" ? "warn" : logLevel);
    logger->set_level(level);
    logger->flush_on(level);

    if (bVerboseConsoleOutput)
    {
        bool bHasConsole = false;
        for (const auto& sink : logger->sinks())
        {
            if (std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(sink))
            {
                bHasConsole = true;
            }
        }

        if (!bHasConsole)
        {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern("[%^%l%$] %v");
            logger->sinks().push_back(console);
        }
    }
}
