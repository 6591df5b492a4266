#include "FimCommandHandler.h"
#include "BaselineStore.h"
#include "ChangeReport.h"
#include "CommandBus.h"
#include "FIMBaselineGenerator.h"
#include "FIMIntegScan.h"
#include "FimErrors.h"
#include "FimLogger.h"
#include "StringUtils.h"

#include <filesystem>
#include <memory>
#include <unistd.h>
#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace
{
    // 터미널일 때만 진행률 표시
    class ProgressDisplay
    {
    public:
        ProgressDisplay(bool bEnabled, std::ostream& out)
            : mbEnabled(bEnabled && isatty(STDOUT_FILENO)),
              mOut(out)
        {
            if (!mbEnabled)
            {
                return;
            }

            indicators::show_console_cursor(false);
            mBar = std::make_shared<indicators::ProgressBar>(
                indicators::option::BarWidth{50},
                indicators::option::Start{"["},
                indicators::option::Fill{"="},
                indicators::option::Lead{">"},
                indicators::option::Remainder{"-"},
                indicators::option::End{"]"},
                indicators::option::ShowPercentage{true},
                indicators::option::ShowElapsedTime{true},
                indicators::option::ShowRemainingTime{true},
                indicators::option::Stream{out});
        }

        ~ProgressDisplay()
        {
            if (mbEnabled)
            {
                mOut << std::endl;
                indicators::show_console_cursor(true);
            }
        }

        ProgressDisplay(const ProgressDisplay&) = delete;
        ProgressDisplay& operator=(const ProgressDisplay&) = delete;

        Scanner::ProgressFunc Callback() const
        {
            if (!mbEnabled)
            {
                return nullptr;
            }

            std::shared_ptr<indicators::ProgressBar> bar = mBar;
            return [bar](size_t done, size_t total, const std::string&)
            {
                bar->set_progress(done * 100 / total);
            };
        }

    private:
        bool mbEnabled;
        std::ostream& mOut;
        std::shared_ptr<indicators::ProgressBar> mBar;
    };
}

FimCommandHandler::FimCommandHandler(const std::atomic<bool>& shouldRun)
    : mShouldRun(shouldRun)
{}

void FimCommandHandler::RegisterCommands(CommandBus& bus)
{
    bus.Register("init", [this](const CommandOptions& o, std::ostream& out) { return Init(o, out); });
    bus.Register("check", [this](const CommandOptions& o, std::ostream& out) { return Check(o, out); });
    bus.Register("status", [this](const CommandOptions& o, std::ostream& out) { return Status(o, out); });
}

FimConfig FimCommandHandler::loadConfig(const std::string& configPath) const
{
    FimConfig config = LoadFimConfig(configPath);
    ApplyLogSettings(config.logLevel, config.bVerboseConsoleOutput);
    return config;
}

void FimCommandHandler::printWarnings(const std::vector<std::string>& warnings, std::ostream& out) const
{
    for (const auto& w : warnings)
    {
        out << "[WARN] " << w << "\n";
    }
}

int FimCommandHandler::Init(const CommandOptions& options, std::ostream& out)
{
    spdlog::info("FIM 베이스라인 초기화 시작 (config: {}, db: {})", options.configPath, options.dbPath);

    try
    {
        FimConfig config = loadConfig(options.configPath);

        fs::path dbDir = fs::path(options.dbPath).parent_path();
        if (!dbDir.empty())
        {
            fs::create_directories(dbDir);
        }

        SqliteBaselineStore store(options.dbPath);
        BaselineLock lock(options.dbPath, true);

        if (store.Exists())
        {
            if (!options.bForce)
            {
                out << "[ERROR] 베이스라인 DB가 이미 존재합니다: " << options.dbPath
                    << "\n        덮어쓰려면 --force 옵션을 사용하십시오.\n";
                spdlog::error("베이스라인 DB가 이미 존재함 (--force 없음): {}", options.dbPath);
                return FIM_EXIT_FATAL;
            }
            spdlog::warn("기존 베이스라인을 교체합니다 (forced): {}", options.dbPath);
        }

        out << "baseline 해시값 생성중...\n";

        BaselineGenerator generator(config, store);
        generator.SetRunFlag(&mShouldRun);

        ScanRun run;
        bool bStored = false;
        {
            ProgressDisplay progress(config.bVerboseConsoleOutput, out);
            generator.SetProgressCallback(progress.Callback());
            bStored = generator.GenerateAndStore(run);
        }

        printWarnings(run.warnings, out);

        if (!bStored)
        {
            out << "[!] 검사가 중단되었습니다. 기존 베이스라인은 변경되지 않았습니다.\n";
            return FIM_EXIT_INTERRUPTED;
        }

        for (const auto& f : run.snapshot.failures)
        {
            out << "[WARN] 읽기 실패로 제외됨: " << f.path << " (" << ToString(f.reason) << ")\n";
        }

        out << "\n[SUCCESS] Baseline 생성 완료\n"
            << "총 검사 파일 수: " << run.snapshot.records.size() << "\n"
            << "해시 알고리즘:   " << ToString(config.hashAlgorithm) << "\n";
        return FIM_EXIT_CLEAN;
    }
    catch (const ConfigError& e)
    {
        out << "[ERROR] 설정 오류: " << e.what() << "\n";
        spdlog::critical("베이스라인 생성 실패 (설정): {}", e.what());
    }
    catch (const StoreError& e)
    {
        out << "[ERROR] 베이스라인 저장소 오류: " << e.what() << "\n";
        spdlog::critical("베이스라인 생성 실패 (저장소): {}", e.what());
    }
    catch (const std::exception& e)
    {
        out << "[ERROR] Baseline 생성 실패: " << e.what() << "\n";
        spdlog::critical("베이스라인 생성 실패: {}", e.what());
    }
    return FIM_EXIT_FATAL;
}

int FimCommandHandler::Check(const CommandOptions& options, std::ostream& out)
{
    spdlog::info("무결성 검사 시작 (config: {}, db: {})", options.configPath, options.dbPath);

    try
    {
        FimConfig config = loadConfig(options.configPath);

        SqliteBaselineStore store(options.dbPath);
        if (!store.Exists())
        {
            out << "[ERROR] 베이스라인 DB가 없습니다: " << options.dbPath
                << "\n        먼저 'init'을 실행하십시오.\n";
            spdlog::error("베이스라인 DB 없음: {}", options.dbPath);
            return FIM_EXIT_FATAL;
        }

        BaselineLock lock(options.dbPath, false);

        out << "해시값 무결성 검사 실행중...\n";

        IntegScanResult result;
        {
            ProgressDisplay progress(config.bVerboseConsoleOutput, out);
            result = CompareWithBaseline(config, store, &mShouldRun, progress.Callback());
        }

        printWarnings(result.warnings, out);

        if (!result.complete)
        {
            out << "[!] 검사가 중단되었습니다.\n";
            return FIM_EXIT_INTERRUPTED;
        }

        fimguard::ChangeReport::Write(out, result.changes, result.summary);
        return result.summary.HasViolations() ? FIM_EXIT_CHANGES : FIM_EXIT_CLEAN;
    }
    catch (const ConfigError& e)
    {
        out << "[ERROR] 설정 오류: " << e.what() << "\n";
        spdlog::critical("무결성 검사 실패 (설정): {}", e.what());
    }
    catch (const StoreError& e)
    {
        out << "[ERROR] 베이스라인 저장소 오류: " << e.what() << "\n";
        spdlog::critical("무결성 검사 실패 (저장소): {}", e.what());
    }
    catch (const std::exception& e)
    {
        out << "[ERROR] 무결성 검사 중 오류 발생: " << e.what() << "\n";
        spdlog::critical("무결성 검사 실패: {}", e.what());
    }
    return FIM_EXIT_FATAL;
}

int FimCommandHandler::Status(const CommandOptions& options, std::ostream& out)
{
    spdlog::info("베이스라인 상태 조회: {}", options.dbPath);

    try
    {
        SqliteBaselineStore store(options.dbPath);
        if (!store.Exists())
        {
            out << "[!] 베이스라인 DB가 없습니다: " << options.dbPath << "\n"
                << "    설정된 베이스라인이 없습니다.\n";
            return FIM_EXIT_CLEAN;
        }

        BaselineLock lock(options.dbPath, false);
        std::optional<BaselineInfo> info = store.Info();
        if (!info)
        {
            out << "[!] 베이스라인 DB가 없습니다: " << options.dbPath << "\n";
            return FIM_EXIT_CLEAN;
        }

        out << "\n--- FIM Baseline Status ---\n"
            << "Baseline Database: " << options.dbPath << "\n"
            << "Monitored Files in Baseline: " << info->fileCount << "\n"
            << "Hash Algorithm: " << ToString(info->algorithm) << "\n"
            << "Last Init: " << fimguard::utils::formatTime(info->createdAt * 1000000000LL) << "\n"
            << "---------------------------\n";
        return FIM_EXIT_CLEAN;
    }
    catch (const std::exception& e)
    {
        out << "[ERROR] 베이스라인 DB 조회 중 오류 발생: " << e.what() << "\n";
        spdlog::error("베이스라인 상태 조회 실패: {}", e.what());
    }
    return FIM_EXIT_FATAL;
}
