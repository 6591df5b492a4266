#include "FimConfig.h"
#include "FimErrors.h"
#include "Hasher.h"
#include "Paths.h"
#include "StringUtils.h"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;
using fimguard::utils::toLower;
using fimguard::utils::trim;

namespace
{
    std::string envOrDefault(const char* name, const char* fallback)
    {
        const char* value = std::getenv(name);
        if (value != nullptr && *value != '\0')
        {
            return value;
        }
        return fallback;
    }

    // include / exclude 시퀀스 파싱 (키가 없거나 null이면 빈 목록)
    std::vector<std::string> readPathList(const YAML::Node& root, const std::string& key)
    {
        std::vector<std::string> result;
        const YAML::Node node = root[key];
        if (!node || node.IsNull())
        {
            return result;
        }
        if (!node.IsSequence())
        {
            throw ConfigError("'" + key + "' 항목은 경로 목록(sequence)이어야 합니다.");
        }

        for (const auto& item : node)
        {
            std::string path = trim(item.as<std::string>());
            if (!path.empty())
            {
                result.push_back(path);
            }
        }
        return result;
    }

    std::string parseLogLevel(const std::string& raw)
    {
        std::string level = toLower(trim(raw));
        if (level == "warn")
        {
            level = "warning";
        }
        if (level == "debug" || level == "info" || level == "warning" ||
            level == "error" || level == "critical")
        {
            return level;
        }
        throw ConfigError("알 수 없는 log_level: '" + raw + "'");
    }

    MetadataPolicy parseMetadataPolicy(const std::string& raw)
    {
        std::string policy = toLower(trim(raw));
        if (policy == "content") return MetadataPolicy::ContentOnly;
        if (policy == "strict")  return MetadataPolicy::Strict;
        throw ConfigError("알 수 없는 metadata_policy: '" + raw + "' (content|strict)");
    }
}

FimConfig LoadFimConfig(const std::string& configPath)
{
    if (!fs::exists(configPath))
    {
        throw ConfigError("설정 파일이 존재하지 않습니다: " + configPath);
    }

    FimConfig config;
    try
    {
        YAML::Node root = YAML::LoadFile(configPath);
        if (root.IsNull())
        {
            spdlog::warn("설정 파일이 비어 있음, 기본값 사용: {}", configPath);
            return config;
        }
        if (!root.IsMap())
        {
            throw ConfigError("설정 파일 최상위는 map이어야 합니다: " + configPath);
        }

        config.includePaths = readPathList(root, "include");
        config.excludePaths = readPathList(root, "exclude");

        if (root["hash_algorithm"])
        {
            config.hashAlgorithm = ParseHashAlgorithm(root["hash_algorithm"].as<std::string>());
        }
        if (root["log_level"])
        {
            config.logLevel = parseLogLevel(root["log_level"].as<std::string>());
        }
        if (root["verbose_console_output"])
        {
            config.bVerboseConsoleOutput = root["verbose_console_output"].as<bool>();
        }
        if (root["metadata_policy"])
        {
            config.metadataPolicy = parseMetadataPolicy(root["metadata_policy"].as<std::string>());
        }
        if (root["max_file_size_mb"])
        {
            std::uint64_t megabytes = root["max_file_size_mb"].as<std::uint64_t>();
            if (megabytes > (std::numeric_limits<std::uint64_t>::max() >> 20))
            {
                throw ConfigError("max_file_size_mb 값이 너무 큽니다: " + std::to_string(megabytes));
            }
            config.maxFileSize = megabytes * 1024 * 1024;
        }
        if (root["read_timeout_sec"])
        {
            config.readTimeout = std::chrono::seconds(root["read_timeout_sec"].as<unsigned int>());
        }
        if (root["workers"])
        {
            config.workers = root["workers"].as<unsigned int>();
        }
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigError("설정 파일 파싱 실패 (" + configPath + "): " + e.what());
    }

    spdlog::info("FIM 설정 로드 완료: include {}개, exclude {}개, 알고리즘 {}",
                 config.includePaths.size(), config.excludePaths.size(),
                 ToString(config.hashAlgorithm));
    return config;
}

std::string ResolveConfigPath()
{
    return envOrDefault(ENV_FIM_CONFIG_PATH, PATH_FIM_CONFIG_YAML);
}

std::string ResolveDatabasePath()
{
    return envOrDefault(ENV_FIM_DATABASE_PATH, PATH_BASELINE_DB);
}

std::string ResolveLogPath()
{
    return envOrDefault(ENV_FIM_LOG_FILE, PATH_FIM_LOG);
}
