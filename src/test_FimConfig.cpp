#undef NDEBUG
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "FimConfig.h"
#include "FimErrors.h"
#include "Paths.h"
#include "TestUtils.h"

namespace {

template <typename Fn>
bool throwsConfigError(Fn fn)
{
    try
    {
        fn();
    }
    catch (const ConfigError&)
    {
        return true;
    }
    return false;
}

void test_full_config()
{
    TempDir dir;
    fs::path conf = WriteFile(dir.path / "fim_config.yaml",
        "# 모니터링 설정\n"
        "include:\n"
        "  - /etc\n"
        "  - /usr/local/bin\n"
        "exclude:\n"
        "  - /etc/mtab\n"
        "hash_algorithm: SHA512\n"
        "log_level: warn\n"
        "verbose_console_output: false\n"
        "metadata_policy: strict\n"
        "max_file_size_mb: 2\n"
        "read_timeout_sec: 5\n"
        "workers: 3\n");

    FimConfig config = LoadFimConfig(conf.string());
    assert(config.includePaths.size() == 2);
    assert(config.includePaths[1] == "/usr/local/bin");
    assert(config.excludePaths.size() == 1);
    assert(config.hashAlgorithm == HashAlgorithm::SHA512);
    assert(config.logLevel == "warning");
    assert(!config.bVerboseConsoleOutput);
    assert(config.metadataPolicy == MetadataPolicy::Strict);
    assert(config.maxFileSize == 2ULL * 1024 * 1024);
    assert(config.readTimeout == std::chrono::seconds(5));
    assert(config.workers == 3);
}

void test_defaults()
{
    TempDir dir;
    fs::path conf = WriteFile(dir.path / "minimal.yaml", "include:\n  - /etc\n");

    FimConfig config = LoadFimConfig(conf.string());
    assert(config.excludePaths.empty());
    assert(config.hashAlgorithm == HashAlgorithm::SHA256);
    assert(config.logLevel == "info");
    assert(config.bVerboseConsoleOutput);
    assert(config.metadataPolicy == MetadataPolicy::ContentOnly);
    assert(config.maxFileSize == 1024ULL * 1024 * 1024);
    assert(config.readTimeout == std::chrono::seconds(60));
    assert(config.workers == 0);

    fs::path empty = WriteFile(dir.path / "empty.yaml", "");
    assert(LoadFimConfig(empty.string()).includePaths.empty());
}

void test_invalid_configs()
{
    TempDir dir;

    assert(throwsConfigError([&] { LoadFimConfig((dir.path / "missing.yaml").string()); }));

    fs::path algo = WriteFile(dir.path / "algo.yaml", "hash_algorithm: crc32\n");
    assert(throwsConfigError([&] { LoadFimConfig(algo.string()); }));

    fs::path scalar = WriteFile(dir.path / "scalar.yaml", "include: /etc\n");
    assert(throwsConfigError([&] { LoadFimConfig(scalar.string()); }));

    fs::path broken = WriteFile(dir.path / "broken.yaml", "include: [/etc, /usr\nexclude: {\n");
    assert(throwsConfigError([&] { LoadFimConfig(broken.string()); }));

    fs::path level = WriteFile(dir.path / "level.yaml", "log_level: chatty\n");
    assert(throwsConfigError([&] { LoadFimConfig(level.string()); }));

    fs::path policy = WriteFile(dir.path / "policy.yaml", "metadata_policy: loose\n");
    assert(throwsConfigError([&] { LoadFimConfig(policy.string()); }));

    fs::path workers = WriteFile(dir.path / "workers.yaml", "workers: many\n");
    assert(throwsConfigError([&] { LoadFimConfig(workers.string()); }));

    // 2^44 MB는 바이트로 환산하면 64비트를 넘는다
    fs::path huge = WriteFile(dir.path / "huge.yaml", "max_file_size_mb: 17592186044416\n");
    assert(throwsConfigError([&] { LoadFimConfig(huge.string()); }));

    fs::path largest = WriteFile(dir.path / "largest.yaml", "max_file_size_mb: 17592186044415\n");
    assert(LoadFimConfig(largest.string()).maxFileSize == 17592186044415ULL * 1024 * 1024);

    fs::path list = WriteFile(dir.path / "list.yaml", "- /etc\n- /usr\n");
    assert(throwsConfigError([&] { LoadFimConfig(list.string()); }));
}

void test_environment_overrides()
{
    unsetenv(ENV_FIM_CONFIG_PATH);
    unsetenv(ENV_FIM_DATABASE_PATH);
    unsetenv(ENV_FIM_LOG_FILE);
    assert(ResolveConfigPath() == PATH_FIM_CONFIG_YAML);
    assert(ResolveDatabasePath() == PATH_BASELINE_DB);
    assert(ResolveLogPath() == PATH_FIM_LOG);

    setenv(ENV_FIM_CONFIG_PATH, "/tmp/custom.yaml", 1);
    setenv(ENV_FIM_DATABASE_PATH, "/tmp/custom.db", 1);
    setenv(ENV_FIM_LOG_FILE, "/tmp/custom.log", 1);
    assert(ResolveConfigPath() == "/tmp/custom.yaml");
    assert(ResolveDatabasePath() == "/tmp/custom.db");
    assert(ResolveLogPath() == "/tmp/custom.log");

    unsetenv(ENV_FIM_CONFIG_PATH);
    unsetenv(ENV_FIM_DATABASE_PATH);
    unsetenv(ENV_FIM_LOG_FILE);
}

} // namespace

int main()
{
    test_full_config();
    test_defaults();
    test_invalid_configs();
    test_environment_overrides();

    std::cout << "test_FimConfig: all tests passed" << std::endl;
    return 0;
}
