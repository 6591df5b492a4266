#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// 테스트마다 사용하는 임시 디렉토리 (소멸 시 삭제)
struct TempDir
{
    fs::path path;

    TempDir()
    {
        static int sCounter = 0;
        path = fs::temp_directory_path() /
               ("fimguard_test_" + std::to_string(getpid()) + "_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
                std::to_string(sCounter++));
        fs::create_directories(path);
    }

    ~TempDir()
    {
        std::error_code ec;
        // 권한을 막아둔 파일/디렉토리도 지울 수 있도록 복구
        for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        }
        fs::remove_all(path, ec);
    }
};

inline fs::path WriteFile(const fs::path& file, const std::string& content)
{
    fs::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << content;
    return file;
}
