#pragma once
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace railguard {
namespace testing {

// Временный каталог, удаляется в деструкторе
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("railguard_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    void write(const std::filesystem::path& relative, const std::string& content) const {
        auto full = path_ / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

private:
    std::filesystem::path path_;
};

} // namespace testing
} // namespace railguard
