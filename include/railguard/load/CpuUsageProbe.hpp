#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace railguard {
namespace load {

// Загрузка CPU по приращениям счётчиков первой строки /proc/stat между вызовами
class CpuUsageProbe {
public:
    explicit CpuUsageProbe(std::string procStatPath = "/proc/stat");

    // Процент 0..100; первый вызов возвращает 0 (нет предыдущего замера).
    // std::nullopt, если файл не читается
    std::optional<double> sample();

private:
    std::string procStatPath_;
    std::optional<uint64_t> prevIdle_;
    std::optional<uint64_t> prevTotal_;
};

} // namespace load
} // namespace railguard
