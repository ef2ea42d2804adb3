#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace railguard {
namespace config {

// Конфигурация монитора. Загружается один раз при старте и дальше не меняется
struct MonitorConfig {
    // Основные параметры
    double thresholdVoltage = 14.5;
    std::chrono::milliseconds interval{1000};
    std::string logPath = "/var/log/railguard/railguard.log";
    unsigned undervoltageLimit = 10;
    bool debugMode = false;

    // Датчик INA3221 в hwmon
    std::string hwmonRoot = "/sys/bus/i2c/drivers";
    std::string driverBus = "ina3221";
    std::string i2cAddress = "1-0040";
    std::string channelLabelFilter = "VDD";

    // Ротация лога
    size_t maxLogSize = 1024 * 1024 * 10;
    size_t maxLogFiles = 5;

    // Внешние утилиты
    std::vector<std::string> shutdownCommand{"/sbin/shutdown", "now"};
    std::chrono::milliseconds probeTimeout{2000};
    std::vector<std::string> gpuLoadPaths{
        "/sys/devices/gpu.0/load",
        "/sys/devices/platform/gpu.0/load",
        "/sys/class/devfreq/17000000.gv11b/load"};
    std::string procStatPath = "/proc/stat";

    // Каталог hwmon конкретного устройства
    std::string hwmonDevicePath() const {
        return hwmonRoot + "/" + driverBus + "/" + i2cAddress + "/hwmon";
    }

    bool validate(std::string* reason = nullptr) const;

    nlohmann::json toJson() const;
    // Отсутствующие в JSON ключи сохраняют значения из base
    static MonitorConfig fromJson(const nlohmann::json& j, const MonitorConfig& base);
    static MonitorConfig fromJson(const nlohmann::json& j);
    static MonitorConfig loadFromFile(const std::string& path, const MonitorConfig& base);
    static MonitorConfig loadFromFile(const std::string& path);
};

inline MonitorConfig MonitorConfig::fromJson(const nlohmann::json& j) {
    return fromJson(j, MonitorConfig{});
}

inline MonitorConfig MonitorConfig::loadFromFile(const std::string& path) {
    return loadFromFile(path, MonitorConfig{});
}

// Интервал в секундах -> миллисекунды. Бросает ConfigError, если значение
// не конечно, не положительно или не помещается в std::chrono::milliseconds
std::chrono::milliseconds intervalFromSeconds(double seconds);

// Порог срабатывания из целого. Бросает ConfigError вне диапазона unsigned
unsigned undervoltageLimitFromCount(long long count);

} // namespace config
} // namespace railguard
