#include "railguard/config/MonitorConfig.hpp"
#include "railguard/common/Errors.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace railguard {
namespace config {

namespace {

bool fail(std::string* reason, const char* message) {
    if (reason) {
        *reason = message;
    }
    return false;
}

} // namespace

std::chrono::milliseconds intervalFromSeconds(double seconds) {
    // 2^63 как double точен: всё, что строго меньше, помещается в long long
    constexpr double kMaxMilliseconds = static_cast<double>(std::chrono::milliseconds::max().count());
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        throw ConfigError("interval must be a positive number of seconds");
    }
    if (!(seconds * 1000.0 < kMaxMilliseconds)) {
        throw ConfigError("interval is too large");
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

unsigned undervoltageLimitFromCount(long long count) {
    if (count < 0) {
        throw ConfigError("undervoltage limit must not be negative");
    }
    if (static_cast<unsigned long long>(count) > std::numeric_limits<unsigned>::max()) {
        throw ConfigError("undervoltage limit is too large");
    }
    return static_cast<unsigned>(count);
}

bool MonitorConfig::validate(std::string* reason) const {
    if (!(thresholdVoltage > 0.0)) return fail(reason, "threshold must be positive");
    if (interval.count() <= 0) return fail(reason, "interval must be positive");
    if (undervoltageLimit == 0) return fail(reason, "undervoltage limit must be at least 1");
    if (logPath.empty()) return fail(reason, "log path is empty");
    if (shutdownCommand.empty() || shutdownCommand.front().empty()) return fail(reason, "shutdown command is empty");
    if (probeTimeout.count() <= 0) return fail(reason, "probe timeout must be positive");
    if (maxLogSize == 0 || maxLogFiles == 0) return fail(reason, "log rotation limits must be positive");
    return true;
}

nlohmann::json MonitorConfig::toJson() const {
    return {
        {"threshold", thresholdVoltage},
        {"interval", interval.count() / 1000.0},
        {"log", logPath},
        {"undervoltage_limit", undervoltageLimit},
        {"debug", debugMode},
        {"hwmon_root", hwmonRoot},
        {"driver_bus", driverBus},
        {"i2c_address", i2cAddress},
        {"channel_label_filter", channelLabelFilter},
        {"max_log_size", maxLogSize},
        {"max_log_files", maxLogFiles},
        {"shutdown_command", shutdownCommand},
        {"probe_timeout_ms", probeTimeout.count()},
        {"gpu_load_paths", gpuLoadPaths},
        {"proc_stat_path", procStatPath}
    };
}

MonitorConfig MonitorConfig::fromJson(const nlohmann::json& j, const MonitorConfig& base) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }
    MonitorConfig config = base;
    try {
        config.thresholdVoltage = j.value("threshold", base.thresholdVoltage);
        if (j.contains("interval")) {
            config.interval = intervalFromSeconds(j.at("interval").get<double>());
        }
        config.logPath = j.value("log", base.logPath);
        if (j.contains("undervoltage_limit")) {
            config.undervoltageLimit = undervoltageLimitFromCount(j.at("undervoltage_limit").get<long long>());
        }
        config.debugMode = j.value("debug", base.debugMode);
        config.hwmonRoot = j.value("hwmon_root", base.hwmonRoot);
        config.driverBus = j.value("driver_bus", base.driverBus);
        config.i2cAddress = j.value("i2c_address", base.i2cAddress);
        config.channelLabelFilter = j.value("channel_label_filter", base.channelLabelFilter);
        config.maxLogSize = j.value("max_log_size", base.maxLogSize);
        config.maxLogFiles = j.value("max_log_files", base.maxLogFiles);
        config.shutdownCommand = j.value("shutdown_command", base.shutdownCommand);
        if (j.contains("probe_timeout_ms")) {
            config.probeTimeout = std::chrono::milliseconds(j.at("probe_timeout_ms").get<long long>());
        }
        config.gpuLoadPaths = j.value("gpu_load_paths", base.gpuLoadPaths);
        config.procStatPath = j.value("proc_stat_path", base.procStatPath);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
    return config;
}

MonitorConfig MonitorConfig::loadFromFile(const std::string& path, const MonitorConfig& base) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open configuration file " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    spdlog::debug("MonitorConfig: loaded {}", path);
    return fromJson(j, base);
}

} // namespace config
} // namespace railguard
