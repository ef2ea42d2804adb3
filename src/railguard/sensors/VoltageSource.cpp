#include "railguard/sensors/VoltageSource.hpp"
#include "railguard/common/Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <spdlog/spdlog.h>

namespace railguard {
namespace sensors {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> readTrimmed(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::string value;
    if (!std::getline(file, value)) {
        return std::nullopt;
    }
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    return value;
}

// Значение inN_input в милливольтах
std::optional<double> readMillivolts(const std::string& path) {
    auto text = readTrimmed(path);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        long long raw = std::stoll(*text, &pos);
        if (pos != text->size()) {
            return std::nullopt;
        }
        return static_cast<double>(raw);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

} // namespace

SensorContext SensorContext::discover(const std::string& devicePath, const std::string& labelFilter) {
    SensorContext context;
    context.devicePath = devicePath;

    std::error_code ec;
    std::vector<fs::path> hwmonDirs;
    for (fs::directory_iterator it(devicePath, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().rfind("hwmon", 0) == 0 && it->is_directory(ec)) {
            hwmonDirs.push_back(it->path());
        }
    }
    if (hwmonDirs.empty()) {
        throw SensorUnavailable("No hwmon directories found under " + devicePath);
    }
    std::sort(hwmonDirs.begin(), hwmonDirs.end());

    for (const auto& dir : hwmonDirs) {
        std::vector<fs::path> labels;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string file = it->path().filename().string();
            if (file.rfind("in", 0) == 0 && file.size() > 6 &&
                file.compare(file.size() - 6, 6, "_label") == 0) {
                labels.push_back(it->path());
            }
        }
        std::sort(labels.begin(), labels.end());

        for (const auto& labelPath : labels) {
            auto label = readTrimmed(labelPath);
            if (!label || label->find(labelFilter) == std::string::npos) {
                continue;
            }
            std::string file = labelPath.filename().string();
            std::string channel = file.substr(0, file.find('_'));
            context.channels.push_back({channel, *label, (dir / (channel + "_input")).string()});
            spdlog::debug("VoltageSource: channel {} '{}' -> {}", channel, *label,
                          context.channels.back().inputPath);
        }
    }

    if (context.channels.empty()) {
        throw SensorUnavailable("No channels labelled '" + labelFilter + "' under " + devicePath);
    }
    return context;
}

HwmonVoltageSource::HwmonVoltageSource(SensorContext context) : context_(std::move(context)) {
    spdlog::info("VoltageSource: monitoring {} channel(s) under {}", context_.channels.size(), context_.devicePath);
}

double HwmonVoltageSource::readRawVoltage() {
    double total = 0.0;
    size_t readable = 0;
    for (const auto& channel : context_.channels) {
        auto millivolts = readMillivolts(channel.inputPath);
        if (!millivolts) {
            spdlog::debug("VoltageSource: channel {} unreadable, skipped", channel.name);
            continue;
        }
        total += *millivolts / 1000.0;
        ++readable;
    }
    if (readable == 0) {
        throw SensorUnavailable("No voltage channel readable under " + context_.devicePath);
    }
    return total;
}

} // namespace sensors
} // namespace railguard
