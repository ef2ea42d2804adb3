#include "railguard/load/GpuLoadProbes.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace railguard {
namespace load {

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool isDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Строка цифр -> число; слишком длинная строка даёт std::nullopt
std::optional<double> parseNumber(const std::string& digits) {
    try {
        return std::stod(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

NvidiaSmiProbe::NvidiaSmiProbe(process::ICommandRunner& runner, std::chrono::milliseconds timeout)
    : runner_(runner), timeout_(timeout) {}

std::optional<double> NvidiaSmiProbe::probe() {
    auto result = runner_.run({"nvidia-smi", "--query-gpu=utilization.gpu", "--format=csv,noheader,nounits"}, timeout_);
    if (!result || result->timedOut || result->exitCode != 0) {
        return std::nullopt;
    }
    std::string value = trim(result->output);
    if (!isDigits(value)) {
        return std::nullopt;
    }
    return parseNumber(value);
}

TegrastatsProbe::TegrastatsProbe(process::ICommandRunner& runner, std::chrono::milliseconds window)
    : runner_(runner), window_(window) {}

std::optional<double> TegrastatsProbe::probe() {
    // tegrastats не завершается сам: таймаут здесь штатный конец замера
    auto result = runner_.run({"tegrastats", "--interval", "100"}, window_);
    if (!result) {
        return std::nullopt;
    }
    return parse(result->output);
}

std::optional<double> TegrastatsProbe::parse(const std::string& output) {
    static const std::regex pattern(R"(GR3D_FREQ\s+(\d+)%)");
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            return parseNumber(match[1].str());
        }
    }
    return std::nullopt;
}

SysfsGpuLoadProbe::SysfsGpuLoadProbe(std::vector<std::string> paths) : paths_(std::move(paths)) {}

std::optional<double> SysfsGpuLoadProbe::probe() {
    static const std::regex number(R"((\d+))");
    for (const auto& path : paths_) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            continue;
        }
        std::ifstream file(path);
        std::string content;
        if (!file || !std::getline(file, content)) {
            continue;
        }
        std::smatch match;
        if (!std::regex_search(content, match, number)) {
            continue;
        }
        auto value = parseNumber(match[1].str());
        if (!value) {
            spdlog::trace("SysfsGpuLoadProbe: {} holds an out of range value", path);
            continue;
        }
        spdlog::trace("SysfsGpuLoadProbe: {} -> '{}'", path, trim(content));
        return std::min(100.0, *value);
    }
    return std::nullopt;
}

JtopProbe::JtopProbe(process::ICommandRunner& runner, std::chrono::milliseconds timeout)
    : runner_(runner), timeout_(timeout) {}

std::optional<double> JtopProbe::probe() {
    auto result = runner_.run({"jtop", "--json"}, timeout_);
    if (!result || result->timedOut || result->exitCode != 0) {
        return std::nullopt;
    }
    return parse(result->output);
}

std::optional<double> JtopProbe::parse(const std::string& output) {
    auto j = nlohmann::json::parse(output, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    auto gpu = j.find("gpu");
    if (gpu == j.end() || !gpu->is_object()) {
        return std::nullopt;
    }
    auto val = gpu->find("val");
    if (val == gpu->end() || !val->is_number()) {
        return std::nullopt;
    }
    return val->get<double>();
}

} // namespace load
} // namespace railguard
