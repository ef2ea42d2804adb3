#include "railguard/report/SampleReporter.hpp"
#include <cmath>
#include <ctime>
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace railguard {
namespace report {

namespace {

double roundTo(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    std::tm local{};
    localtime_r(&seconds, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
    return fmt::format("{}.{:03d}", buffer, static_cast<int>(ms));
}

} // namespace

SampleReporter::SampleReporter(std::shared_ptr<spdlog::logger> logger, ReportFormat format)
    : logger_(std::move(logger)), format_(format) {}

std::string SampleReporter::formatStructured(const Sample& sample, const policy::PolicyDecision& decision) {
    nlohmann::ordered_json line;
    line["ts"] = formatTimestamp(sample.timestamp);
    line["raw_v"] = roundTo(sample.rawVoltage, 3);
    line["cpu_pct"] = roundTo(sample.cpuLoad, 1);
    line["gpu_pct"] = roundTo(sample.gpuLoad, 1);
    line["corrected_v"] = roundTo(sample.correctedVoltage, 3);
    line["count"] = decision.consecutiveCount;
    line["tripped"] = decision.tripped;
    return line.dump();
}

std::string SampleReporter::formatHuman(const Sample& sample, const policy::PolicyDecision& decision) {
    return fmt::format("Raw: {:.3f}V, Corrected: {:.3f}V, CPU: {:.1f}%, GPU: {:.1f}%, Count: {}{}",
                       sample.rawVoltage, sample.correctedVoltage, sample.cpuLoad, sample.gpuLoad,
                       decision.consecutiveCount, decision.tripped ? " [TRIPPED]" : "");
}

void SampleReporter::record(const Sample& sample, const policy::PolicyDecision& decision) {
    try {
        if (format_ == ReportFormat::Human) {
            logger_->info(formatHuman(sample, decision));
        } else {
            logger_->info(formatStructured(sample, decision));
        }
    } catch (const std::exception& e) {
        std::cerr << "railguard: failed to record sample: " << e.what() << std::endl;
    }
}

} // namespace report
} // namespace railguard
