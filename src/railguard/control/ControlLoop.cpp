#include "railguard/control/ControlLoop.hpp"
#include "railguard/common/Errors.hpp"
#include "railguard/correction/VoltageCorrector.hpp"
#include <spdlog/spdlog.h>

namespace railguard {
namespace control {

ControlLoop::ControlLoop(config::MonitorConfig config,
                         sensors::IVoltageSource& voltageSource,
                         load::ILoadSource& loadSource,
                         report::IReporter& reporter,
                         shutdown::IShutdownActuator& actuator,
                         IClock& clock)
    : config_(std::move(config))
    , voltageSource_(voltageSource)
    , loadSource_(loadSource)
    , reporter_(reporter)
    , actuator_(actuator)
    , clock_(clock)
    , policy_(config_.undervoltageLimit) {}

CycleOutcome ControlLoop::runCycle() {
    state_ = LoopState::Sampling;

    double raw = voltageSource_.readRawVoltage();
    load::LoadReading loads = loadSource_.readLoads();

    Sample sample;
    sample.timestamp = clock_.now();
    sample.rawVoltage = raw;
    sample.cpuLoad = loads.cpuPercent;
    sample.gpuLoad = loads.gpuPercent;
    sample.correctedVoltage = correction::correctVoltage(raw, loads.cpuPercent, loads.gpuPercent);
    lastSample_ = sample;

    policy::PolicyDecision decision = policy_.evaluate(sample.correctedVoltage, config_.thresholdVoltage);
    reporter_.record(sample, decision);

    if (decision.consecutiveCount > 0) {
        spdlog::warn("Below threshold ({:.3f}V). Count: {}/{}",
                     sample.correctedVoltage, decision.consecutiveCount, config_.undervoltageLimit);
    }

    if (!decision.tripped) {
        return CycleOutcome::Continue;
    }
    if (config_.debugMode) {
        spdlog::warn("Undervoltage limit exceeded, shutdown suppressed in debug mode");
        return CycleOutcome::Continue;
    }

    state_ = LoopState::ShuttingDown;
    actuator_.shutdown();
    state_ = LoopState::Stopped;
    return CycleOutcome::ShutdownInitiated;
}

LoopExit ControlLoop::run(const std::atomic<bool>& running) {
    spdlog::info("Starting monitor (threshold={}V, interval={}s, limit={}{})",
                 config_.thresholdVoltage, config_.interval.count() / 1000.0,
                 config_.undervoltageLimit, config_.debugMode ? ", debug" : "");

    try {
        while (running) {
            if (runCycle() == CycleOutcome::ShutdownInitiated) {
                return LoopExit::ShutdownInitiated;
            }
            if (!running) {
                break;
            }
            state_ = LoopState::Sleeping;
            clock_.sleepFor(config_.interval);
        }
    } catch (const SensorUnavailable& e) {
        state_ = LoopState::Stopped;
        spdlog::error("No VDD channels found or failed to read any voltages: {}", e.what());
        throw;
    } catch (const ShutdownFailure& e) {
        state_ = LoopState::Stopped;
        spdlog::critical("Shutdown failed: {}", e.what());
        throw;
    }

    state_ = LoopState::Stopped;
    spdlog::info("Monitor stopped");
    return LoopExit::Stopped;
}

} // namespace control
} // namespace railguard
