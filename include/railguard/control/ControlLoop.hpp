#pragma once

#include <atomic>
#include <optional>
#include "railguard/common/Clock.hpp"
#include "railguard/common/Sample.hpp"
#include "railguard/config/MonitorConfig.hpp"
#include "railguard/load/LoadSource.hpp"
#include "railguard/policy/UndervoltagePolicy.hpp"
#include "railguard/report/SampleReporter.hpp"
#include "railguard/sensors/VoltageSource.hpp"
#include "railguard/shutdown/ShutdownActuator.hpp"

namespace railguard {
namespace control {

enum class LoopState {
    Idle,          // run() ещё не вызван
    Sampling,      // чтение, коррекция, политика, отчёт
    Sleeping,      // пауза между циклами
    ShuttingDown,  // вызван актуатор выключения
    Stopped
};

enum class CycleOutcome {
    Continue,
    ShutdownInitiated
};

enum class LoopExit {
    Stopped,           // сброшен флаг running (сигнал)
    ShutdownInitiated
};

// Однопоточный цикл мониторинга:
// чтение -> коррекция -> политика -> отчёт -> (выключение) -> пауза interval.
// SensorUnavailable и ShutdownFailure пробрасываются наружу и завершают цикл
class ControlLoop {
public:
    ControlLoop(config::MonitorConfig config,
                sensors::IVoltageSource& voltageSource,
                load::ILoadSource& loadSource,
                report::IReporter& reporter,
                shutdown::IShutdownActuator& actuator,
                IClock& clock);

    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    // Один цикл без паузы
    CycleOutcome runCycle();

    // Работает, пока running == true или до выключения
    LoopExit run(const std::atomic<bool>& running);

    LoopState state() const { return state_; }
    unsigned consecutiveCount() const { return policy_.consecutiveCount(); }
    const std::optional<Sample>& lastSample() const { return lastSample_; }

private:
    config::MonitorConfig config_;
    sensors::IVoltageSource& voltageSource_;
    load::ILoadSource& loadSource_;
    report::IReporter& reporter_;
    shutdown::IShutdownActuator& actuator_;
    IClock& clock_;
    policy::UndervoltagePolicy policy_;
    LoopState state_ = LoopState::Idle;
    std::optional<Sample> lastSample_;
};

} // namespace control
} // namespace railguard
