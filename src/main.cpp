#include <iostream>
#include <memory>
#include <signal.h>
#include <atomic>
#include <spdlog/spdlog.h>

#include "railguard/common/Clock.hpp"
#include "railguard/common/Errors.hpp"
#include "railguard/config/CommandLine.hpp"
#include "railguard/control/ControlLoop.hpp"
#include "railguard/load/LoadSource.hpp"
#include "railguard/logging/Logging.hpp"
#include "railguard/process/CommandRunner.hpp"
#include "railguard/report/SampleReporter.hpp"
#include "railguard/sensors/VoltageSource.hpp"
#include "railguard/shutdown/ShutdownActuator.hpp"

using namespace railguard;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitShutdownFailed = 2;

// Flag checked by the control loop between cycles
std::atomic<bool> g_running{true};
volatile sig_atomic_t g_signal = 0;

void signalHandler(int signal) {
    g_signal = signal;
    g_running = false;
}

} // namespace

int main(int argc, char* argv[]) {
    config::CommandLineOptions options;
    try {
        options = config::parseCommandLine(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "railguard: " << e.what() << "\n\n" << config::usage(argv[0]);
        return kExitFailure;
    }
    if (options.showHelp) {
        std::cout << config::usage(argv[0]);
        return kExitOk;
    }
    const config::MonitorConfig& cfg = options.config;

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = logging::initializeLogging(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        return kExitFailure;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        process::PosixCommandRunner runner;

        auto sensorContext = sensors::SensorContext::discover(cfg.hwmonDevicePath(), cfg.channelLabelFilter);
        sensors::HwmonVoltageSource voltageSource(std::move(sensorContext));

        auto loadSource = load::SystemLoadSource::create(load::LoadContext::fromConfig(cfg), runner);

        report::SampleReporter reporter(logger, cfg.debugMode ? report::ReportFormat::Human
                                                              : report::ReportFormat::Structured);
        shutdown::CommandShutdownActuator actuator(runner, cfg.shutdownCommand);
        SystemClock clock;

        control::ControlLoop loop(cfg, voltageSource, *loadSource, reporter, actuator, clock);
        control::LoopExit outcome = loop.run(g_running);

        if (outcome == control::LoopExit::Stopped && g_signal != 0) {
            spdlog::info("Received signal {}, monitoring stopped", static_cast<int>(g_signal));
        }
        logger->flush();
        return kExitOk;

    } catch (const ShutdownFailure& e) {
        spdlog::critical("Protective shutdown could not be completed: {}", e.what());
        logger->flush();
        return kExitShutdownFailed;
    } catch (const SensorUnavailable& e) {
        spdlog::error("Voltage monitoring failed: {}", e.what());
        logger->flush();
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        spdlog::critical("Fatal error: {}", e.what());
        logger->flush();
        return kExitFailure;
    }
}
