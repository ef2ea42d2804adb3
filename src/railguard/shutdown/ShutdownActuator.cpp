#include "railguard/shutdown/ShutdownActuator.hpp"
#include "railguard/common/Errors.hpp"
#include <spdlog/spdlog.h>

namespace railguard {
namespace shutdown {

CommandShutdownActuator::CommandShutdownActuator(process::ICommandRunner& runner,
                                                 std::vector<std::string> command,
                                                 std::chrono::milliseconds timeout)
    : runner_(runner), command_(std::move(command)), timeout_(timeout) {}

void CommandShutdownActuator::shutdown() {
    if (command_.empty()) {
        throw ShutdownFailure("shutdown command is not configured");
    }
    spdlog::warn("Undervoltage threshold exceeded. Initiating shutdown.");

    auto result = runner_.run(command_, timeout_);
    if (!result) {
        throw ShutdownFailure("cannot execute " + command_.front());
    }
    if (result->timedOut) {
        throw ShutdownFailure(command_.front() + " did not finish in " + std::to_string(timeout_.count()) + " ms");
    }
    if (result->exitCode != 0) {
        throw ShutdownFailure(command_.front() + " exited with status " + std::to_string(result->exitCode));
    }
    spdlog::info("Shutdown command accepted");
}

} // namespace shutdown
} // namespace railguard
