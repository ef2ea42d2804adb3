#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "railguard/process/CommandRunner.hpp"

namespace railguard {
namespace shutdown {

class IShutdownActuator {
public:
    virtual ~IShutdownActuator() = default;

    // Инициирует выключение ОС. Бросает ShutdownFailure, если команда не выполнена
    virtual void shutdown() = 0;
};

// Выполняет команду выключения (по умолчанию /sbin/shutdown now)
class CommandShutdownActuator : public IShutdownActuator {
public:
    CommandShutdownActuator(process::ICommandRunner& runner, std::vector<std::string> command,
                            std::chrono::milliseconds timeout = std::chrono::seconds(30));

    void shutdown() override;

private:
    process::ICommandRunner& runner_;
    std::vector<std::string> command_;
    std::chrono::milliseconds timeout_;
};

} // namespace shutdown
} // namespace railguard
