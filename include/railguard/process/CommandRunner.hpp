#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace railguard {
namespace process {

struct CommandResult {
    int exitCode = -1;       // -1, если процесс убит по таймауту или сигналом
    bool timedOut = false;
    std::string output;      // stdout, собранный до завершения или таймаута
};

// Запуск внешних утилит (nvidia-smi, tegrastats, shutdown)
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // std::nullopt: процесс не удалось запустить (нет бинарника, fork/pipe упал)
    virtual std::optional<CommandResult> run(const std::vector<std::string>& argv,
                                             std::chrono::milliseconds timeout) = 0;
};

// fork/execvp с ограничением по времени; по истечении таймаута процесс получает SIGTERM, затем SIGKILL
class PosixCommandRunner : public ICommandRunner {
public:
    std::optional<CommandResult> run(const std::vector<std::string>& argv,
                                     std::chrono::milliseconds timeout) override;
};

} // namespace process
} // namespace railguard
