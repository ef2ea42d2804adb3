#include "railguard/process/CommandRunner.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace railguard {
namespace process {

namespace {

// execvp в дочернем процессе вернул ошибку
constexpr int kExecFailed = 127;

int exitCodeOf(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

int waitChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return exitCodeOf(status);
}

// Ждёт завершения до deadline; std::nullopt, если процесс ещё жив
std::optional<int> waitChildUntil(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        int status = 0;
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            return exitCodeOf(status);
        }
        if (done < 0 && errno != EINTR) {
            return -1;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        ::usleep(10 * 1000);
    }
}

void terminateChild(pid_t pid) {
    ::kill(pid, SIGTERM);
    for (int i = 0; i < 10; ++i) {
        int status = 0;
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid || (done < 0 && errno != EINTR)) {
            return;
        }
        ::usleep(10 * 1000);
    }
    ::kill(pid, SIGKILL);
    waitChild(pid);
}

} // namespace

std::optional<CommandResult> PosixCommandRunner::run(const std::vector<std::string>& argv,
                                                     std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::nullopt;
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        spdlog::debug("CommandRunner: pipe failed: {}", std::strerror(errno));
        return std::nullopt;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        spdlog::debug("CommandRunner: fork failed: {}", std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return std::nullopt;
    }
    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(kExecFailed);
    }
    ::close(fds[1]);

    CommandResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    bool eof = false;
    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }
        struct pollfd pfd{fds[0], POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            result.timedOut = true;
            break;
        }
        ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            eof = true;
        }
    }
    ::close(fds[0]);

    // Процесс мог закрыть stdout и продолжать работу
    std::optional<int> exitCode;
    if (!result.timedOut) {
        exitCode = waitChildUntil(pid, deadline);
        result.timedOut = !exitCode.has_value();
    }

    if (result.timedOut) {
        terminateChild(pid);
        result.exitCode = -1;
        spdlog::trace("CommandRunner: '{}' stopped after {} ms", argv.front(), timeout.count());
        return result;
    }

    result.exitCode = *exitCode;
    if (result.exitCode == kExecFailed) {
        spdlog::trace("CommandRunner: '{}' could not be executed", argv.front());
        return std::nullopt;
    }
    return result;
}

} // namespace process
} // namespace railguard
