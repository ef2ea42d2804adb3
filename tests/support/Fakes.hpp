#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <string>
#include <vector>
#include "railguard/common/Clock.hpp"
#include "railguard/common/Errors.hpp"
#include "railguard/load/LoadSource.hpp"
#include "railguard/process/CommandRunner.hpp"
#include "railguard/report/SampleReporter.hpp"
#include "railguard/sensors/VoltageSource.hpp"
#include "railguard/shutdown/ShutdownActuator.hpp"

namespace railguard {
namespace testing {

// Выдаёт напряжения по очереди; пустая очередь -> SensorUnavailable
class ScriptedVoltageSource : public sensors::IVoltageSource {
public:
    explicit ScriptedVoltageSource(std::deque<double> voltages) : voltages_(std::move(voltages)) {}

    double readRawVoltage() override {
        if (voltages_.empty()) {
            throw SensorUnavailable("scripted source exhausted");
        }
        double v = voltages_.front();
        voltages_.pop_front();
        return v;
    }

private:
    std::deque<double> voltages_;
};

class FixedLoadSource : public load::ILoadSource {
public:
    FixedLoadSource(double cpu = 0.0, double gpu = 0.0) {
        reading_.cpuPercent = cpu;
        reading_.gpuPercent = gpu;
    }
    load::LoadReading readLoads() override { return reading_; }

private:
    load::LoadReading reading_;
};

class RecordingReporter : public report::IReporter {
public:
    struct Entry {
        Sample sample;
        policy::PolicyDecision decision;
    };

    void record(const Sample& sample, const policy::PolicyDecision& decision) override {
        entries.push_back({sample, decision});
    }

    std::vector<Entry> entries;
};

class CountingActuator : public shutdown::IShutdownActuator {
public:
    explicit CountingActuator(bool fail = false) : fail_(fail) {}

    void shutdown() override {
        ++calls;
        if (fail_) {
            throw ShutdownFailure("permission denied");
        }
    }

    int calls = 0;

private:
    bool fail_;
};

// Время идёт только через sleepFor
class FakeClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override { return now_; }
    void sleepFor(std::chrono::milliseconds duration) override {
        now_ += duration;
        sleeps.push_back(duration);
    }

    std::vector<std::chrono::milliseconds> sleeps;

private:
    std::chrono::system_clock::time_point now_{};
};

// Ответы по имени программы (argv[0]); неизвестная программа считается отсутствующей
class FakeCommandRunner : public process::ICommandRunner {
public:
    std::optional<process::CommandResult> run(const std::vector<std::string>& argv,
                                              std::chrono::milliseconds) override {
        invocations.push_back(argv);
        auto it = responses.find(argv.front());
        if (it == responses.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void respond(const std::string& program, int exitCode, std::string output, bool timedOut = false) {
        process::CommandResult result;
        result.exitCode = exitCode;
        result.output = std::move(output);
        result.timedOut = timedOut;
        responses[program] = result;
    }

    std::map<std::string, process::CommandResult> responses;
    std::vector<std::vector<std::string>> invocations;
};

} // namespace testing
} // namespace railguard
