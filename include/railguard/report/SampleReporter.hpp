#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "railguard/common/Sample.hpp"
#include "railguard/policy/UndervoltagePolicy.hpp"

namespace railguard {
namespace report {

// Запись одного замера за цикл. Не бросает: сбой записи не останавливает мониторинг
class IReporter {
public:
    virtual ~IReporter() = default;
    virtual void record(const Sample& sample, const policy::PolicyDecision& decision) = 0;
};

enum class ReportFormat {
    Human,      // строка для консоли
    Structured  // JSON-строка для файла лога
};

class SampleReporter : public IReporter {
public:
    SampleReporter(std::shared_ptr<spdlog::logger> logger, ReportFormat format);

    void record(const Sample& sample, const policy::PolicyDecision& decision) override;

    // Поля в порядке: ts, raw_v, cpu_pct, gpu_pct, corrected_v, count, tripped.
    // Напряжения округлены до 3 знаков, проценты до 1
    static std::string formatStructured(const Sample& sample, const policy::PolicyDecision& decision);
    static std::string formatHuman(const Sample& sample, const policy::PolicyDecision& decision);

private:
    std::shared_ptr<spdlog::logger> logger_;
    ReportFormat format_;
};

} // namespace report
} // namespace railguard
