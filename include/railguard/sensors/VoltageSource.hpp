#pragma once
#include <string>
#include <vector>

namespace railguard {
namespace sensors {

// Канал hwmon: inN_label прошёл фильтр, значение читается из inN_input (мВ)
struct SensorChannel {
    std::string name;       // "in1"
    std::string label;      // "VDD_IN"
    std::string inputPath;
};

// Результат обнаружения каналов. Строится один раз при старте
struct SensorContext {
    std::string devicePath;
    std::vector<SensorChannel> channels;

    // Ищет hwmon* в devicePath и каналы, чья метка содержит labelFilter.
    // Бросает SensorUnavailable, если не найдено ни одного канала
    static SensorContext discover(const std::string& devicePath, const std::string& labelFilter);
};

// Источник напряжения шины
class IVoltageSource {
public:
    virtual ~IVoltageSource() = default;

    // Напряжение шины в вольтах (сумма по каналам). Бросает SensorUnavailable
    virtual double readRawVoltage() = 0;
};

// Чтение INA3221 через sysfs hwmon. Значения каналов не кэшируются
class HwmonVoltageSource : public IVoltageSource {
public:
    explicit HwmonVoltageSource(SensorContext context);

    double readRawVoltage() override;

    const SensorContext& context() const { return context_; }

private:
    SensorContext context_;
};

} // namespace sensors
} // namespace railguard
