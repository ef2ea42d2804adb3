#pragma once

namespace railguard {
namespace policy {

// Решение политики по одному замеру
struct PolicyDecision {
    unsigned consecutiveCount = 0;  // счётчик после учёта замера
    bool tripped = false;           // требуется выключение
};

// Счётчик подряд идущих замеров ниже порога.
// Замер строго ниже порога увеличивает счётчик, равный порогу или выше сбрасывает его.
// Срабатывание: счётчик превысил limit (limit подряд замеров ещё не срабатывание).
// После срабатывания счётчик обнуляется, чтобы в отладочном режиме не срабатывать каждый цикл
class UndervoltagePolicy {
public:
    explicit UndervoltagePolicy(unsigned undervoltageLimit);

    PolicyDecision evaluate(double correctedVoltage, double thresholdVoltage);

    unsigned consecutiveCount() const { return count_; }
    unsigned limit() const { return limit_; }

private:
    unsigned limit_;
    unsigned count_ = 0;
};

} // namespace policy
} // namespace railguard
