#pragma once
#include <chrono>

namespace railguard {

// Источник времени и ожидания для цикла мониторинга (подменяется в тестах)
class IClock {
public:
    virtual ~IClock() = default;
    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

} // namespace railguard
