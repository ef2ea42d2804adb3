#pragma once
#include <chrono>

namespace railguard {

// Один замер цикла мониторинга. Создаётся один раз за итерацию и не меняется
struct Sample {
    std::chrono::system_clock::time_point timestamp;
    double rawVoltage = 0.0;       // В, сумма по каналам
    double cpuLoad = 0.0;          // %, 0..100
    double gpuLoad = 0.0;          // %, 0..100
    double correctedVoltage = 0.0; // В
};

} // namespace railguard
