#pragma once

namespace railguard {
namespace correction {

// Эмпирические коэффициенты поправки на падение напряжения под нагрузкой
constexpr double kCpuCoefficient = 0.00395;  // В на % загрузки CPU
constexpr double kGpuCoefficient = 0.01478;  // В на % загрузки GPU
constexpr double kBaseOffset = 0.560;        // В

// real[V] = raw[V] + 0.00395 * CPU + 0.01478 * GPU + 0.560, без округления
constexpr double correctVoltage(double rawVoltage, double cpuPercent, double gpuPercent) noexcept {
    return rawVoltage + kCpuCoefficient * cpuPercent + kGpuCoefficient * gpuPercent + kBaseOffset;
}

} // namespace correction
} // namespace railguard
