#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "railguard/config/MonitorConfig.hpp"

namespace railguard {
namespace logging {

constexpr const char* kLoggerName = "railguard";

// Обработчик ошибок sink'ов: сообщение уходит в stderr, мониторинг продолжается
void reportSinkError(const std::string& message);

// Отладочный режим: цветной вывод в консоль, уровень debug.
// Рабочий режим: ротируемый файл config.logPath, каждая запись сразу сбрасывается на диск.
// Созданный логгер становится логгером spdlog по умолчанию.
// Бросает spdlog::spdlog_ex, если файл лога нельзя открыть
std::shared_ptr<spdlog::logger> initializeLogging(const config::MonitorConfig& config);

} // namespace logging
} // namespace railguard
