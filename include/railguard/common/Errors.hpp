#pragma once
#include <stdexcept>
#include <string>

namespace railguard {

// Ни один канал напряжения не читается: мониторинг невозможен
class SensorUnavailable : public std::runtime_error {
public:
    explicit SensorUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Команда выключения не выполнилась или вернула ошибку
class ShutdownFailure : public std::runtime_error {
public:
    explicit ShutdownFailure(const std::string& what) : std::runtime_error(what) {}
};

// Некорректная конфигурация (файл, аргументы командной строки)
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace railguard
