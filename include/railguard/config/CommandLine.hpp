#pragma once
#include <string>
#include "railguard/config/MonitorConfig.hpp"

namespace railguard {
namespace config {

struct CommandLineOptions {
    MonitorConfig config;
    std::string configFile;
    bool showHelp = false;
};

// Порядок применения: значения по умолчанию, затем файл -c, затем флаги
// Бросает ConfigError на неизвестный флаг или некорректное значение
CommandLineOptions parseCommandLine(int argc, char* argv[]);

std::string usage(const std::string& program);

} // namespace config
} // namespace railguard
