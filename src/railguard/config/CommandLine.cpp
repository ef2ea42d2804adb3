#include "railguard/config/CommandLine.hpp"
#include "railguard/common/Errors.hpp"
#include <getopt.h>
#include <cmath>
#include <optional>
#include <sstream>

namespace railguard {
namespace config {

namespace {

enum LongOnly { OPT_DEBUG = 1000 };

const struct option kLongOptions[] = {
    {"threshold", required_argument, nullptr, 't'},
    {"interval", required_argument, nullptr, 'i'},
    {"log", required_argument, nullptr, 'l'},
    {"undervoltage_limit", required_argument, nullptr, 'u'},
    {"config", required_argument, nullptr, 'c'},
    {"debug", no_argument, nullptr, OPT_DEBUG},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
};

double parseDouble(const char* flag, const std::string& text) {
    try {
        size_t pos = 0;
        double value = std::stod(text, &pos);
        if (pos != text.size() || !std::isfinite(value)) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("invalid value for ") + flag + ": '" + text + "'");
    }
}

unsigned parseCount(const char* flag, const std::string& text) {
    long long value = 0;
    try {
        size_t pos = 0;
        value = std::stoll(text, &pos);
        if (pos != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("invalid value for ") + flag + ": '" + text + "'");
    }
    try {
        return undervoltageLimitFromCount(value);
    } catch (const ConfigError& e) {
        throw ConfigError(std::string("invalid value for ") + flag + ": " + e.what());
    }
}

} // namespace

CommandLineOptions parseCommandLine(int argc, char* argv[]) {
    std::optional<double> threshold;
    std::optional<double> interval;
    std::optional<std::string> logPath;
    std::optional<unsigned> limit;
    bool debug = false;

    CommandLineOptions options;

    // optind = 0 заставляет glibc полностью переинициализировать разбор
    optind = 0;
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, ":t:i:l:u:c:h", kLongOptions, nullptr)) != -1) {
        switch (opt) {
            case 't': threshold = parseDouble("--threshold", optarg); break;
            case 'i': interval = parseDouble("--interval", optarg); break;
            case 'l': logPath = optarg; break;
            case 'u': limit = parseCount("--undervoltage_limit", optarg); break;
            case 'c': options.configFile = optarg; break;
            case OPT_DEBUG: debug = true; break;
            case 'h': options.showHelp = true; break;
            case ':':
                throw ConfigError(std::string("missing value for ") + argv[optind - 1]);
            default:
                throw ConfigError(std::string("unknown option ") + argv[optind - 1]);
        }
    }
    if (optind < argc) {
        throw ConfigError(std::string("unexpected argument ") + argv[optind]);
    }
    if (options.showHelp) {
        return options;
    }

    if (!options.configFile.empty()) {
        options.config = MonitorConfig::loadFromFile(options.configFile);
    }
    if (threshold) options.config.thresholdVoltage = *threshold;
    if (interval) {
        try {
            options.config.interval = intervalFromSeconds(*interval);
        } catch (const ConfigError& e) {
            throw ConfigError(std::string("invalid value for --interval: ") + e.what());
        }
    }
    if (logPath) options.config.logPath = *logPath;
    if (limit) options.config.undervoltageLimit = *limit;
    if (debug) options.config.debugMode = true;

    std::string reason;
    if (!options.config.validate(&reason)) {
        throw ConfigError("invalid configuration: " + reason);
    }
    return options;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "Monitor the supply rail and shut the system down on sustained undervoltage.\n\n"
        << "  -t, --threshold V            voltage threshold in volts (default 14.5)\n"
        << "  -i, --interval S             sampling interval in seconds (default 1.0)\n"
        << "  -l, --log PATH               log file path\n"
        << "  -u, --undervoltage_limit N   consecutive readings below threshold before shutdown (default 10)\n"
        << "  -c, --config FILE            JSON configuration file, flags override it\n"
        << "      --debug                  console output only, shutdown suppressed\n"
        << "  -h, --help                   show this help\n";
    return out.str();
}

} // namespace config
} // namespace railguard
