#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "railguard/common/Errors.hpp"
#include "railguard/config/CommandLine.hpp"
#include "railguard/config/MonitorConfig.hpp"
#include "support/TempDir.hpp"

using railguard::ConfigError;
using railguard::config::CommandLineOptions;
using railguard::config::MonitorConfig;
using railguard::config::parseCommandLine;
using railguard::testing::TempDir;

CommandLineOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "railguard");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return parseCommandLine(static_cast<int>(args.size()), argv.data());
}

bool parseThrows(std::vector<std::string> args) {
    try {
        parse(std::move(args));
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

void testDefaults() {
    auto options = parse({});
    const auto& cfg = options.config;
    assert(cfg.thresholdVoltage == 14.5);
    assert(cfg.interval == std::chrono::milliseconds(1000));
    assert(cfg.undervoltageLimit == 10);
    assert(!cfg.debugMode);
    assert(!cfg.logPath.empty());
    assert(cfg.hwmonDevicePath() == "/sys/bus/i2c/drivers/ina3221/1-0040/hwmon");
    assert(cfg.validate());
    std::cout << "[OK] default configuration\n";
}

void testFlags() {
    auto options = parse({"-t", "13.2", "--interval", "0.5", "-l", "/tmp/x.log",
                          "--undervoltage_limit=3", "--debug"});
    const auto& cfg = options.config;
    assert(cfg.thresholdVoltage == 13.2);
    assert(cfg.interval == std::chrono::milliseconds(500));
    assert(cfg.logPath == "/tmp/x.log");
    assert(cfg.undervoltageLimit == 3);
    assert(cfg.debugMode);

    assert(parse({"-h"}).showHelp);
    std::cout << "[OK] command line flags\n";
}

void testInvalidFlags() {
    assert(parseThrows({"-t", "abc"}));
    assert(parseThrows({"-i", "0"}));
    assert(parseThrows({"-i", "-1"}));
    assert(parseThrows({"-u", "0"}));
    assert(parseThrows({"-u", "-2"}));
    assert(parseThrows({"--bogus"}));
    assert(parseThrows({"-t"}));
    assert(parseThrows({"extra"}));
    std::cout << "[OK] invalid flags rejected\n";
}

void testOutOfRangeNumbers() {
    // Значения вне unsigned не должны сворачиваться в маленький порог
    assert(parseThrows({"-u", "4294967297"}));
    assert(parseThrows({"-u", "4294967296"}));
    assert(parseThrows({"-u", "99999999999999999999"}));
    assert(parse({"-u", "4294967295"}).config.undervoltageLimit == 4294967295u);

    assert(parseThrows({"-i", "1e300"}));
    assert(parseThrows({"-i", "9223372036854776"}));
    assert(parse({"-i", "86400"}).config.interval == std::chrono::hours(24));

    TempDir dir;
    dir.write("limit.json", R"({"undervoltage_limit": 4294967297})");
    dir.write("interval.json", R"({"interval": 1e300})");
    dir.write("negative.json", R"({"interval": -1.0})");
    assert(parseThrows({"-c", (dir.path() / "limit.json").string()}));
    assert(parseThrows({"-c", (dir.path() / "interval.json").string()}));
    assert(parseThrows({"-c", (dir.path() / "negative.json").string()}));

    bool thrown = false;
    try {
        MonitorConfig::fromJson(nlohmann::json{{"undervoltage_limit", 4294967297LL}});
    } catch (const ConfigError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] out of range numbers rejected\n";
}

void testJsonFileAndOverride() {
    TempDir dir;
    dir.write("railguard.json", R"({
        "threshold": 12.0,
        "interval": 2.5,
        "undervoltage_limit": 4,
        "i2c_address": "7-0040",
        "channel_label_filter": "VIN",
        "shutdown_command": ["/usr/bin/systemctl", "poweroff"]
    })");
    std::string path = (dir.path() / "railguard.json").string();

    auto options = parse({"-c", path, "-t", "11.5"});
    const auto& cfg = options.config;
    assert(cfg.thresholdVoltage == 11.5);
    assert(cfg.interval == std::chrono::milliseconds(2500));
    assert(cfg.undervoltageLimit == 4);
    assert(cfg.i2cAddress == "7-0040");
    assert(cfg.channelLabelFilter == "VIN");
    assert(cfg.shutdownCommand.size() == 2 && cfg.shutdownCommand[1] == "poweroff");
    assert(cfg.driverBus == "ina3221");

    auto again = MonitorConfig::fromJson(cfg.toJson());
    assert(again.toJson() == cfg.toJson());
    std::cout << "[OK] JSON configuration file\n";
}

void testBadJson() {
    TempDir dir;
    dir.write("broken.json", "{ threshold: ");
    dir.write("wrongtype.json", R"({"threshold": "high"})");
    assert(parseThrows({"-c", (dir.path() / "broken.json").string()}));
    assert(parseThrows({"-c", (dir.path() / "wrongtype.json").string()}));
    assert(parseThrows({"-c", (dir.path() / "missing.json").string()}));
    std::cout << "[OK] bad JSON configuration rejected\n";
}

int main() {
    testDefaults();
    testFlags();
    testInvalidFlags();
    testOutOfRangeNumbers();
    testJsonFileAndOverride();
    testBadJson();
    std::cout << "All MonitorConfig tests passed!\n";
    return 0;
}
