#pragma once
#include <string>
#include <vector>

#include "long_tasks.hpp"

// Settings shared by the CLI and the viewer.
// File format (every key optional):
// {
//   "trace": "page.json",
//   "devtoolsLog": "page.devtools.log.json",
//   "audit": "long-tasks",
//   "thresholdMs": 50,
//   "output": "text" | "json",
//   "logLevel": "info",
//   "autoReload": true,
//   "autoReloadIntervalS": 1.0
// }
struct AppConfig
{
    std::string tracePath;
    std::string devtoolsLogPath;
    std::string audit = "long-tasks";
    double      thresholdMs = kLongTaskThresholdMs;
    std::string output = "text";
    std::string logLevel = "info";
    bool        autoReload = true;
    float       autoReloadIntervalS = 1.0f;
};

// Merge the keys present in a JSON config file into `cfg`.
bool load_config(const std::string& path, AppConfig& cfg, std::string* outError = nullptr);
bool parse_config(const std::string& jsonText, AppConfig& cfg, std::string* outError = nullptr);

// Apply command line flags on top of `cfg`:
//   --config <file> --trace <file> --devtools-log <file> --audit <id>
//   --threshold <ms> --json --log-level <level>
// A positional argument is taken as the trace path.
bool apply_command_line(const std::vector<std::string>& args, AppConfig& cfg, std::string* outError = nullptr);

// spdlog level from its name; false for an unknown name
bool apply_log_level(const std::string& level, std::string* outError = nullptr);
