#include "config.hpp"
#include "parser.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>

using json = nlohmann::json;

namespace
{
    bool checkOutput(const std::string& v, std::string* outError)
    {
        if (v == "text" || v == "json") return true;
        if (outError) *outError = "output must be \"text\" or \"json\", got \"" + v + "\"";
        return false;
    }

    bool checkThreshold(double v, std::string* outError)
    {
        if (v >= 0.0) return true;
        if (outError) *outError = "threshold must be >= 0 ms";
        return false;
    }
} // namespace

bool parse_config(const std::string& jsonText, AppConfig& cfg, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(jsonText);
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
    if (!root.is_object())
    {
        if (outError) *outError = "config root must be an object";
        return false;
    }

    AppConfig next = cfg;
    try
    {
        next.tracePath = root.value("trace", next.tracePath);
        next.devtoolsLogPath = root.value("devtoolsLog", next.devtoolsLogPath);
        next.audit = root.value("audit", next.audit);
        next.thresholdMs = root.value("thresholdMs", next.thresholdMs);
        next.output = root.value("output", next.output);
        next.logLevel = root.value("logLevel", next.logLevel);
        next.autoReload = root.value("autoReload", next.autoReload);
        next.autoReloadIntervalS = root.value("autoReloadIntervalS", next.autoReloadIntervalS);
    }
    catch (const json::exception& e)
    {
        if (outError) *outError = e.what();
        return false;
    }

    if (!checkThreshold(next.thresholdMs, outError)) return false;
    if (!checkOutput(next.output, outError)) return false;

    cfg = std::move(next);
    return true;
}

bool load_config(const std::string& path, AppConfig& cfg, std::string* outError)
{
    std::string text;
    if (!read_file(path, text))
    {
        if (outError) *outError = "Failed to open config file: " + path;
        return false;
    }
    if (!parse_config(text, cfg, outError))
    {
        if (outError) *outError = path + ": " + *outError;
        return false;
    }
    spdlog::debug("config loaded from {}", path);
    return true;
}

bool apply_command_line(const std::vector<std::string>& args, AppConfig& cfg, std::string* outError)
{
    auto fail = [&](const std::string& msg)
    {
        if (outError) *outError = msg;
        return false;
    };

    // --config first, so the other flags override the file
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] != "--config") continue;
        if (i + 1 >= args.size()) return fail("--config needs a value");
        if (!load_config(args[i + 1], cfg, outError)) return false;
    }

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& a = args[i];
        auto value = [&](std::string& dst)
        {
            if (i + 1 >= args.size()) return fail(a + " needs a value");
            dst = args[++i];
            return true;
        };

        if (a == "--config") { ++i; continue; }
        if (a == "--trace") { if (!value(cfg.tracePath)) return false; continue; }
        if (a == "--devtools-log") { if (!value(cfg.devtoolsLogPath)) return false; continue; }
        if (a == "--audit") { if (!value(cfg.audit)) return false; continue; }
        if (a == "--log-level") { if (!value(cfg.logLevel)) return false; continue; }
        if (a == "--json") { cfg.output = "json"; continue; }
        if (a == "--threshold")
        {
            std::string v;
            if (!value(v)) return false;
            char* end = nullptr;
            const double ms = std::strtod(v.c_str(), &end);
            if (v.empty() || end != v.c_str() + v.size()) return fail("--threshold expects a number, got \"" + v + "\"");
            if (!checkThreshold(ms, outError)) return false;
            cfg.thresholdMs = ms;
            continue;
        }
        if (!a.empty() && a[0] == '-') return fail("unknown option " + a);
        cfg.tracePath = a;
    }
    return true;
}

bool apply_log_level(const std::string& level, std::string* outError)
{
    const auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off")
    {
        if (outError) *outError = "unknown log level \"" + level + "\"";
        return false;
    }
    spdlog::set_level(lvl);
    return true;
}
