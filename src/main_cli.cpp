#include "config.hpp"
#include "analysis.hpp"
#include "audits.hpp"
#include "report.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>
#include <vector>

namespace
{
    void printUsage()
    {
        std::cerr <<
            "usage: tasklens [options] [trace.json]\n"
            "  --trace <file>          Chrome trace (traceEvents JSON)\n"
            "  --devtools-log <file>   DevTools protocol log of the same load\n"
            "  --audit <id>            long-tasks (default) | main-thread-tasks\n"
            "  --threshold <ms>        minimum task duration (default 50)\n"
            "  --json                  print the audit result as JSON\n"
            "  --config <file>         JSON config, overridden by the flags above\n"
            "  --log-level <level>     trace|debug|info|warn|err|critical|off\n";
    }
} // namespace

int main(int argc, char** argv)
{
    // diagnostics on stderr, report on stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("tasklens"));

    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto& a : args)
    {
        if (a == "-h" || a == "--help")
        {
            printUsage();
            return 0;
        }
    }

    AppConfig cfg;
    std::string err;
    if (!apply_command_line(args, cfg, &err) || !apply_log_level(cfg.logLevel, &err))
    {
        spdlog::error("{}", err);
        printUsage();
        return 2;
    }
    if (cfg.tracePath.empty())
    {
        spdlog::error("no trace given");
        printUsage();
        return 2;
    }
    const AuditDefinition* audit = find_audit(cfg.audit);
    if (!audit)
    {
        spdlog::error("unknown audit \"{}\"", cfg.audit);
        return 2;
    }

    AuditArtifacts artifacts;
    if (!load_artifacts(cfg.tracePath, cfg.devtoolsLogPath, artifacts, &err))
    {
        spdlog::error("{}", err);
        return 1;
    }

    AnalysisContext ctx;
    AuditOptions opts;
    opts.thresholdMs = cfg.thresholdMs;
    AuditResult result;
    if (!run_audit(*audit, artifacts, ctx, opts, result, &err))
        return 1;

    if (cfg.output == "json")
        std::cout << result_to_json(result).dump(2) << '\n';
    else
        std::cout << render_text(result);
    return 0;
}
