#include "audits.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace
{
    AuditMeta longTasksMeta()
    {
        return { "long-tasks",
                 "Long main thread tasks",
                 "Lists the longest tasks on the main thread, useful for identifying worst contributors to input delay.",
                 ScoreDisplayMode::Informative };
    }

    AuditMeta mainThreadTasksMeta()
    {
        return { "main-thread-tasks",
                 "Tasks",
                 "Lists the toplevel main thread tasks that executed during page load.",
                 ScoreDisplayMode::Informative };
    }

    // Forest + script URLs -> attributed rows
    bool attributedRows(const AuditArtifacts& artifacts, AnalysisContext& ctx, const AuditOptions& opts, std::vector<AttributedRow>& rows, std::string* outError)
    {
        TaskForestPtr tasks;
        if (!ctx.mainThreadTasks(artifacts.traceJson, tasks, outError))
            return false;
        NetworkRecordsPtr records;
        if (!ctx.networkRecords(artifacts.devtoolsLogJson, records, outError))
            return false;

        const auto jsUrls = javascript_urls(*records);
        rows = attribute_long_tasks(*tasks, jsUrls, opts.thresholdMs);
        return true;
    }
} // namespace

const char* score_display_mode_name(ScoreDisplayMode m)
{
    switch (m)
    {
        case ScoreDisplayMode::Informative:   return "informative";
        case ScoreDisplayMode::Binary:        return "binary";
        case ScoreDisplayMode::NotApplicable: return "notApplicable";
    }
    return "informative";
}

bool run_long_tasks_audit(const AuditArtifacts& artifacts, AnalysisContext& ctx, const AuditOptions& opts, AuditResult& out, std::string* outError)
{
    out = AuditResult{};
    out.meta = longTasksMeta();

    if (!attributedRows(artifacts, ctx, opts, out.items, outError))
        return false;

    out.headings = {
        { "url",      "url", 1.0,  "URL" },
        { "start",    "ms",  10.0, "Start Time" },
        { "duration", "ms",  10.0, "Duration" },
    };
    out.score = 1.0;
    out.displayValue = long_tasks_display_value(out.items.size());
    // nothing blocked the main thread long enough to list
    out.notApplicable = out.items.empty();
    return true;
}

bool run_main_thread_tasks_audit(const AuditArtifacts& artifacts, AnalysisContext& ctx, const AuditOptions& opts, AuditResult& out, std::string* outError)
{
    out = AuditResult{};
    out.meta = mainThreadTasksMeta();

    if (!attributedRows(artifacts, ctx, opts, out.items, outError))
        return false;

    out.headings = {
        { "url",      "url", 1.0, "URL" },
        { "start",    "ms",  1.0, "Start Time" },
        { "duration", "ms",  1.0, "Duration" },
        { "end",      "ms",  1.0, "End Time" },
    };
    out.score = 1.0;
    return true;
}

const std::vector<AuditDefinition>& audit_registry()
{
    static const std::vector<AuditDefinition> kAudits = {
        { longTasksMeta(),       &run_long_tasks_audit },
        { mainThreadTasksMeta(), &run_main_thread_tasks_audit },
    };
    return kAudits;
}

const AuditDefinition* find_audit(std::string_view id)
{
    const auto& reg = audit_registry();
    auto it = std::find_if(reg.begin(), reg.end(), [&](const AuditDefinition& d) { return d.meta.id == id; });
    return it != reg.end() ? &*it : nullptr;
}

bool run_audit(const AuditDefinition& def, const AuditArtifacts& artifacts, AnalysisContext& ctx, const AuditOptions& opts, AuditResult& out, std::string* outError)
{
    std::string err;
    if (!def.run(artifacts, ctx, opts, out, &err))
    {
        spdlog::error("{}: {}", def.meta.id, err);
        if (outError) *outError = err;
        return false;
    }
    spdlog::info("{}: {} rows (threshold {} ms)", def.meta.id, out.items.size(), opts.thresholdMs);
    return true;
}
