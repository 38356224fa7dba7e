#include "analysis.hpp"
#include "parser.hpp"
#include "main_thread_tasks.hpp"
#include "network_records.hpp"

#include <spdlog/spdlog.h>

namespace
{
    constexpr const char* kTasksKey = "MainThreadTasks";
    constexpr const char* kRecordsKey = "NetworkRecords";
} // namespace

bool load_artifacts(const std::string& tracePath, const std::string& devtoolsLogPath, AuditArtifacts& out, std::string* outError)
{
    out = AuditArtifacts{};
    if (!read_file(tracePath, out.traceJson))
    {
        if (outError) *outError = "Failed to open trace file: " + tracePath;
        return false;
    }
    if (!devtoolsLogPath.empty())
    {
        std::string log;
        if (!read_file(devtoolsLogPath, log))
        {
            if (outError) *outError = "Failed to open DevTools log: " + devtoolsLogPath;
            return false;
        }
        out.devtoolsLogJson = std::move(log);
    }
    spdlog::info("loaded {} ({} bytes){}", tracePath, out.traceJson.size(),
        out.devtoolsLogJson ? " with DevTools log " + devtoolsLogPath : std::string());
    return true;
}

bool AnalysisContext::mainThreadTasks(const std::string& traceJson, TaskForestPtr& out, std::string* outError)
{
    const CacheKey key{ kTasksKey, content_identity(traceJson) };
    const bool hit = _tasks.get(key).has_value();
    spdlog::debug("MainThreadTasks {} ({})", hit ? "cache hit" : "cache miss", key.identity);

    return _tasks.get_or_compute(key, out, [&](TaskForestPtr& v)
    {
        std::vector<TraceEvent> events;
        if (!parse_trace_payload(traceJson, events, outError))
            return false;

        auto forest = std::make_shared<TaskForest>();
        if (!build_main_thread_tasks(events, *forest, outError))
            return false;
        if (!validate_task_forest(*forest, outError))
            return false;

        spdlog::info("main thread: {} tasks over {:.1f} ms", forest->size(), forest->traceEnd);
        v = std::move(forest);
        return true;
    });
}

bool AnalysisContext::networkRecords(const std::optional<std::string>& devtoolsLogJson, NetworkRecordsPtr& out, std::string* outError)
{
    if (!devtoolsLogJson)
    {
        spdlog::warn("no DevTools log, script URLs cannot be confirmed");
        out = std::make_shared<const std::vector<ResourceRecord>>();
        return true;
    }

    const CacheKey key{ kRecordsKey, content_identity(*devtoolsLogJson) };
    spdlog::debug("NetworkRecords {} ({})", _records.get(key) ? "cache hit" : "cache miss", key.identity);

    return _records.get_or_compute(key, out, [&](NetworkRecordsPtr& v)
    {
        auto records = std::make_shared<std::vector<ResourceRecord>>();
        if (!parse_devtools_log(*devtoolsLogJson, *records, outError))
            return false;
        spdlog::info("network: {} records", records->size());
        v = std::move(records);
        return true;
    });
}

void AnalysisContext::retainOnly(const AuditArtifacts& artifacts)
{
    const size_t before = _tasks.size() + _records.size();
    _tasks.retain_only(kTasksKey, content_identity(artifacts.traceJson));
    _records.retain_only(kRecordsKey, artifacts.devtoolsLogJson
        ? std::optional<std::string>(content_identity(*artifacts.devtoolsLogJson))
        : std::nullopt);
    const size_t after = _tasks.size() + _records.size();
    if (after != before)
        spdlog::debug("analysis cache: dropped {} stale entries", before - after);
}

void AnalysisContext::clear()
{
    _tasks.clear();
    _records.clear();
}
