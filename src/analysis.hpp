#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "model.hpp"
#include "computed_cache.hpp"

using TaskForestPtr = std::shared_ptr<const TaskForest>;
using NetworkRecordsPtr = std::shared_ptr<const std::vector<ResourceRecord>>;

// Raw inputs of one run: the trace and, when available, the DevTools log.
struct AuditArtifacts
{
    std::string traceJson;
    std::optional<std::string> devtoolsLogJson;
};

// Read both files. An empty devtools path leaves devtoolsLogJson unset.
bool load_artifacts(const std::string& tracePath, const std::string& devtoolsLogPath, AuditArtifacts& out, std::string* outError = nullptr);

// Collaborator results memoized per input, shared by every audit of a run.
class AnalysisContext
{
public:
    // Task forest of the trace (built, validated, then cached).
    bool mainThreadTasks(const std::string& traceJson, TaskForestPtr& out, std::string* outError = nullptr);
    // Network records of the DevTools log; an absent log yields no records.
    bool networkRecords(const std::optional<std::string>& devtoolsLogJson, NetworkRecordsPtr& out, std::string* outError = nullptr);

    const ComputedCache<TaskForestPtr>& taskCache() const { return _tasks; }
    const ComputedCache<NetworkRecordsPtr>& recordCache() const { return _records; }

    // Forget results computed from any other input than `artifacts`.
    void retainOnly(const AuditArtifacts& artifacts);
    void clear();

private:
    ComputedCache<TaskForestPtr> _tasks;
    ComputedCache<NetworkRecordsPtr> _records;
};
