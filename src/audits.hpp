#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model.hpp"
#include "long_tasks.hpp"
#include "analysis.hpp"

enum class ScoreDisplayMode { Informative, Binary, NotApplicable };

const char* score_display_mode_name(ScoreDisplayMode m);

// Column of a table detail. granularity: rounding step of "ms" values.
struct TableHeading
{
    std::string key;        // "url", "start", "duration", "end"
    std::string itemType;   // "url", "ms"
    double      granularity = 1.0;
    std::string text;
};

struct AuditMeta
{
    std::string id;
    std::string title;
    std::string description;
    ScoreDisplayMode scoreDisplayMode = ScoreDisplayMode::Informative;
};

struct AuditResult
{
    AuditMeta meta;
    double score = 1.0;
    bool notApplicable = false;
    std::optional<std::string> displayValue;
    std::vector<TableHeading> headings;
    std::vector<AttributedRow> items;
};

struct AuditOptions
{
    double thresholdMs = kLongTaskThresholdMs;
};

using AuditFn = bool (*)(const AuditArtifacts&, AnalysisContext&, const AuditOptions&, AuditResult&, std::string*);

struct AuditDefinition
{
    AuditMeta meta;
    AuditFn   run;
};

// Longest top-level tasks, attributed, with the "N long tasks found" summary.
bool run_long_tasks_audit(const AuditArtifacts& artifacts, AnalysisContext& ctx, const AuditOptions& opts, AuditResult& out, std::string* outError = nullptr);
// Same selection listed with start/end times and no summary.
bool run_main_thread_tasks_audit(const AuditArtifacts& artifacts, AnalysisContext& ctx, const AuditOptions& opts, AuditResult& out, std::string* outError = nullptr);

const std::vector<AuditDefinition>& audit_registry();
const AuditDefinition* find_audit(std::string_view id);

// Runs `def`, logging the outcome. Collaborator errors are returned unchanged.
bool run_audit(const AuditDefinition& def, const AuditArtifacts& artifacts, AnalysisContext& ctx, const AuditOptions& opts, AuditResult& out, std::string* outError = nullptr);
