#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <optional>
#include <unordered_set>
#include <cstddef>

#include "model.hpp"

// A top-level task at least this long blocks input long enough to be noticed (ms).
inline constexpr double kLongTaskThresholdMs = 50.0;
// The report is a top-N list.
inline constexpr size_t kMaxLongTasks = 20;

inline constexpr std::string_view kBrowserLabel = "Browser";
inline constexpr std::string_view kBrowserGCLabel = "Browser GC";
inline constexpr std::string_view kUnattributableLabel = "Unattributable";
inline constexpr std::string_view kBlankPageUrl = "about:blank";

// URLs of every record the network stack classified as script.
std::unordered_set<std::string> javascript_urls(const std::vector<ResourceRecord>& records);

// Top-level, bounded tasks with duration >= thresholdMs, longest first, at most maxCount.
// Equal durations keep forest order.
std::vector<const TaskNode*> select_long_tasks(const TaskForest& forest, double thresholdMs = kLongTaskThresholdMs, size_t maxCount = kMaxLongTasks);

// Resolve the URL (or browser bucket) blamed for a task:
//  1) first candidate that is a known script
//  2) first candidate
//  3) no candidate or about:blank -> "Browser" / "Browser GC" by event name, else "Unattributable"
std::string attributable_url_for_task(const TaskNode& task, const std::unordered_set<std::string>& jsUrls);

bool is_browser_task_name(std::string_view eventName);
bool is_browser_gc_task_name(std::string_view eventName);

// Selector + Attributor: one row per selected task, in selection order.
std::vector<AttributedRow> attribute_long_tasks(const TaskForest& forest, const std::unordered_set<std::string>& jsUrls, double thresholdMs = kLongTaskThresholdMs);

// "1 long task found" / "N long tasks found"; nothing for zero.
std::optional<std::string> long_tasks_display_value(size_t count);
