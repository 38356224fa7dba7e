#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include "model.hpp"

// Renderer main thread of the inspected page and the trace clock bounds (µs).
struct MainThreadInfo
{
    uint32_t pid = 0;
    uint32_t tid = 0;
    uint64_t timeOrigin = 0;    // navigationStart, or the first main-thread timestamp
    uint64_t firstTs = 0;       // first main-thread timestamp
    uint64_t traceEnd = 0;      // last ts+dur in the whole trace
};

// Locate the CrRendererMain thread of the main frame's renderer.
bool find_main_thread(const std::vector<TraceEvent>& events, MainThreadInfo& out, std::string* outError = nullptr);

// Build the main-thread task forest from parsed trace events.
// - tasks are X events and B/E pairs of the main thread, nested by time
// - an end (or start) not observed in the trace marks the task unbounded
// - times are converted to ms relative to MainThreadInfo::timeOrigin
bool build_main_thread_tasks(const std::vector<TraceEvent>& events, TaskForest& out, std::string* outError = nullptr);

// Boundary check of the forest invariants (non-negative times, selfTime <= duration,
// parent before child, child inside parent).
bool validate_task_forest(const TaskForest& forest, std::string* outError = nullptr);
