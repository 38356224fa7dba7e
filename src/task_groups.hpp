#pragma once
#include <string_view>
#include <array>

// Kind of main-thread work, derived from the trace event name.
enum class TaskGroupId
{
    ParseHTML,
    StyleLayout,
    PaintCompositeRender,
    ScriptParseCompile,
    ScriptEvaluation,
    GarbageCollection,
    Other
};

struct TaskGroup
{
    TaskGroupId      id;
    std::string_view key;     // "scriptEvaluation"
    std::string_view label;   // "Script Evaluation"
};

const std::array<TaskGroup, 7>& task_groups();

// Group whose event table lists `eventName`, or nullptr.
const TaskGroup* task_group_for_event(std::string_view eventName);

const TaskGroup& task_group(TaskGroupId id);

// Reverse lookup from a label, used by the viewer to color lanes. Falls back to Other.
const TaskGroup& task_group_by_label(std::string_view label);
