#pragma once
#include <imgui.h>

#include <unordered_set>
#include <vector>

#include "model.hpp"
#include "filter.hpp"
#include "TimeRuler.hpp"
#include "ViewportAnim.hpp"

/// @brief TimelineView: top-level main thread tasks, one lane block per group.
class TimelineView
{
public:
    // Show the whole trace.
    void reset(double traceEndMs);
    // Animate the window onto `task` with some margin.
    void focus(const TaskNode& task);

    // longTasks: the tasks listed by the report, outlined in red.
    // `selected` is updated on click.
    void draw(const TaskForest& forest, const std::unordered_set<const TaskNode*>& longTasks, const RowFilter& filter, double thresholdMs, const TaskNode*& selected);

private:
    void handleInput(const ImVec2& canvasMin, float contentW, bool hovered, bool active);
    void drawGroupBlock(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, float leftPad, float contentW, const char* label, const std::vector<std::vector<const TaskNode*>>& lanes, const std::unordered_set<const TaskNode*>& longTasks, double thresholdMs, float& curY, const TaskNode*& hovered, const TaskNode*& selected);

    double _viewStart = 0.0;
    double _viewEnd = 1.0;
    double _totalMs = 1.0;
    float  _panY = 0.f;
    size_t _visibleCount = 0;

    ViewportAnim _anim;
    TimeRuler _ruler;
};
