#pragma once
#include <vector>
#include <string>

#include <imgui.h>

#include "audits.hpp"
#include "filter.hpp"

/// @brief LongTasksPanel: report table of the long-tasks audit.
class LongTasksPanel
{
public:
    // result.items and tasks are parallel (selection order).
    // Returns the task whose row was clicked this frame, or nullptr.
    const TaskNode* draw(const AuditResult& result, const std::vector<const TaskNode*>& tasks, const RowFilter& filter, const TaskNode* selected);

private:
    enum Column : ImGuiID { Rank, Url, Group, Start, Self, Duration, Share, Count };

    // indices into result.items after filter and sort
    std::vector<size_t> _order;
};
