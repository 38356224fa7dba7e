#pragma once
#include <vector>
#include <string>
#include <unordered_set>
#include <cstdint>

#include <imgui.h>

#include "model.hpp"

/// @brief TaskInfoPanel: details of the selected task.
class TaskInfoPanel
{
public:
    // Draws the info window if `sel` is not null.
    // - jsUrls: script URLs of the network records, to resolve the attribution
    void draw(const TaskNode* sel, const std::unordered_set<std::string>& jsUrls, bool& p_open);

private:
    // Self time of `sel` and its descendants, per group
    struct Row
    {
        std::string group;
        uint64_t count = 0;
        double self_ms = 0.0;
        double max_ms = 0.0;
        ImU32 col_u32 = 0;
    };

    static void collect(const TaskNode& node, std::vector<Row>& rows);

    const TaskNode* _lastSel = nullptr;
};
