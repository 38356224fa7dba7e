#include "TaskInfoPanel.hpp"
#include "color_helper.hpp"
#include "long_tasks.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdio>

void TaskInfoPanel::collect(const TaskNode& node, std::vector<Row>& rows)
{
    auto it = std::find_if(rows.begin(), rows.end(), [&](const Row& r) { return r.group == node.group; });
    if (it == rows.end())
    {
        Row r;
        r.group = node.group;
        r.col_u32 = color::groupColorU32(node.group);
        rows.push_back(std::move(r));
        it = rows.end() - 1;
    }
    it->count += 1;
    it->self_ms += node.selfTime;
    it->max_ms = std::max(it->max_ms, node.duration);

    for (const TaskNode* c : node.children)
        collect(*c, rows);
}

// -------------------------------------------------------------
// Selected task information
// -------------------------------------------------------------
void TaskInfoPanel::draw(const TaskNode* sel, const std::unordered_set<std::string>& jsUrls, bool& p_open)
{
    if (!sel) return;

    if (_lastSel != sel) { _lastSel = sel; ImGui::SetNextWindowFocus(); }

    ImGui::SetNextWindowSize(ImVec2(530, 520), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowPos(ImVec2(40, 40), ImGuiCond_FirstUseEver);

    if (!ImGui::Begin("Task info", &p_open, ImGuiWindowFlags_NoCollapse))
    {
        ImGui::End();
        return;
    }

    ImGui::PushStyleColor(ImGuiCol_Text, color::groupColorU32(sel->group));
    ImGui::Text("%s", sel->eventName.c_str());
    ImGui::PopStyleColor();
    ImGui::Separator();

    ImGui::Text("Group     : %s", sel->group.c_str());
    ImGui::Text("Start     : %s", format_ms(sel->startTime, 1.0).c_str());
    ImGui::Text("End       : %s", format_ms(sel->endTime, 1.0).c_str());
    ImGui::Text("Duration  : %s%s", fmtMs(sel->duration).c_str(), sel->unbounded ? "  (unbounded, never ended)" : "");
    ImGui::Text("Self time : %s", fmtMs(sel->selfTime).c_str());
    ImGui::Text("Depth     : %d%s", sel->depth, sel->parent ? "" : "  (top-level)");
    ImGui::Spacing();

    // ================== Attribution ==================
    if (ImGui::CollapsingHeader("Attribution", ImGuiTreeNodeFlags_DefaultOpen))
    {
        const std::string blamed = attributable_url_for_task(*sel, jsUrls);
        ImGui::Text("Attributed to: %s", blamed.c_str());
        if (sel->attributableURLs.empty())
        {
            ImGui::TextDisabled("No candidate URL.");
        }
        else
        {
            ImGui::TextDisabled("Candidates (first known script wins):");
            for (const std::string& u : sel->attributableURLs)
            {
                const bool isScript = jsUrls.count(u) > 0;
                if (isScript)
                    ImGui::BulletText("%s  [script]", u.c_str());
                else
                    ImGui::BulletText("%s", u.c_str());
            }
        }
    }

    ImGui::Spacing();

    // ================== Breakdown by group ==================
    if (ImGui::CollapsingHeader("Self time by group (task and descendants)", ImGuiTreeNodeFlags_DefaultOpen))
    {
        std::vector<Row> rows;
        collect(*sel, rows);

        double total = 0.0;
        for (const Row& r : rows) total += r.self_ms;

        std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) { return a.self_ms > b.self_ms; });

        for (const Row& r : rows)
        {
            const float fract = total > 0.0 ? float(r.self_ms / total) : 0.0f;

            ImGui::PushStyleColor(ImGuiCol_Header, IM_COL32(40, 40, 45, 180));
            ImGui::PushStyleColor(ImGuiCol_HeaderHovered, IM_COL32(55, 55, 60, 200));
            ImGui::PushStyleColor(ImGuiCol_HeaderActive, IM_COL32(55, 55, 60, 220));
            const bool open = ImGui::CollapsingHeader((r.group + "  (tasks=" + std::to_string(r.count) + ")").c_str());
            ImGui::PopStyleColor(3);

            char right[128];
            std::snprintf(right, sizeof(right), "%.1f%%  (%s)", 100.0 * double(fract), fmtMs(r.self_ms).c_str());
            drawBar(fract, right, 260.0f, 10.0f, r.col_u32);

            if (open)
            {
                ImGui::Indent();
                ImGui::Text("self=%s   longest=%s", fmtMs(r.self_ms).c_str(), fmtMs(r.max_ms).c_str());
                ImGui::Unindent();
            }
            ImGui::Spacing();
        }
    }

    // ================== Children ==================
    if (!sel->children.empty() && ImGui::CollapsingHeader("Children"))
    {
        for (const TaskNode* c : sel->children)
            ImGui::BulletText("%s  %s", c->eventName.c_str(), fmtMs(c->duration).c_str());
    }

    ImGui::End();
}
