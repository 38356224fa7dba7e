#include "LongTasksPanel.hpp"
#include "color_helper.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdio>

const TaskNode* LongTasksPanel::draw(const AuditResult& result, const std::vector<const TaskNode*>& tasks, const RowFilter& filter, const TaskNode* selected)
{
    const TaskNode* clicked = nullptr;

    ImGui::SetNextWindowSize(ImVec2(760, 420), ImGuiCond_FirstUseEver);
    if (!ImGui::Begin("Long tasks"))
    {
        ImGui::End();
        return nullptr;
    }

    ImGui::TextUnformatted(result.meta.title.c_str());
    ImGui::SameLine();
    if (result.displayValue)
        ImGui::TextColored(ImVec4(0.95f, 0.45f, 0.42f, 1.f), "%s", result.displayValue->c_str());
    else
        ImGui::TextDisabled("(no long tasks)");
    ImGui::TextDisabled("%s", result.meta.description.c_str());
    ImGui::Separator();

    _order.clear();
    double totalMs = 0.0;
    for (size_t i = 0; i < result.items.size(); ++i)
    {
        totalMs += result.items[i].duration;
        if (filter.match(result.items[i])) _order.push_back(i);
    }

    if (result.items.empty())
    {
        ImGui::TextDisabled("Not applicable: no top-level task reached the threshold.");
        ImGui::End();
        return nullptr;
    }

    constexpr ImGuiTableFlags kFlags = ImGuiTableFlags_Resizable | ImGuiTableFlags_Sortable | ImGuiTableFlags_RowBg
        | ImGuiTableFlags_BordersOuter | ImGuiTableFlags_BordersV | ImGuiTableFlags_ScrollY | ImGuiTableFlags_SizingFixedFit;

    if (ImGui::BeginTable("LongTasksTable", int(Count), kFlags))
    {
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("#",          ImGuiTableColumnFlags_DefaultSort, 30.f, Rank);
        ImGui::TableSetupColumn("URL",        ImGuiTableColumnFlags_WidthStretch, 0.f, Url);
        ImGui::TableSetupColumn("Group",      ImGuiTableColumnFlags_None, 160.f, Group);
        ImGui::TableSetupColumn("Start Time", ImGuiTableColumnFlags_PreferSortDescending, 90.f, Start);
        ImGui::TableSetupColumn("Self",       ImGuiTableColumnFlags_PreferSortDescending, 80.f, Self);
        ImGui::TableSetupColumn("Duration",   ImGuiTableColumnFlags_PreferSortDescending, 90.f, Duration);
        ImGui::TableSetupColumn("Share",      ImGuiTableColumnFlags_NoSort, 170.f, Share);
        ImGui::TableHeadersRow();

        if (ImGuiTableSortSpecs* specs = ImGui::TableGetSortSpecs(); specs && specs->SpecsCount > 0)
        {
            const ImGuiTableColumnSortSpecs& spec = specs->Specs[0];
            const bool asc = spec.SortDirection == ImGuiSortDirection_Ascending;
            const ImGuiID col = spec.ColumnUserID;
            const auto& items = result.items;
            // Rank is the audit order itself
            std::stable_sort(_order.begin(), _order.end(), [&](size_t a, size_t b)
            {
                const AttributedRow& ra = items[a];
                const AttributedRow& rb = items[b];
                int c = 0;
                switch (col)
                {
                    case Url:      c = ra.url.compare(rb.url); break;
                    case Group:    c = ra.group.compare(rb.group); break;
                    case Start:    c = (ra.start > rb.start) - (ra.start < rb.start); break;
                    case Self:     c = (ra.self > rb.self) - (ra.self < rb.self); break;
                    case Duration: c = (ra.duration > rb.duration) - (ra.duration < rb.duration); break;
                    default:       c = (a > b) - (a < b); break;
                }
                return asc ? c < 0 : c > 0;
            });
        }

        for (size_t i : _order)
        {
            const AttributedRow& row = result.items[i];
            const TaskNode* task = i < tasks.size() ? tasks[i] : nullptr;

            ImGui::TableNextRow();
            ImGui::PushID(int(i));

            ImGui::TableSetColumnIndex(Rank);
            char rank[16];
            std::snprintf(rank, sizeof(rank), "%zu", i + 1);
            if (ImGui::Selectable(rank, task && task == selected, ImGuiSelectableFlags_SpanAllColumns | ImGuiSelectableFlags_AllowOverlap))
                clicked = task;

            ImGui::TableSetColumnIndex(Url);
            const std::string url = elideUrlToWidth(row.url, ImGui::GetContentRegionAvail().x);
            ImGui::TextUnformatted(url.c_str());
            if (ImGui::IsItemHovered() && url != row.url)
                ImGui::SetTooltip("%s", row.url.c_str());

            ImGui::TableSetColumnIndex(Group);
            ImGui::PushStyleColor(ImGuiCol_Text, color::groupColorU32(row.group));
            ImGui::TextUnformatted(row.group.c_str());
            ImGui::PopStyleColor();

            ImGui::TableSetColumnIndex(Start);
            ImGui::TextUnformatted(format_ms(row.start, 10.0).c_str());
            ImGui::TableSetColumnIndex(Self);
            ImGui::TextUnformatted(format_ms(row.self, 1.0).c_str());
            ImGui::TableSetColumnIndex(Duration);
            ImGui::TextUnformatted(format_ms(row.duration, 10.0).c_str());

            ImGui::TableSetColumnIndex(Share);
            const float fract = totalMs > 0.0 ? float(row.duration / totalMs) : 0.f;
            char pct[32];
            std::snprintf(pct, sizeof(pct), "%.1f%%", 100.0 * double(fract));
            drawBar(fract, pct, 110.f, 8.f, color::groupColorU32(row.group));

            ImGui::PopID();
        }
        ImGui::EndTable();
    }

    ImGui::End();
    return clicked;
}
