#include "TimelineView.hpp"
#include "color_helper.hpp"
#include "task_groups.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace
{
    constexpr float kLeftPad = 170.f;
    constexpr float kTopPad = 44.f;
    constexpr float kRightPad = 6.f;

    void drawTaskBox(ImDrawList* dl, const ImVec2& p1, const ImVec2& p2, ImU32 color, bool hovered, bool selected)
    {
        ImU32 fill = color;
        if (hovered)   fill = color::AdjustRGB(color, +20);
        if (selected)  fill = color::Lighten(color, +60, 255);
        dl->AddRectFilled(p1, p2, fill, 4.0f);
        dl->AddRect(p1, p2, IM_COL32(0, 0, 0, 140), 4.0f, 0, 1.0f);
    }

    void drawCenteredLabel(ImDrawList* dl, const ImVec2& p1, const ImVec2& p2, const char* text, ImU32 color)
    {
        if (p2.x - p1.x <= 8.f) return;
        const ImVec2 tsz = ImGui::CalcTextSize(text);
        dl->AddText(ImVec2(p1.x + (p2.x - p1.x - tsz.x) * 0.5f, p1.y + (p2.y - p1.y - tsz.y) * 0.5f), color, text);
    }
} // namespace

void TimelineView::reset(double traceEndMs)
{
    _anim.cancel();
    _totalMs = std::max(1.0, traceEndMs);
    _viewStart = 0.0;
    _viewEnd = _totalMs;
    _panY = 0.f;
}

void TimelineView::focus(const TaskNode& task)
{
    const double pad = std::max(1.0, task.duration * 0.25);
    _anim.begin(_viewStart, _viewEnd, task.startTime - pad, task.endTime + pad, _totalMs);
}

void TimelineView::handleInput(const ImVec2& canvasMin, float contentW, bool hovered, bool active)
{
    ImGuiIO& io = ImGui::GetIO();
    const double span = _viewEnd - _viewStart;

    if (hovered && io.MouseWheel != 0.f)
    {
        const double base = io.KeyShift ? 1.05 : io.KeyCtrl ? 1.25 : 1.15;
        const double factor = std::pow(base, io.MouseWheel);
        const double atCursor = msFromX(io.MousePos.x, canvasMin.x + kLeftPad, contentW, _viewStart, _viewEnd);
        const double cx = span > 0.0 ? (atCursor - _viewStart) / span : 0.5;
        const double newSpan = std::min(_totalMs, span / factor);
        const double newStart = std::clamp(atCursor - cx * newSpan, 0.0, std::max(0.0, _totalMs - newSpan));
        _anim.begin(_viewStart, _viewEnd, newStart, newStart + newSpan, _totalMs);
    }

    // right double-click: back to the whole trace
    if (hovered && ImGui::IsMouseDoubleClicked(ImGuiMouseButton_Right))
        _anim.begin(_viewStart, _viewEnd, 0.0, _totalMs, _totalMs);

    if (active && ImGui::IsMouseDragging(ImGuiMouseButton_Left))
    {
        _anim.cancel();
        const double dMs = double(io.MouseDelta.x) / std::max(1.0f, contentW) * span;
        const double newStart = std::clamp(_viewStart - dMs, 0.0, std::max(0.0, _totalMs - span));
        _viewStart = newStart;
        _viewEnd = newStart + span;
        _panY = std::min(0.f, _panY + io.MouseDelta.y);
    }
}

// ---------- one group ----------
void TimelineView::drawGroupBlock(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax,
    float leftPad, float contentW, const char* label,
    const std::vector<std::vector<const TaskNode*>>& lanes,
    const std::unordered_set<const TaskNode*>& longTasks, double thresholdMs,
    float& curY, const TaskNode*& hovered, const TaskNode*& selected)
{
    constexpr float kLaneH = 30.f;
    constexpr float kRectH = 20.f;
    constexpr float kGroupGap = 10.f;
    constexpr float kMinBoxW = 3.f;

    if (lanes.empty()) return;

    const float vx1 = canvasMin.x + leftPad + 1.0f;
    const float vx2 = canvasMax.x - kRightPad;
    const float blockH = float(lanes.size()) * kLaneH;
    const ImU32 col = color::groupColorU32(label);

    // label band
    dl->AddRectFilled(ImVec2(canvasMin.x + 8, curY - 4.f), ImVec2(canvasMin.x + leftPad - 6, curY + blockH + 4.f), IM_COL32(22, 26, 32, 230), 6.f);
    dl->AddRectFilled(ImVec2(canvasMin.x + 8, curY - 4.f), ImVec2(canvasMin.x + 12, curY + blockH + 4.f), col, 2.f);
    dl->AddText(ImVec2(canvasMin.x + 18, curY + 6.f), IM_COL32(190, 200, 215, 255), label);

    ImGuiIO& io = ImGui::GetIO();
    for (size_t li = 0; li < lanes.size(); ++li)
    {
        const float laneY = curY + float(li) * kLaneH;
        const ImU32 bg = (li % 2 == 0) ? IM_COL32(24, 28, 34, 180) : IM_COL32(28, 32, 39, 180);
        dl->AddRectFilled(ImVec2(vx1 - 1.f, laneY), ImVec2(vx2, laneY + kLaneH), bg, 4.f);

        for (const TaskNode* t : lanes[li])
        {
            if (t->endTime < _viewStart || t->startTime > _viewEnd) continue;
            ++_visibleCount;

            float x1 = xFromMs(t->startTime, canvasMin.x + leftPad, contentW, _viewStart, _viewEnd);
            float x2 = xFromMs(t->endTime, canvasMin.x + leftPad, contentW, _viewStart, _viewEnd);
            if (x2 - x1 < kMinBoxW) x2 = x1 + kMinBoxW;
            x1 = std::max(x1, vx1);
            x2 = std::min(x2, vx2);
            if (x2 <= x1) continue;

            const ImVec2 p1(x1, laneY + (kLaneH - kRectH) * 0.5f);
            const ImVec2 p2(x2, laneY + (kLaneH + kRectH) * 0.5f);
            const bool isHovered = io.MousePos.x >= p1.x && io.MousePos.x <= p2.x && io.MousePos.y >= p1.y && io.MousePos.y <= p2.y;
            const bool isSelected = selected == t;

            drawTaskBox(dl, p1, p2, col, isHovered, isSelected);
            if (longTasks.count(t))
                dl->AddRect(ImVec2(p1.x - 1.f, p1.y - 1.f), ImVec2(p2.x + 1.f, p2.y + 1.f), color::longTaskEdge(t->duration, thresholdMs), 4.f, 0, 2.0f);
            if (t->unbounded)
                dl->AddLine(ImVec2(p2.x - 1.f, p1.y), ImVec2(p2.x - 1.f, p2.y), IM_COL32(255, 255, 255, 200), 2.0f);

            if (p2.x - p1.x >= 28.f)
            {
                const std::string lab = elideToWidth(t->eventName, p2.x - p1.x - 8.f);
                if (!lab.empty()) drawCenteredLabel(dl, p1, p2, lab.c_str(), IM_COL32(20, 20, 20, 235));
            }

            if (isHovered)
            {
                hovered = t;
                if (ImGui::IsMouseClicked(ImGuiMouseButton_Left)) selected = t;
            }
        }
    }

    curY += blockH + kGroupGap;
}

// =============== timeline ===============
void TimelineView::draw(const TaskForest& forest, const std::unordered_set<const TaskNode*>& longTasks, const RowFilter& filter, double thresholdMs, const TaskNode*& selected)
{
    if (std::abs(forest.traceEnd - _totalMs) > 1e-9 && forest.traceEnd > 0.0)
    {
        // new trace length: keep the window, clamp it
        _totalMs = forest.traceEnd;
        _viewEnd = std::min(_viewEnd, _totalMs);
        _viewStart = std::min(_viewStart, std::max(0.0, _viewEnd - 1e-3));
    }

    _anim.tick(ImGui::GetIO().DeltaTime, _viewStart, _viewEnd);

    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 canvasMin = ImGui::GetCursorScreenPos();
    const ImVec2 avail = ImGui::GetContentRegionAvail();
    const ImVec2 canvasMax(canvasMin.x + std::max(1.f, avail.x), canvasMin.y + std::max(1.f, avail.y));
    const float contentW = std::max(1.0f, canvasMax.x - canvasMin.x - kLeftPad - kRightPad);
    dl->AddRectFilled(canvasMin, canvasMax, IM_COL32(12, 14, 18, 255));

    ImGui::InvisibleButton("timeline_canvas", ImVec2(canvasMax.x - canvasMin.x, canvasMax.y - canvasMin.y));
    handleInput(canvasMin, contentW, ImGui::IsItemHovered(), ImGui::IsItemActive());

    dl->PushClipRect(canvasMin, canvasMax, true);
    _ruler.draw(dl, canvasMin, canvasMax, kLeftPad, contentW, _viewStart, _viewEnd);
    _ruler.drawThresholdMarker(dl, canvasMin, kLeftPad, contentW, _viewStart, _viewEnd, thresholdMs);

    // Group -> lanes of non-overlapping top-level tasks
    std::vector<std::vector<const TaskNode*>> byGroup(task_groups().size());
    for (const auto& t : forest.tasks)
    {
        if (t->parent) continue;
        if (!filter.match(*t)) continue;
        byGroup[size_t(task_group_by_label(t->group).id)].push_back(t.get());
    }

    _visibleCount = 0;
    const TaskNode* hovered = nullptr;
    float curY = canvasMin.y + kTopPad + _panY;
    for (size_t g = 0; g < byGroup.size(); ++g)
    {
        auto& tasks = byGroup[g];
        if (tasks.empty()) continue;
        std::sort(tasks.begin(), tasks.end(), [](const TaskNode* a, const TaskNode* b) { return a->startTime < b->startTime; });

        std::vector<std::vector<const TaskNode*>> lanes;
        for (const TaskNode* t : tasks)
        {
            bool placed = false;
            for (auto& lane : lanes)
            {
                if (lane.back()->endTime <= t->startTime) { lane.push_back(t); placed = true; break; }
            }
            if (!placed) lanes.push_back({ t });
        }

        const std::string label(task_groups()[g].label);
        drawGroupBlock(dl, canvasMin, canvasMax, kLeftPad, contentW, label.c_str(), lanes, longTasks, thresholdMs, curY, hovered, selected);
    }
    dl->PopClipRect();

    if (hovered)
    {
        ImGui::BeginTooltip();
        ImGui::Text("%s", hovered->eventName.c_str());
        ImGui::Separator();
        ImGui::Text("Group:    %s", hovered->group.c_str());
        ImGui::Text("Start:    %s", fmtMs(hovered->startTime).c_str());
        ImGui::Text("Duration: %s%s", fmtMs(hovered->duration).c_str(), hovered->unbounded ? " (unbounded)" : "");
        ImGui::Text("Self:     %s", fmtMs(hovered->selfTime).c_str());
        if (!hovered->attributableURLs.empty())
            ImGui::Text("URL:      %s", hovered->attributableURLs.front().c_str());
        ImGui::EndTooltip();
    }

    // Status bar
    const ImVec2 sMin(canvasMin.x, canvasMax.y - 22.f), sMax(canvasMax.x, canvasMax.y);
    dl->AddRectFilled(sMin, sMax, IM_COL32(18, 21, 26, 255));
    char left[160];
    std::snprintf(left, sizeof(left), "View: %s .. %s", fmtMs(_viewStart).c_str(), fmtMs(_viewEnd).c_str());
    char right[160];
    std::snprintf(right, sizeof(right), "Range: %s  |  Visible tasks: %zu", fmtMs(_viewEnd - _viewStart).c_str(), _visibleCount);
    dl->AddText(ImVec2(sMin.x + 8, sMin.y + 3), IM_COL32(200, 200, 200, 255), left);
    const float rw = ImGui::CalcTextSize(right).x;
    dl->AddText(ImVec2(sMax.x - rw - 8, sMin.y + 3), IM_COL32(200, 200, 200, 255), right);
}
