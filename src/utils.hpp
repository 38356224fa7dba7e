#pragma once

#include <imgui.h>

#include <algorithm>
#include <cmath>
#include <string>

#include "time_format.hpp"

inline std::string elideToWidth(const std::string& s, float maxPx)
{
    if (maxPx <= 0.f || s.empty()) return {};
    if (ImGui::CalcTextSize(s.c_str()).x <= maxPx) return s;
    static constexpr const char* dots = "...";
    float wd = ImGui::CalcTextSize(dots).x;
    if (wd >= maxPx) return {};
    int lo = 0, hi = int(s.size());
    while (lo < hi) {
        int mid = (lo + hi + 1) / 2;
        std::string st = s.substr(0, mid) + dots;
        if (ImGui::CalcTextSize(st.c_str()).x <= maxPx) lo = mid; else hi = mid - 1;
    }
    return s.substr(0, lo) + dots;
}

// Keep the tail of a URL ("...cdn.example.com/app.js") which carries the file name.
inline std::string elideUrlToWidth(const std::string& s, float maxPx)
{
    if (maxPx <= 0.f || s.empty()) return {};
    if (ImGui::CalcTextSize(s.c_str()).x <= maxPx) return s;
    static constexpr const char* dots = "...";
    if (ImGui::CalcTextSize(dots).x >= maxPx) return {};
    int lo = 0, hi = int(s.size());
    while (lo < hi) {
        int mid = (lo + hi + 1) / 2;
        std::string st = dots + s.substr(s.size() - mid);
        if (ImGui::CalcTextSize(st.c_str()).x <= maxPx) lo = mid; else hi = mid - 1;
    }
    return dots + s.substr(s.size() - lo);
}

// x screen from a trace time (ms) given the visible window [viewStart, viewEnd]
inline float xFromMs(double ms, float contentX, float contentW, double viewStart, double viewEnd)
{
    const double span = std::max(1e-9, viewEnd - viewStart);
    return contentX + float((ms - viewStart) / span * contentW);
}

inline double msFromX(float x, float contentX, float contentW, double viewStart, double viewEnd)
{
    const double t = std::clamp(double(x - contentX) / std::max(1.0f, contentW), 0.0, 1.0);
    return viewStart + t * (viewEnd - viewStart);
}

// Small filled bar with a label on its right (share of a total).
inline void drawBar(float fraction01, const char* rightLabel, float width = 260.f, float height = 10.f, ImU32 fill = 0)
{
    fraction01 = std::clamp(fraction01, 0.0f, 1.0f);
    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 p1 = ImGui::GetCursorScreenPos();
    const float lineH = ImGui::GetTextLineHeight();
    const float y = p1.y + std::max(0.f, (lineH - height) * 0.5f);
    const ImVec2 b1(p1.x, y), b2(p1.x + width, y + height);

    dl->AddRectFilled(b1, b2, IM_COL32(35, 40, 45, 255), 3.0f);
    const float w = width * fraction01;
    if (w > 1.0f)
        dl->AddRectFilled(b1, ImVec2(b1.x + w, b2.y), fill ? fill : IM_COL32(230, 90, 80, 220), 3.0f);
    dl->AddRect(b1, b2, IM_COL32(0, 0, 0, 140), 3.0f, 0, 1.0f);

    ImGui::Dummy(ImVec2(width, std::max(lineH, height)));
    if (rightLabel && *rightLabel)
    {
        ImGui::SameLine();
        ImGui::TextUnformatted(rightLabel);
    }
}
