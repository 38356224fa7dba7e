// Viewer colors: task groups and long-task highlights
#pragma once
#include <imgui.h>

#include <algorithm>
#include <string_view>
#include <cstdint>

#include "task_groups.hpp"

namespace color
{
    static inline bool parseHexRGB(std::string_view s, uint8_t& R, uint8_t& G, uint8_t& B, uint8_t& A) {
        if (s.size() != 7 && s.size() != 9) return false;
        if (s[0] != '#') return false;
        auto hex = [](char c)->int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
            };
        auto rd2 = [&](int i)->int { int a = hex(s[i]), b = hex(s[i + 1]); return (a < 0 || b < 0) ? -1 : ((a << 4) | b); };
        int r = rd2(1), g = rd2(3), b = rd2(5); if (r < 0 || g < 0 || b < 0) return false;
        int a = 255; if (s.size() == 9) { a = rd2(7); if (a < 0) return false; }
        R = (uint8_t)r; G = (uint8_t)g; B = (uint8_t)b; A = (uint8_t)a; return true;
    }

    /**
     * - colorHex : "#RRGGBB" or "#RRGGBBAA"
     */
    static inline ImU32 getColorU32(std::string_view colorHex)
    {
        uint8_t r, g, b, a;
        if (parseHexRGB(colorHex, r, g, b, a))
        {
            return IM_COL32(r, g, b, a);
        }
        return IM_COL32(170, 170, 170, 255);
    }

    // Same hues as the DevTools performance panel categories
    inline auto group_to_hex = [](TaskGroupId g) -> const char*
        {
            switch (g)
            {
                case TaskGroupId::ParseHTML:            return "#4A8FE7";
                case TaskGroupId::StyleLayout:          return "#8B5CF6";
                case TaskGroupId::PaintCompositeRender: return "#16A34A";
                case TaskGroupId::ScriptParseCompile:   return "#F59E0B";
                case TaskGroupId::ScriptEvaluation:     return "#FACC15";
                case TaskGroupId::GarbageCollection:    return "#EA580C";
                default:                                return "#9CA3AF";
            }
        };

    static inline ImU32 groupColorU32(std::string_view groupLabel)
    {
        return getColorU32(group_to_hex(task_group_by_label(groupLabel).id));
    }

    static inline ImU32 AdjustRGB(ImU32 col, int d)
    {
        int r = (col) & 0xFF, g = (col >> 8) & 0xFF, b = (col >> 16) & 0xFF, a = (col >> 24) & 0xFF;
        r = std::clamp(r + d, 0, 255); g = std::clamp(g + d, 0, 255); b = std::clamp(b + d, 0, 255);
        return IM_COL32(r, g, b, a);
    }

    static inline ImU32 Lighten(ImU32 c, int delta = 40, int alpha = 255)
    {
        int r = std::clamp((int)((c >> 0) & 255) + delta, 0, 255);
        int g = std::clamp((int)((c >> 8) & 255) + delta, 0, 255);
        int b = std::clamp((int)((c >> 16) & 255) + delta, 0, 255);
        return IM_COL32(r, g, b, alpha);
    }

    // Long tasks get a red edge, brighter the further they pass the threshold.
    static inline ImU32 longTaskEdge(double durationMs, double thresholdMs)
    {
        const double over = thresholdMs > 0.0 ? std::clamp((durationMs - thresholdMs) / (4.0 * thresholdMs), 0.0, 1.0) : 1.0;
        const int r = 200 + int(55.0 * over);
        return IM_COL32(r, 40, 40, 255);
    }
}
