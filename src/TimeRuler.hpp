#pragma once
#include <imgui.h>
#include <string>

/// @brief TimeRuler: time axis drawn above the timeline lanes.
class TimeRuler {
public:
    struct UnitInfo {
        double msPerUnit;
        const char* suffix; // "us","ms","s","min"
    };

    // viewStart/viewEnd : visible window (ms since the trace origin)
    void draw(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, float leftPad, float contentW, double viewStart, double viewEnd) const;

    // Short bar of `thresholdMs` width under the ruler, so long tasks can be judged by eye.
    void drawThresholdMarker(ImDrawList* dl, const ImVec2& canvasMin, float leftPad, float contentW, double viewStart, double viewEnd, double thresholdMs) const;

private:
    UnitInfo pickUnit(double visibleSpanMs, float contentW) const;
    double   chooseStep(double msPerUnit, double visibleSpanMs, float contentW, float targetPx) const;

    static std::string formatTick(double ms, const UnitInfo& ui, double majorStepMs);
    static int decimalsForStepUnits(double stepUnits);
};
