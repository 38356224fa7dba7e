#include "TimeRuler.hpp"
#include "utils.hpp"
#include <cmath>
#include <algorithm>
#include <cstdio>

// ---------- unit ----------
TimeRuler::UnitInfo TimeRuler::pickUnit(double visibleSpanMs, float contentW) const
{
    // ~90 px per major label
    const double targetMaj = std::max(4.0f, contentW / 90.0f);
    const double msPerLabel = visibleSpanMs / targetMaj;

    if (msPerLabel >= 60.0 * 1e3) return { 60.0 * 1e3, "min" };
    if (msPerLabel >= 1e3)        return { 1e3, "s" };
    if (msPerLabel >= 1.0)        return { 1.0, "ms" };
    return { 1e-3, "us" };
}

double TimeRuler::chooseStep(double msPerUnit, double visibleSpanMs, float contentW, float targetPx) const
{
    // 1/2/5·10^n units, back to ms
    const double targetSteps = std::max(3.0f, contentW / targetPx);
    const double rawUnits = visibleSpanMs / msPerUnit / targetSteps;

    const double p10 = std::pow(10.0, std::floor(std::log10(std::max(1e-12, rawUnits))));
    double stepUnits = p10;
    if (rawUnits > 2.0 * p10) stepUnits = 2.0 * p10;
    if (rawUnits > 5.0 * p10) stepUnits = 5.0 * p10;

    return stepUnits * msPerUnit;
}

int TimeRuler::decimalsForStepUnits(double stepUnits)
{
    if (stepUnits >= 1.0)  return 0;
    if (stepUnits >= 0.1)  return 1;
    if (stepUnits >= 0.01) return 2;
    return 3;
}

std::string TimeRuler::formatTick(double ms, const UnitInfo& ui, double majorStepMs)
{
    const int dec = decimalsForStepUnits(majorStepMs / ui.msPerUnit);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f %s", dec, ms / ui.msPerUnit, ui.suffix);
    return buf;
}

// -------------------- draw --------------------
void TimeRuler::draw(ImDrawList* dl, const ImVec2& canvasMin, const ImVec2& canvasMax, float leftPad, float contentW, double viewStart, double viewEnd) const
{
    const double spanMs = std::max(1e-6, viewEnd - viewStart);
    const float  x0 = canvasMin.x + leftPad;

    const UnitInfo ui = pickUnit(spanMs, contentW);
    const double   majorStep = chooseStep(ui.msPerUnit, spanMs, contentW, 110.0f);
    const int      minorCnt = 5;
    const double   minorStep = majorStep / double(minorCnt);

    const float vx1 = x0;
    const float vx2 = canvasMax.x - 6.0f;
    const float rulerTop = canvasMin.y;
    const float majorH = 8.0f;
    const float minorH = 4.0f;
    const ImU32 tickCol = IM_COL32(150, 150, 150, 180);
    const ImU32 textCol = IM_COL32(200, 200, 200, 210);

    dl->AddLine(ImVec2(vx1, rulerTop), ImVec2(vx2, rulerTop), IM_COL32(70, 80, 90, 120), 1.0f);

    // Ticks are absolute: "0 ms" is the trace origin, not the left edge.
    const float minLabelPx = 80.0f;
    float lastLabelX = -1e9f;
    for (double t = std::floor(viewStart / majorStep) * majorStep; t <= viewEnd + majorStep; t += majorStep)
    {
        const float x = xFromMs(t, x0, contentW, viewStart, viewEnd);
        if (x >= vx1 - 1.0f && x <= vx2 + 1.0f)
        {
            dl->AddLine(ImVec2(x, rulerTop), ImVec2(x, rulerTop + majorH), tickCol);
            if (x - lastLabelX >= minLabelPx)
            {
                const std::string label = formatTick(t, ui, majorStep);
                dl->AddText(ImVec2(x + 3.0f, rulerTop + majorH), textCol, label.c_str());
                lastLabelX = x;
            }
        }

        for (int i = 1; i < minorCnt; ++i)
        {
            const double mt = t + i * minorStep;
            if (mt < viewStart || mt > viewEnd) continue;
            const float mx = xFromMs(mt, x0, contentW, viewStart, viewEnd);
            dl->AddLine(ImVec2(mx, rulerTop), ImVec2(mx, rulerTop + minorH), tickCol);
        }
    }
}

void TimeRuler::drawThresholdMarker(ImDrawList* dl, const ImVec2& canvasMin, float leftPad, float contentW, double viewStart, double viewEnd, double thresholdMs) const
{
    if (thresholdMs <= 0.0) return;
    const double span = std::max(1e-6, viewEnd - viewStart);
    const float w = float(thresholdMs / span * contentW);
    // too small or wider than the view: nothing useful to show
    if (w < 3.0f || w > contentW) return;

    const float y = canvasMin.y + 26.0f;
    const float x1 = canvasMin.x + leftPad - w - 12.0f;
    const float xr = canvasMin.x + leftPad - 12.0f;
    const ImU32 col = IM_COL32(230, 70, 65, 230);
    if (x1 < canvasMin.x + 4.0f)
    {
        // lane labels column too narrow: draw it at the right end of the ruler
        const float rx2 = canvasMin.x + leftPad + contentW - 8.0f;
        dl->AddLine(ImVec2(rx2 - w, y), ImVec2(rx2, y), col, 3.0f);
        return;
    }
    dl->AddLine(ImVec2(x1, y), ImVec2(xr, y), col, 3.0f);
    dl->AddLine(ImVec2(x1, y - 4.0f), ImVec2(x1, y + 4.0f), col);
    dl->AddLine(ImVec2(xr, y - 4.0f), ImVec2(xr, y + 4.0f), col);

    const std::string label = fmtMs(thresholdMs);
    const ImVec2 tsz = ImGui::CalcTextSize(label.c_str());
    dl->AddText(ImVec2(x1 + (w - tsz.x) * 0.5f, y + 4.0f), col, label.c_str());
}
