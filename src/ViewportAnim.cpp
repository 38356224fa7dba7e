#include "ViewportAnim.hpp"

namespace
{
    // narrowest window the timeline zooms to (ms)
    constexpr double kMinSpanMs = 0.01;
}

ViewportAnim::ViewportAnim()
{

}

void ViewportAnim::begin(double viewStart, double viewEnd, double targetStart, double targetEnd, double totalMs)
{
    totalMs = std::max(totalMs, kMinSpanMs);
    targetStart = std::clamp(targetStart, 0.0, totalMs);
    targetEnd = std::clamp(targetEnd, 0.0, totalMs);
    if (targetEnd - targetStart < kMinSpanMs)
    {
        const double mid = (targetStart + targetEnd) * 0.5;
        targetStart = std::max(0.0, mid - kMinSpanMs * 0.5);
        targetEnd = std::min(totalMs, targetStart + kMinSpanMs);
    }
    _fromStart = viewStart;
    _fromEnd = viewEnd;
    _toStart = targetStart;
    _toEnd = targetEnd;
    _t = 0.0;
    _active = true;
}

void ViewportAnim::tick(double dt, double& viewStart, double& viewEnd)
{
    if (!_active) return;

    _t = std::min(1.0, _t + dt / _duration);
    // ease-out cubic
    const double u = 1.0 - _t;
    const double w = 1.0 - u * u * u;
    viewStart = _fromStart + (_toStart - _fromStart) * w;
    viewEnd = _fromEnd + (_toEnd - _fromEnd) * w;

    if (_t >= 1.0)
        _active = false;
}
