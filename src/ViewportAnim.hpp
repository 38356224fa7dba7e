#pragma once
#include <algorithm>
#include <cmath>

/// @brief ViewportAnim: eased transition of the visible time window (ms).
class ViewportAnim
{
public:
    ViewportAnim();

    // Start moving the window [viewStart, viewEnd] to [targetStart, targetEnd],
    // both clamped to [0, totalMs].
    void begin(double viewStart, double viewEnd, double targetStart, double targetEnd, double totalMs);

    // Advance by dt seconds and write the interpolated window.
    void tick(double dt, double& viewStart, double& viewEnd);

    bool isActive() const { return _active; }
    void cancel() { _active = false; }

private:
    double _duration = 0.25;    // seconds
    double _t = 0.0;            // [0,1]
    bool   _active = false;
    double _fromStart = 0.0, _fromEnd = 1.0;
    double _toStart = 0.0, _toEnd = 1.0;
};
