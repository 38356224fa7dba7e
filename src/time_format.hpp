#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

// Compact human duration of a millisecond value ("350 us", "12.5 ms", "1.250 s", "02:03.500").
inline std::string fmtMs(double ms)
{
    // safe entry
    if (!std::isfinite(ms)) ms = 0.0;
    if (ms < 0.0) ms = 0.0;

    char buf[64];

    // < 1 ms -> µs
    if (ms < 1.0)
    {
        std::snprintf(buf, sizeof(buf), "%.0f us", ms * 1e3);
        return buf;
    }

    // < 1 s -> ms
    if (ms < 1e3)
    {
        if (ms >= 100.0)     std::snprintf(buf, sizeof(buf), "%.0f ms", ms);
        else if (ms >= 10.0) std::snprintf(buf, sizeof(buf), "%.1f ms", ms);
        else                 std::snprintf(buf, sizeof(buf), "%.2f ms", ms);
        return buf;
    }

    // < 60 s -> seconds
    if (ms < 60.0 * 1e3)
    {
        const double s = ms / 1e3;
        if (s >= 10.0) std::snprintf(buf, sizeof(buf), "%.2f s", s);
        else           std::snprintf(buf, sizeof(buf), "%.3f s", s);
        return buf;
    }

    // mm:ss.mmm
    uint64_t total_ms = static_cast<uint64_t>(std::llround(ms));
    uint64_t mm = total_ms / 60000;
    uint64_t ss = (total_ms / 1000) % 60;
    uint64_t rest = total_ms % 1000;
    std::snprintf(buf, sizeof(buf), "%02llu:%02llu.%03llu",
        (unsigned long long)mm,
        (unsigned long long)ss,
        (unsigned long long)rest);
    return buf;
}

// Report cell of an "ms" column: rounded to `granularity`, grouped thousands ("1,230 ms").
inline std::string format_ms(double ms, double granularity = 1.0)
{
    if (!std::isfinite(ms)) ms = 0.0;
    if (granularity > 0.0) ms = std::round(ms / granularity) * granularity;

    // granularity below 1 keeps its decimals
    int decimals = 0;
    for (double g = granularity; g > 0.0 && g < 1.0 && decimals < 3; g *= 10.0) ++decimals;

    char num[64];
    std::snprintf(num, sizeof(num), "%.*f", decimals, std::fabs(ms));
    std::string digits(num);
    const auto dot = digits.find('.');
    std::string intPart = digits.substr(0, dot);
    const std::string frac = dot == std::string::npos ? std::string() : digits.substr(dot);

    std::string grouped;
    for (size_t i = 0; i < intPart.size(); ++i)
    {
        if (i > 0 && (intPart.size() - i) % 3 == 0) grouped.push_back(',');
        grouped.push_back(intPart[i]);
    }
    return (ms < 0.0 ? "-" : "") + grouped + frac + " ms";
}
