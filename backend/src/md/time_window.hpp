#pragma once
#include <cstdint>
#include <string>
#include <string_view>

// Trailing duration whose entries are considered current.
enum class TimeWindow : std::uint8_t
{
    OneMinute,
    FiveMinutes,
    FifteenMinutes,
    OneHour
};

constexpr std::int64_t window_ms(TimeWindow w) noexcept
{
    switch (w) {
        case TimeWindow::OneMinute:      return 60 * 1000;
        case TimeWindow::FiveMinutes:    return 5 * 60 * 1000;
        case TimeWindow::FifteenMinutes: return 15 * 60 * 1000;
        case TimeWindow::OneHour:        return 60 * 60 * 1000;
    }
    return 60 * 1000;
}

inline const char* to_label(TimeWindow w) noexcept
{
    switch (w) {
        case TimeWindow::OneMinute:      return "1m";
        case TimeWindow::FiveMinutes:    return "5m";
        case TimeWindow::FifteenMinutes: return "15m";
        case TimeWindow::OneHour:        return "1h";
    }
    return "1m";
}

// Returns false for unknown labels; `out` is then left untouched.
inline bool parse_window(std::string_view label, TimeWindow& out) noexcept
{
    if (label == "1m")  { out = TimeWindow::OneMinute;      return true; }
    if (label == "5m")  { out = TimeWindow::FiveMinutes;    return true; }
    if (label == "15m") { out = TimeWindow::FifteenMinutes; return true; }
    if (label == "1h")  { out = TimeWindow::OneHour;        return true; }
    return false;
}

// Unknown labels fall back to one minute.
inline TimeWindow window_or_default(std::string_view label) noexcept
{
    TimeWindow w = TimeWindow::OneMinute;
    (void)parse_window(label, w);
    return w;
}
