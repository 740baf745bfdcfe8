#pragma once
#include <chrono>
#include <cstdint>

// Milliseconds since the Unix epoch; the unit of every entry timestamp.
inline std::int64_t wall_clock_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
