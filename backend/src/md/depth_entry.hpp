#pragma once
#include <cmath>
#include <string>
#include <cstdint>
#include <vector>

// One normalized price/quantity observation from a venue.
// Quantity is always > 0: zero-size levels are deletions and never become entries.
struct DepthEntry
{
    double price{0};
    double quantity{0};
    std::string venue;     // "binance", "okx", "bybit", ...
    std::int64_t ts_ms{0}; // venue-reported time, or local receipt time
};

using EntryBatch = std::vector<DepthEntry>;

// Prices beyond this are rejected at decode time; integer price buckets stay in range.
constexpr double kMaxEntryPrice = 1e12;

// Finite price within +/- kMaxEntryPrice and a finite quantity > 0.
inline bool is_usable(const DepthEntry& e) noexcept
{
    return std::isfinite(e.price) && std::fabs(e.price) <= kMaxEntryPrice &&
           std::isfinite(e.quantity) && e.quantity > 0.0;
}
