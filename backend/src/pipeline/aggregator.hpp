#pragma once
#include <cstdint>
#include <vector>

#include "depth_view.hpp"
#include "pressure_zones.hpp"

struct AggregateOptions
{
    std::int64_t window_ms{60 * 1000};
    bool detect_zones{true};
    double zone_threshold_ratio{0.2}; // seed threshold as a fraction of max_quantity
    ZoneParams zone_params{};
};

// Build a depth view from buffered entries as of `now_ms`.
//  - keeps entries with now_ms - ts_ms < window_ms (hard cutoff); entries
//    failing is_usable() (non-finite or out-of-range numbers) are dropped
//  - splits bids/asks against each venue's mean price (global mean as fallback)
//  - bids sorted price descending, asks ascending, ties in arrival order
//  - pressure zones detected per venue and ranked across venues
// Pure function: identical inputs give identical views.
DepthView aggregate(const std::vector<DepthEntry>& entries,
                    std::int64_t now_ms,
                    const AggregateOptions& opts);

// Usable entries still inside the window as of `now_ms`, in their original order.
std::vector<DepthEntry> filter_window(const std::vector<DepthEntry>& entries,
                                      std::int64_t now_ms,
                                      std::int64_t window_ms);
