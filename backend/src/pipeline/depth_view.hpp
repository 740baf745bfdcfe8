#pragma once
#include <cstdint>
#include <vector>

#include "md/depth_entry.hpp"

enum class ZoneSide : std::uint8_t
{
    Bid = 0,
    Ask = 1
};

inline const char* to_label(ZoneSide s) noexcept { return s == ZoneSide::Bid ? "bid" : "ask"; }

// A contiguous run of integer price buckets with concentrated volume.
// Derived on every pass, never updated in place.
struct PressureZone
{
    double min_price{0};      // lowest bucket
    double max_price{0};      // highest bucket
    double total_volume{0};   // sum of quantities of `entries`
    double pressure_score{0}; // total_volume * (max_price - min_price + 1)
    ZoneSide side{ZoneSide::Bid};
    std::vector<DepthEntry> entries;
};

// Immutable aggregate snapshot. Carried around via shared_ptr<const DepthView>
// so readers never observe a half-built view.
struct DepthView
{
    std::vector<DepthEntry> bids; // price descending
    std::vector<DepthEntry> asks; // price ascending
    std::vector<PressureZone> pressure_zones; // score descending

    double min_price{0};
    double max_price{0};
    double max_quantity{0}; // 0 when empty; callers scaling by it must check
    std::int64_t last_updated_ms{0};
};
