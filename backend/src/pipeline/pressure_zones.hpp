#pragma once
#include <vector>

#include "depth_view.hpp"

// Growth heuristics for zone detection.
struct ZoneParams
{
    int scan_radius{5};        // buckets examined on each side of a seed
    double growth_ratio{0.5};  // neighbour must hold >= growth_ratio * threshold
};

struct ZoneDetection
{
    std::vector<PressureZone> zones; // score descending
    double max_quantity{0};          // largest single-entry quantity seen
};

// Cluster `entries` into pressure zones. Prices are rounded half-up to integer
// buckets; buckets are visited in ascending order and a bucket whose summed
// quantity reaches `threshold` seeds a zone that grows outward over adjacent
// buckets holding at least growth_ratio * threshold. A zone is labelled Bid
// when its first entry sits below the mean price of `entries`.
// A threshold of 0 makes every non-empty bucket a seed. Entries failing
// is_usable() are ignored.
ZoneDetection detect_pressure_zones(const std::vector<DepthEntry>& entries,
                                    double threshold,
                                    const ZoneParams& params = {});

// Rounded bucket for a price (half-up).
long long price_bucket(double price) noexcept;
