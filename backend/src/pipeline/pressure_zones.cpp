#include "pressure_zones.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace {

struct Bucket {
    std::vector<const DepthEntry*> entries; // arrival order
    double volume{0};
};

} // namespace

long long price_bucket(double price) noexcept {
    return static_cast<long long>(std::floor(price + 0.5));
}

ZoneDetection detect_pressure_zones(const std::vector<DepthEntry>& entries,
                                    double threshold,
                                    const ZoneParams& params)
{
    ZoneDetection out;
    if (entries.empty()) return out;

    // Ascending bucket order drives seeding
    std::map<long long, Bucket> buckets;
    double price_sum = 0.0;
    std::size_t used = 0;
    for (const auto& e : entries) {
        if (!is_usable(e)) continue;
        ++used;
        auto& b = buckets[price_bucket(e.price)];
        b.entries.push_back(&e);
        b.volume += e.quantity;
        price_sum += e.price;
        if (e.quantity > out.max_quantity) out.max_quantity = e.quantity;
    }
    if (used == 0) return out;
    const double mean_price = price_sum / static_cast<double>(used);
    const double growth_threshold = threshold * params.growth_ratio;

    std::set<long long> claimed;

    auto absorb = [](PressureZone& zone, const Bucket& b) {
        zone.total_volume += b.volume;
        for (const DepthEntry* e : b.entries) zone.entries.push_back(*e);
    };

    // Extend from `seed` in direction `step`; returns the outermost bucket taken.
    // Empty buckets inside the radius are stepped over; a weak or already
    // claimed neighbour ends the run.
    auto grow = [&](PressureZone& zone, long long seed, int step) {
        long long edge = seed;
        for (int i = 1; i <= params.scan_radius; ++i) {
            const long long p = seed + static_cast<long long>(step) * i;
            auto it = buckets.find(p);
            if (it == buckets.end()) continue;
            if (claimed.count(p) || it->second.volume < growth_threshold) break;
            absorb(zone, it->second);
            claimed.insert(p);
            edge = p;
        }
        return edge;
    };

    for (const auto& [bucket, b] : buckets) {
        if (claimed.count(bucket)) continue;
        if (b.volume < threshold) continue;

        PressureZone zone;
        claimed.insert(bucket);
        absorb(zone, b);
        zone.min_price = static_cast<double>(grow(zone, bucket, -1));
        zone.max_price = static_cast<double>(grow(zone, bucket, +1));
        zone.side = zone.entries.front().price < mean_price ? ZoneSide::Bid : ZoneSide::Ask;
        zone.pressure_score = zone.total_volume * (zone.max_price - zone.min_price + 1.0);
        out.zones.push_back(std::move(zone));
    }

    std::stable_sort(out.zones.begin(), out.zones.end(),
                     [](const PressureZone& a, const PressureZone& b) {
                         return a.pressure_score > b.pressure_score;
                     });
    return out;
}
