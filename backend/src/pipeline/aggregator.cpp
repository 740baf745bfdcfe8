#include "aggregator.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>

namespace {

// Entries grouped by venue, groups in first-seen venue order.
struct VenueGroup {
    std::string venue;
    std::vector<DepthEntry> entries;
    double mid{0};
};

std::vector<VenueGroup> group_by_venue(const std::vector<DepthEntry>& entries) {
    std::vector<VenueGroup> groups;
    std::unordered_map<std::string, std::size_t> index;
    for (const auto& e : entries) {
        auto [it, inserted] = index.emplace(e.venue, groups.size());
        if (inserted) groups.push_back(VenueGroup{e.venue, {}, 0.0});
        groups[it->second].entries.push_back(e);
    }
    for (auto& g : groups) {
        double sum = 0.0;
        for (const auto& e : g.entries) sum += e.price;
        g.mid = sum / static_cast<double>(g.entries.size());
    }
    return groups;
}

double mean_price(const std::vector<DepthEntry>& entries) {
    if (entries.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& e : entries) sum += e.price;
    return sum / static_cast<double>(entries.size());
}

} // namespace

std::vector<DepthEntry> filter_window(const std::vector<DepthEntry>& entries,
                                      std::int64_t now_ms,
                                      std::int64_t window_ms)
{
    std::vector<DepthEntry> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        if (!is_usable(e)) continue;
        if (now_ms - e.ts_ms < window_ms) out.push_back(e);
    }
    return out;
}

DepthView aggregate(const std::vector<DepthEntry>& entries,
                    std::int64_t now_ms,
                    const AggregateOptions& opts)
{
    DepthView view;
    view.last_updated_ms = now_ms;

    const std::vector<DepthEntry> current = filter_window(entries, now_ms, opts.window_ms);
    if (current.empty()) return view;

    const std::vector<VenueGroup> groups = group_by_venue(current);
    std::unordered_map<std::string, double> venue_mid;
    for (const auto& g : groups) venue_mid.emplace(g.venue, g.mid);
    const double global_mid = mean_price(current);

    // Heuristic split: below the venue's own mean is a bid, anything else an ask
    for (const auto& e : current) {
        auto it = venue_mid.find(e.venue);
        const double mid = (it != venue_mid.end() && it->second != 0.0) ? it->second : global_mid;
        if (e.price < mid) view.bids.push_back(e);
        else               view.asks.push_back(e);
    }

    std::stable_sort(view.bids.begin(), view.bids.end(),
                     [](const DepthEntry& a, const DepthEntry& b) { return a.price > b.price; });
    std::stable_sort(view.asks.begin(), view.asks.end(),
                     [](const DepthEntry& a, const DepthEntry& b) { return a.price < b.price; });

    bool first = true;
    auto extend = [&](const DepthEntry& e) {
        if (first) {
            view.min_price = view.max_price = e.price;
            view.max_quantity = e.quantity;
            first = false;
            return;
        }
        view.min_price    = std::min(view.min_price, e.price);
        view.max_price    = std::max(view.max_price, e.price);
        view.max_quantity = std::max(view.max_quantity, e.quantity);
    };
    for (const auto& e : view.bids) extend(e);
    for (const auto& e : view.asks) extend(e);

    if (!opts.detect_zones) return view;

    const double threshold = view.max_quantity * opts.zone_threshold_ratio;
    for (const auto& g : groups) {
        ZoneDetection det = detect_pressure_zones(g.entries, threshold, opts.zone_params);
        for (auto& z : det.zones) view.pressure_zones.push_back(std::move(z));
    }
    std::stable_sort(view.pressure_zones.begin(), view.pressure_zones.end(),
                     [](const PressureZone& a, const PressureZone& b) {
                         return a.pressure_score > b.pressure_score;
                     });
    return view;
}
