#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <sstream>
#include <iomanip>
#include <cstddef>

#include "md/depth_entry.hpp"
#include "pipeline/depth_view.hpp"

// Basic JSON string escaper
inline std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

// Encode entries as an array of objects:
// [ { "price": ..., "quantity": ..., "venue": "...", "timestamp": ... }, ... ]
inline void json_entry_array(std::ostringstream& os,
                             const std::vector<DepthEntry>& rows) {
    os << "[";
    bool first = true;
    for (const auto& e : rows) {
        if (!first) os << ",";
        first = false;
        os << "{"
           << "\"price\":"     << std::setprecision(15) << e.price << ","
           << "\"quantity\":"  << std::setprecision(15) << e.quantity << ","
           << "\"venue\":\""   << json_escape(e.venue) << "\","
           << "\"timestamp\":" << e.ts_ms
           << "}";
    }
    os << "]";
}

// Encode at most `limit` zones, best score first.
inline void json_zone_array(std::ostringstream& os,
                            const std::vector<PressureZone>& zones,
                            std::size_t limit) {
    os << "[";
    std::size_t n = 0;
    for (const auto& z : zones) {
        if (n == limit) break;
        if (n++) os << ",";
        os << "{"
           << "\"minPrice\":"      << std::setprecision(15) << z.min_price << ","
           << "\"maxPrice\":"      << std::setprecision(15) << z.max_price << ","
           << "\"totalVolume\":"   << std::setprecision(15) << z.total_volume << ","
           << "\"pressureScore\":" << std::setprecision(15) << z.pressure_score << ","
           << "\"type\":\""        << to_label(z.side) << "\","
           << "\"entries\":";
        json_entry_array(os, z.entries);
        os << "}";
    }
    os << "]";
}
