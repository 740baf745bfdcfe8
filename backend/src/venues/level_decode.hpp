#pragma once
#include "md/depth_entry.hpp"
#include "util/clock.hpp"

#include <simdjson.h>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

// Shared decoding helpers for the [["price","qty",...], ...] ladders every
// supported venue sends.

// Strict decimal parse: the whole string must be consumed and the value must
// be finite. "nan", "inf" and hex floats are rejected.
inline bool parse_decimal(std::string_view sv, double& out) {
    if (sv.empty()) return false;
    for (char c : sv) {
        const bool ok = (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
        if (!ok) return false;
    }
    std::string tmp(sv);
    char* end = nullptr;
    double v = std::strtod(tmp.c_str(), &end);
    if (end != tmp.c_str() + tmp.size()) return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

// Millisecond timestamps arrive either as numbers or as decimal strings.
inline bool read_ts_ms(simdjson::ondemand::value v, std::int64_t& out) {
    simdjson::ondemand::json_type t;
    if (v.type().get(t)) return false;
    if (t == simdjson::ondemand::json_type::number) {
        return !v.get_int64().get(out);
    }
    if (t == simdjson::ondemand::json_type::string) {
        std::string_view sv;
        if (v.get_string().get(sv)) return false;
        double d = 0;
        if (!parse_decimal(sv, d)) return false;
        out = static_cast<std::int64_t>(d);
        return true;
    }
    return false;
}

inline bool read_decimal(simdjson::ondemand::value v, double& out) {
    simdjson::ondemand::json_type t;
    if (v.type().get(t)) return false;
    if (t == simdjson::ondemand::json_type::string) {
        std::string_view sv;
        if (v.get_string().get(sv)) return false;
        return parse_decimal(sv, out);
    }
    if (t == simdjson::ondemand::json_type::number) {
        double d = 0;
        if (v.get_double().get(d) || !std::isfinite(d)) return false;
        out = d;
        return true;
    }
    return false;
}

// Append one entry per level with quantity > 0. Zero-quantity levels are
// deletions and carry nothing for a windowed view. Returns false when the
// ladder is malformed (including a negative quantity or a price outside
// (0, kMaxEntryPrice]); `out` may then hold a partial batch.
inline bool append_levels(simdjson::ondemand::array ladder,
                          const std::string& venue,
                          std::int64_t ts_ms,
                          EntryBatch& out) {
    for (auto elem : ladder) {
        simdjson::ondemand::array level;
        if (elem.get_array().get(level)) return false;

        double px = 0.0, qty = 0.0;
        std::size_t idx = 0;
        for (auto field : level) {
            simdjson::ondemand::value v;
            if (field.get(v)) return false;
            if (idx == 0 && !read_decimal(v, px)) return false;
            if (idx == 1 && !read_decimal(v, qty)) return false;
            ++idx; // trailing members (order counts, liquidations) are ignored
        }
        if (idx < 2) return false;
        if (!(px > 0.0) || px > kMaxEntryPrice) return false;
        if (qty < 0.0) return false;
        if (!(qty > 0.0)) continue;

        DepthEntry e;
        e.price    = px;
        e.quantity = qty;
        e.venue    = venue;
        e.ts_ms    = ts_ms;
        out.emplace_back(std::move(e));
    }
    return true;
}
