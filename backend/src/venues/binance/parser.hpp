#pragma once
#include "md/depth_parser.hpp"
#include "venues/level_decode.hpp"

#include <simdjson.h>
#include <cstdint>
#include <iostream>
#include <string>

// Diff depth stream: {"e":"depthUpdate","E":1699999999999,"s":"BTCUSDT","U":..,"u":..,
//                     "b":[["price","qty"],...],"a":[["price","qty"],...]}
class BinanceDepthParser : public IDepthParser {
public:
    BinanceDepthParser() = default;

    bool parse(const std::string& raw, EntryBatch& out) override {
        // Fast reject for subscription results and anything else
        if (raw.find("\"depthUpdate\"") == std::string::npos) return false;

        simdjson::padded_string pj(raw);
        auto doc_res = parser_.iterate(pj);
        if (auto err = doc_res.error()) {
            std::cerr << "[binance-parser] iterate error: " << err << "\n";
            return false;
        }
        simdjson::ondemand::document doc = std::move(doc_res.value());

        std::int64_t ts_ms = 0;
        simdjson::ondemand::value ts_val;
        if (doc["E"].get(ts_val) || !read_ts_ms(ts_val, ts_ms)) {
            ts_ms = wall_clock_ms();
        }

        const auto mark = out.size();
        if (!decode_side(doc, "b", ts_ms, out) || !decode_side(doc, "a", ts_ms, out)) {
            out.resize(mark);
            return false;
        }
        return out.size() > mark;
    }

    // REST /api/v3/depth body: {"lastUpdateId":..,"bids":[...],"asks":[...]}.
    // The snapshot carries no time, so every entry is stamped with `now_ms`.
    static bool parse_snapshot(const std::string& body, std::int64_t now_ms, EntryBatch& out) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string pj(body);
        simdjson::ondemand::document doc;
        if (auto err = parser.iterate(pj).get(doc)) {
            std::cerr << "[binance-parser] snapshot iterate error: " << err << "\n";
            return false;
        }
        return decode_side(doc, "bids", now_ms, out) && decode_side(doc, "asks", now_ms, out);
    }

private:
    static bool decode_side(simdjson::ondemand::document& doc, const char* key,
                            std::int64_t ts_ms, EntryBatch& out) {
        simdjson::ondemand::array ladder;
        if (auto err = doc[key].get_array().get(ladder)) {
            std::cerr << "[binance-parser] missing '" << key << "': " << err << "\n";
            return false;
        }
        if (!append_levels(ladder, "binance", ts_ms, out)) {
            std::cerr << "[binance-parser] malformed '" << key << "' ladder\n";
            return false;
        }
        return true;
    }

    simdjson::ondemand::parser parser_;
};
