#pragma once
#include "md/depth_parser.hpp"
#include "venues/level_decode.hpp"

#include <simdjson.h>
#include <cstdint>
#include <iostream>
#include <string>

// Spot orderbook push:
// {"topic":"orderbook.50.BTCUSDT","type":"snapshot"|"delta","ts":1672304484978,
//  "data":{"s":"BTCUSDT","b":[["px","qty"]],"a":[...],"u":..,"seq":..},"cts":..}
class BybitDepthParser : public IDepthParser {
public:
    BybitDepthParser() = default;

    bool parse(const std::string& raw, EntryBatch& out) override {
        // Subscription acks and pongs have no orderbook topic
        if (raw.find("\"topic\":\"orderbook") == std::string::npos) return false;

        simdjson::padded_string pj(raw);
        auto doc_res = parser_.iterate(pj);
        if (auto err = doc_res.error()) {
            std::cerr << "[bybit-parser] iterate error: " << err << "\n";
            return false;
        }
        simdjson::ondemand::document doc = std::move(doc_res.value());

        std::int64_t ts_ms = 0;
        simdjson::ondemand::value ts_val;
        if (doc["ts"].get(ts_val) || !read_ts_ms(ts_val, ts_ms)) {
            ts_ms = wall_clock_ms();
        }

        simdjson::ondemand::object data;
        if (auto err = doc["data"].get_object().get(data)) {
            std::cerr << "[bybit-parser] data get_object error: " << err << "\n";
            return false;
        }

        const auto mark = out.size();
        if (!decode_book(data, ts_ms, out)) {
            std::cerr << "[bybit-parser] malformed book payload\n";
            out.resize(mark);
            return false;
        }
        return out.size() > mark;
    }

    // REST /v5/market/orderbook body:
    // {"retCode":0,"retMsg":"OK","result":{"s":..,"b":[...],"a":[...],"ts":..,"u":..},"time":..}
    static bool parse_snapshot(const std::string& body, std::int64_t now_ms, EntryBatch& out) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string pj(body);
        simdjson::ondemand::document doc;
        if (auto err = parser.iterate(pj).get(doc)) {
            std::cerr << "[bybit-parser] snapshot iterate error: " << err << "\n";
            return false;
        }

        std::int64_t ret_code = -1;
        if (doc["retCode"].get_int64().get(ret_code) || ret_code != 0) {
            std::cerr << "[bybit-parser] snapshot rejected, retCode=" << ret_code << "\n";
            return false;
        }

        simdjson::ondemand::object result;
        if (doc["result"].get_object().get(result)) {
            std::cerr << "[bybit-parser] no result in snapshot\n";
            return false;
        }

        std::int64_t ts_ms = now_ms;
        simdjson::ondemand::value ts_val;
        if (result["ts"].get(ts_val) || !read_ts_ms(ts_val, ts_ms)) {
            ts_ms = now_ms;
        }
        return decode_book(result, ts_ms, out);
    }

private:
    static bool decode_book(simdjson::ondemand::object& book, std::int64_t ts_ms, EntryBatch& out) {
        simdjson::ondemand::array bids, asks;
        if (book["b"].get_array().get(bids)) return false;
        if (!append_levels(bids, "bybit", ts_ms, out)) return false;
        if (book["a"].get_array().get(asks)) return false;
        return append_levels(asks, "bybit", ts_ms, out);
    }

    simdjson::ondemand::parser parser_;
};
