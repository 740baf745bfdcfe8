#pragma once
#include "md/depth_parser.hpp"
#include "venues/level_decode.hpp"

#include <simdjson.h>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

// "books" channel push:
// {"arg":{"channel":"books","instId":"BTC-USDT"},"action":"snapshot"|"update",
//  "data":[{"asks":[["px","sz","0","n"]],"bids":[...],"ts":"1597026383085","checksum":..}]}
class OkxDepthParser : public IDepthParser {
public:
    OkxDepthParser() = default;

    bool parse(const std::string& raw, EntryBatch& out) override {
        // Subscription acks, errors and pongs carry "event" or no data
        if (raw.find("\"event\"") != std::string::npos) {
            if (raw.find("\"error\"") != std::string::npos) {
                std::cerr << "[okx-parser] venue error event: " << raw << "\n";
            }
            return false;
        }
        if (raw.find("\"data\"") == std::string::npos) return false;

        simdjson::padded_string pj(raw);
        auto doc_res = parser_.iterate(pj);
        if (auto err = doc_res.error()) {
            std::cerr << "[okx-parser] iterate error: " << err << "\n";
            return false;
        }
        simdjson::ondemand::document doc = std::move(doc_res.value());

        simdjson::ondemand::array data;
        if (auto err = doc["data"].get_array().get(data)) {
            std::cerr << "[okx-parser] data get_array error: " << err << "\n";
            return false;
        }

        const auto mark = out.size();
        if (!decode_books(data, out)) {
            out.resize(mark);
            return false;
        }
        return out.size() > mark;
    }

    // REST /api/v5/market/books body: {"code":"0","msg":"","data":[{...}]}
    static bool parse_snapshot(const std::string& body, std::int64_t now_ms, EntryBatch& out) {
        (void)now_ms; // OKX stamps every book with its own "ts"
        simdjson::ondemand::parser parser;
        simdjson::padded_string pj(body);
        simdjson::ondemand::document doc;
        if (auto err = parser.iterate(pj).get(doc)) {
            std::cerr << "[okx-parser] snapshot iterate error: " << err << "\n";
            return false;
        }

        std::string_view code;
        if (doc["code"].get_string().get(code) || code != "0") {
            std::cerr << "[okx-parser] snapshot rejected, code=" << code << "\n";
            return false;
        }

        simdjson::ondemand::array data;
        if (doc["data"].get_array().get(data)) {
            std::cerr << "[okx-parser] no data in snapshot\n";
            return false;
        }
        return decode_books(data, out);
    }

private:
    static bool decode_books(simdjson::ondemand::array& data, EntryBatch& out) {
        std::size_t books = 0;
        for (auto elem : data) {
            simdjson::ondemand::object book;
            if (elem.get_object().get(book)) return false;

            std::int64_t ts_ms = 0;
            simdjson::ondemand::value ts_val;
            if (book["ts"].get(ts_val) || !read_ts_ms(ts_val, ts_ms)) {
                ts_ms = wall_clock_ms();
            }

            simdjson::ondemand::array bids, asks;
            if (book["bids"].get_array().get(bids)) return false;
            if (!append_levels(bids, "okx", ts_ms, out)) return false;
            if (book["asks"].get_array().get(asks)) return false;
            if (!append_levels(asks, "okx", ts_ms, out)) return false;
            ++books;
        }
        if (books == 0) {
            std::cerr << "[okx-parser] empty data array\n";
            return false;
        }
        return true;
    }

    simdjson::ondemand::parser parser_;
};
