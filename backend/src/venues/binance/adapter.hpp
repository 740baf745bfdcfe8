#pragma once

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

#include "md/depth_stream.hpp"
#include "venues/rest_client.hpp"
#include "venues/venue_adapter.hpp"
#include "venues/binance/parser.hpp"

class BinanceAdapter final : public IVenueAdapter {
public:
    std::string name() const override { return "binance"; }

    // symbol like "btcusdt"; the REST endpoint wants it upper-cased
    EntryBatch fetch_snapshot(const std::string& venue_symbol, std::size_t limit) override {
        std::string rest_symbol = venue_symbol;
        std::transform(rest_symbol.begin(), rest_symbol.end(), rest_symbol.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        const std::string url = "https://api.binance.com/api/v3/depth?symbol=" + rest_symbol
                              + "&limit=" + std::to_string(limit);
        HttpResponse res = http_get(url);
        if (res.status < 200 || res.status >= 300) {
            throw TransportError("binance snapshot HTTP status " + std::to_string(res.status));
        }

        EntryBatch out;
        if (!BinanceDepthParser::parse_snapshot(res.body, wall_clock_ms(), out)) {
            throw TransportError("binance snapshot payload malformed");
        }
        return out;
    }

    std::unique_ptr<IDepthStream> open_stream(const std::string& venue_symbol,
                                              OnEntries on_entries,
                                              OnError on_error) override {
        WsEndpoint ep;
        ep.tag  = "binance-ws";
        ep.host = "stream.binance.com";
        ep.path = "/ws/" + venue_symbol + "@depth";

        auto stream = std::make_unique<DepthStream<BinanceDepthParser>>(
            "binance", std::move(ep), 9443, std::move(on_entries), std::move(on_error));
        stream->start();
        return stream;
    }
};
