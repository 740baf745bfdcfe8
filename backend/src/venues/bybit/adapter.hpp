#pragma once

#include <memory>
#include <string>

#include "md/depth_stream.hpp"
#include "venues/rest_client.hpp"
#include "venues/venue_adapter.hpp"
#include "venues/bybit/parser.hpp"

// Spot depth feed. The stream subscribes at a fixed depth of 50 levels.
class BybitAdapter final : public IVenueAdapter {
public:
    std::string name() const override { return "bybit"; }

    // symbol like "BTCUSDT"
    EntryBatch fetch_snapshot(const std::string& venue_symbol, std::size_t limit) override {
        const std::string url = "https://api.bybit.com/v5/market/orderbook?category=spot&symbol="
                              + venue_symbol + "&limit=" + std::to_string(limit);
        HttpResponse res = http_get(url);
        if (res.status < 200 || res.status >= 300) {
            throw TransportError("bybit snapshot HTTP status " + std::to_string(res.status));
        }

        EntryBatch out;
        if (!BybitDepthParser::parse_snapshot(res.body, wall_clock_ms(), out)) {
            throw TransportError("bybit snapshot payload malformed");
        }
        return out;
    }

    std::unique_ptr<IDepthStream> open_stream(const std::string& venue_symbol,
                                              OnEntries on_entries,
                                              OnError on_error) override {
        WsEndpoint ep;
        ep.tag  = "bybit-ws";
        ep.host = "stream.bybit.com";
        ep.path = "/v5/public/spot";
        ep.subscribe = std::string("{\"op\":\"subscribe\",\"args\":[\"orderbook.50.")
                     + venue_symbol + "\"]}";

        auto stream = std::make_unique<DepthStream<BybitDepthParser>>(
            "bybit", std::move(ep), 443, std::move(on_entries), std::move(on_error));
        stream->start();
        return stream;
    }
};
