#pragma once

#include <memory>
#include <string>

#include "md/depth_stream.hpp"
#include "venues/rest_client.hpp"
#include "venues/venue_adapter.hpp"
#include "venues/okx/parser.hpp"

class OkxAdapter final : public IVenueAdapter {
public:
    std::string name() const override { return "okx"; }

    // symbol like "BTC-USDT"
    EntryBatch fetch_snapshot(const std::string& venue_symbol, std::size_t limit) override {
        const std::string url = "https://www.okx.com/api/v5/market/books?instId=" + venue_symbol
                              + "&sz=" + std::to_string(limit);
        HttpResponse res = http_get(url);
        if (res.status < 200 || res.status >= 300) {
            throw TransportError("okx snapshot HTTP status " + std::to_string(res.status));
        }

        EntryBatch out;
        if (!OkxDepthParser::parse_snapshot(res.body, wall_clock_ms(), out)) {
            throw TransportError("okx snapshot payload malformed");
        }
        return out;
    }

    std::unique_ptr<IDepthStream> open_stream(const std::string& venue_symbol,
                                              OnEntries on_entries,
                                              OnError on_error) override {
        WsEndpoint ep;
        ep.tag  = "okx-ws";
        ep.host = "ws.okx.com";
        ep.path = "/ws/v5/public";
        // {"op":"subscribe","args":[{"channel":"books","instId":"BTC-USDT"}]}
        ep.subscribe = std::string("{\"op\":\"subscribe\",\"args\":[{\"channel\":\"books\",\"instId\":\"")
                     + venue_symbol + "\"}]}";

        auto stream = std::make_unique<DepthStream<OkxDepthParser>>(
            "okx", std::move(ep), 8443, std::move(on_entries), std::move(on_error));
        stream->start();
        return stream;
    }
};
