#pragma once
#include <boost/url.hpp>
#include <boost/beast/http.hpp>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include "util/json_encode.hpp"
#include "pipeline/depth_session.hpp"
#include "server/env_config.hpp"

namespace http  = boost::beast::http;
namespace urls  = boost::urls;

inline void json_reply(http::response<http::string_body>& res, http::status st, std::string body) {
    res.result(st);
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body);
}

inline std::string encode_snapshot(const SessionSnapshot& snap, std::size_t zone_limit) {
    const DepthView& v = *snap.view;

    std::ostringstream os;
    os << "{";
    os << "\"status\":\"" << to_label(snap.status) << "\",";
    if (snap.error.empty()) os << "\"error\":null,";
    else                    os << "\"error\":\"" << json_escape(snap.error) << "\",";
    os << "\"minPrice\":"    << std::setprecision(15) << v.min_price << ",";
    os << "\"maxPrice\":"    << std::setprecision(15) << v.max_price << ",";
    os << "\"maxQuantity\":" << std::setprecision(15) << v.max_quantity << ",";
    os << "\"lastUpdated\":" << v.last_updated_ms << ",";
    os << "\"bids\":"; json_entry_array(os, v.bids); os << ",";
    os << "\"asks\":"; json_entry_array(os, v.asks); os << ",";
    os << "\"pressureZones\":"; json_zone_array(os, v.pressure_zones, zone_limit);
    os << "}";
    return os.str();
}

inline void handle_request(DepthSession& session,
                           const http::request<http::string_body>& req,
                           http::response<http::string_body>& res)
{
    res.set(http::field::server, "depth-aggregator/0.1");

    // Parse the target as an origin-form URL
    std::string_view target{req.target().data(), req.target().size()};
    auto parsed_result = urls::parse_origin_form(target);
    if (!parsed_result) {
        json_reply(res, http::status::bad_request, R"({"error":"bad request"})");
        return;
    }

    urls::url_view url = *parsed_result;
    const bool is_get  = req.method() == http::verb::get;
    const bool is_post = req.method() == http::verb::post;

    auto param = [&url](std::string_view key) -> std::string {
        for (auto const& p : url.params()) {
            if (p.key == key) return std::string(p.value);
        }
        return {};
    };

    // /api/health
    if (is_get && url.path() == "/api/health") {
        json_reply(res, http::status::ok, R"({"status":"ok"})");
        return;
    }

    // /api/depth?zones=20
    if (is_get && url.path() == "/api/depth") {
        std::size_t zone_limit = std::numeric_limits<std::size_t>::max();
        const std::string zones = param("zones");
        if (!zones.empty()) {
            try {
                zone_limit = std::stoul(zones);
            } catch (const std::exception&) {
                json_reply(res, http::status::bad_request, R"({"error":"zones must be a number"})");
                return;
            }
        }
        json_reply(res, http::status::ok, encode_snapshot(session.snapshot(), zone_limit));
        return;
    }

    // /api/reconnect
    if (is_post && url.path() == "/api/reconnect") {
        session.reconnect();
        json_reply(res, http::status::ok,
                   std::string("{\"status\":\"") + to_label(session.status()) + "\"}");
        return;
    }

    // /api/venues            -> selected venues
    // /api/venues?list=a,b   -> replace the selection (reconnects)
    if (url.path() == "/api/venues" && (is_get || is_post)) {
        if (is_post) {
            if (!session.set_venues(split_venue_list(param("list")))) {
                json_reply(res, http::status::bad_request, R"({"error":"at least one venue is required"})");
                return;
            }
        }
        std::ostringstream os;
        os << "{\"venues\":[";
        bool first = true;
        for (const auto& v : session.config().venues) {
            if (!first) os << ",";
            first = false;
            os << "\"" << json_escape(v) << "\"";
        }
        os << "],\"status\":\"" << to_label(session.status()) << "\"}";
        json_reply(res, http::status::ok, os.str());
        return;
    }

    // /api/window?range=5m
    if (is_post && url.path() == "/api/window") {
        TimeWindow w = TimeWindow::OneMinute;
        if (!parse_window(param("range"), w)) {
            json_reply(res, http::status::bad_request, R"({"error":"range must be one of 1m, 5m, 15m, 1h"})");
            return;
        }
        session.set_window(w);
        json_reply(res, http::status::ok, std::string("{\"range\":\"") + to_label(w) + "\"}");
        return;
    }

    // /api/mode?realtime=0|1&zones=0|1
    if (is_post && url.path() == "/api/mode") {
        const std::string rt = param("realtime");
        const std::string zones = param("zones");
        if (!rt.empty())    session.set_realtime(rt == "1" || rt == "true");
        if (!zones.empty()) session.set_zones_enabled(zones == "1" || zones == "true");
        const SessionConfig cfg = session.config();
        json_reply(res, http::status::ok,
                   std::string("{\"realtime\":") + (cfg.realtime ? "true" : "false")
                   + ",\"zones\":" + (cfg.zones_enabled ? "true" : "false") + "}");
        return;
    }

    // 404
    json_reply(res, http::status::not_found, R"({"error":"not found"})");
}
