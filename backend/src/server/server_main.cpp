#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <iostream>
#include <string>

#include "pipeline/depth_session.hpp"
#include "venues/venue_registry.hpp"
#include "server/env_config.hpp"
#include "server/http_server.hpp"
#include "server/http_routes.hpp"

using tcp = boost::asio::ip::tcp;

int main() {
    // Load .env file
    load_env_file();

    SessionConfig cfg;
    unsigned short port = 8080;
    try {
        cfg = session_config_from_env();
        port = http_port_from_env();
    } catch (const std::exception& e) {
        std::cerr << "[setup] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    const auto& registry = VenueRegistry::instance();
    for (const auto& venue : cfg.venues) {
        if (!registry.find(venue)) {
            std::cerr << "[setup] Unknown venue '" << venue << "' will be skipped." << std::endl;
        }
    }

    std::cout << "[setup] symbol=" << cfg.symbol
              << " window=" << to_label(cfg.window)
              << " mode=" << (cfg.realtime ? "realtime" : "batched")
              << " zones=" << (cfg.zones_enabled ? "on" : "off") << std::endl;

    DepthSession session{registry, cfg};
    session.set_status_listener([](SessionStatus s) {
        std::cout << "[session] status -> " << to_label(s) << std::endl;
    });
    session.start();
    if (session.status() == SessionStatus::Error) {
        std::cerr << "[setup] " << session.error() << "; POST /api/reconnect to retry." << std::endl;
    }

    // Start HTTP server
    boost::asio::io_context ioc{1};
    try {
        tcp::endpoint ep{boost::asio::ip::make_address("0.0.0.0"), port};
        HttpServer server{ioc, ep, [&](auto const& req, auto& res){
            handle_request(session, req, res);
        }};
        server.run();

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](boost::beast::error_code, int sig) {
            std::cout << "[setup] signal " << sig << ", shutting down" << std::endl;
            server.stop();
            ioc.stop();
        });

        std::cout << "HTTP listening on :" << port << std::endl;
        ioc.run();
    } catch (const std::exception& e) {
        std::cerr << "[setup] HTTP server failed: " << e.what() << std::endl;
        session.stop();
        return 1;
    }

    session.stop();
    return 0;
}
