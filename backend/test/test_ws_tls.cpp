#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>
#include <string>

#include "ws/ws.hpp"

namespace {

using tcp = boost::asio::ip::tcp;
using namespace std::chrono_literals;

// A loopback listener that never accepts: the kernel completes the TCP
// handshake, after which the peer stays silent forever.
class SilentPeer {
public:
    SilentPeer() : acceptor_(ioc_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {}
    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
};

struct ErrorLog {
    std::mutex m;
    std::vector<std::string> errors;

    void add(const std::string& what) {
        std::lock_guard<std::mutex> lk(m);
        errors.push_back(what);
    }
    std::size_t size() {
        std::lock_guard<std::mutex> lk(m);
        return errors.size();
    }
};

WsEndpoint loopback(std::chrono::milliseconds handshake_timeout) {
    WsEndpoint ep;
    ep.tag = "test-ws";
    ep.host = "127.0.0.1";
    ep.path = "/ws";
    ep.handshake_timeout = handshake_timeout;
    return ep;
}

} // namespace

TEST(TlsWsTest, StopInterruptsPendingHandshake) {
    SilentPeer peer;
    ErrorLog log;
    TlsWs ws(loopback(60s), [](const std::string&) {}, [&](const std::string& w) { log.add(w); });

    auto running = std::async(std::launch::async, [&] { ws.start(peer.port()); });
    std::this_thread::sleep_for(100ms);
    ASSERT_EQ(running.wait_for(0ms), std::future_status::timeout);

    const auto t0 = std::chrono::steady_clock::now();
    ws.stop();
    const auto status = running.wait_for(2s);
    EXPECT_EQ(status, std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
    running.get();

    // A local stop is not a failure
    EXPECT_EQ(log.size(), 0u);
}

TEST(TlsWsTest, SilentPeerFailsAtHandshakeDeadline) {
    SilentPeer peer;
    ErrorLog log;
    TlsWs ws(loopback(200ms), [](const std::string&) {}, [&](const std::string& w) { log.add(w); });

    auto running = std::async(std::launch::async, [&] { ws.start(peer.port()); });
    const auto status = running.wait_for(5s);
    if (status != std::future_status::ready) ws.stop();
    EXPECT_EQ(status, std::future_status::ready);
    running.get();

    ASSERT_EQ(log.size(), 1u);
    EXPECT_NE(log.errors[0].find("timed out"), std::string::npos);
}

TEST(TlsWsTest, StopBeforeStartReturnsImmediately) {
    ErrorLog log;
    TlsWs ws(loopback(60s), [](const std::string&) {}, [&](const std::string& w) { log.add(w); });
    ws.stop();

    auto running = std::async(std::launch::async, [&] { ws.start(9); });
    EXPECT_EQ(running.wait_for(1s), std::future_status::ready);
    running.get();
    EXPECT_EQ(log.size(), 0u);
}

TEST(TlsWsTest, RefusedConnectionReportedOnce) {
    unsigned short closed_port = 0;
    {
        SilentPeer peer;
        closed_port = peer.port();
    }
    ErrorLog log;
    TlsWs ws(loopback(5s), [](const std::string&) {}, [&](const std::string& w) { log.add(w); });

    auto running = std::async(std::launch::async, [&] { ws.start(closed_port); });
    const auto status = running.wait_for(5s);
    if (status != std::future_status::ready) ws.stop();
    EXPECT_EQ(status, std::future_status::ready);
    running.get();

    ASSERT_EQ(log.size(), 1u);
    EXPECT_NE(log.errors[0].find("connect"), std::string::npos);
}
