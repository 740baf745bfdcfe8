#pragma once
#include <chrono>
#include <functional>
#include <string>

// Interface for a market-data WebSocket connector.
// start() runs the connection on the calling thread until stop() or a failure.
// stop() may be called from any thread, at any point, and makes start() return promptly.
// OnMsg(json): called for each text frame from the exchange.
// OnError(what): called once when the connection fails or the venue drops it.
struct IMarketWs
{
    using OnMsg = std::function<void(const std::string &)>;
    using OnError = std::function<void(const std::string &)>;
    virtual ~IMarketWs() = default;
    virtual void start(unsigned short port = 443) = 0;
    virtual void stop() noexcept = 0;
};

// Where to connect and what to send once the handshake completes.
struct WsEndpoint
{
    std::string tag;       // log prefix, e.g. "binance-ws"
    std::string host;      // "stream.binance.com"
    std::string path{"/"}; // "/ws/btcusdt@depth"
    std::string subscribe; // first text frame; empty when the path subscribes

    // Deadline for resolve + connect + TLS and WebSocket handshakes.
    std::chrono::milliseconds handshake_timeout{10000};
    // A connection silent for this long (pings unanswered) is a failure.
    std::chrono::milliseconds idle_timeout{20000};
};

// NOTE: TLS WebSocket connector uses a PIMPL to hide Boost headers from dependents.
class TlsWs : public IMarketWs
{
public:
    TlsWs(WsEndpoint endpoint, OnMsg cb, OnError on_error);
    ~TlsWs();
    TlsWs(const TlsWs &) = delete;
    TlsWs &operator=(const TlsWs &) = delete;

    void start(unsigned short port = 443) override; // blocks until closed
    void stop() noexcept override;                  // thread-safe

private:
    struct Impl;
    Impl *impl_;
};
