#include "ws.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <atomic>
#include <iostream>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Every operation is asynchronous and runs on `ioc`, driven by the thread
// inside start(). stop() only posts to that io_context, so the socket is never
// touched from two threads and a pending resolve, connect, handshake or read
// is cancelled immediately.
struct TlsWs::Impl
{
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    WsEndpoint ep;
    OnMsg on_msg;
    OnError on_error;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};
    tcp::resolver resolver{ioc};
    net::steady_timer deadline{ioc}; // covers everything up to the WS handshake
    std::unique_ptr<Stream> ws;
    beast::flat_buffer buffer;
    std::string host_header;

    std::atomic<bool> stop_flag{false};
    bool finished{false}; // io thread only

    Impl(WsEndpoint endpoint, OnMsg cb, OnError err)
    : ep(std::move(endpoint)), on_msg(std::move(cb)), on_error(std::move(err))
    {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    bool stopping() const { return stop_flag.load(std::memory_order_relaxed); }

    void run(unsigned short port)
    {
        if (stopping()) return;

        host_header = ep.host + ":" + std::to_string(port);
        ws = std::make_unique<Stream>(ioc, ssl_ctx);

        deadline.expires_after(ep.handshake_timeout);
        deadline.async_wait([this](beast::error_code ec) {
            if (ec == net::error::operation_aborted) return;
            fail("handshake timed out after " + std::to_string(ep.handshake_timeout.count()) + " ms");
        });

        resolver.async_resolve(ep.host, std::to_string(port),
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                on_resolve(ec, results);
            });

        try
        {
            ioc.run();
        }
        catch (const std::exception &e)
        {
            fail(e.what());
        }
    }

    void on_resolve(beast::error_code ec, const tcp::resolver::results_type &results)
    {
        if (finished) return;
        if (ec) return fail("resolve: " + ec.message());

        beast::get_lowest_layer(*ws).async_connect(results,
            [this](beast::error_code cec, const tcp::resolver::results_type::endpoint_type &) {
                on_connect(cec);
            });
    }

    void on_connect(beast::error_code ec)
    {
        if (finished) return;
        if (ec) return fail("connect: " + ec.message());

        // SNI (Server Name Indication) for TLS
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), ep.host.c_str())) {
            beast::error_code sni_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            return fail("SNI set failed: " + sni_ec.message());
        }

        ws->next_layer().async_handshake(net::ssl::stream_base::client,
            [this](beast::error_code hec) { on_tls_handshake(hec); });
    }

    void on_tls_handshake(beast::error_code ec)
    {
        if (finished) return;
        if (ec) return fail("tls handshake: " + ec.message());

        // Pings at half the idle timeout; an unanswered one ends the read with timeout
        auto opt = websocket::stream_base::timeout::suggested(beast::role_type::client);
        opt.handshake_timeout = ep.handshake_timeout;
        opt.idle_timeout = ep.idle_timeout;
        opt.keep_alive_pings = true;
        ws->set_option(opt);
        ws->set_option(websocket::stream_base::decorator([](websocket::request_type &req){
            req.set(http::field::user_agent, std::string("depth-aggregator-ws/0.1"));
        }));

        ws->async_handshake(host_header, ep.path,
            [this](beast::error_code wec) { on_ws_handshake(wec); });
    }

    void on_ws_handshake(beast::error_code ec)
    {
        if (finished) return;
        if (ec) return fail("websocket handshake: " + ec.message());

        deadline.cancel();
        std::cout << "[" << ep.tag << "] connected to " << ep.host << ep.path << "\n";

        if (ep.subscribe.empty()) return do_read();

        ws->text(true);
        ws->async_write(net::buffer(ep.subscribe),
            [this](beast::error_code wec, std::size_t) {
                if (finished) return;
                if (wec) return fail("subscribe: " + wec.message());
                do_read();
            });
    }

    void do_read()
    {
        ws->async_read(buffer, [this](beast::error_code ec, std::size_t) { on_read(ec); });
    }

    void on_read(beast::error_code ec)
    {
        if (finished) return;
        if (ec == websocket::error::closed) return fail("connection closed by venue");
        if (ec == beast::error::timeout) return fail("connection idle past " + std::to_string(ep.idle_timeout.count()) + " ms");
        if (ec) return fail("read: " + ec.message());

        std::string data = beast::buffers_to_string(buffer.cdata());
        buffer.consume(buffer.size());
        if (on_msg) on_msg(data);
        do_read();
    }

    // io thread only. Reports once, unless the failure was provoked by stop().
    void fail(const std::string &what)
    {
        if (finished) return;
        shutdown();
        if (stopping()) return;
        std::cerr << "[" << ep.tag << "] error: " << what << "\n";
        if (on_error) on_error(what);
    }

    // io thread only. Cancels every pending operation; their handlers see `finished`.
    void shutdown()
    {
        finished = true;
        deadline.cancel();
        resolver.cancel();
        if (ws) beast::get_lowest_layer(*ws).close();
    }

    void stop() noexcept
    {
        stop_flag.store(true, std::memory_order_relaxed);
        net::post(ioc, [this] { if (!finished) shutdown(); });
    }
};

TlsWs::TlsWs(WsEndpoint endpoint, OnMsg cb, OnError on_error)
    : impl_(new Impl(std::move(endpoint), std::move(cb), std::move(on_error))) {}
TlsWs::~TlsWs() { delete impl_; }

// The outer class methods just forward to the implementation
void TlsWs::start(unsigned short port) { impl_->run(port); }
void TlsWs::stop() noexcept { impl_->stop(); }
