#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// Small JSON API server: one strand per connection, keep-alive honoured,
// CORS headers on every reply. The handler runs on the io_context thread.
class HttpServer {
public:
    using Request  = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using HandlerFn = std::function<void(const Request&, Response&)>;

    static constexpr std::uint64_t kBodyLimit = 16 * 1024;
    static constexpr std::chrono::seconds kIdleTimeout{30};

    HttpServer(boost::asio::io_context& ioc, tcp::endpoint ep, HandlerFn handler)
    : ioc_(ioc), acceptor_(ioc), handler_(std::move(handler)) {
        boost::beast::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("open: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("set_option: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("bind: " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("listen: " + ec.message());
    }

    void run() { do_accept(); }

    // Stop accepting; connections in flight finish on their own.
    void stop() {
        boost::beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(tcp::socket s, HandlerFn h) : stream_(std::move(s)), handler_(std::move(h)) {}

        void run() { do_read(); }

    private:
        void do_read() {
            parser_.emplace();
            parser_->body_limit(kBodyLimit);
            stream_.expires_after(kIdleTimeout);
            http::async_read(stream_, buffer_, *parser_,
                [self = shared_from_this()](boost::beast::error_code ec, std::size_t) {
                    self->on_read(ec);
                });
        }

        void on_read(boost::beast::error_code ec) {
            if (ec == http::error::end_of_stream) return do_close();
            if (ec) {
                if (ec != boost::beast::error::timeout) {
                    std::cerr << "[http] read error: " << ec.message() << std::endl;
                }
                return;
            }

            Request req = parser_->release();
            std::cout << "[http] " << req.method_string() << " " << req.target() << std::endl;

            auto res = std::make_shared<Response>();
            res->version(req.version());
            res->keep_alive(req.keep_alive());
            respond(req, *res);
            res->prepare_payload();

            http::async_write(stream_, *res,
                [self = shared_from_this(), res](boost::beast::error_code wec, std::size_t) {
                    if (wec) {
                        std::cerr << "[http] write error: " << wec.message() << std::endl;
                        return;
                    }
                    if (!res->keep_alive()) return self->do_close();
                    self->do_read();
                });
        }

        void respond(const Request& req, Response& res) {
            res.set(http::field::access_control_allow_origin, "*");
            res.set(http::field::access_control_allow_headers, "*");
            res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");

            // Preflight never reaches the routes
            if (req.method() == http::verb::options) {
                res.result(http::status::no_content);
                return;
            }
            try {
                handler_(req, res);
            } catch (const std::exception& e) {
                std::cerr << "[http] handler failed: " << e.what() << std::endl;
                res.result(http::status::internal_server_error);
                res.set(http::field::content_type, "application/json");
                res.body() = R"({"error":"internal error"})";
            }
        }

        void do_close() {
            boost::beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        HandlerFn handler_;
    };

    void do_accept() {
        acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            [this](boost::beast::error_code ec, tcp::socket s){
                if (ec == boost::asio::error::operation_aborted) return;
                if (ec) {
                    std::cerr << "[http] accept error: " << ec.message() << std::endl;
                } else {
                    std::make_shared<Connection>(std::move(s), handler_)->run();
                }
                do_accept();
            });
    }

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    HandlerFn handler_;
};
