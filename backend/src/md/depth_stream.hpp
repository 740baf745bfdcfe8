#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "util/spsc_ring.hpp"
#include "ws/ws.hpp"
#include "venues/venue_adapter.hpp"
#include "depth_entry.hpp"

// DepthStream is parameterized by a concrete parser type.
// Each DepthStream owns:
//  - a TLS WebSocket connector (producer thread lives in ws_thread_)
//  - an SPSC ring for raw frames
//  - a consumer thread that parses frames into entry batches and hands
//    them to the subscriber
template <typename ParserT, std::size_t QueuePow2 = 4096>
class DepthStream final : public IDepthStream {
public:
    DepthStream(std::string venue_name,
                WsEndpoint endpoint,
                unsigned short port,
                IVenueAdapter::OnEntries on_entries,
                IVenueAdapter::OnError on_error)
    : venue_(std::move(venue_name))
    , on_entries_(std::move(on_entries))
    , on_error_(std::move(on_error))
    , port_(port)
    {
        // The WS callback only enqueues; parsing happens on the consumer thread.
        ws_ = std::make_unique<TlsWs>(std::move(endpoint),
            [this](const std::string& raw) {
                std::string msg(raw);
                if (!queue_.try_push(std::move(msg))) {
                    // Queue full: drop the newest frame
                    const auto n = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
                    if ((n & (n - 1)) == 0) {
                        std::cerr << "[" << venue_ << "-stream] queue full ("
                                  << queue_.capacity() << "), dropped " << n << " frame(s)\n";
                    }
                }
            },
            [this](const std::string& what) { report_error(what); });
    }

    ~DepthStream() override { close(); }

    DepthStream(const DepthStream&) = delete;
    DepthStream& operator=(const DepthStream&) = delete;

    // Start consumer + websocket threads
    void start() {
        running_.store(true, std::memory_order_relaxed);
        consumer_ = std::thread([this] { consume_loop(); });
        ws_thread_ = std::thread([this] { ws_->start(port_); });
    }

    // Orderly stop websocket + consumer
    void close() override {
        running_.store(false, std::memory_order_relaxed);
        if (ws_) ws_->stop();
        if (ws_thread_.joinable()) ws_thread_.join();
        if (consumer_.joinable()) consumer_.join();
    }

    const std::string& venue() const override { return venue_; }

    std::uint64_t dropped_frames() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    void report_error(const std::string& what) {
        if (errored_.exchange(true)) return;
        if (on_error_) on_error_(venue_, what);
    }

    /*
     * Main consumer loop: try_pop from queue, parse, forward the batch.
    */
    void consume_loop() {
        ParserT parser;
        EntryBatch batch;
        std::string raw;

        while (running_.load(std::memory_order_relaxed)) {
            if (!queue_.try_pop(raw)) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                continue;
            }
            batch.clear();
            if (parser.parse(raw, batch) && !batch.empty() && on_entries_) {
                on_entries_(std::move(batch));
                batch = EntryBatch{};
            }
        }
    }

    // Identity
    std::string venue_;
    IVenueAdapter::OnEntries on_entries_;
    IVenueAdapter::OnError on_error_;
    unsigned short port_;

    // Per-venue components
    SpscRing<std::string, QueuePow2> queue_;
    std::unique_ptr<TlsWs> ws_;
    std::thread ws_thread_;
    std::thread consumer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> errored_{false};
    std::atomic<std::uint64_t> dropped_{0};
};
