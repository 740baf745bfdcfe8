#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "venues/venue_adapter.hpp"
#include "venues/venue_registry.hpp"

// Scripted venue for session tests. The test thread plays the role of the
// stream's reader thread through emit() and fail().
class FakeVenue {
public:
    explicit FakeVenue(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    void set_snapshot(EntryBatch snap) {
        std::lock_guard<std::mutex> lk(m_);
        snapshot_ = std::move(snap);
        snapshot_error_.clear();
    }

    void fail_snapshots(std::string what) {
        std::lock_guard<std::mutex> lk(m_);
        snapshot_error_ = std::move(what);
    }

    void fail_open(bool on) {
        std::lock_guard<std::mutex> lk(m_);
        fail_open_ = on;
    }

    // Deliver a batch through the most recently opened stream, if it is still open.
    bool emit(EntryBatch batch) {
        IVenueAdapter::OnEntries cb;
        {
            std::lock_guard<std::mutex> lk(m_);
            if (streams_.empty() || streams_.back()->closed) return false;
            cb = streams_.back()->on_entries;
        }
        cb(std::move(batch));
        return true;
    }

    // Report a transport failure on the stream opened `index` (default: latest),
    // whether or not it has been closed since.
    void fail(const std::string& what, int index = -1) {
        IVenueAdapter::OnError cb;
        {
            std::lock_guard<std::mutex> lk(m_);
            if (streams_.empty()) return;
            const std::size_t i = index < 0 ? streams_.size() - 1 : static_cast<std::size_t>(index);
            cb = streams_.at(i)->on_error;
        }
        cb(name_, what);
    }

    int snapshots() const { return snapshots_.load(); }
    int opened() const { return opened_.load(); }
    int closed() const { return closed_.load(); }

    std::string last_symbol() const {
        std::lock_guard<std::mutex> lk(m_);
        return last_symbol_;
    }

    VenueFactory factory();

private:
    friend class FakeAdapter;
    friend class FakeStream;

    struct StreamState {
        IVenueAdapter::OnEntries on_entries;
        IVenueAdapter::OnError on_error;
        bool closed{false};
    };

    std::string name_;
    mutable std::mutex m_;
    EntryBatch snapshot_;
    std::string snapshot_error_;
    bool fail_open_{false};
    std::string last_symbol_;
    std::vector<std::shared_ptr<StreamState>> streams_;
    std::atomic<int> snapshots_{0};
    std::atomic<int> opened_{0};
    std::atomic<int> closed_{0};
};

class FakeStream final : public IDepthStream {
public:
    FakeStream(FakeVenue& venue, std::shared_ptr<FakeVenue::StreamState> state)
        : venue_(venue), state_(std::move(state)) {}

    ~FakeStream() override { close(); }

    void close() override {
        std::lock_guard<std::mutex> lk(venue_.m_);
        if (state_->closed) return;
        state_->closed = true;
        ++venue_.closed_;
    }

    const std::string& venue() const override { return venue_.name(); }

private:
    FakeVenue& venue_;
    std::shared_ptr<FakeVenue::StreamState> state_;
};

class FakeAdapter final : public IVenueAdapter {
public:
    explicit FakeAdapter(FakeVenue& venue) : venue_(venue) {}

    std::string name() const override { return venue_.name(); }

    EntryBatch fetch_snapshot(const std::string& venue_symbol, std::size_t) override {
        std::lock_guard<std::mutex> lk(venue_.m_);
        ++venue_.snapshots_;
        venue_.last_symbol_ = venue_symbol;
        if (!venue_.snapshot_error_.empty()) throw TransportError(venue_.snapshot_error_);
        return venue_.snapshot_;
    }

    std::unique_ptr<IDepthStream> open_stream(const std::string&,
                                              OnEntries on_entries,
                                              OnError on_error) override {
        std::lock_guard<std::mutex> lk(venue_.m_);
        if (venue_.fail_open_) throw TransportError("connect refused");
        auto state = std::make_shared<FakeVenue::StreamState>();
        state->on_entries = std::move(on_entries);
        state->on_error = std::move(on_error);
        venue_.streams_.push_back(state);
        ++venue_.opened_;
        return std::make_unique<FakeStream>(venue_, std::move(state));
    }

private:
    FakeVenue& venue_;
};

inline VenueFactory FakeVenue::factory() {
    VenueFactory f;
    f.name = name_;
    f.make_adapter = [this]() -> std::unique_ptr<IVenueAdapter> {
        return std::make_unique<FakeAdapter>(*this);
    };
    f.to_venue_symbol = [](const std::string& canonical) { return "fake:" + canonical; };
    return f;
}

inline DepthEntry make_entry(double px, double qty, const std::string& venue, std::int64_t ts) {
    DepthEntry e;
    e.price = px;
    e.quantity = qty;
    e.venue = venue;
    e.ts_ms = ts;
    return e;
}

// Poll `pred` until it holds or two seconds pass.
inline bool eventually(const std::function<bool()>& pred) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}
