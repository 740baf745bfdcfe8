#include "depth_session.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

#include "pipeline/aggregator.hpp"
#include "pipeline/entry_channel.hpp"
#include "util/clock.hpp"
#include "venues/venue_adapter.hpp"

// Everything that lives exactly as long as one connected session.
struct DepthSession::Live {
    std::uint64_t generation{0};
    std::vector<std::unique_ptr<IDepthStream>> streams;
    EntryChannel channel;
    std::vector<DepthEntry> seed; // snapshot entries carried into real-time passes
    std::thread drain;

    // Fixed for the lifetime of the session
    std::chrono::milliseconds batch_period{1000};
    std::size_t max_buffer_entries{0};
    double zone_threshold_ratio{0.2};
    ZoneParams zone_params{};
};

DepthSession::DepthSession(const VenueRegistry& registry, SessionConfig cfg, NowFn now)
    : registry_(registry)
    , now_(now ? std::move(now) : NowFn(&wall_clock_ms))
    , cfg_(std::move(cfg))
    , window_ms_(window_ms(cfg_.window))
    , realtime_(cfg_.realtime)
    , zones_enabled_(cfg_.zones_enabled)
    , view_(std::make_shared<const DepthView>())
{}

DepthSession::~DepthSession() { stop(); }

void DepthSession::start() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    teardown();
    connect();
}

void DepthSession::reconnect() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    std::cout << "[session] reconnect requested" << std::endl;
    teardown();
    connect();
}

bool DepthSession::set_venues(std::vector<std::string> venues) {
    if (venues.empty()) {
        std::cerr << "[session] refusing empty venue set" << std::endl;
        return false;
    }
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    {
        std::lock_guard<std::mutex> cl(cfg_m_);
        cfg_.venues = std::move(venues);
    }
    teardown();
    connect();
    return true;
}

void DepthSession::set_window(TimeWindow w) {
    window_ms_.store(window_ms(w), std::memory_order_relaxed);
    std::lock_guard<std::mutex> cl(cfg_m_);
    cfg_.window = w;
}

void DepthSession::set_realtime(bool on) {
    const bool was = realtime_.exchange(on, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> cl(cfg_m_);
        cfg_.realtime = on;
    }
    if (was == on) return;

    // The drain thread may be parked in the other mode's wait
    std::lock_guard<std::mutex> wl(wake_m_);
    if (wake_target_) wake_target_->wake();
}

void DepthSession::set_zones_enabled(bool on) {
    zones_enabled_.store(on, std::memory_order_relaxed);
    std::lock_guard<std::mutex> cl(cfg_m_);
    cfg_.zones_enabled = on;
}

void DepthSession::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_m_);
    const bool had_live = live_ != nullptr;
    teardown();
    if (had_live || status() != SessionStatus::Closed) {
        set_state(SessionStatus::Closed, "");
    }
}

SessionSnapshot DepthSession::snapshot() const {
    SessionSnapshot out;
    {
        std::lock_guard<std::mutex> lk(state_m_);
        out.status = status_;
        out.error  = error_;
    }
    out.view = load_view();
    return out;
}

std::shared_ptr<const DepthView> DepthSession::load_view() const noexcept {
    return std::atomic_load_explicit(&view_, std::memory_order_acquire);
}

SessionStatus DepthSession::status() const {
    std::lock_guard<std::mutex> lk(state_m_);
    return status_;
}

std::string DepthSession::error() const {
    std::lock_guard<std::mutex> lk(state_m_);
    return error_;
}

SessionConfig DepthSession::config() const {
    std::lock_guard<std::mutex> lk(cfg_m_);
    return cfg_;
}

void DepthSession::set_status_listener(StatusListener fn) {
    std::lock_guard<std::mutex> lk(state_m_);
    listener_ = std::move(fn);
}

void DepthSession::set_state(SessionStatus s, std::string err) {
    StatusListener listener;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(state_m_);
        changed = status_ != s;
        status_ = s;
        error_  = std::move(err);
        listener = listener_;
    }
    if (changed && listener) listener(s);
}

void DepthSession::open_if_connecting() {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lk(state_m_);
        // A stream may already have failed while the others were opening
        if (status_ != SessionStatus::Connecting) return;
        status_ = SessionStatus::Open;
        listener = listener_;
    }
    if (listener) listener(SessionStatus::Open);
}

void DepthSession::on_stream_error(std::uint64_t generation,
                                   const std::string& venue,
                                   const std::string& what) {
    // Ignore failures reported by a session that has since been torn down
    if (generation != generation_.load(std::memory_order_acquire)) return;
    std::cerr << "[session] " << venue << " stream failed: " << what << std::endl;
    set_state(SessionStatus::Error, "WebSocket connection error (" + venue + "): " + what);
}

void DepthSession::connect() {
    const std::uint64_t gen = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    set_state(SessionStatus::Connecting, "");

    const SessionConfig cfg = config();

    struct Selected {
        std::string venue;
        std::string venue_symbol;
        std::unique_ptr<IVenueAdapter> adapter;
    };
    std::vector<Selected> selected;
    selected.reserve(cfg.venues.size());

    // Initial snapshots, one venue after the other
    EntryBatch initial;
    for (const auto& venue : cfg.venues) {
        const VenueFactory* factory = registry_.find(venue);
        if (!factory) {
            std::cerr << "[session] Unknown venue '" << venue << "'; skipping." << std::endl;
            continue;
        }
        auto adapter = factory->make_adapter ? factory->make_adapter() : nullptr;
        if (!adapter) {
            std::cerr << "[session] Venue '" << venue
                      << "' failed to create an adapter; skipping." << std::endl;
            continue;
        }

        const std::string venue_symbol = factory->to_venue_symbol(cfg.symbol);
        try {
            EntryBatch snap = adapter->fetch_snapshot(venue_symbol, cfg.snapshot_limit);
            std::cout << "[session] " << venue << " snapshot " << venue_symbol
                      << ": " << snap.size() << " entries" << std::endl;
            initial.insert(initial.end(),
                           std::make_move_iterator(snap.begin()),
                           std::make_move_iterator(snap.end()));
        } catch (const std::exception& e) {
            // A failed snapshot counts as an empty one
            std::cerr << "[session] " << venue << " snapshot failed: " << e.what() << std::endl;
        }
        selected.push_back(Selected{venue, venue_symbol, std::move(adapter)});
    }

    if (initial.empty()) {
        DepthView empty;
        empty.last_updated_ms = now_();
        publish(std::move(empty));
        set_state(SessionStatus::Error, "Failed to fetch initial orderbook data");
        return;
    }

    run_pass(initial, now_(), cfg.zone_threshold_ratio, cfg.zone_params);

    auto live = std::make_unique<Live>();
    live->generation = gen;
    live->batch_period = cfg.batch_period;
    live->max_buffer_entries = cfg.max_buffer_entries;
    live->zone_threshold_ratio = cfg.zone_threshold_ratio;
    live->zone_params = cfg.zone_params;
    if (realtime_.load(std::memory_order_relaxed)) {
        live->seed = std::move(initial);
    }

    EntryChannel* channel = &live->channel;
    for (auto& sel : selected) {
        try {
            live->streams.push_back(sel.adapter->open_stream(
                sel.venue_symbol,
                [channel](EntryBatch&& batch) { channel->push(std::move(batch)); },
                [this, gen](const std::string& venue, const std::string& what) {
                    on_stream_error(gen, venue, what);
                }));
        } catch (const std::exception& e) {
            on_stream_error(gen, sel.venue, e.what());
        }
    }

    Live* raw = live.get();
    live->drain = std::thread([this, raw] { drain_loop(*raw); });
    live_ = std::move(live);
    {
        std::lock_guard<std::mutex> wl(wake_m_);
        wake_target_ = channel;
    }

    std::cout << "[session] " << live_->streams.size() << " stream(s) running for "
              << cfg.symbol << std::endl;
    open_if_connecting();
}

void DepthSession::teardown() {
    // Stale callbacks from the old streams are ignored from here on
    generation_.fetch_add(1, std::memory_order_acq_rel);

    std::unique_ptr<Live> live = std::move(live_);
    if (!live) return;
    {
        std::lock_guard<std::mutex> wl(wake_m_);
        wake_target_ = nullptr;
    }

    for (auto& stream : live->streams) {
        if (stream) stream->close();
    }
    live->channel.close();
    if (live->drain.joinable()) live->drain.join();

    std::cout << "[session] closed " << live->streams.size() << " stream(s)" << std::endl;
}

void DepthSession::drain_loop(Live& live) {
    const std::size_t max_entries = live.max_buffer_entries;
    const auto period = live.batch_period;
    std::vector<DepthEntry> buffer = std::move(live.seed);

    auto take_pending = [&] {
        EntryBatch fresh = live.channel.drain();
        buffer.insert(buffer.end(),
                      std::make_move_iterator(fresh.begin()),
                      std::make_move_iterator(fresh.end()));
        if (buffer.size() > max_entries) {
            buffer.erase(buffer.begin(),
                         buffer.begin() + static_cast<std::ptrdiff_t>(buffer.size() - max_entries));
        }
        return !fresh.empty();
    };

    auto next_tick = EntryChannel::Clock::now() + period;
    for (;;) {
        if (realtime_.load(std::memory_order_relaxed)) {
            if (!live.channel.wait_pending()) break;

            if (!realtime_.load(std::memory_order_relaxed)) {
                // Switched to batched: pending entries belong to the first tick
                buffer.clear();
                next_tick = EntryChannel::Clock::now() + period;
                continue;
            }
            if (!take_pending()) continue;

            const std::int64_t now = now_();
            run_pass(buffer, now, live.zone_threshold_ratio, live.zone_params);

            // Entries outside the window never come back
            const std::int64_t win = window_ms_.load(std::memory_order_relaxed);
            buffer.erase(std::remove_if(buffer.begin(), buffer.end(),
                                        [&](const DepthEntry& e) { return now - e.ts_ms >= win; }),
                         buffer.end());
        } else {
            if (!live.channel.wait_until(next_tick)) break;
            // Switched to real-time: whatever is pending is picked up right away
            if (realtime_.load(std::memory_order_relaxed)) continue;
            if (EntryChannel::Clock::now() < next_tick) continue;
            next_tick += period;

            take_pending();
            if (!buffer.empty()) {
                run_pass(buffer, now_(), live.zone_threshold_ratio, live.zone_params);
            }
            buffer.clear();
        }
    }
}

void DepthSession::run_pass(const std::vector<DepthEntry>& buffer, std::int64_t now_ms,
                            double zone_threshold_ratio, const ZoneParams& zone_params) {
    AggregateOptions opts;
    opts.window_ms            = window_ms_.load(std::memory_order_relaxed);
    opts.detect_zones         = zones_enabled_.load(std::memory_order_relaxed);
    opts.zone_threshold_ratio = zone_threshold_ratio;
    opts.zone_params          = zone_params;

    publish(aggregate(buffer, now_ms, opts));
}

void DepthSession::publish(DepthView view) {
    auto snap = std::make_shared<const DepthView>(std::move(view));
    std::atomic_store_explicit(&view_, std::move(snap), std::memory_order_release);
    passes_.fetch_add(1, std::memory_order_acq_rel);
}
