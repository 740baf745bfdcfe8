#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "md/time_window.hpp"
#include "pipeline/depth_view.hpp"
#include "pipeline/pressure_zones.hpp"
#include "venues/venue_registry.hpp"

class EntryChannel;

enum class SessionStatus : std::uint8_t
{
    Connecting = 0,
    Open = 1,
    Closed = 2,
    Error = 3
};

inline const char* to_label(SessionStatus s) noexcept
{
    switch (s) {
        case SessionStatus::Connecting: return "connecting";
        case SessionStatus::Open:       return "open";
        case SessionStatus::Closed:     return "closed";
        case SessionStatus::Error:      return "error";
    }
    return "closed";
}

// Session config option
struct SessionConfig {
    std::vector<std::string> venues{"binance"}; // non-empty
    std::string symbol{"BTC-USDT"};             // canonical
    TimeWindow window{TimeWindow::OneMinute};
    bool realtime{true};       // recompute on every arrival, else every batch_period
    bool zones_enabled{true};
    std::size_t snapshot_limit{100};
    std::chrono::milliseconds batch_period{1000};
    std::size_t max_buffer_entries{200000}; // oldest entries dropped beyond this
    double zone_threshold_ratio{0.2};
    ZoneParams zone_params{};
};

// The single read-and-react value handed to the presentation layer.
struct SessionSnapshot {
    std::shared_ptr<const DepthView> view; // never null
    SessionStatus status{SessionStatus::Closed};
    std::string error;                     // empty unless status is Error
};

// DepthSession owns the venue streams of one aggregation session:
//  - connect: sequential snapshots, first pass, live streams, then Open
//  - every stream batch goes through an EntryChannel to one drain thread,
//    which owns the working buffer and publishes each new DepthView atomically
//  - a stream failure moves the session to Error without touching its siblings
//  - reconnect() and set_venues() tear everything down and connect again
// Lifecycle calls are serialized; they must not be made from a status listener.
class DepthSession {
public:
    using StatusListener = std::function<void(SessionStatus)>;
    using NowFn = std::function<std::int64_t()>; // wall clock, ms

    DepthSession(const VenueRegistry& registry, SessionConfig cfg, NowFn now = {});
    ~DepthSession();

    DepthSession(const DepthSession&) = delete;
    DepthSession& operator=(const DepthSession&) = delete;

    // Enter Connecting and run the connect sequence on the calling thread.
    void start();

    // Close every stream, clear the error and connect again.
    void reconnect();

    // Replace the venue set; always a full teardown and reconnect.
    // Returns false (and changes nothing) for an empty set.
    bool set_venues(std::vector<std::string> venues);

    // Applied from the next pass on, without reconnecting.
    void set_window(TimeWindow w);
    void set_realtime(bool on);
    void set_zones_enabled(bool on);

    // Close every stream; status becomes Closed.
    void stop();

    SessionSnapshot snapshot() const;
    std::shared_ptr<const DepthView> load_view() const noexcept;
    SessionStatus status() const;
    std::string error() const;
    SessionConfig config() const;

    // Number of aggregation passes published so far.
    std::uint64_t passes() const noexcept { return passes_.load(std::memory_order_acquire); }

    void set_status_listener(StatusListener fn);

private:
    struct Live;

    void connect();
    void teardown();
    void drain_loop(Live& live);
    void run_pass(const std::vector<DepthEntry>& buffer, std::int64_t now_ms,
                  double zone_threshold_ratio, const ZoneParams& zone_params);
    void publish(DepthView view);
    void set_state(SessionStatus s, std::string err);
    void open_if_connecting();
    void on_stream_error(std::uint64_t generation, const std::string& venue, const std::string& what);

    const VenueRegistry& registry_;
    NowFn now_;

    std::mutex lifecycle_m_; // serializes start/reconnect/set_venues/stop
    std::unique_ptr<Live> live_;
    std::atomic<std::uint64_t> generation_{0};

    std::mutex wake_m_; // protects wake_target_; never held across a blocking call
    EntryChannel* wake_target_{nullptr};

    mutable std::mutex cfg_m_; // protects cfg_ (venues, symbol, limits)
    SessionConfig cfg_;
    std::atomic<std::int64_t> window_ms_;
    std::atomic<bool> realtime_;
    std::atomic<bool> zones_enabled_;

    mutable std::mutex state_m_; // protects status_, error_, listener_
    SessionStatus status_{SessionStatus::Closed};
    std::string error_;
    StatusListener listener_;

    // Published view (immutable via shared_ptr)
    std::shared_ptr<const DepthView> view_;
    std::atomic<std::uint64_t> passes_{0};
};
