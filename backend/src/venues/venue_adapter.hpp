#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "md/depth_entry.hpp"

// Snapshot fetch or stream failure for one venue. Recoverable by reconnecting.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A live depth subscription. Owns every thread it started.
struct IDepthStream {
    virtual ~IDepthStream() = default;

    // Stop and join. Idempotent; no callback runs after close() returns.
    virtual void close() = 0;

    virtual const std::string& venue() const = 0;
};

// Capability set every venue provides: a one-shot snapshot and a live stream.
class IVenueAdapter {
public:
    using OnEntries = std::function<void(EntryBatch&&)>;
    using OnError   = std::function<void(const std::string& venue, const std::string& what)>;

    virtual ~IVenueAdapter() = default;

    virtual std::string name() const = 0;

    // Throws TransportError on network failure, non-2xx status or a payload
    // that does not decode.
    virtual EntryBatch fetch_snapshot(const std::string& venue_symbol, std::size_t limit) = 0;

    // Delivers decoded batches as they arrive. The handle does not reconnect
    // on its own; on_error is the end of the stream.
    virtual std::unique_ptr<IDepthStream> open_stream(const std::string& venue_symbol,
                                                      OnEntries on_entries,
                                                      OnError on_error) = 0;
};
