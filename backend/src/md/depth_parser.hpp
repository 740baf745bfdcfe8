#pragma once
#include "depth_entry.hpp"
#include <string>
#include <vector>

// Uniform interface for any venue depth parser (snapshot + incremental updates).
struct IDepthParser {
    virtual ~IDepthParser() = default;

    // Parse a raw JSON text frame and append its non-zero levels to `out`.
    // Returns false for frames that carry no depth (acks, pongs) and for
    // malformed frames; malformed frames are logged by the parser.
    virtual bool parse(const std::string& raw, EntryBatch& out) = 0;
};
