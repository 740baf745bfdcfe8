#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <algorithm>

#include "venue_factory.hpp"

// Venue id -> factory. Adding a venue means registering one more factory;
// nothing downstream of the adapter interface changes.
class VenueRegistry {
public:
    VenueRegistry() = default;

    // Registry preloaded with every built-in venue.
    static const VenueRegistry& instance();

    const VenueFactory* find(std::string_view name) const {
        auto it = factories_.find(std::string(name));
        if (it == factories_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    std::vector<std::string> list_names() const {
        std::vector<std::string> names;
        names.reserve(factories_.size());
        for (const auto& kv : factories_) {
            names.push_back(kv.first);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    // Incomplete factories are ignored.
    bool register_factory(VenueFactory factory) {
        if (factory.name.empty() ||
            !factory.make_adapter ||
            !factory.to_venue_symbol) {
            return false;
        }
        factories_.insert_or_assign(factory.name, std::move(factory));
        return true;
    }

private:
    std::unordered_map<std::string, VenueFactory> factories_;
};
