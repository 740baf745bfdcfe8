#pragma once

#include <functional>
#include <memory>
#include <string>

class IVenueAdapter;

struct VenueFactory {
    std::string name;
    std::function<std::unique_ptr<IVenueAdapter>()> make_adapter;
    std::function<std::string(const std::string& canonical)> to_venue_symbol;
};
