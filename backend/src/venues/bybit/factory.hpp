#pragma once

#include "venues/venue_factory.hpp"
#include "venues/bybit/adapter.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_bybit_factory() {
    VenueFactory factory;
    factory.name = "bybit";
    factory.make_adapter = []() -> std::unique_ptr<IVenueAdapter> {
        return std::make_unique<BybitAdapter>();
    };
    factory.to_venue_symbol = [](const std::string& canonical) {
        return SymbolCodec::to_venue("bybit", canonical);
    };
    return factory;
}
