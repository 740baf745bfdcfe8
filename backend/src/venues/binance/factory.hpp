#pragma once

#include "venues/venue_factory.hpp"
#include "venues/binance/adapter.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_binance_factory() {
    VenueFactory factory;
    factory.name = "binance";
    factory.make_adapter = []() -> std::unique_ptr<IVenueAdapter> {
        return std::make_unique<BinanceAdapter>();
    };
    factory.to_venue_symbol = [](const std::string& canonical) {
        return SymbolCodec::to_venue("binance", canonical);
    };
    return factory;
}
