#pragma once

#include "venues/venue_factory.hpp"
#include "venues/okx/adapter.hpp"
#include "md/symbol_codec.hpp"

inline VenueFactory make_okx_factory() {
    VenueFactory factory;
    factory.name = "okx";
    factory.make_adapter = []() -> std::unique_ptr<IVenueAdapter> {
        return std::make_unique<OkxAdapter>();
    };
    factory.to_venue_symbol = [](const std::string& canonical) {
        return SymbolCodec::to_venue("okx", canonical);
    };
    return factory;
}
