#include "venue_registry.hpp"

#include "binance/factory.hpp"
#include "bybit/factory.hpp"
#include "okx/factory.hpp"

const VenueRegistry& VenueRegistry::instance() {
    static const VenueRegistry registry = [] {
        VenueRegistry r;
        r.register_factory(make_binance_factory());
        r.register_factory(make_okx_factory());
        r.register_factory(make_bybit_factory());
        return r;
    }();
    return registry;
}
