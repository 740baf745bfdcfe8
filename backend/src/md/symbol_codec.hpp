#pragma once
#include <string>

struct SymbolCodec
{
    // Convert canonical ("BTC-USDT") to venue stream format
    // (binance "btcusdt", okx "BTC-USDT", bybit "BTCUSDT").
    static std::string to_venue(const std::string &venue, const std::string &canonical);
    // Convert a venue symbol back to canonical. Venues without a separator
    // ("BTCUSDT") are split on a known quote currency.
    static std::string to_canonical(const std::string &venue, const std::string &venue_sym);
};
