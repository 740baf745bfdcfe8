#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "md/symbol_codec.hpp"
#include "md/time_window.hpp"
#include "server/env_config.hpp"

TEST(TimeWindowTest, LabelsAndDurations) {
    TimeWindow w = TimeWindow::OneMinute;
    ASSERT_TRUE(parse_window("15m", w));
    EXPECT_EQ(w, TimeWindow::FifteenMinutes);
    EXPECT_EQ(window_ms(w), 15 * 60 * 1000);
    EXPECT_STREQ(to_label(w), "15m");

    EXPECT_EQ(window_ms(TimeWindow::OneMinute), 60000);
    EXPECT_EQ(window_ms(TimeWindow::FiveMinutes), 300000);
    EXPECT_EQ(window_ms(TimeWindow::OneHour), 3600000);
}

TEST(TimeWindowTest, UnknownLabelFallsBackToOneMinute) {
    TimeWindow w = TimeWindow::OneHour;
    EXPECT_FALSE(parse_window("2h", w));
    EXPECT_EQ(w, TimeWindow::OneHour);
    EXPECT_EQ(window_or_default("2h"), TimeWindow::OneMinute);
    EXPECT_EQ(window_or_default(""), TimeWindow::OneMinute);
    EXPECT_EQ(window_or_default("5m"), TimeWindow::FiveMinutes);
}

TEST(SymbolCodecTest, CanonicalToVenue) {
    EXPECT_EQ(SymbolCodec::to_venue("binance", "BTC-USDT"), "btcusdt");
    EXPECT_EQ(SymbolCodec::to_venue("bybit", "BTC-USDT"), "BTCUSDT");
    EXPECT_EQ(SymbolCodec::to_venue("okx", "btc-usdt"), "BTC-USDT");
    EXPECT_EQ(SymbolCodec::to_venue("OKX", "ETH-USDC"), "ETH-USDC");
}

TEST(SymbolCodecTest, VenueToCanonical) {
    EXPECT_EQ(SymbolCodec::to_canonical("binance", "btcusdt"), "BTC-USDT");
    EXPECT_EQ(SymbolCodec::to_canonical("bybit", "ETHBTC"), "ETH-BTC");
    EXPECT_EQ(SymbolCodec::to_canonical("bybit", "SOLFDUSD"), "SOL-FDUSD");
    EXPECT_EQ(SymbolCodec::to_canonical("okx", "btc-usdt"), "BTC-USDT");
}

TEST(EnvConfigTest, SplitVenueList) {
    auto v = split_venue_list(" Binance, okx ,,BYBIT ");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0], "binance");
    EXPECT_EQ(v[1], "okx");
    EXPECT_EQ(v[2], "bybit");
    EXPECT_TRUE(split_venue_list(" , ").empty());
}

class EnvConfigFromEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* k : {"DEPTH_VENUES", "DEPTH_SYMBOL", "DEPTH_WINDOW", "DEPTH_REALTIME",
                              "DEPTH_ZONES", "DEPTH_SNAPSHOT_LIMIT", "DEPTH_HTTP_PORT"}) {
            unsetenv(k);
        }
    }
};

TEST_F(EnvConfigFromEnvTest, DefaultsWhenUnset) {
    SessionConfig cfg = session_config_from_env();
    ASSERT_EQ(cfg.venues.size(), 1u);
    EXPECT_EQ(cfg.venues[0], "binance");
    EXPECT_EQ(cfg.symbol, "BTC-USDT");
    EXPECT_EQ(cfg.window, TimeWindow::OneMinute);
    EXPECT_TRUE(cfg.realtime);
    EXPECT_TRUE(cfg.zones_enabled);
    EXPECT_EQ(cfg.snapshot_limit, 100u);
    EXPECT_EQ(http_port_from_env(), 8080);
}

TEST_F(EnvConfigFromEnvTest, ReadsEveryVariable) {
    setenv("DEPTH_VENUES", "okx,bybit", 1);
    setenv("DEPTH_SYMBOL", "ETH-USDT", 1);
    setenv("DEPTH_WINDOW", "1h", 1);
    setenv("DEPTH_REALTIME", "false", 1);
    setenv("DEPTH_ZONES", "0", 1);
    setenv("DEPTH_SNAPSHOT_LIMIT", "500", 1);
    setenv("DEPTH_HTTP_PORT", "9090", 1);

    SessionConfig cfg = session_config_from_env();
    ASSERT_EQ(cfg.venues.size(), 2u);
    EXPECT_EQ(cfg.venues[1], "bybit");
    EXPECT_EQ(cfg.symbol, "ETH-USDT");
    EXPECT_EQ(cfg.window, TimeWindow::OneHour);
    EXPECT_FALSE(cfg.realtime);
    EXPECT_FALSE(cfg.zones_enabled);
    EXPECT_EQ(cfg.snapshot_limit, 500u);
    EXPECT_EQ(http_port_from_env(), 9090);
}

TEST_F(EnvConfigFromEnvTest, RejectsUnusableValues) {
    setenv("DEPTH_VENUES", " , ", 1);
    EXPECT_THROW(session_config_from_env(), std::runtime_error);
    unsetenv("DEPTH_VENUES");

    setenv("DEPTH_WINDOW", "10m", 1);
    EXPECT_THROW(session_config_from_env(), std::runtime_error);
    unsetenv("DEPTH_WINDOW");

    setenv("DEPTH_SNAPSHOT_LIMIT", "lots", 1);
    EXPECT_THROW(session_config_from_env(), std::runtime_error);
    unsetenv("DEPTH_SNAPSHOT_LIMIT");

    setenv("DEPTH_REALTIME", "maybe", 1);
    EXPECT_THROW(session_config_from_env(), std::runtime_error);
    unsetenv("DEPTH_REALTIME");

    setenv("DEPTH_HTTP_PORT", "70000", 1);
    EXPECT_THROW(http_port_from_env(), std::runtime_error);
}
