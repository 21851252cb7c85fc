#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

#include "config.hpp"
#include "exceptions.hpp"

using core::config::loadFromString;

namespace {

    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            for (const char* name : {"MEXC_API_KEY", "MEXC_API_SECRET", "TELEGRAM_BOT_TOKEN", "TELEGRAM_CHAT_ID"}) {
                unsetenv(name);
            }
        }
        void TearDown() override { SetUp(); }
    };

} // end anonymous namespace

TEST_F(ConfigTest, MinimalDocumentUsesDefaults) {
    auto config = loadFromString(R"({"instruments": [{"market_symbol": "ARPAUSDT"}]})");

    ASSERT_EQ(config.instruments.size(), 1u);
    const auto& instrument = config.instruments[0];
    EXPECT_EQ(instrument.market_symbol, "ARPAUSDT");
    EXPECT_EQ(instrument.interval, "1m");
    EXPECT_FALSE(instrument.trading_enabled);
    EXPECT_EQ(instrument.strategy.kind, core::StrategyKind::BollingerBreakout);
    EXPECT_EQ(instrument.strategy.policy, core::DetectorPolicy::Latch);
    EXPECT_EQ(instrument.strategy.period, 8);
    EXPECT_DOUBLE_EQ(instrument.strategy.entry_threshold_pct, 0.2);
    EXPECT_EQ(config.loop.interval_seconds, 2);
    EXPECT_EQ(config.loop.error_sleep_seconds, 5);
    EXPECT_DOUBLE_EQ(config.trading.stop_loss_pct, 1.0);
    EXPECT_DOUBLE_EQ(config.trading.take_profit_pct, 2.0);
    EXPECT_EQ(config.notifications.utc_offset_minutes, -180);
    EXPECT_FALSE(config.anyTradingEnabled());
}

TEST_F(ConfigTest, ParsesTripleSmaInstrument) {
    auto config = loadFromString(R"({
        "instruments": [{
            "market_symbol": "BTCUSDT", "trading_symbol": "BTC_USDT",
            "trading_enabled": true, "quantity": 3, "window_size": 120,
            "strategy": {"kind": "triple_sma", "detector": "dedup",
                         "fast_period": 4, "mid_period": 9, "slow_period": 21,
                         "min_slope_pct": 0.05, "adx_period": 10, "adx_min": 22.5}
        }]
    })");

    const auto& params = config.instruments[0].strategy;
    EXPECT_EQ(params.kind, core::StrategyKind::TripleSma);
    EXPECT_EQ(params.policy, core::DetectorPolicy::Dedup);
    EXPECT_EQ(params.fast_period, 4);
    EXPECT_EQ(params.mid_period, 9);
    EXPECT_EQ(params.slow_period, 21);
    EXPECT_DOUBLE_EQ(params.min_slope_pct, 0.05);
    EXPECT_DOUBLE_EQ(params.adx_min, 22.5);
    EXPECT_TRUE(config.anyTradingEnabled());
    EXPECT_DOUBLE_EQ(config.instruments[0].quantity, 3.0);
}

TEST_F(ConfigTest, RejectsInvalidDocuments) {
    EXPECT_THROW(loadFromString("{not json"), core::ConfigException);
    EXPECT_THROW(loadFromString(R"({"instruments": []})"), core::ConfigException);
    EXPECT_THROW(loadFromString(R"({"instruments": [{"market_symbol": ""}]})"), core::ConfigException);
    EXPECT_THROW(loadFromString(R"({"instruments": [{"market_symbol": "X", "window_size": "big"}]})"),
                 core::ConfigException);
    EXPECT_THROW(loadFromString(R"({"instruments": [{"market_symbol": "X",
                                   "strategy": {"kind": "triple_sma", "fast_period": 13, "mid_period": 5}}]})"),
                 core::ConfigException);
    EXPECT_THROW(loadFromString(R"({"instruments": [{"market_symbol": "X", "window_size": 8}]})"),
                 core::ConfigException);
    EXPECT_THROW(loadFromString(R"({"instruments": [{"market_symbol": "X", "trading_enabled": true}]})"),
                 core::ConfigException);
    EXPECT_THROW(loadFromString(R"({"retry": {"multiplier": 0.5}, "instruments": [{"market_symbol": "X"}]})"),
                 core::ConfigException);
    EXPECT_THROW(loadFromString(R"({"instruments": [{"market_symbol": "X", "strategy": {"kind": "macd"}}]})"),
                 core::ConfigException);
}

TEST_F(ConfigTest, CredentialsComeFromEnvironment) {
    setenv("MEXC_API_KEY", "key-123", 1);
    setenv("MEXC_API_SECRET", "secret-456", 1);

    auto config = loadFromString(R"({"instruments": [{"market_symbol": "ARPAUSDT"}]})");
    EXPECT_EQ(config.trading.api_key, "key-123");
    EXPECT_EQ(config.trading.api_secret, "secret-456");
}

TEST_F(ConfigTest, TelegramNeedsCredentials) {
    const char* doc = R"({"notifications": {"telegram_enabled": true},
                          "instruments": [{"market_symbol": "ARPAUSDT"}]})";
    EXPECT_THROW(loadFromString(doc), core::ConfigException);

    setenv("TELEGRAM_BOT_TOKEN", "123:abc", 1);
    setenv("TELEGRAM_CHAT_ID", "-100200", 1);
    auto config = loadFromString(doc);
    EXPECT_TRUE(config.notifications.telegram_enabled);
    EXPECT_EQ(config.notifications.chat_id, "-100200");
}

TEST_F(ConfigTest, MissingFileIsConfigError) {
    EXPECT_THROW(core::config::loadFromFile("/nonexistent/sentinel.json"), core::ConfigException);
}
