#include <gtest/gtest.h>

#include "config.hpp"

#include <cstdlib>

TEST(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.trend_ma_period, 200);
    EXPECT_EQ(config.liquidity_lookback, 15);
    EXPECT_DOUBLE_EQ(config.actionable_threshold, 60.0);
    EXPECT_EQ(config.lock_cooldown_minutes, 0);
}

TEST(ConfigTest, RejectsZeroWindows) {
    Config config;
    config.atr_window = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config();
    config.liquidity_lookback = 0;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(ConfigTest, RejectsMisorderedThresholds) {
    Config config;
    config.actionable_threshold = 85.0;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(ConfigTest, RejectsUnknownVocabulary) {
    Config config;
    config.trend_ma_kind = "wma";
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config();
    config.news_min_impact = "extreme";
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(ConfigTest, RejectsOutOfRangeSessionSettings) {
    Config config;
    config.asian_session_multiplier = 1.5;
    EXPECT_THROW(config.validate(), std::runtime_error);

    config = Config();
    config.session_utc_offset_hours = 15;
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(ConfigTest, ReadsOverridesFromEnvironment) {
    setenv("SIGNAL_TREND_MA_PERIOD", "50", 1);
    setenv("SIGNAL_ASIAN_SESSION_MULTIPLIER", "0.75", 1);
    setenv("SIGNAL_RSI_PERIOD", "not-a-number", 1);

    Config config = Config::from_env();

    unsetenv("SIGNAL_TREND_MA_PERIOD");
    unsetenv("SIGNAL_ASIAN_SESSION_MULTIPLIER");
    unsetenv("SIGNAL_RSI_PERIOD");

    EXPECT_EQ(config.trend_ma_period, 50);
    EXPECT_DOUBLE_EQ(config.asian_session_multiplier, 0.75);
    EXPECT_EQ(config.rsi_period, 14);
}
