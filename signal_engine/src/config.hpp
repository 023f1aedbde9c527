#pragma once

#include <chrono>
#include <string>

struct Config {
    // Service configuration
    std::string service_name = "signal_engine";
    std::string instrument = "XAUUSD";
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8090;
    std::string log_level = "info";
    int eval_interval_seconds = 60;

    // Series provider
    std::string data_api_url = "http://market-data:8081";
    std::string fast_interval = "5m";
    std::string slow_interval = "1h";
    std::string yield_symbol = "US10Y";
    std::string volatility_symbol = "DXY";
    int macro_points_limit = 120;
    int fast_bars_limit = 300;
    int slow_bars_limit = 300;
    int request_timeout_ms = 8000;
    std::string calendar_path;

    // Report publishing (disabled when empty)
    std::string redis_url;
    std::string stream_reports = "signal.reports";
    int stream_max_len = 1000;

    // Single-flight cache
    int report_ttl_ms = 15000;

    // Indicator Bank
    int trend_ma_period = 200;
    std::string trend_ma_kind = "sma";
    int atr_window = 14;
    int rsi_period = 14;
    double rsi_bull_level = 58.0;
    double rsi_bear_level = 42.0;
    int vsa_baseline_window = 20;
    double vsa_volume_spike_ratio = 1.5;
    double vsa_narrow_range_ratio = 0.5;
    int expansion_window = 50;
    double expansion_body_ratio = 1.8;

    // Pattern detectors
    int liquidity_lookback = 15;
    double sweep_margin_atr = 0.1;

    // Yield bias
    int yield_window_bars = 12;
    int macro_alignment_tolerance_sec = 7200;

    // Volatility proxy
    int vol_baseline_window = 20;
    double vol_shock_abs_delta = 0.15;
    double vol_shock_sigma = 3.0;

    // Scoring weights
    double base_confidence = 50.0;
    double weight_trend_alignment = 10.0;
    double weight_vsa = 8.0;
    double weight_liquidity = 7.0;
    double weight_momentum = 5.0;
    double weight_expansion = 5.0;
    double weight_yield = 5.0;
    double volatility_danger_penalty = 10.0;

    // Signal thresholds
    double wait_floor = 45.0;
    double actionable_threshold = 60.0;
    double strong_threshold = 80.0;
    double institutional_confidence = 70.0;

    // Safety lock
    int news_buffer_minutes = 5;
    std::string news_min_impact = "high";
    int session_utc_offset_hours = 4;
    double asian_session_multiplier = 0.5;
    int lock_cooldown_minutes = 0;

    // Risk levels
    int swing_lookback = 10;
    double atr_stop_multiple = 1.5;
    double risk_reward = 2.0;

    std::chrono::milliseconds request_timeout() const { return std::chrono::milliseconds(request_timeout_ms); }
    std::chrono::milliseconds report_ttl() const { return std::chrono::milliseconds(report_ttl_ms); }
    std::chrono::seconds macro_alignment_tolerance() const { return std::chrono::seconds(macro_alignment_tolerance_sec); }
    std::chrono::minutes news_buffer() const { return std::chrono::minutes(news_buffer_minutes); }
    std::chrono::minutes lock_cooldown() const { return std::chrono::minutes(lock_cooldown_minutes); }

    static Config from_env();
    void validate() const;
};
