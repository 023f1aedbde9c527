#include "config.hpp"
#include "types.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using util::get_env_double;
using util::get_env_int;
using util::get_env_var;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", config.service_name);
    config.instrument = get_env_var("INSTRUMENT", config.instrument);
    config.listen_addr = get_env_var("LISTEN_ADDR", config.listen_addr);
    config.listen_port = get_env_int("LISTEN_PORT", config.listen_port);
    config.log_level = get_env_var("LOG_LEVEL", config.log_level);
    config.eval_interval_seconds = get_env_int("EVAL_INTERVAL_SECONDS", config.eval_interval_seconds);

    // Series provider
    config.data_api_url = get_env_var("DATA_API_URL", config.data_api_url);
    config.fast_interval = get_env_var("FAST_INTERVAL", config.fast_interval);
    config.slow_interval = get_env_var("SLOW_INTERVAL", config.slow_interval);
    config.yield_symbol = get_env_var("YIELD_SYMBOL", config.yield_symbol);
    config.volatility_symbol = get_env_var("VOLATILITY_SYMBOL", config.volatility_symbol);
    config.macro_points_limit = get_env_int("MACRO_POINTS_LIMIT", config.macro_points_limit);
    config.fast_bars_limit = get_env_int("FAST_BARS_LIMIT", config.fast_bars_limit);
    config.slow_bars_limit = get_env_int("SLOW_BARS_LIMIT", config.slow_bars_limit);
    config.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", config.request_timeout_ms);
    config.calendar_path = get_env_var("CALENDAR_PATH", config.calendar_path);

    // Publishing
    config.redis_url = get_env_var("REDIS_URL", config.redis_url);
    config.stream_reports = get_env_var("STREAM_REPORTS", config.stream_reports);
    config.stream_max_len = get_env_int("STREAM_MAX_LEN", config.stream_max_len);
    config.report_ttl_ms = get_env_int("REPORT_TTL_MS", config.report_ttl_ms);

    // Indicators
    config.trend_ma_period = get_env_int("SIGNAL_TREND_MA_PERIOD", config.trend_ma_period);
    config.trend_ma_kind = get_env_var("SIGNAL_TREND_MA_KIND", config.trend_ma_kind);
    config.atr_window = get_env_int("SIGNAL_ATR_WINDOW", config.atr_window);
    config.rsi_period = get_env_int("SIGNAL_RSI_PERIOD", config.rsi_period);
    config.rsi_bull_level = get_env_double("SIGNAL_RSI_BULL_LEVEL", config.rsi_bull_level);
    config.rsi_bear_level = get_env_double("SIGNAL_RSI_BEAR_LEVEL", config.rsi_bear_level);
    config.vsa_baseline_window = get_env_int("SIGNAL_VSA_BASELINE_WINDOW", config.vsa_baseline_window);
    config.vsa_volume_spike_ratio = get_env_double("SIGNAL_VSA_VOLUME_SPIKE_RATIO", config.vsa_volume_spike_ratio);
    config.vsa_narrow_range_ratio = get_env_double("SIGNAL_VSA_NARROW_RANGE_RATIO", config.vsa_narrow_range_ratio);
    config.expansion_window = get_env_int("SIGNAL_EXPANSION_WINDOW", config.expansion_window);
    config.expansion_body_ratio = get_env_double("SIGNAL_EXPANSION_BODY_RATIO", config.expansion_body_ratio);

    // Detectors
    config.liquidity_lookback = get_env_int("SIGNAL_LIQUIDITY_LOOKBACK", config.liquidity_lookback);
    config.sweep_margin_atr = get_env_double("SIGNAL_SWEEP_MARGIN_ATR", config.sweep_margin_atr);
    config.yield_window_bars = get_env_int("SIGNAL_YIELD_WINDOW_BARS", config.yield_window_bars);
    config.macro_alignment_tolerance_sec = get_env_int("SIGNAL_MACRO_ALIGNMENT_TOLERANCE_SEC",
                                                       config.macro_alignment_tolerance_sec);
    config.vol_baseline_window = get_env_int("SIGNAL_VOL_BASELINE_WINDOW", config.vol_baseline_window);
    config.vol_shock_abs_delta = get_env_double("SIGNAL_VOL_SHOCK_ABS_DELTA", config.vol_shock_abs_delta);
    config.vol_shock_sigma = get_env_double("SIGNAL_VOL_SHOCK_SIGMA", config.vol_shock_sigma);

    // Scoring
    config.base_confidence = get_env_double("SIGNAL_BASE_CONFIDENCE", config.base_confidence);
    config.weight_trend_alignment = get_env_double("SIGNAL_WEIGHT_TREND_ALIGNMENT", config.weight_trend_alignment);
    config.weight_vsa = get_env_double("SIGNAL_WEIGHT_VSA", config.weight_vsa);
    config.weight_liquidity = get_env_double("SIGNAL_WEIGHT_LIQUIDITY", config.weight_liquidity);
    config.weight_momentum = get_env_double("SIGNAL_WEIGHT_MOMENTUM", config.weight_momentum);
    config.weight_expansion = get_env_double("SIGNAL_WEIGHT_EXPANSION", config.weight_expansion);
    config.weight_yield = get_env_double("SIGNAL_WEIGHT_YIELD", config.weight_yield);
    config.volatility_danger_penalty = get_env_double("SIGNAL_VOLATILITY_DANGER_PENALTY",
                                                      config.volatility_danger_penalty);
    config.wait_floor = get_env_double("SIGNAL_WAIT_FLOOR", config.wait_floor);
    config.actionable_threshold = get_env_double("SIGNAL_ACTIONABLE_THRESHOLD", config.actionable_threshold);
    config.strong_threshold = get_env_double("SIGNAL_STRONG_THRESHOLD", config.strong_threshold);
    config.institutional_confidence = get_env_double("SIGNAL_INSTITUTIONAL_CONFIDENCE",
                                                     config.institutional_confidence);

    // Safety lock
    config.news_buffer_minutes = get_env_int("SIGNAL_NEWS_BUFFER_MINUTES", config.news_buffer_minutes);
    config.news_min_impact = get_env_var("SIGNAL_NEWS_MIN_IMPACT", config.news_min_impact);
    config.session_utc_offset_hours = get_env_int("SIGNAL_SESSION_UTC_OFFSET_HOURS", config.session_utc_offset_hours);
    config.asian_session_multiplier = get_env_double("SIGNAL_ASIAN_SESSION_MULTIPLIER",
                                                     config.asian_session_multiplier);
    config.lock_cooldown_minutes = get_env_int("SIGNAL_LOCK_COOLDOWN_MINUTES", config.lock_cooldown_minutes);

    // Risk levels
    config.swing_lookback = get_env_int("SIGNAL_SWING_LOOKBACK", config.swing_lookback);
    config.atr_stop_multiple = get_env_double("SIGNAL_ATR_STOP_MULTIPLE", config.atr_stop_multiple);
    config.risk_reward = get_env_double("SIGNAL_RISK_REWARD", config.risk_reward);

    return config;
}

void Config::validate() const {
    if (instrument.empty()) {
        throw std::runtime_error("INSTRUMENT must not be empty");
    }

    if (trend_ma_period <= 0 || atr_window <= 0 || rsi_period <= 0 ||
        vsa_baseline_window <= 0 || expansion_window <= 0 ||
        liquidity_lookback <= 0 || yield_window_bars <= 0 ||
        vol_baseline_window <= 1 || swing_lookback <= 0) {
        throw std::runtime_error("Indicator and detector windows must be positive");
    }

    if (trend_ma_kind != "sma" && trend_ma_kind != "ema") {
        throw std::runtime_error("Trend moving average kind must be 'sma' or 'ema'");
    }

    if (rsi_bear_level >= rsi_bull_level || rsi_bear_level < 0.0 || rsi_bull_level > 100.0) {
        throw std::runtime_error("RSI levels must satisfy 0 <= bear < bull <= 100");
    }

    if (vsa_volume_spike_ratio <= 0.0 || vsa_narrow_range_ratio <= 0.0 || expansion_body_ratio <= 0.0) {
        throw std::runtime_error("VSA and expansion ratios must be positive");
    }

    if (sweep_margin_atr < 0.0 || vol_shock_abs_delta <= 0.0 || vol_shock_sigma <= 0.0) {
        throw std::runtime_error("Sweep margin and volatility shock thresholds are out of range");
    }

    if (macro_alignment_tolerance_sec <= 0) {
        throw std::runtime_error("Macro alignment tolerance must be positive");
    }

    if (weight_trend_alignment < 0.0 || weight_vsa < 0.0 || weight_liquidity < 0.0 ||
        weight_momentum < 0.0 || weight_expansion < 0.0 || weight_yield < 0.0 ||
        volatility_danger_penalty < 0.0) {
        throw std::runtime_error("Factor weights must not be negative");
    }

    if (base_confidence < 0.0 || base_confidence > 100.0) {
        throw std::runtime_error("Base confidence must be within [0, 100]");
    }

    if (!(0.0 <= wait_floor && wait_floor <= actionable_threshold &&
          actionable_threshold <= strong_threshold && strong_threshold <= 100.0)) {
        throw std::runtime_error("Confidence thresholds must satisfy 0 <= floor <= actionable <= strong <= 100");
    }

    if (news_buffer_minutes < 0 || lock_cooldown_minutes < 0) {
        throw std::runtime_error("News buffer and lock cooldown must not be negative");
    }

    try {
        impact_from_string(news_min_impact);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("News minimum impact: ") + e.what());
    }

    if (session_utc_offset_hours < -12 || session_utc_offset_hours > 14) {
        throw std::runtime_error("Session UTC offset must be within [-12, 14]");
    }

    if (asian_session_multiplier <= 0.0 || asian_session_multiplier > 1.0) {
        throw std::runtime_error("Asian session multiplier must be within (0, 1]");
    }

    if (atr_stop_multiple <= 0.0 || risk_reward <= 0.0) {
        throw std::runtime_error("ATR stop multiple and risk/reward must be positive");
    }

    if (request_timeout_ms <= 0 || report_ttl_ms < 0 || eval_interval_seconds <= 0) {
        throw std::runtime_error("Timeouts and intervals must be positive");
    }

    if (fast_bars_limit <= 0 || slow_bars_limit <= 0 || macro_points_limit <= 0 || stream_max_len <= 0) {
        throw std::runtime_error("Bar limits and stream length must be positive");
    }

    spdlog::info("Configuration validated successfully");
}
