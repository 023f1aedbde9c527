#include "signals.hpp"
#include "patterns.hpp"
#include "scoring.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

const TimeframeSeries& usable(const TimeframeSeries& series, const TimeframeSeries& empty) {
    if (series.is_strictly_increasing()) {
        return series;
    }
    spdlog::warn("{} series has non-increasing timestamps, treating as unavailable", series.interval);
    return empty;
}

} // namespace

FactorCalculator::FactorCalculator(const Config& config)
    : config_(config),
      ma_kind_(indicators::moving_average_kind_from_string(config.trend_ma_kind)),
      yield_analyzer_(config.yield_window_bars, config.macro_alignment_tolerance()),
      volatility_monitor_(config) {}

FactorSet FactorCalculator::calculate_factors(const MarketSnapshot& snapshot) const {
    const TimeframeSeries empty;
    const TimeframeSeries& fast = usable(snapshot.fast, empty);
    const TimeframeSeries& slow = usable(snapshot.slow, empty);

    FactorSet factors;

    // Indicator bank
    factors.fast_trend = indicators::trend_direction(fast, config_.trend_ma_period, ma_kind_);
    factors.slow_trend = indicators::trend_direction(slow, config_.trend_ma_period, ma_kind_);
    factors.fast_atr = indicators::average_true_range(fast, config_.atr_window);
    factors.rsi = indicators::relative_strength_index(fast, config_.rsi_period);

    const TrendDirection prevailing = factors.prevailing_trend();
    factors.vsa = indicators::classify_vsa(fast, prevailing, indicators::VsaParams{
        config_.vsa_baseline_window,
        config_.vsa_volume_spike_ratio,
        config_.vsa_narrow_range_ratio
    });

    // Pattern detectors
    factors.trend_alignment = patterns::multi_timeframe_alignment(factors.fast_trend, factors.slow_trend);
    auto stop_run = patterns::detect_stop_run(fast, config_.liquidity_lookback,
                                              factors.fast_atr, config_.sweep_margin_atr);
    factors.stop_run = stop_run.kind;

    factors.vsa_confirmation = calculate_vsa_confirmation(factors.vsa, prevailing);
    factors.liquidity_reversal = calculate_liquidity_reversal(factors.stop_run);
    factors.momentum_confirmation = calculate_momentum_confirmation(factors.rsi, prevailing);
    factors.expansion_bar = indicators::is_expansion_bar(fast, config_.expansion_window,
                                                         config_.expansion_body_ratio);
    factors.expansion = calculate_expansion(fast, prevailing);

    // Yield support is judged against the bias of the directional factors
    ConfidenceScorer scorer(config_);
    const Bias preliminary = ConfidenceScorer::bias_from_net(scorer.directional_net(factors));
    factors.yield = yield_analyzer_.analyze(fast, snapshot.yield);
    factors.yield_support = YieldBiasAnalyzer::support(factors.yield, preliminary);

    auto shock = volatility_monitor_.assess(snapshot.volatility, snapshot.as_of);
    factors.volatility_danger = shock.shock;

    factors.reasons = generate_reasons(factors, shock);

    spdlog::debug("Factors: mta={} vsa={} liq={} mom={} exp={} yield={} danger={}",
                  factors.trend_alignment, factors.vsa_confirmation, factors.liquidity_reversal,
                  factors.momentum_confirmation, factors.expansion, factors.yield_support,
                  factors.volatility_danger);

    return factors;
}

int FactorCalculator::calculate_vsa_confirmation(VsaLabel label, TrendDirection prevailing) const {
    const int trend_sign = direction_sign(prevailing);
    switch (label) {
        case VsaLabel::Confirm: return trend_sign;
        case VsaLabel::Contradict: return -trend_sign;
        default: return 0;
    }
}

int FactorCalculator::calculate_momentum_confirmation(
    const std::optional<double>& rsi,
    TrendDirection prevailing
) const {
    if (!rsi) {
        return 0;
    }

    int momentum = 0;
    if (*rsi > config_.rsi_bull_level) {
        momentum = 1;
    } else if (*rsi < config_.rsi_bear_level) {
        momentum = -1;
    }

    // Confirmation only; RSI alone never sets the direction
    return momentum != 0 && momentum == direction_sign(prevailing) ? momentum : 0;
}

int FactorCalculator::calculate_expansion(const TimeframeSeries& fast, TrendDirection prevailing) const {
    if (!indicators::is_expansion_bar(fast, config_.expansion_window, config_.expansion_body_ratio)) {
        return 0;
    }

    const int body_sign = util::sign(fast.last().close - fast.last().open);
    return body_sign != 0 && body_sign == direction_sign(prevailing) ? body_sign : 0;
}

int FactorCalculator::calculate_liquidity_reversal(StopRun stop_run) {
    switch (stop_run) {
        case StopRun::Bullish: return 1;
        case StopRun::Bearish: return -1;
        case StopRun::None: return 0;
    }
    return 0;
}

std::vector<std::string> FactorCalculator::generate_reasons(
    const FactorSet& factors,
    const VolatilityShock& shock
) const {
    std::vector<std::string> reasons;

    // Trend reasons
    reasons.push_back(fmt::format("trend fast {} / slow {}",
                                  to_string(factors.fast_trend), to_string(factors.slow_trend)));
    if (factors.trend_alignment != 0) {
        reasons.push_back(fmt::format("timeframes aligned {}",
                                      factors.trend_alignment > 0 ? "bullish" : "bearish"));
    }

    // Volume/spread
    if (factors.vsa == VsaLabel::Confirm) {
        reasons.push_back("VSA: volume spike confirms trend");
    } else if (factors.vsa == VsaLabel::Contradict) {
        reasons.push_back("VSA: volume spike contradicts trend");
    } else if (factors.vsa == VsaLabel::Undetermined) {
        reasons.push_back("VSA undetermined (volume history)");
    }

    // Liquidity
    if (factors.stop_run == StopRun::Bullish) {
        reasons.push_back(fmt::format("stop-run below {}-bar low rejected", config_.liquidity_lookback));
    } else if (factors.stop_run == StopRun::Bearish) {
        reasons.push_back(fmt::format("stop-run above {}-bar high rejected", config_.liquidity_lookback));
    }

    // Momentum
    if (factors.rsi) {
        reasons.push_back(fmt::format("RSI {:.1f}{}", *factors.rsi,
                                      factors.momentum_confirmation != 0 ? " (confirms)" : ""));
    }
    if (factors.expansion != 0) {
        reasons.push_back("expansion bar with trend");
    }

    // Macro
    if (!factors.yield.determined) {
        reasons.push_back("yield data misaligned, factor excluded");
    } else if (factors.yield_support > 0) {
        reasons.push_back(fmt::format("yields {:+.3f} inverse to price", factors.yield.yield_change));
    } else if (factors.yield_support < 0) {
        reasons.push_back(fmt::format("yields {:+.3f} moving with price", factors.yield.yield_change));
    }

    if (shock.shock) {
        reasons.push_back(fmt::format("volatility shock: {}", shock.detail));
    }

    if (factors.fast_atr) {
        reasons.push_back(fmt::format("ATR({}) {:.2f}", config_.atr_window, *factors.fast_atr));
    } else {
        reasons.push_back("ATR undetermined (history)");
    }

    return reasons;
}
