#pragma once

#include "types.hpp"
#include "config.hpp"
#include "indicators.hpp"
#include "volatility_monitor.hpp"
#include "yield_bias.hpp"

class FactorCalculator {
public:
    explicit FactorCalculator(const Config& config);

    // Build a fresh FactorSet for one evaluation cycle
    FactorSet calculate_factors(const MarketSnapshot& snapshot) const;

    // Individual factor calculations
    int calculate_vsa_confirmation(VsaLabel label, TrendDirection prevailing) const;
    int calculate_momentum_confirmation(const std::optional<double>& rsi, TrendDirection prevailing) const;
    int calculate_expansion(const TimeframeSeries& fast, TrendDirection prevailing) const;
    static int calculate_liquidity_reversal(StopRun stop_run);

    // Generate reasons for the factor set
    std::vector<std::string> generate_reasons(const FactorSet& factors, const VolatilityShock& shock) const;

private:
    const Config& config_;
    indicators::MovingAverageKind ma_kind_;
    YieldBiasAnalyzer yield_analyzer_;
    VolatilityMonitor volatility_monitor_;
};
