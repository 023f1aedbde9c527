#pragma once

#include "types.hpp"
#include "config.hpp"
#include <optional>

struct RiskLevels {
    double entry = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
};

class ReportAssembler {
public:
    explicit ReportAssembler(const Config& config);

    // Stop beyond the recent swing extreme by a multiple of ATR, target at
    // the configured risk/reward. None without a bias or a usable ATR.
    std::optional<RiskLevels> calculate_levels(
        const TimeframeSeries& fast,
        Bias bias,
        const std::optional<double>& atr
    ) const;

    SignalReport assemble(
        const MarketSnapshot& snapshot,
        const FactorSet& factors,
        const ScoreResult& score,
        Signal signal,
        const LockState& lock,
        const SessionRisk& session,
        ForecastLabel forecast
    ) const;

private:
    const Config& config_;
};
