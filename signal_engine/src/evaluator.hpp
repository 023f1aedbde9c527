#pragma once

#include "types.hpp"
#include "config.hpp"
#include "signals.hpp"
#include "scoring.hpp"
#include "safety_lock.hpp"
#include "forecast.hpp"
#include "report.hpp"
#include <optional>
#include <string>

// One evaluation cycle as a pure function of a snapshot. Holds no state
// between calls, so identical snapshots produce identical reports.
class SignalEvaluator {
public:
    explicit SignalEvaluator(const Config& config);

    // `latched` is a lock carried over by the caller's cooldown latch
    SignalReport evaluate(
        const MarketSnapshot& snapshot,
        const std::optional<LockState>& latched = std::nullopt
    ) const;

    // Degraded WAIT report used whenever input could not be obtained
    SignalReport unavailable(
        const std::string& instrument,
        const TimePoint& as_of,
        const std::string& detail
    ) const;

    const Config& config() const { return config_; }

    // Components hold references into config_
    SignalEvaluator(const SignalEvaluator&) = delete;
    SignalEvaluator& operator=(const SignalEvaluator&) = delete;

private:
    std::vector<std::string> summarize(const SignalReport& report) const;

    Config config_;
    FactorCalculator factor_calculator_;
    ConfidenceScorer confidence_scorer_;
    SafetyLock safety_lock_;
    ForecastGenerator forecast_generator_;
    ReportAssembler report_assembler_;
};
