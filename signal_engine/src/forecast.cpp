#include "forecast.hpp"

ForecastGenerator::ForecastGenerator(const Config& config) : config_(config) {}

ForecastLabel ForecastGenerator::generate(
    const FactorSet& factors,
    const ScoreResult& score,
    const LockState& lock
) const {
    if (lock.engaged || factors.volatility_danger) {
        return ForecastLabel::StayOut;
    }

    const int bias = bias_sign(score.bias);

    if (bias != 0 && factors.vsa_confirmation == bias &&
        score.confidence >= config_.institutional_confidence) {
        return bias > 0 ? ForecastLabel::InstitutionalRally : ForecastLabel::InstitutionalDump;
    }

    if (factors.trend_alignment != 0) {
        return ForecastLabel::MultiTimeframeConfluence;
    }

    if (factors.liquidity_reversal != 0) {
        return ForecastLabel::LiquidityReversal;
    }

    if (factors.yield_support > 0) {
        return ForecastLabel::YieldSupported;
    }

    const bool trend_agrees = bias != 0 &&
        (direction_sign(factors.fast_trend) == bias || direction_sign(factors.slow_trend) == bias);

    if (trend_agrees && score.confidence >= config_.actionable_threshold) {
        return ForecastLabel::HighProbabilityContinuation;
    }

    if (trend_agrees) {
        return bias > 0 ? ForecastLabel::ProbableUpside : ForecastLabel::ProbableDownside;
    }

    return ForecastLabel::Consolidation;
}
