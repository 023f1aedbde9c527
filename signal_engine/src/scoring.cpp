#include "scoring.hpp"
#include <algorithm>
#include <cmath>

ConfidenceScorer::ConfidenceScorer(const Config& config) : config_(config) {}

double ConfidenceScorer::directional_net(const FactorSet& factors) const {
    return config_.weight_trend_alignment * factors.trend_alignment +
           config_.weight_vsa * factors.vsa_confirmation +
           config_.weight_liquidity * factors.liquidity_reversal +
           config_.weight_momentum * factors.momentum_confirmation +
           config_.weight_expansion * factors.expansion;
}

Bias ConfidenceScorer::bias_from_net(double net) {
    if (net > 0.0) return Bias::Buy;
    if (net < 0.0) return Bias::Sell;
    return Bias::Neutral;
}

ScoreResult ConfidenceScorer::score(const FactorSet& factors, double session_multiplier) const {
    ScoreResult result;
    result.net_weight = directional_net(factors);
    result.bias = bias_from_net(result.net_weight);

    // Edge over a coin flip, measured in the bias direction
    double edge = std::abs(result.net_weight);
    edge += config_.weight_yield * factors.yield_support;
    if (factors.volatility_danger) {
        edge -= config_.volatility_danger_penalty;
    }

    double confidence = config_.base_confidence + edge * session_multiplier;
    result.confidence = std::max(0.0, std::min(100.0, confidence));
    return result;
}

Signal ConfidenceScorer::determine_signal(const ScoreResult& score) const {
    if (score.bias == Bias::Neutral || score.confidence < config_.actionable_threshold) {
        return Signal::Wait;
    }

    const bool strong = score.confidence >= config_.strong_threshold;
    if (score.bias == Bias::Buy) {
        return strong ? Signal::StrongBuy : Signal::Buy;
    }
    return strong ? Signal::StrongSell : Signal::Sell;
}
