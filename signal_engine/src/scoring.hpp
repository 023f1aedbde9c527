#pragma once

#include "types.hpp"
#include "config.hpp"

class ConfidenceScorer {
public:
    explicit ConfidenceScorer(const Config& config);

    // Weighted sum of the directional factors; positive favours BUY
    double directional_net(const FactorSet& factors) const;

    // Sign of the net, exact ties are NEUTRAL
    static Bias bias_from_net(double net);

    // Confidence in the bias direction, clamped to [0, 100]. The session
    // multiplier scales the distance from the base confidence.
    ScoreResult score(const FactorSet& factors, double session_multiplier = 1.0) const;

    // Dead zone below the actionable threshold always maps to WAIT
    Signal determine_signal(const ScoreResult& score) const;

private:
    const Config& config_;
};
