#pragma once

#include "types.hpp"
#include "config.hpp"

// Maps the active factor combination to one label, highest priority first:
// stay out, institutional move, confluence, liquidity reversal, yield support,
// continuation, probable move, consolidation.
class ForecastGenerator {
public:
    explicit ForecastGenerator(const Config& config);

    ForecastLabel generate(const FactorSet& factors, const ScoreResult& score, const LockState& lock) const;

private:
    const Config& config_;
};
