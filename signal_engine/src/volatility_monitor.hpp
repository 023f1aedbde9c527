#pragma once

#include "types.hpp"
#include "config.hpp"
#include <string>

struct VolatilityShock {
    bool determined = false;
    bool shock = false;
    double latest = 0.0;
    double previous = 0.0;
    double baseline_mean = 0.0;
    double baseline_stddev = 0.0;
    std::string detail;
};

// Watches the currency-strength proxy for abnormal moves. Missing or stale
// proxy data leaves the result undetermined, which never raises a shock.
class VolatilityMonitor {
public:
    explicit VolatilityMonitor(const Config& config);

    VolatilityShock assess(const MacroSeries& proxy, const TimePoint& as_of) const;

private:
    const Config& config_;
};
