#pragma once

#include "types.hpp"
#include "config.hpp"
#include <chrono>
#include <mutex>
#include <optional>

// Stateless hard gate, re-evaluated every cycle
class SafetyLock {
public:
    explicit SafetyLock(const Config& config);

    // News window and volatility shock, OR-combined
    LockState evaluate(const MarketSnapshot& snapshot, const FactorSet& factors) const;

    // Soft gate: never forces WAIT, only scales confidence
    SessionRisk classify_session(const TimePoint& at) const;

    static LockState data_unavailable(const std::string& detail);

private:
    const Config& config_;
    Impact min_impact_;
};

// Optional hysteresis kept by the coordinator: a hard lock stays ON for the
// cooldown after its last trigger. A zero cooldown disables it.
class LockLatch {
public:
    explicit LockLatch(std::chrono::minutes cooldown);

    std::optional<LockState> active(const TimePoint& at) const;
    void record(const LockState& state, const TimePoint& at);

private:
    std::chrono::minutes cooldown_;
    mutable std::mutex mutex_;
    std::optional<LockState> last_lock_;
    TimePoint last_trigger_;
};
