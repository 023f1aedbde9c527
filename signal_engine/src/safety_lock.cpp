#include "safety_lock.hpp"
#include "news_calendar.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cstdlib>

SafetyLock::SafetyLock(const Config& config)
    : config_(config), min_impact_(impact_from_string(config.news_min_impact)) {}

LockState SafetyLock::evaluate(const MarketSnapshot& snapshot, const FactorSet& factors) const {
    LockState state;

    // Without a calendar the news trigger fails open
    if (snapshot.calendar) {
        auto event = NewsCalendar::event_near(*snapshot.calendar, snapshot.as_of,
                                              config_.news_buffer(), min_impact_);
        if (event) {
            auto minutes = std::chrono::duration_cast<std::chrono::minutes>(
                event->timestamp - snapshot.as_of).count();
            state.engaged = true;
            state.reason = LockReason::NewsWindow;
            state.detail = fmt::format("{} impact event '{}' {} {} min",
                                       to_string(event->impact), event->title,
                                       minutes >= 0 ? "in" : "released", std::abs(minutes));
            return state;
        }
    }

    if (factors.volatility_danger) {
        state.engaged = true;
        state.reason = LockReason::VolatilityShock;
        state.detail = "currency-strength proxy outside its baseline";
    }

    return state;
}

SessionRisk SafetyLock::classify_session(const TimePoint& at) const {
    const int local_hour = ((util::utc_hour(at) + config_.session_utc_offset_hours) % 24 + 24) % 24;

    SessionRisk session;
    if (local_hour >= 2 && local_hour < 12) {
        session.name = "ASIAN";
        session.soft_lock = true;
        session.multiplier = config_.asian_session_multiplier;
    } else if (local_hour >= 12 && local_hour < 17) {
        session.name = "LONDON";
    } else if (local_hour >= 17 && local_hour < 21) {
        session.name = "OVERLAP";
    } else if (local_hour >= 21 && local_hour < 23) {
        session.name = "NY";
    } else {
        session.name = "LATE NY";
    }
    return session;
}

LockState SafetyLock::data_unavailable(const std::string& detail) {
    LockState state;
    state.engaged = true;
    state.reason = LockReason::DataUnavailable;
    state.detail = detail;
    return state;
}

LockLatch::LockLatch(std::chrono::minutes cooldown) : cooldown_(cooldown) {}

std::optional<LockState> LockLatch::active(const TimePoint& at) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cooldown_.count() <= 0 || !last_lock_ || at < last_trigger_ || at - last_trigger_ >= cooldown_) {
        return std::nullopt;
    }

    LockState latched = *last_lock_;
    latched.latched = true;
    auto remaining = std::chrono::duration_cast<std::chrono::minutes>(cooldown_ - (at - last_trigger_));
    latched.detail = fmt::format("cooldown {} min remaining after: {}", remaining.count(), last_lock_->detail);
    return latched;
}

void LockLatch::record(const LockState& state, const TimePoint& at) {
    // Missing data says nothing about the market, so it never latches
    if (cooldown_.count() <= 0 || !state.engaged || state.latched ||
        state.reason == LockReason::DataUnavailable) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_lock_ || at >= last_trigger_) {
        spdlog::debug("Lock latched for {} min: {}", cooldown_.count(), to_string(state.reason));
        last_lock_ = state;
        last_trigger_ = at;
    }
}
