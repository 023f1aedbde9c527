#include "signal_engine.hpp"
#include <spdlog/spdlog.h>

SignalEngine::SignalEngine(const Config& config, std::shared_ptr<SeriesProvider> provider,
                           NewsCalendar calendar)
    : evaluator_(config), provider_(std::move(provider)), calendar_(std::move(calendar)) {}

SignalReport SignalEngine::get_report(const std::string& instrument) {
    Slot& slot = slot_for(instrument);
    const Config& config = evaluator_.config();

    {
        std::unique_lock<std::mutex> lock(slot.mutex);

        auto now = std::chrono::steady_clock::now();
        if (slot.last && now - slot.completed_at < config.report_ttl()) {
            return *slot.last;
        }

        if (slot.in_flight) {
            if (slot.last) {
                return *slot.last;
            }

            // Nothing cached yet: wait for the leader, bounded by its fetch timeouts
            // (four upstream requests per cycle) plus one for evaluation
            auto generation = slot.generation;
            bool finished = slot.cv.wait_for(lock, config.request_timeout() * 5, [&slot, generation] {
                return slot.generation != generation;
            });
            if (finished && slot.last) {
                return *slot.last;
            }
            return evaluator_.unavailable(instrument, std::chrono::system_clock::now(),
                                          "evaluation in progress");
        }

        slot.in_flight = true;
    }

    SignalReport report = run_cycle(instrument, slot);
    store(slot, report, true);
    return report;
}

SignalReport SignalEngine::evaluate_now(MarketSnapshot snapshot) {
    Slot& slot = slot_for(snapshot.instrument);
    SignalReport report = evaluate_snapshot(std::move(snapshot), slot);
    store(slot, report, false);
    return report;
}

std::optional<SignalReport> SignalEngine::last_report(const std::string& instrument) {
    Slot* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto it = slots_.find(instrument);
        if (it == slots_.end()) {
            return std::nullopt;
        }
        slot = it->second.get();
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->last;
}

bool SignalEngine::serves(const std::string& instrument) const {
    return instrument == evaluator_.config().instrument;
}

void SignalEngine::set_report_listener(ReportListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

SignalEngine::Slot& SignalEngine::slot_for(const std::string& instrument) {
    if (!serves(instrument)) {
        spdlog::warn("Refusing unknown instrument '{}'", instrument);
        throw std::invalid_argument("unknown instrument: " + instrument);
    }

    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(instrument);
    if (it == slots_.end()) {
        it = slots_.emplace(instrument, std::make_unique<Slot>(evaluator_.config().lock_cooldown())).first;
    }
    return *it->second;
}

SignalReport SignalEngine::run_cycle(const std::string& instrument, Slot& slot) {
    MarketSnapshot snapshot;
    try {
        snapshot = provider_->fetch_snapshot(instrument);
    } catch (const FetchError& e) {
        spdlog::warn("Fetch failed for {}: {}", instrument, e.what());
        return evaluator_.unavailable(instrument, std::chrono::system_clock::now(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected provider error for {}: {}", instrument, e.what());
        return evaluator_.unavailable(instrument, std::chrono::system_clock::now(), e.what());
    }

    return evaluate_snapshot(std::move(snapshot), slot);
}

SignalReport SignalEngine::evaluate_snapshot(MarketSnapshot snapshot, Slot& slot) {
    if (!snapshot.calendar && !calendar_.empty()) {
        snapshot.calendar = calendar_.events();
    }

    auto latched = slot.latch.active(snapshot.as_of);
    SignalReport report = evaluator_.evaluate(snapshot, latched);
    slot.latch.record(report.lock, snapshot.as_of);

    ++computations_;
    return report;
}

void SignalEngine::store(Slot& slot, const SignalReport& report, bool leader) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);

        // Never let an older snapshot overwrite a newer evaluation. Degraded
        // reports carry wall-clock time and are always replaceable.
        const bool stale = slot.last &&
                           slot.last->lock.reason != LockReason::DataUnavailable &&
                           report.evaluated_at < slot.last->evaluated_at;
        if (!stale) {
            changed = !slot.last ||
                      slot.last->signal != report.signal ||
                      slot.last->lock.reason != report.lock.reason ||
                      slot.last->forecast != report.forecast;
            slot.last = report;
            slot.completed_at = std::chrono::steady_clock::now();
        }

        // Only the fetching leader owns the in-flight flag
        if (leader) {
            slot.in_flight = false;
        }
        ++slot.generation;
    }
    slot.cv.notify_all();

    if (changed) {
        spdlog::info("{} -> {} {:.1f}% ({}), lock {}",
                     report.instrument, to_string(report.signal), report.confidence,
                     to_string(report.forecast), report.lock.engaged ? to_string(report.lock.reason) : "OFF");

        ReportListener listener;
        {
            std::lock_guard<std::mutex> lock(listener_mutex_);
            listener = listener_;
        }
        if (listener) {
            listener(report);
        }
    }
}
