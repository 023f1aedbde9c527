#pragma once

#include "config.hpp"
#include "evaluator.hpp"
#include "news_calendar.hpp"
#include "safety_lock.hpp"
#include "series_provider.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

// Single-flight coordinator. At most one computation per instrument runs at
// a time; concurrent callers get the last completed report instead of
// triggering another upstream fetch.
class SignalEngine {
public:
    using ReportListener = std::function<void(const SignalReport&)>;

    SignalEngine(const Config& config, std::shared_ptr<SeriesProvider> provider,
                 NewsCalendar calendar = NewsCalendar());

    // True for the configured instrument; others are refused with
    // std::invalid_argument and never reach the provider
    bool serves(const std::string& instrument) const;

    // Cached report while fresh, otherwise runs (or joins) a cycle
    SignalReport get_report(const std::string& instrument);

    // Evaluates a caller-supplied snapshot; supersedes older cached reports
    SignalReport evaluate_now(MarketSnapshot snapshot);

    std::optional<SignalReport> last_report(const std::string& instrument);

    // Invoked outside any lock when signal, lock reason or forecast changes
    void set_report_listener(ReportListener listener);

    std::uint64_t computations() const { return computations_.load(); }

private:
    struct Slot {
        std::mutex mutex;
        std::condition_variable cv;
        bool in_flight = false;
        std::uint64_t generation = 0;
        std::optional<SignalReport> last;
        std::chrono::steady_clock::time_point completed_at;
        LockLatch latch;

        explicit Slot(std::chrono::minutes cooldown) : latch(cooldown) {}
    };

    Slot& slot_for(const std::string& instrument);
    SignalReport run_cycle(const std::string& instrument, Slot& slot);
    SignalReport evaluate_snapshot(MarketSnapshot snapshot, Slot& slot);
    void store(Slot& slot, const SignalReport& report, bool leader);

    SignalEvaluator evaluator_;
    std::shared_ptr<SeriesProvider> provider_;
    NewsCalendar calendar_;

    std::mutex slots_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;

    std::mutex listener_mutex_;
    ReportListener listener_;

    std::atomic<std::uint64_t> computations_{0};
};
