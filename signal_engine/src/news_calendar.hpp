#pragma once

#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Scheduled high-impact releases. An absent calendar is a valid state:
// the news trigger is then inactive.
class NewsCalendar {
public:
    NewsCalendar() = default;
    explicit NewsCalendar(std::vector<NewsEvent> events);

    // JSON array of {"t": epoch_ms, "impact": "high", "title": "..."}
    static NewsCalendar load_from_file(const std::string& path);
    static std::vector<NewsEvent> parse(const nlohmann::json& j);

    const std::vector<NewsEvent>& events() const { return events_; }
    bool empty() const { return events_.empty(); }

    // Closest event of at least min_impact within buffer of `at`
    static std::optional<NewsEvent> event_near(
        const std::vector<NewsEvent>& events,
        const TimePoint& at,
        std::chrono::minutes buffer,
        Impact min_impact
    );

private:
    std::vector<NewsEvent> events_;
};
