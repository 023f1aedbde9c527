#include "news_calendar.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

NewsCalendar::NewsCalendar(std::vector<NewsEvent> events) : events_(std::move(events)) {
    std::sort(events_.begin(), events_.end(),
              [](const NewsEvent& a, const NewsEvent& b) { return a.timestamp < b.timestamp; });
}

NewsCalendar NewsCalendar::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open news calendar: " + path);
    }

    try {
        auto j = nlohmann::json::parse(file);
        NewsCalendar calendar(parse(j));
        spdlog::info("Loaded {} calendar events from {}", calendar.events().size(), path);
        return calendar;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid news calendar " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid news calendar " + path + ": " + e.what());
    }
}

std::vector<NewsEvent> NewsCalendar::parse(const nlohmann::json& j) {
    std::vector<NewsEvent> events;
    for (const auto& item : j) {
        NewsEvent event;
        event.timestamp = util::from_epoch_ms(item.at("t").get<std::int64_t>());
        event.impact = impact_from_string(item.value("impact", "high"));
        event.title = item.value("title", "");
        events.push_back(event);
    }
    return events;
}

std::optional<NewsEvent> NewsCalendar::event_near(
    const std::vector<NewsEvent>& events,
    const TimePoint& at,
    std::chrono::minutes buffer,
    Impact min_impact
) {
    std::optional<NewsEvent> nearest;
    TimePoint::duration nearest_distance = TimePoint::duration::max();

    for (const auto& event : events) {
        if (static_cast<int>(event.impact) < static_cast<int>(min_impact)) {
            continue;
        }

        auto distance = event.timestamp > at ? event.timestamp - at : at - event.timestamp;
        if (distance <= buffer && distance < nearest_distance) {
            nearest = event;
            nearest_distance = distance;
        }
    }

    return nearest;
}
