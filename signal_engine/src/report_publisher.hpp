#pragma once

#include "config.hpp"
#include "types.hpp"
#include <memory>

// Appends reports to a capped Redis stream. Disabled when REDIS_URL is empty.
class ReportPublisher {
public:
    explicit ReportPublisher(const Config& config);
    ~ReportPublisher();

    bool enabled() const;

    bool publish(const SignalReport& report);

    bool check_health();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
