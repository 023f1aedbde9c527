#pragma once

#include "config.hpp"
#include "report_publisher.hpp"
#include "signal_engine.hpp"
#include "status_server.hpp"
#include <atomic>
#include <memory>

// Long-running process: periodic evaluation of the configured instrument,
// publishing on change and serving the status endpoints.
class EngineService {
public:
    EngineService(const Config& config, std::shared_ptr<SeriesProvider> provider,
                  NewsCalendar calendar);
    ~EngineService();

    void run();
    void stop();

private:
    void tick();

    const Config& config_;
    SignalEngine engine_;
    ReportPublisher publisher_;
    StatusServer status_server_;

    std::atomic<bool> running_{false};
};
