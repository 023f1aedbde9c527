#include "engine_service.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

EngineService::EngineService(const Config& config, std::shared_ptr<SeriesProvider> provider,
                             NewsCalendar calendar)
    : config_(config),
      engine_(config, std::move(provider), std::move(calendar)),
      publisher_(config),
      status_server_(config, engine_) {

    engine_.set_report_listener([this](const SignalReport& report) {
        if (publisher_.enabled() && !publisher_.publish(report)) {
            spdlog::warn("Report for {} was not published", report.instrument);
        }
    });

    if (publisher_.enabled()) {
        status_server_.set_health_probe([this]() { return publisher_.check_health(); });
    }
}

EngineService::~EngineService() {
    stop();
    status_server_.stop();
}

void EngineService::run() {
    running_ = true;
    status_server_.start();
    spdlog::info("Signal engine started for {}. Evaluating every {} seconds.",
                 config_.instrument, config_.eval_interval_seconds);

    while (running_) {
        try {
            tick();
        } catch (const std::exception& e) {
            spdlog::error("Error in evaluation tick: {}", e.what());
        }

        auto wake_up_time = std::chrono::steady_clock::now() + std::chrono::seconds(config_.eval_interval_seconds);
        while (running_ && std::chrono::steady_clock::now() < wake_up_time) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    status_server_.stop();
    spdlog::info("Signal engine run loop finished.");
}

void EngineService::stop() {
    if (running_.exchange(false)) {
        spdlog::info("Stopping signal engine...");
    }
}

void EngineService::tick() {
    auto start_time = std::chrono::steady_clock::now();

    SignalReport report = engine_.get_report(config_.instrument);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::debug("Evaluation tick for {} completed in {} ms: {} {:.1f}%",
                  report.instrument, duration, to_string(report.signal), report.confidence);
}
