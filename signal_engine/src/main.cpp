#include "config.hpp"
#include "engine_service.hpp"
#include "news_calendar.hpp"
#include "series_provider.hpp"
#include "signal_engine.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <iostream>
#include <memory>

// Global pointer to the service to allow signal handler to access it
std::unique_ptr<EngineService> service_ptr;

void signal_handler(int signum) {
    spdlog::info("Caught signal {}, shutting down...", signum);
    if (service_ptr) {
        service_ptr->stop();
    }
}

namespace {

NewsCalendar load_calendar(const Config& config) {
    if (config.calendar_path.empty()) {
        spdlog::warn("CALENDAR_PATH not set, news window lock inactive unless snapshots carry a calendar");
        return NewsCalendar();
    }
    return NewsCalendar::load_from_file(config.calendar_path);
}

// One-shot mode: evaluate a snapshot file and print the report
int evaluate_file(const Config& config, const std::string& path) {
    auto provider = std::make_shared<FileSeriesProvider>(path);
    SignalEngine engine(config, provider, load_calendar(config));

    SignalReport report = engine.get_report(config.instrument);
    std::cout << report.to_json().dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // 1. Load configuration
        Config config = Config::from_env();

        // 2. Setup logging
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");

        config.validate();

        if (argc > 1) {
            return evaluate_file(config, argv[1]);
        }

        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {}...", config.service_name);

        // 3. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Create and run the service
        auto provider = std::make_shared<HttpSeriesProvider>(config);
        service_ptr = std::make_unique<EngineService>(config, provider, load_calendar(config));
        service_ptr->run();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Signal engine has shut down gracefully.");
    return 0;
}
