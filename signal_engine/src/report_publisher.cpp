#include "report_publisher.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <unordered_map>

class ReportPublisher::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {
        if (config_.redis_url.empty()) {
            spdlog::info("REDIS_URL not set, report publishing disabled");
            return;
        }

        try {
            sw::redis::ConnectionOptions connection_opts(config_.redis_url);

            sw::redis::ConnectionPoolOptions pool_opts;
            pool_opts.size = 2;

            redis_ = std::make_unique<sw::redis::Redis>(connection_opts, pool_opts);

            spdlog::info("Connected to Redis at {}", config_.redis_url);
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_ = nullptr;
        }
    }

    bool enabled() const {
        return redis_ != nullptr;
    }

    bool publish(const SignalReport& report) {
        if (!redis_) {
            return false;
        }

        try {
            std::unordered_map<std::string, std::string> fields;
            fields["instrument"] = report.instrument;
            fields["signal"] = to_string(report.signal);
            fields["data"] = report.to_json().dump();

            redis_->xadd(config_.stream_reports, "*", fields.begin(), fields.end(),
                         config_.stream_max_len, true);

            spdlog::debug("Published {} report to stream {}", report.instrument, config_.stream_reports);
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to publish report to Redis: {}", e.what());
            return false;
        }
    }

    bool check_health() {
        if (!redis_) {
            return false;
        }

        try {
            redis_->ping();
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Redis health check failed: {}", e.what());
            return false;
        }
    }

private:
    const Config& config_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

ReportPublisher::ReportPublisher(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
ReportPublisher::~ReportPublisher() = default;
bool ReportPublisher::enabled() const { return pImpl_->enabled(); }
bool ReportPublisher::publish(const SignalReport& report) { return pImpl_->publish(report); }
bool ReportPublisher::check_health() { return pImpl_->check_health(); }
