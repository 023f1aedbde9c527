#include "status_server.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

StatusServer::StatusServer(const Config& config, SignalEngine& engine)
    : config_(config), engine_(engine), running_(false) {
    server_ = std::make_unique<httplib::Server>();
}

StatusServer::~StatusServer() {
    stop();
}

void StatusServer::set_health_probe(HealthProbe probe) {
    health_probe_ = std::move(probe);
}

void StatusServer::start() {
    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Status server starting on {}:{}", config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("Status server failed to bind {}:{}", config_.listen_addr, config_.listen_port);
        }
    });
}

void StatusServer::stop() {
    if (running_) {
        running_ = false;
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("Status server stopped");
    }
}

bool StatusServer::is_running() const {
    return running_;
}

void StatusServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json health_status;
        health_status["service"] = config_.service_name;
        health_status["status"] = "healthy";
        health_status["timestamp"] = util::current_iso8601();

        if (health_probe_) {
            bool redis_healthy = health_probe_();
            health_status["components"]["redis"] = redis_healthy ? "healthy" : "unhealthy";
            if (!redis_healthy) {
                health_status["status"] = "degraded";
            }
        }

        res.status = 200;
        res.set_content(health_status.dump(2), "application/json");
    });

    server_->Get("/api/status", [this](const httplib::Request& req, httplib::Response& res) {
        std::string instrument = req.has_param("instrument")
            ? util::to_upper(util::trim(req.get_param_value("instrument")))
            : config_.instrument;

        if (instrument.empty()) {
            res.status = 400;
            res.set_content(R"({"error":"instrument must not be empty"})", "application/json");
            return;
        }

        if (!engine_.serves(instrument)) {
            res.status = 404;
            nlohmann::json error;
            error["error"] = "unknown instrument";
            error["instrument"] = instrument;
            res.set_content(error.dump(), "application/json");
            return;
        }

        try {
            SignalReport report = engine_.get_report(instrument);
            res.status = 200;
            res.set_content(report.to_json().dump(2), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Status request for {} failed: {}", instrument, e.what());
            res.status = 500;
            res.set_content(R"({"error":"internal server error"})", "application/json");
        }
    });
}
