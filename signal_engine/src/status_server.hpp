#pragma once

#include "config.hpp"
#include "signal_engine.hpp"
#include <atomic>
#include <functional>
#include <httplib.h>
#include <memory>
#include <thread>

// Read-only HTTP surface: GET /health and GET /api/status?instrument=
class StatusServer {
public:
    using HealthProbe = std::function<bool()>;

    StatusServer(const Config& config, SignalEngine& engine);
    ~StatusServer();

    // Optional dependency check folded into /health (e.g. Redis ping)
    void set_health_probe(HealthProbe probe);

    void start();
    void stop();
    bool is_running() const;

private:
    void setup_routes();

    const Config& config_;
    SignalEngine& engine_;
    HealthProbe health_probe_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
};
