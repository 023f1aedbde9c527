#include "series_provider.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

class HttpSeriesProvider::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {
        spdlog::info("Series provider using {}", config_.data_api_url);
    }

    MarketSnapshot fetch_snapshot(const std::string& instrument) {
        nlohmann::json j;
        j["instrument"] = instrument;
        j["as_of"] = util::to_epoch_ms(std::chrono::system_clock::now());

        j["fast"] = fetch_bars(instrument, config_.fast_interval, config_.fast_bars_limit);
        j["slow"] = fetch_bars(instrument, config_.slow_interval, config_.slow_bars_limit);
        j["yield"] = fetch_macro(config_.yield_symbol);
        j["volatility"] = fetch_macro(config_.volatility_symbol);

        try {
            return MarketSnapshot::from_json(j);
        } catch (const std::exception& e) {
            throw FetchError(std::string("Malformed market data: ") + e.what());
        }
    }

private:
    nlohmann::json fetch_bars(const std::string& instrument, const std::string& interval, int limit) {
        auto body = get(config_.data_api_url + "/v1/bars", cpr::Parameters{
            {"symbol", instrument},
            {"interval", interval},
            {"limit", std::to_string(limit)}
        });

        if (!body.contains("bars") || !body["bars"].is_array()) {
            throw FetchError(fmt::format("Unexpected bars response for {} {}", instrument, interval));
        }

        spdlog::debug("Fetched {} {} bars for {}", body["bars"].size(), interval, instrument);
        return {{"interval", interval}, {"bars", body["bars"]}};
    }

    nlohmann::json fetch_macro(const std::string& symbol) {
        auto body = get(config_.data_api_url + "/v1/macro", cpr::Parameters{
            {"series", symbol},
            {"limit", std::to_string(config_.macro_points_limit)}
        });

        if (!body.contains("points") || !body["points"].is_array()) {
            throw FetchError("Unexpected macro response for " + symbol);
        }
        return body["points"];
    }

    nlohmann::json get(const std::string& url, const cpr::Parameters& params) {
        auto response = cpr::Get(
            cpr::Url{url},
            params,
            cpr::Timeout{config_.request_timeout_ms},
            cpr::Header{{"User-Agent", "SignalEngine/1.0"}}
        );

        if (response.error) {
            throw FetchError(fmt::format("Request to {} failed: {}", url, response.error.message));
        }

        if (response.status_code != 200) {
            throw FetchError(fmt::format("Request to {} returned status {}", url, response.status_code));
        }

        try {
            return nlohmann::json::parse(response.text);
        } catch (const nlohmann::json::exception& e) {
            throw FetchError(fmt::format("Invalid JSON from {}: {}", url, e.what()));
        }
    }

    Config config_;
};

HttpSeriesProvider::HttpSeriesProvider(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

HttpSeriesProvider::~HttpSeriesProvider() = default;

MarketSnapshot HttpSeriesProvider::fetch_snapshot(const std::string& instrument) {
    return pImpl_->fetch_snapshot(instrument);
}

FileSeriesProvider::FileSeriesProvider(std::string path) : path_(std::move(path)) {}

MarketSnapshot FileSeriesProvider::fetch_snapshot(const std::string& instrument) {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw FetchError("Cannot open snapshot file: " + path_);
    }

    try {
        auto snapshot = MarketSnapshot::from_json(nlohmann::json::parse(file));
        if (snapshot.instrument != instrument) {
            spdlog::warn("Snapshot {} holds {}, requested {}", path_, snapshot.instrument, instrument);
        }
        return snapshot;
    } catch (const std::exception& e) {
        throw FetchError("Malformed snapshot " + path_ + ": " + e.what());
    }
}
