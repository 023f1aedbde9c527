#pragma once

#include "types.hpp"
#include "config.hpp"
#include <memory>
#include <stdexcept>
#include <string>

// Upstream data could not be obtained in time or was malformed
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SeriesProvider {
public:
    virtual ~SeriesProvider() = default;

    // Throws FetchError; never blocks past the configured timeout
    virtual MarketSnapshot fetch_snapshot(const std::string& instrument) = 0;
};

// Pulls bars and macro series from the market-data gateway
class HttpSeriesProvider : public SeriesProvider {
public:
    explicit HttpSeriesProvider(const Config& config);
    ~HttpSeriesProvider() override;

    MarketSnapshot fetch_snapshot(const std::string& instrument) override;

    // Non-copyable
    HttpSeriesProvider(const HttpSeriesProvider&) = delete;
    HttpSeriesProvider& operator=(const HttpSeriesProvider&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Reads a recorded snapshot from disk on every fetch
class FileSeriesProvider : public SeriesProvider {
public:
    explicit FileSeriesProvider(std::string path);

    MarketSnapshot fetch_snapshot(const std::string& instrument) override;

private:
    std::string path_;
};
