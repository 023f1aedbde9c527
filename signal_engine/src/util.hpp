#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_upper(std::string str);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
std::int64_t to_epoch_ms(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms);
int utc_hour(const std::chrono::system_clock::time_point& tp);

// Math utilities
int sign(double value);

} // namespace util
