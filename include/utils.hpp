/*
 * LanChat - utility helpers
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lanchat {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);

std::optional<LogLevel> parse_log_level(const std::string& name);

// Lines at or above the threshold go to stderr. Every line, whatever its
// level, is kept in a bounded in-memory ring; nothing is written to disk.
void log(LogLevel level, const std::string& message);

inline void log_info(const std::string& message) {
    log(LogLevel::Info, message);
}

inline void log_warn(const std::string& message) {
    log(LogLevel::Warn, message);
}

inline void log_error(const std::string& message) {
    log(LogLevel::Error, message);
}

inline void log_debug(const std::string& message) {
    log(LogLevel::Debug, message);
}

std::vector<std::string> recent_log_lines();

std::vector<uint8_t> random_bytes(std::size_t count);

std::string hex_encode(const std::vector<uint8_t>& data);

std::string base64_encode(const std::vector<uint8_t>& data);

std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded);

uint64_t monotonic_millis();

// "YYYY-mm-dd HH:MM:SS" in local time.
std::string format_local_time(std::chrono::system_clock::time_point when);

std::string kv_string(const std::map<std::string, std::string>& values);

std::map<std::string, std::string> parse_kv_string(const std::string& input);

std::string trim(const std::string& input);

std::vector<std::string> split(const std::string& input, char delimiter);

} // namespace lanchat
