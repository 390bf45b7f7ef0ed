/*
 * LanChat - utility helpers implementation
 */

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <deque>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace lanchat {

namespace {
constexpr std::size_t kLogRingCapacity = 256;

std::mutex g_log_mutex;
LogLevel g_current_level = LogLevel::Warn;
std::deque<std::string> g_log_ring;

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "LOG";
    }
}
} // namespace

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_current_level = level;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lowered = trim(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    std::string line = "[" + level_to_string(level) + " " +
                       format_local_time(std::chrono::system_clock::now()) + "] " + message;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_ring.push_back(line);
    while (g_log_ring.size() > kLogRingCapacity) {
        g_log_ring.pop_front();
    }
    if (static_cast<int>(level) < static_cast<int>(g_current_level)) {
        return;
    }
    std::cerr << line << std::endl;
}

std::vector<std::string> recent_log_lines() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return std::vector<std::string>(g_log_ring.begin(), g_log_ring.end());
}

std::vector<uint8_t> random_bytes(std::size_t count) {
    std::vector<uint8_t> buffer(count);
    if (!buffer.empty() && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return buffer;
}

namespace {
constexpr char kHexDigits[] = "0123456789abcdef";
} // namespace

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    if (data.empty()) {
        return encoded;
    }
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), data.data(),
                                        static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("EVP_EncodeBlock failed");
    }
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> decoded(encoded.size() / 4 * 3);
    if (decoded.empty()) {
        return decoded;
    }
    const int written = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                                        static_cast<int>(encoded.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes.
    const auto padding = static_cast<std::size_t>(
        std::count(encoded.end() - 2, encoded.end(), '='));
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return decoded;
}

uint64_t monotonic_millis() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

std::string format_local_time(std::chrono::system_clock::time_point when) {
    std::time_t tt = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&tt, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

std::string kv_string(const std::map<std::string, std::string>& values) {
    std::string out;
    for (const auto& [key, value] : values) {
        if (!out.empty()) {
            out += ';';
        }
        out += key;
        out += '=';
        out += value;
    }
    return out;
}

std::map<std::string, std::string> parse_kv_string(const std::string& input) {
    std::map<std::string, std::string> result;
    for (const auto& pair : split(input, ';')) {
        const auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[trim(pair.substr(0, eq))] = trim(pair.substr(eq + 1));
        }
    }
    return result;
}

std::string trim(const std::string& input) {
    static const char* const kWhitespace = " \t\r\n\f\v";
    const auto first = input.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = input.find_last_not_of(kWhitespace);
    return input.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    std::size_t begin = 0;
    while (begin < input.size()) {
        auto end = input.find(delimiter, begin);
        if (end == std::string::npos) {
            end = input.size();
        }
        parts.push_back(input.substr(begin, end - begin));
        begin = end + 1;
    }
    return parts;
}

} // namespace lanchat
