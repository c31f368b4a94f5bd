#include "lattice/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace lattice {

namespace {

std::atomic<int>& level_storage() {
    static std::atomic<int> level{[] {
        const char* env = std::getenv("LATTICE_LOG_LEVEL");
        return static_cast<int>(env ? parse_log_level(env) : LogLevel::Warn);
    }()};
    return level;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "info";
}

std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug" || lower == "trace") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return fallback;
}

LogLevel log_level() {
    return static_cast<LogLevel>(level_storage().load());
}

void set_log_level(LogLevel level) {
    level_storage().store(static_cast<int>(level));
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields) {
    if (level == LogLevel::Off || level < log_level()) {
        return;
    }
    nlohmann::json log_entry = {
        {"level", level_name(level)},
        {"message", message},
        {"component", component},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }
    std::lock_guard<std::mutex> lock(output_mutex());
    std::clog << log_entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

} // namespace lattice
