#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace lattice {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/**
 * Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
 * Unknown values give the fallback.
 */
LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Warn);

/**
 * Current threshold. Initialised from LATTICE_LOG_LEVEL on first use.
 */
LogLevel log_level();

void set_log_level(LogLevel level);

std::string now_iso8601();

/**
 * Write one structured JSON log line to stderr if level passes the threshold.
 */
void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, component, message, fields);
}

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, component, message, fields);
}

} // namespace lattice
