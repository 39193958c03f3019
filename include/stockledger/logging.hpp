#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace stockledger {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * Parse "debug", "info", "warn" or "error". Returns false for anything else.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * Set the process-wide minimum level. Entries below it are dropped.
 */
void set_log_level(LogLevel level);

LogLevel log_level();

std::string now_iso8601();

/**
 * Write one JSON line: level, message, component, timestamp, then fields.
 */
void log_entry(LogLevel level, const std::string& component, const std::string& message,
               const nlohmann::json& fields = {});

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_entry(LogLevel::Debug, component, message, fields);
}

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry(LogLevel::Info, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry(LogLevel::Warn, component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_entry(LogLevel::Error, component, message, fields);
}

}  // namespace stockledger
