#include "stockledger/logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace stockledger {

namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::Info)};
std::mutex g_output_mutex;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

} // anonymous namespace

bool parse_log_level(const std::string& name, LogLevel& level) {
    if (name == "debug") { level = LogLevel::Debug; return true; }
    if (name == "info") { level = LogLevel::Info; return true; }
    if (name == "warn") { level = LogLevel::Warn; return true; }
    if (name == "error") { level = LogLevel::Error; return true; }
    return false;
}

void set_log_level(LogLevel level) {
    g_min_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_min_level.load());
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

void log_entry(LogLevel level, const std::string& component, const std::string& message,
               const nlohmann::json& fields) {
    if (static_cast<int>(level) < g_min_level.load()) return;

    nlohmann::json log_entry = {
        {"level", level_name(level)},
        {"message", message},
        {"component", component},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    // One line per entry even when many threads log at once.
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << log_entry.dump() << std::endl;
}

}  // namespace stockledger
