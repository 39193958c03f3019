#include "stockledger/config.hpp"
#include "stockledger/errors.hpp"

#include <cstdlib>

namespace stockledger {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

long long positive_env(const char* name, long long fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;

    char* end = nullptr;
    long long parsed = std::strtoll(value, &end, 10);
    if (*end != '\0' || parsed <= 0) {
        throw ConfigError(std::string(name) + " must be a positive integer, got '" + value + "'");
    }
    return parsed;
}

} // anonymous namespace

Config Config::from_env() {
    Config config;
    config.port = env_or("PORT", config.port);
    config.catalog_path = env_or("STOCKLEDGER_CATALOG", "");
    config.journal_path = env_or("STOCKLEDGER_JOURNAL", "");
    config.checkpoint_path = env_or("STOCKLEDGER_CHECKPOINT", "");
    config.version_retention = static_cast<size_t>(
        positive_env("STOCKLEDGER_VERSION_RETENTION", static_cast<long long>(config.version_retention)));
    config.sales_window_days = static_cast<int>(
        positive_env("STOCKLEDGER_SALES_WINDOW_DAYS", config.sales_window_days));

    auto level = env_or("STOCKLEDGER_LOG_LEVEL", "info");
    if (!parse_log_level(level, config.log_level)) {
        throw ConfigError("STOCKLEDGER_LOG_LEVEL must be debug, info, warn or error, got '" +
                          level + "'");
    }
    return config;
}

} // namespace stockledger
