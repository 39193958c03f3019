#pragma once

#include <cstddef>
#include <string>
#include "logging.hpp"

namespace stockledger {

/**
 * Process configuration, read once at startup from the environment.
 *
 *   PORT                           listen port (default 51010)
 *   STOCKLEDGER_CATALOG            catalog JSON document path
 *   STOCKLEDGER_JOURNAL            ledger journal path; empty keeps the ledger in memory
 *   STOCKLEDGER_CHECKPOINT         projection checkpoint path (optional)
 *   STOCKLEDGER_VERSION_RETENTION  quantity versions kept per key (default 256)
 *   STOCKLEDGER_SALES_WINDOW_DAYS  low-stock look-back window (default 30)
 *   STOCKLEDGER_LOG_LEVEL          debug | info | warn | error (default info)
 */
struct Config {
    std::string port = "51010";
    std::string catalog_path;
    std::string journal_path;
    std::string checkpoint_path;
    size_t version_retention = 256;
    int sales_window_days = 30;
    LogLevel log_level = LogLevel::Info;

    /**
     * @throws ConfigError naming the offending variable
     */
    static Config from_env();

    std::string server_address() const { return "0.0.0.0:" + port; }
};

} // namespace stockledger
