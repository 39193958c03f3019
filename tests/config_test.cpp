#include <gtest/gtest.h>
#include <cstdlib>
#include "stockledger/config.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"

using namespace stockledger;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : {"PORT", "STOCKLEDGER_CATALOG", "STOCKLEDGER_JOURNAL",
                                 "STOCKLEDGER_CHECKPOINT", "STOCKLEDGER_VERSION_RETENTION",
                                 "STOCKLEDGER_SALES_WINDOW_DAYS", "STOCKLEDGER_LOG_LEVEL"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, FromEnv_WithNothingSet_ShouldUseDefaults) {
    auto config = Config::from_env();

    EXPECT_EQ(config.port, "51010");
    EXPECT_EQ(config.server_address(), "0.0.0.0:51010");
    EXPECT_TRUE(config.journal_path.empty());
    EXPECT_TRUE(config.catalog_path.empty());
    EXPECT_EQ(config.version_retention, 256u);
    EXPECT_EQ(config.sales_window_days, 30);
    EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST_F(ConfigTest, FromEnv_ShouldReadEveryVariable) {
    setenv("PORT", "6000", 1);
    setenv("STOCKLEDGER_CATALOG", "/etc/stockledger/catalog.json", 1);
    setenv("STOCKLEDGER_JOURNAL", "/var/lib/stockledger/ledger.journal", 1);
    setenv("STOCKLEDGER_CHECKPOINT", "/var/lib/stockledger/projection.ckpt", 1);
    setenv("STOCKLEDGER_VERSION_RETENTION", "64", 1);
    setenv("STOCKLEDGER_SALES_WINDOW_DAYS", "14", 1);
    setenv("STOCKLEDGER_LOG_LEVEL", "debug", 1);

    auto config = Config::from_env();

    EXPECT_EQ(config.server_address(), "0.0.0.0:6000");
    EXPECT_EQ(config.catalog_path, "/etc/stockledger/catalog.json");
    EXPECT_EQ(config.journal_path, "/var/lib/stockledger/ledger.journal");
    EXPECT_EQ(config.checkpoint_path, "/var/lib/stockledger/projection.ckpt");
    EXPECT_EQ(config.version_retention, 64u);
    EXPECT_EQ(config.sales_window_days, 14);
    EXPECT_EQ(config.log_level, LogLevel::Debug);
}

TEST_F(ConfigTest, FromEnv_WithNonNumericRetention_ShouldThrowConfigError) {
    setenv("STOCKLEDGER_VERSION_RETENTION", "lots", 1);
    EXPECT_THROW(Config::from_env(), ConfigError);
}

TEST_F(ConfigTest, FromEnv_WithZeroWindow_ShouldThrowConfigError) {
    setenv("STOCKLEDGER_SALES_WINDOW_DAYS", "0", 1);
    EXPECT_THROW(Config::from_env(), ConfigError);
}

TEST_F(ConfigTest, FromEnv_WithUnknownLogLevel_ShouldThrowConfigError) {
    setenv("STOCKLEDGER_LOG_LEVEL", "verbose", 1);
    try {
        Config::from_env();
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("STOCKLEDGER_LOG_LEVEL"), std::string::npos);
    }
}

TEST(LogLevelTest, ParseLogLevel_ShouldAcceptKnownNames) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("warn", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("WARN", level));
    EXPECT_EQ(level, LogLevel::Warn);
}
