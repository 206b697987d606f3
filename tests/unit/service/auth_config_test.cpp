#include <gtest/gtest.h>

#include "oas/foundation/config_manager.hpp"
#include "oas/foundation/service_logger.hpp"
#include "oas/service/auth_config.hpp"

using namespace oas::service;
using oas::foundation::ConfigManager;
using oas::foundation::ErrorCode;
using oas::foundation::LogCategory;
using oas::foundation::LogLevel;
using oas::foundation::ServiceLogger;

// --- AuthConfig ---

TEST(AuthConfigTest, EmptyConfigKeepsDefaults) {
    ConfigManager config;
    auto loaded = loadAuthConfig(config);
    ASSERT_TRUE(loaded.hasValue());

    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.sessionLifetime, std::chrono::seconds(86400));
    EXPECT_EQ(cfg.lockoutThreshold, 5u);
    EXPECT_EQ(cfg.lockoutDuration, std::chrono::seconds(1800));
    EXPECT_EQ(cfg.tokenBytes, 32u);
    EXPECT_TRUE(cfg.legacyLookupEnabled);
    EXPECT_EQ(cfg.legacyScanLimit, 1000u);
}

TEST(AuthConfigTest, ReadsPresentKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
auth:
  session_lifetime_seconds: 3600
  lockout_threshold: 3
  lockout_duration_seconds: 600
  token_bytes: 48
  credential_hash_iterations: 1000
  legacy_lookup_enabled: false
  legacy_scan_limit: 50
  max_api_key_lifetime_seconds: 86400
)").hasValue());

    auto loaded = loadAuthConfig(config);
    ASSERT_TRUE(loaded.hasValue());
    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.sessionLifetime, std::chrono::seconds(3600));
    EXPECT_EQ(cfg.lockoutThreshold, 3u);
    EXPECT_EQ(cfg.lockoutDuration, std::chrono::seconds(600));
    EXPECT_EQ(cfg.tokenBytes, 48u);
    EXPECT_EQ(cfg.credentialHashIterations, 1000u);
    EXPECT_FALSE(cfg.legacyLookupEnabled);
    EXPECT_EQ(cfg.legacyScanLimit, 50u);
    EXPECT_EQ(cfg.maxApiKeyLifetime, std::chrono::seconds(86400));
}

TEST(AuthConfigTest, RejectsZeroThreshold) {
    ConfigManager config;
    config.set("auth.lockout_threshold", 0);
    auto loaded = loadAuthConfig(config);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(AuthConfigTest, RejectsShortTokens) {
    ConfigManager config;
    config.set("auth.token_bytes", 16);
    auto loaded = loadAuthConfig(config);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(AuthConfigTest, RejectsWrongType) {
    ConfigManager config;
    config.set("auth.session_lifetime_seconds", std::string("one day"));
    auto loaded = loadAuthConfig(config);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch);
}

// --- StoreConfig ---

TEST(StoreConfigTest, DefaultsToMemory) {
    ConfigManager config;
    auto loaded = loadStoreConfig(config);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value().backend, StoreBackend::Memory);
    EXPECT_EQ(loaded.value().keyPrefix, "oas");
    EXPECT_EQ(loaded.value().timeout, std::chrono::milliseconds(250));
}

TEST(StoreConfigTest, ReadsRedisSettings) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
store:
  backend: redis
  redis_uri: tcp://10.0.0.5:6380
  timeout_ms: 100
  key_prefix: auth-prod
)").hasValue());

    auto loaded = loadStoreConfig(config);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value().backend, StoreBackend::Redis);
    EXPECT_EQ(loaded.value().redisUri, "tcp://10.0.0.5:6380");
    EXPECT_EQ(loaded.value().timeout, std::chrono::milliseconds(100));
    EXPECT_EQ(loaded.value().keyPrefix, "auth-prod");
}

TEST(StoreConfigTest, RejectsUnknownBackend) {
    ConfigManager config;
    config.set("store.backend", std::string("memcached"));
    auto loaded = loadStoreConfig(config);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(StoreConfigTest, RejectsEmptyPrefix) {
    ConfigManager config;
    config.set("store.key_prefix", std::string(""));
    EXPECT_TRUE(loadStoreConfig(config).hasError());
}

// --- Logging ---

class LoggingConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        auto& logger = ServiceLogger::instance();
        logger.setCategoryLevel(LogCategory::Core, LogLevel::Info);
        logger.setCategoryLevel(LogCategory::Auth, LogLevel::Info);
        logger.setCategoryLevel(LogCategory::Lockout, LogLevel::Info);
        logger.setCategoryLevel(LogCategory::Token, LogLevel::Info);
        logger.setCategoryLevel(LogCategory::Store, LogLevel::Warning);
        logger.setCategoryLevel(LogCategory::Audit, LogLevel::Info);
    }
};

TEST_F(LoggingConfigTest, AppliesLevelToEveryCategory) {
    ConfigManager config;
    config.set("logging.level", std::string("debug"));
    ASSERT_TRUE(applyLoggingConfig(config).hasValue());

    auto& logger = ServiceLogger::instance();
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Auth), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Store), LogLevel::Debug);
}

TEST_F(LoggingConfigTest, AbsentLevelIsNoOp) {
    ConfigManager config;
    EXPECT_TRUE(applyLoggingConfig(config).hasValue());
    EXPECT_EQ(ServiceLogger::instance().getCategoryLevel(LogCategory::Store), LogLevel::Warning);
}

TEST_F(LoggingConfigTest, RejectsUnknownLevel) {
    ConfigManager config;
    config.set("logging.level", std::string("verbose"));
    EXPECT_TRUE(applyLoggingConfig(config).hasError());
}
