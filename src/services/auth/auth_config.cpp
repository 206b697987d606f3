/// @file auth_config.cpp
/// @brief Configuration loading for the auth core.

#include "oas/service/auth_config.hpp"

#include "oas/foundation/service_logger.hpp"

namespace oas::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

ServiceError invalidValue(std::string_view key, std::string_view why) {
    return ServiceError(ErrorCode::ConfigTypeMismatch,
                        std::string("invalid value for ") + std::string(key) + ": " +
                            std::string(why));
}

/// Read a strictly positive integer, keeping @p fallback when absent.
ServiceResult<int64_t> positive(const ConfigManager& config, std::string_view key,
                                int64_t fallback) {
    auto value = config.getOr<int64_t>(key, fallback);
    if (value.hasError()) {
        return value;
    }
    if (value.value() <= 0) {
        return ServiceResult<int64_t>::err(invalidValue(key, "must be positive"));
    }
    return value;
}

}  // namespace

ServiceResult<AuthConfig> loadAuthConfig(const ConfigManager& config) {
    AuthConfig cfg;

    auto lifetime = positive(config, "auth.session_lifetime_seconds", cfg.sessionLifetime.count());
    if (lifetime.hasError()) {
        return ServiceResult<AuthConfig>::err(lifetime.error());
    }
    cfg.sessionLifetime = std::chrono::seconds(lifetime.value());

    auto threshold = positive(config, "auth.lockout_threshold", cfg.lockoutThreshold);
    if (threshold.hasError()) {
        return ServiceResult<AuthConfig>::err(threshold.error());
    }
    cfg.lockoutThreshold = static_cast<uint32_t>(threshold.value());

    auto lockDuration =
        positive(config, "auth.lockout_duration_seconds", cfg.lockoutDuration.count());
    if (lockDuration.hasError()) {
        return ServiceResult<AuthConfig>::err(lockDuration.error());
    }
    cfg.lockoutDuration = std::chrono::seconds(lockDuration.value());

    auto tokenBytes = positive(config, "auth.token_bytes", static_cast<int64_t>(cfg.tokenBytes));
    if (tokenBytes.hasError()) {
        return ServiceResult<AuthConfig>::err(tokenBytes.error());
    }
    if (tokenBytes.value() < 32 || tokenBytes.value() > 256) {
        return ServiceResult<AuthConfig>::err(
            invalidValue("auth.token_bytes", "must be between 32 and 256"));
    }
    cfg.tokenBytes = static_cast<std::size_t>(tokenBytes.value());

    auto iterations =
        positive(config, "auth.credential_hash_iterations", cfg.credentialHashIterations);
    if (iterations.hasError()) {
        return ServiceResult<AuthConfig>::err(iterations.error());
    }
    if (iterations.value() < 1000 || iterations.value() > 10'000'000) {
        return ServiceResult<AuthConfig>::err(
            invalidValue("auth.credential_hash_iterations", "must be between 1000 and 10000000"));
    }
    cfg.credentialHashIterations = static_cast<uint32_t>(iterations.value());

    auto legacy = config.getOr<bool>("auth.legacy_lookup_enabled", cfg.legacyLookupEnabled);
    if (legacy.hasError()) {
        return ServiceResult<AuthConfig>::err(legacy.error());
    }
    cfg.legacyLookupEnabled = legacy.value();

    auto scanLimit =
        positive(config, "auth.legacy_scan_limit", static_cast<int64_t>(cfg.legacyScanLimit));
    if (scanLimit.hasError()) {
        return ServiceResult<AuthConfig>::err(scanLimit.error());
    }
    cfg.legacyScanLimit = static_cast<std::size_t>(scanLimit.value());

    auto maxApiKey =
        positive(config, "auth.max_api_key_lifetime_seconds", cfg.maxApiKeyLifetime.count());
    if (maxApiKey.hasError()) {
        return ServiceResult<AuthConfig>::err(maxApiKey.error());
    }
    cfg.maxApiKeyLifetime = std::chrono::seconds(maxApiKey.value());

    return ServiceResult<AuthConfig>::ok(std::move(cfg));
}

ServiceResult<StoreConfig> loadStoreConfig(const ConfigManager& config) {
    StoreConfig cfg;

    auto backend = config.getOr<std::string>("store.backend", "memory");
    if (backend.hasError()) {
        return ServiceResult<StoreConfig>::err(backend.error());
    }
    if (backend.value() == "memory") {
        cfg.backend = StoreBackend::Memory;
    } else if (backend.value() == "redis") {
        cfg.backend = StoreBackend::Redis;
    } else {
        return ServiceResult<StoreConfig>::err(
            invalidValue("store.backend", "expected memory or redis"));
    }

    auto uri = config.getOr<std::string>("store.redis_uri", cfg.redisUri);
    if (uri.hasError()) {
        return ServiceResult<StoreConfig>::err(uri.error());
    }
    cfg.redisUri = std::move(uri).value();

    auto timeout = positive(config, "store.timeout_ms", cfg.timeout.count());
    if (timeout.hasError()) {
        return ServiceResult<StoreConfig>::err(timeout.error());
    }
    cfg.timeout = std::chrono::milliseconds(timeout.value());

    auto prefix = config.getOr<std::string>("store.key_prefix", cfg.keyPrefix);
    if (prefix.hasError()) {
        return ServiceResult<StoreConfig>::err(prefix.error());
    }
    if (prefix.value().empty()) {
        return ServiceResult<StoreConfig>::err(invalidValue("store.key_prefix", "must not be empty"));
    }
    cfg.keyPrefix = std::move(prefix).value();

    return ServiceResult<StoreConfig>::ok(std::move(cfg));
}

ServiceResult<void> applyLoggingConfig(const ConfigManager& config) {
    if (!config.hasKey("logging.level")) {
        return ServiceResult<void>::ok();
    }
    auto name = config.get<std::string>("logging.level");
    if (name.hasError()) {
        return ServiceResult<void>::err(name.error());
    }
    auto level = foundation::parseLogLevel(name.value());
    if (!level) {
        return ServiceResult<void>::err(invalidValue("logging.level", name.value()));
    }
    auto& logger = foundation::ServiceLogger::instance();
    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        logger.setCategoryLevel(static_cast<foundation::LogCategory>(i), *level);
    }
    return ServiceResult<void>::ok();
}

}  // namespace oas::service
