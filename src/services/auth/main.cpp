/// @file main.cpp
/// @brief Auth service entry point.
///
/// Loads configuration, wires the auth core to the configured token and
/// lockout store and runs the periodic expired-token purge until SIGINT or
/// SIGTERM. The identity repository is in-memory; deployments plug their
/// own IIdentityRepository in front of the account database.

#include "oas/foundation/config_manager.hpp"
#include "oas/foundation/service_logger.hpp"
#include "oas/foundation/service_metrics.hpp"
#include "oas/service/auth_config.hpp"
#include "oas/service/auth_events.hpp"
#include "oas/service/auth_metrics.hpp"
#include "oas/service/auth_service.hpp"
#include "oas/service/identity_repository.hpp"
#include "oas/service/service_runner.hpp"
#include "oas/service/token_store.hpp"

#ifdef OAS_WITH_REDIS
#include "oas/service/redis_store.hpp"
#endif

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

using oas::foundation::LogCategory;

struct Stores {
    std::shared_ptr<oas::service::ILockoutStore> lockouts;
    std::shared_ptr<oas::service::ITokenStore> tokens;
};

oas::foundation::ServiceResult<Stores> openStores(
    const oas::service::StoreConfig& storeConfig,
    const std::shared_ptr<oas::service::InMemoryIdentityRepository>& identities) {
    using Result = oas::foundation::ServiceResult<Stores>;

    if (storeConfig.backend == oas::service::StoreBackend::Memory) {
        return Result::ok(Stores{identities, std::make_shared<oas::service::InMemoryTokenStore>()});
    }

#ifdef OAS_WITH_REDIS
    auto redis = oas::service::connectRedis(storeConfig);
    if (!redis) {
        return Result::err(redis.error());
    }
    return Result::ok(Stores{
        std::make_shared<oas::service::RedisLockoutStore>(redis.value(), storeConfig.keyPrefix),
        std::make_shared<oas::service::RedisTokenStore>(redis.value(), storeConfig.keyPrefix)});
#else
    return Result::err(oas::foundation::ServiceError(
        oas::foundation::ErrorCode::ConfigTypeMismatch,
        "store.backend is redis but this build has no redis support"));
#endif
}

}  // namespace

int main(int argc, char* argv[]) {
    oas::service::SignalHandler signals;

    auto configPath = oas::service::resolveConfigPath(oas::service::parseConfigArg(argc, argv));

    oas::foundation::ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto logging = oas::service::applyLoggingConfig(config);
    if (!logging) {
        std::cerr << "Invalid logging config: " << logging.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto authConfig = oas::service::loadAuthConfig(config);
    if (!authConfig) {
        std::cerr << "Invalid auth config: " << authConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto storeConfig = oas::service::loadStoreConfig(config);
    if (!storeConfig) {
        std::cerr << "Invalid store config: " << storeConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto purgeInterval = config.getOr<int>("service.purge_interval_seconds", 300);
    if (!purgeInterval || purgeInterval.value() <= 0) {
        std::cerr << "Invalid config: service.purge_interval_seconds must be a positive integer\n";
        return EXIT_FAILURE;
    }

    auto& metrics = oas::foundation::ServiceMetrics::instance();
    oas::service::metrics::registerAuthMetrics(metrics);

    auto identities = std::make_shared<oas::service::InMemoryIdentityRepository>();
    auto stores = openStores(storeConfig.value(), identities);
    if (!stores) {
        std::cerr << "Failed to open store: " << stores.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto events = std::make_shared<oas::service::LoggingEventSink>();
    oas::service::AuthService service(authConfig.value(), identities, stores.value().lockouts,
                                      stores.value().tokens, events);

    OAS_LOG_INFO(LogCategory::Core, "auth service started (config: " + configPath.string() + ")");

    const auto interval = std::chrono::seconds(purgeInterval.value());
    while (!signals.waitFor(interval)) {
        auto purged = service.purgeExpiredTokens();
        if (!purged) {
            OAS_LOG_WARN(LogCategory::Store,
                         "expired token purge failed: " + std::string(purged.error().message()));
            continue;
        }
        if (purged.value() > 0) {
            OAS_LOG_DEBUG(LogCategory::Store,
                          "purged " + std::to_string(purged.value()) + " expired token records");
        }
    }

    OAS_LOG_INFO(LogCategory::Core, "auth service stopping");
    std::cout << metrics.scrape();

    auto flushed = oas::foundation::ServiceLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    std::cout << "Auth service stopped\n";
    return EXIT_SUCCESS;
}
