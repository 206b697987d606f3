#pragma once

/// @file auth_config.hpp
/// @brief Mapping of configuration keys onto AuthConfig and StoreConfig.

#include "oas/foundation/config_manager.hpp"
#include "oas/foundation/service_result.hpp"
#include "oas/service/auth_types.hpp"

#include <chrono>
#include <string>

namespace oas::service {

enum class StoreBackend : uint8_t { Memory, Redis };

/// Connection settings of the shared token and lockout store.
struct StoreConfig {
    StoreBackend backend = StoreBackend::Memory;

    /// redis-plus-plus URI, e.g. tcp://127.0.0.1:6379 or tcp://:pass@host:6379/2.
    std::string redisUri = "tcp://127.0.0.1:6379";

    /// Per-call bound for connect and socket operations.
    std::chrono::milliseconds timeout{250};

    /// Namespace prepended to every key.
    std::string keyPrefix = "oas";
};

/// Read the `auth.*` keys. Missing keys keep their defaults; present keys of
/// the wrong type or with out-of-range values are ConfigTypeMismatch errors.
[[nodiscard]] foundation::ServiceResult<AuthConfig> loadAuthConfig(
    const foundation::ConfigManager& config);

/// Read the `store.*` keys.
[[nodiscard]] foundation::ServiceResult<StoreConfig> loadStoreConfig(
    const foundation::ConfigManager& config);

/// Apply `logging.level` to every log category when present.
[[nodiscard]] foundation::ServiceResult<void> applyLoggingConfig(
    const foundation::ConfigManager& config);

}  // namespace oas::service
