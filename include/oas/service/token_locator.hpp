#pragma once

/// @file token_locator.hpp
/// @brief Resolves a raw token to its stored record.

#include "oas/foundation/service_metrics.hpp"
#include "oas/foundation/service_result.hpp"
#include "oas/service/auth_types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace oas::service {

class ITokenStore;

/// Two-path token lookup shared by validation and revocation.
///
/// 1. Fast path: point lookup by SHA-256(token), then salted-hash check.
/// 2. Slow path, on index miss only: walk the live records that predate the
///    lookup index in batches of legacyScanLimit, verifying each salted
///    hash, until one matches or the records run out.
///    A match gets its lookup hash backfilled so the next call takes the
///    fast path. Backfill adds the index and changes nothing else.
///
/// Malformed input resolves to nullopt without touching the store.
class TokenLocator {
public:
    TokenLocator(std::shared_ptr<ITokenStore> store,
                 const AuthConfig& config,
                 foundation::ServiceMetrics& metrics = foundation::ServiceMetrics::instance());

    [[nodiscard]] foundation::ServiceResult<std::optional<TokenRecord>> locate(
        std::string_view rawToken, TimePoint now);

private:
    [[nodiscard]] foundation::ServiceResult<std::optional<TokenRecord>> scanUnindexed(
        std::string_view rawToken, std::string_view lookupHash, TimePoint now);

    std::shared_ptr<ITokenStore> store_;
    foundation::ServiceMetrics& metrics_;
    bool legacyLookupEnabled_;
    std::size_t legacyScanBatch_;
};

}  // namespace oas::service
