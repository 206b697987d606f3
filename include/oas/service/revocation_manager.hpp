#pragma once

/// @file revocation_manager.hpp
/// @brief Deletion of single tokens and of all tokens of an identity.

#include "oas/foundation/clock.hpp"
#include "oas/foundation/service_metrics.hpp"
#include "oas/foundation/service_result.hpp"
#include "oas/foundation/types.hpp"
#include "oas/service/auth_types.hpp"
#include "oas/service/token_locator.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace oas::service {

class IAuthEventSink;
class ITokenStore;

/// Revokes tokens by deleting their records.
///
/// Deletions go straight to the shared store, so every validator observes
/// them on its next read. Revoking an unknown, expired or malformed token is
/// a successful no-op.
class RevocationManager {
public:
    RevocationManager(std::shared_ptr<ITokenStore> store,
                      std::shared_ptr<IAuthEventSink> events,
                      std::shared_ptr<foundation::IClock> clock,
                      const AuthConfig& config,
                      foundation::ServiceMetrics& metrics = foundation::ServiceMetrics::instance());

    /// Delete the record matching @p rawToken. Returns true if one was
    /// deleted by this call.
    [[nodiscard]] foundation::ServiceResult<bool> revoke(std::string_view rawToken);

    /// Delete the session @p sessionId (a store key from listSessions) if it
    /// belongs to @p owner.
    [[nodiscard]] foundation::ServiceResult<bool> revokeSession(foundation::IdentityId owner,
                                                               std::string_view sessionId);

    /// Delete every record owned by @p identity, returning how many live
    /// tokens were revoked.
    [[nodiscard]] foundation::ServiceResult<std::size_t> revokeAll(
        foundation::IdentityId identity);

private:
    void publishRevoked(const TokenRecord& record, TimePoint now, std::string_view reason);

    std::shared_ptr<ITokenStore> store_;
    std::shared_ptr<IAuthEventSink> events_;
    std::shared_ptr<foundation::IClock> clock_;
    TokenLocator locator_;
    foundation::ServiceMetrics& metrics_;
};

}  // namespace oas::service
