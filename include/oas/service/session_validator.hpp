#pragma once

/// @file session_validator.hpp
/// @brief Raw token to principal resolution with sliding expiration.

#include "oas/foundation/clock.hpp"
#include "oas/foundation/service_metrics.hpp"
#include "oas/foundation/service_result.hpp"
#include "oas/service/auth_types.hpp"
#include "oas/service/token_locator.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace oas::service {

class IIdentityRepository;
class ITokenStore;

/// Validates raw tokens.
///
/// Every way a token can be unusable (malformed, unknown, expired, revoked,
/// owner disabled or deleted) yields an empty optional. Only store failures
/// travel down the error channel. A successful validation moves expiresAt to
/// now + sessionLifetime in the same store operation that confirms the
/// record is still live; api keys keep their absolute expiry.
class SessionValidator {
public:
    SessionValidator(std::shared_ptr<ITokenStore> store,
                     std::shared_ptr<IIdentityRepository> identities,
                     std::shared_ptr<foundation::IClock> clock,
                     const AuthConfig& config,
                     foundation::ServiceMetrics& metrics = foundation::ServiceMetrics::instance());

    [[nodiscard]] foundation::ServiceResult<std::optional<Principal>> validate(
        std::string_view rawToken);

private:
    std::shared_ptr<ITokenStore> store_;
    std::shared_ptr<IIdentityRepository> identities_;
    std::shared_ptr<foundation::IClock> clock_;
    TokenLocator locator_;
    foundation::ServiceMetrics& metrics_;
    std::chrono::seconds sessionLifetime_;
};

}  // namespace oas::service
