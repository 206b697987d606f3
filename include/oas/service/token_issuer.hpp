#pragma once

/// @file token_issuer.hpp
/// @brief Opaque token generation and storage representation.

#include "oas/foundation/clock.hpp"
#include "oas/foundation/service_result.hpp"
#include "oas/foundation/types.hpp"
#include "oas/service/auth_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace oas::service {

class ITokenStore;

/// Parameters of one issuance.
struct IssueRequest {
    TokenKind kind = TokenKind::Session;
    RequestContext context;

    /// Originating identity provider (oauth-session only).
    std::optional<std::string> provider;

    /// Caller-facing name (api-key only).
    std::optional<std::string> apiKeyName;

    /// Absolute expiry (api-key only). Session kinds use the configured
    /// lifetime.
    std::optional<TimePoint> expiresAt;
};

/// Issues opaque tokens.
///
/// A token is tokenBytes from OpenSSL's CSPRNG, rendered as unpadded
/// base64url (43 characters for 32 bytes). Its record holds a random salt,
/// the salted hash SHA-256(salt || token) and the deterministic lookup hash
/// SHA-256(token) in hex, which is also the record key. Uniqueness comes
/// from entropy alone; there is no counter and no retry.
///
/// Example:
/// @code
///   TokenIssuer issuer(store, clock, config);
///   auto issued = issuer.issue(identityId, IssueRequest{});
///   // issued.value().rawToken is returned to the caller exactly once
/// @endcode
class TokenIssuer {
public:
    TokenIssuer(std::shared_ptr<ITokenStore> store,
                std::shared_ptr<foundation::IClock> clock,
                const AuthConfig& config);

    /// Generate a token, persist its record, and return the raw value.
    [[nodiscard]] foundation::ServiceResult<IssuedToken> issue(foundation::IdentityId owner,
                                                              const IssueRequest& request);

    /// Draw a fresh raw token without persisting anything.
    [[nodiscard]] foundation::ServiceResult<std::string> generateRawToken() const;

    /// Deterministic index hash (lowercase hex SHA-256).
    [[nodiscard]] static std::string lookupHashOf(std::string_view rawToken);

    /// Salted storage hash (lowercase hex SHA-256 of salt || token).
    [[nodiscard]] static std::string saltedHashOf(std::string_view salt,
                                                  std::string_view rawToken);

    /// Constant-time check of a raw token against a record's salted hash.
    [[nodiscard]] static bool matches(std::string_view rawToken, const TokenRecord& record);

private:
    [[nodiscard]] foundation::ServiceResult<TimePoint> expiryFor(const IssueRequest& request,
                                                                TimePoint now) const;

    std::shared_ptr<ITokenStore> store_;
    std::shared_ptr<foundation::IClock> clock_;
    std::size_t tokenBytes_;
    std::chrono::seconds sessionLifetime_;
    std::chrono::seconds maxApiKeyLifetime_;
};

}  // namespace oas::service
