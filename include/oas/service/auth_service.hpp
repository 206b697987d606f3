#pragma once

/// @file auth_service.hpp
/// @brief Authentication orchestrator: login, token validation, revocation
///        and session administration.
///
/// Composes CredentialVerifier, LockoutTracker, TokenIssuer,
/// SessionValidator and RevocationManager over shared stores. The service
/// keeps no per-request or per-identity state of its own; every instance
/// sharing the same stores behaves identically.

#include "oas/foundation/clock.hpp"
#include "oas/foundation/service_result.hpp"
#include "oas/foundation/types.hpp"
#include "oas/service/auth_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace oas::foundation {
class ServiceMetrics;
}

namespace oas::service {

class IIdentityRepository;
class ILockoutStore;
class ITokenStore;
class IAuthEventSink;
class CredentialVerifier;
class LockoutTracker;
class TokenIssuer;
class TokenLocator;
class SessionValidator;
class RevocationManager;
struct IssueRequest;
enum class AuthEventType : uint8_t;

/// Authentication service.
///
/// Credential failures (unknown identifier, wrong secret, malformed input,
/// inactive account) all surface as InvalidCredentials with one uniform
/// message. A locked account surfaces as AccountLocked with a LockoutNotice
/// carrying only the retry window. Store failures keep their own codes and
/// are retriable.
///
/// Example:
/// @code
///   auto identities = std::make_shared<InMemoryIdentityRepository>();
///   auto tokens = std::make_shared<InMemoryTokenStore>();
///   AuthService service(AuthConfig{}, identities, identities, tokens);
///
///   auto login = service.authenticate("alice@example.com", "s3cret", {"10.0.0.1", "curl"});
///   auto principal = service.validateToken(login.value().rawToken);
/// @endcode
class AuthService {
public:
    AuthService(AuthConfig config,
                std::shared_ptr<IIdentityRepository> identities,
                std::shared_ptr<ILockoutStore> lockouts,
                std::shared_ptr<ITokenStore> tokens,
                std::shared_ptr<IAuthEventSink> events = nullptr,
                std::shared_ptr<foundation::IClock> clock = foundation::SystemClock::shared());

    ~AuthService();

    AuthService(const AuthService&) = delete;
    AuthService& operator=(const AuthService&) = delete;
    AuthService(AuthService&&) noexcept;
    AuthService& operator=(AuthService&&) noexcept;

    // -- Login ----------------------------------------------------------------

    /// Verify email and secret and issue a session token.
    /// The raw token in the result is not retrievable again.
    [[nodiscard]] foundation::ServiceResult<IssuedToken> authenticate(
        std::string_view identifier, std::string_view secret, const RequestContext& context = {});

    /// Issue a session after an external identity provider vouched for the
    /// identity. Lockout is not consulted; the provider handshake replaced
    /// the secret check.
    [[nodiscard]] foundation::ServiceResult<IssuedToken> issueProviderSession(
        foundation::IdentityId identity, std::string_view provider,
        const RequestContext& context = {});

    /// Issue a named api key for the caller with an absolute expiry.
    [[nodiscard]] foundation::ServiceResult<IssuedToken> issueApiToken(
        const Principal& caller, std::string_view name, TimePoint expiresAt,
        const RequestContext& context = {});

    // -- Validation -----------------------------------------------------------

    /// Resolve a raw token, sliding its expiry. Empty when the token is not
    /// usable for any reason.
    [[nodiscard]] foundation::ServiceResult<std::optional<Principal>> validateToken(
        std::string_view rawToken);

    /// Metadata of a live token without refreshing it.
    [[nodiscard]] foundation::ServiceResult<std::optional<SessionInfo>> tokenInfo(
        std::string_view rawToken);

    // -- Revocation -----------------------------------------------------------

    /// Revoke one token (logout). Unknown or malformed tokens are a no-op.
    [[nodiscard]] foundation::ServiceResult<bool> revokeToken(std::string_view rawToken);

    /// Revoke every token of an identity (logout everywhere).
    [[nodiscard]] foundation::ServiceResult<std::size_t> revokeAllTokens(
        foundation::IdentityId identity);

    /// Guarded variant: the caller must be the identity or an admin.
    [[nodiscard]] foundation::ServiceResult<std::size_t> revokeAllTokens(
        const Principal& caller, foundation::IdentityId identity);

    /// Revoke one of the caller's sessions by the id listSessions reports.
    [[nodiscard]] foundation::ServiceResult<bool> revokeSession(const Principal& caller,
                                                               std::string_view sessionId);

    // -- Administration -------------------------------------------------------

    /// Live sessions of @p identity. The caller must be the identity or an
    /// admin.
    [[nodiscard]] foundation::ServiceResult<std::vector<SessionInfo>> listSessions(
        const Principal& caller, foundation::IdentityId identity);

    /// Number of live tokens of @p identity, every kind included. Same guard
    /// as listSessions.
    [[nodiscard]] foundation::ServiceResult<std::size_t> countActiveSessions(
        const Principal& caller, foundation::IdentityId identity);

    [[nodiscard]] foundation::ServiceResult<LockoutStatus> lockoutStatus(
        foundation::IdentityId identity);

    /// Administrative unlock. Requires the admin role.
    [[nodiscard]] foundation::ServiceResult<void> unlock(const Principal& caller,
                                                        foundation::IdentityId identity);

    /// Physically drop expired token records.
    [[nodiscard]] foundation::ServiceResult<std::size_t> purgeExpiredTokens();

    /// Hash a secret for storage (registration, secret change).
    [[nodiscard]] foundation::ServiceResult<std::string> hashSecret(std::string_view secret) const;

    [[nodiscard]] const AuthConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] foundation::ServiceResult<IssuedToken> issueFor(const Identity& identity,
                                                                 const IssueRequest& request);

    void emit(AuthEventType type,
              std::optional<foundation::IdentityId> identity,
              std::string outcome,
              std::unordered_map<std::string, std::string> attributes = {});

    [[nodiscard]] foundation::ServiceResult<IssuedToken> rejectCredentials(
        std::optional<foundation::IdentityId> identity, std::string_view reason);

    [[nodiscard]] static SessionInfo toSessionInfo(const TokenRecord& record);

    AuthConfig config_;
    std::shared_ptr<IIdentityRepository> identities_;
    std::shared_ptr<ITokenStore> tokens_;
    std::shared_ptr<IAuthEventSink> events_;
    std::shared_ptr<foundation::IClock> clock_;
    foundation::ServiceMetrics* metrics_;
    std::unique_ptr<CredentialVerifier> verifier_;
    std::unique_ptr<LockoutTracker> lockout_;
    std::unique_ptr<TokenIssuer> issuer_;
    std::unique_ptr<TokenLocator> locator_;
    std::unique_ptr<SessionValidator> validator_;
    std::unique_ptr<RevocationManager> revocation_;
};

}  // namespace oas::service
