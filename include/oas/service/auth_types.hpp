#pragma once

/// @file auth_types.hpp
/// @brief Core type definitions of the authentication core.
///
/// Defines identities, token records, principals, and configuration types
/// used throughout the auth service layer.

#include "oas/foundation/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oas::service {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// -- Identity model -----------------------------------------------------------

/// Lifecycle status of an account.
enum class IdentityStatus : uint8_t { PendingVerification, Active, Disabled, Deleted };

[[nodiscard]] constexpr std::string_view identityStatusName(IdentityStatus status) {
    switch (status) {
        case IdentityStatus::PendingVerification: return "pending-verification";
        case IdentityStatus::Active:              return "active";
        case IdentityStatus::Disabled:            return "disabled";
        case IdentityStatus::Deleted:             return "deleted";
    }
    return "unknown";
}

/// Stored account able to authenticate.
///
/// Secrets are never stored in plaintext: secretHash is produced by
/// CredentialVerifier. Identities are never physically removed; deletedAt
/// acts as a tombstone.
struct Identity {
    foundation::IdentityId id;
    std::string email;
    std::string displayName;
    std::string secretHash;
    IdentityStatus status = IdentityStatus::PendingVerification;
    std::vector<std::string> roles;
    uint32_t failedAttempts = 0;
    std::optional<TimePoint> lockedUntil;
    std::optional<TimePoint> deletedAt;
    TimePoint createdAt{};
    TimePoint updatedAt{};

    [[nodiscard]] bool hasRole(std::string_view role) const {
        for (const auto& r : roles) {
            if (r == role) {
                return true;
            }
        }
        return false;
    }
};

/// Tombstone filter applied on every identity read path of the core.
///
/// A deleted identity (status Deleted or a deletedAt timestamp) is treated
/// as absent.
[[nodiscard]] inline std::optional<Identity> liveIdentity(std::optional<Identity> identity) {
    if (!identity || identity->deletedAt.has_value() ||
        identity->status == IdentityStatus::Deleted) {
        return std::nullopt;
    }
    return identity;
}

// -- Token structures ---------------------------------------------------------

enum class TokenKind : uint8_t { Session, ApiKey, OAuthSession };

[[nodiscard]] constexpr std::string_view tokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::Session:      return "session";
        case TokenKind::ApiKey:       return "api-key";
        case TokenKind::OAuthSession: return "oauth-session";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<TokenKind> parseTokenKind(std::string_view name) {
    if (name == "session") return TokenKind::Session;
    if (name == "api-key") return TokenKind::ApiKey;
    if (name == "oauth-session") return TokenKind::OAuthSession;
    return std::nullopt;
}

/// Persisted representation of an issued token.
///
/// The raw token never appears here. tokenHash is SHA-256(salt || token),
/// lookupHash is the unsalted SHA-256 hex used only as an index. Records
/// issued before the index existed carry an empty lookupHash and an
/// arbitrary key.
struct TokenRecord {
    std::string key;
    std::string tokenHash;
    std::string lookupHash;
    std::string salt;
    std::string ownerRef;  ///< Decimal IdentityId, parsed on every read.
    TimePoint issuedAt{};
    TimePoint expiresAt{};
    TimePoint lastUsed{};
    TokenKind kind = TokenKind::Session;
    std::string sourceIp;
    std::string userAgent;
    std::optional<std::string> provider;
    std::optional<std::string> apiKeyName;

    [[nodiscard]] bool isLive(TimePoint now) const noexcept { return expiresAt > now; }

    /// Sliding expiry applies to every kind except api keys.
    [[nodiscard]] bool slides() const noexcept { return kind != TokenKind::ApiKey; }
};

/// Caller metadata attached to issued tokens.
struct RequestContext {
    std::string sourceIp;
    std::string userAgent;
};

/// Result of a token issuance. The raw token is handed out exactly once.
struct IssuedToken {
    std::string rawToken;
    TokenKind kind = TokenKind::Session;
    TimePoint expiresAt{};
};

/// Authenticated caller resolved from a valid token.
struct Principal {
    foundation::IdentityId identityId;
    std::string email;
    std::string displayName;
    std::vector<std::string> roles;
    TokenKind tokenKind = TokenKind::Session;
    TimePoint expiresAt{};

    [[nodiscard]] bool hasRole(std::string_view role) const {
        for (const auto& r : roles) {
            if (r == role) {
                return true;
            }
        }
        return false;
    }
};

/// Non-secret view of a token record for session listings.
struct SessionInfo {
    std::string sessionId;  ///< Store key, never the raw token.
    TokenKind kind = TokenKind::Session;
    TimePoint issuedAt{};
    TimePoint expiresAt{};
    TimePoint lastUsed{};
    std::string sourceIp;
    std::string userAgent;
    std::optional<std::string> provider;
    std::optional<std::string> apiKeyName;
};

/// Public lockout view. The failure count is deliberately absent.
struct LockoutStatus {
    bool locked = false;
    std::chrono::seconds retryAfter{0};
};

// -- Configuration ------------------------------------------------------------

/// Configuration of the authentication core.
struct AuthConfig {
    /// Session lifetime, refreshed on every successful validation.
    std::chrono::seconds sessionLifetime{86400};  // 24 hours

    /// Consecutive failures that lock an identity.
    uint32_t lockoutThreshold = 5;

    /// Length of the lock window.
    std::chrono::seconds lockoutDuration{1800};  // 30 minutes

    /// Random bytes per token (minimum 32).
    std::size_t tokenBytes = 32;

    /// PBKDF2 iteration count for new credential hashes.
    uint32_t credentialHashIterations = 310000;

    /// Enables the scan for records issued before the lookup index existed.
    bool legacyLookupEnabled = true;

    /// Unindexed records read per batch of a legacy scan. A scan keeps
    /// reading batches until it finds the token or runs out of records.
    std::size_t legacyScanLimit = 1000;

    /// Longest absolute lifetime accepted for api keys.
    std::chrono::seconds maxApiKeyLifetime{31536000};  // 365 days
};

}  // namespace oas::service
