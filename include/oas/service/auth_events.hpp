#pragma once

/// @file auth_events.hpp
/// @brief Audit events emitted by the authentication core.
///
/// Persistence and reporting belong to the consumer; the core only
/// publishes. Events never carry raw tokens, hashes or secrets.

#include "oas/foundation/types.hpp"
#include "oas/service/auth_types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace oas::service {

enum class AuthEventType : uint8_t {
    AuthenticationSucceeded,
    AuthenticationFailed,
    AccountLocked,
    TokenIssued,
    TokenRevoked
};

[[nodiscard]] constexpr std::string_view authEventTypeName(AuthEventType type) {
    switch (type) {
        case AuthEventType::AuthenticationSucceeded: return "authentication-succeeded";
        case AuthEventType::AuthenticationFailed:    return "authentication-failed";
        case AuthEventType::AccountLocked:           return "account-locked";
        case AuthEventType::TokenIssued:             return "token-issued";
        case AuthEventType::TokenRevoked:            return "token-revoked";
    }
    return "unknown";
}

struct AuthEvent {
    AuthEventType type = AuthEventType::AuthenticationFailed;

    /// Absent when the identifier did not resolve to an identity.
    std::optional<foundation::IdentityId> identityId;

    TimePoint timestamp{};

    /// Short machine-readable outcome ("ok", "invalid_credentials", ...).
    std::string outcome;

    std::unordered_map<std::string, std::string> attributes;
};

/// Receiver of audit events.
///
/// publish() is called synchronously on the request path and must not
/// throw. Implementations must be thread-safe.
class IAuthEventSink {
public:
    virtual ~IAuthEventSink() = default;

    virtual void publish(const AuthEvent& event) = 0;
};

/// Writes each event as one JSON line on the Audit log category.
class LoggingEventSink : public IAuthEventSink {
public:
    void publish(const AuthEvent& event) override;

    /// JSON rendering used by publish().
    [[nodiscard]] static std::string render(const AuthEvent& event);
};

/// Dispatches every event to a list of sinks, in registration order.
class FanOutEventSink : public IAuthEventSink {
public:
    void addSink(std::shared_ptr<IAuthEventSink> sink);

    void publish(const AuthEvent& event) override;

    [[nodiscard]] std::size_t sinkCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<IAuthEventSink>> sinks_;
};

}  // namespace oas::service
