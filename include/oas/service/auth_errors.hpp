#pragma once

/// @file auth_errors.hpp
/// @brief Typed authentication failures and their caller-facing form.

#include "oas/foundation/service_error.hpp"

#include <chrono>
#include <string>

namespace oas::service {

/// Uniform message for every credential failure, whatever the internal cause.
inline constexpr const char* kInvalidCredentialsMessage = "invalid email or password";

/// Context attached to AccountLocked errors.
///
/// Carries only the retry window; the failure count is never exposed.
struct LockoutNotice {
    std::chrono::seconds retryAfter{0};
};

[[nodiscard]] inline foundation::ServiceError invalidCredentials() {
    return foundation::ServiceError(foundation::ErrorCode::InvalidCredentials,
                                    kInvalidCredentialsMessage);
}

[[nodiscard]] inline foundation::ServiceError accountLocked(std::chrono::seconds retryAfter) {
    return foundation::ServiceError(foundation::ErrorCode::AccountLocked,
                                    "account temporarily locked",
                                    LockoutNotice{retryAfter});
}

[[nodiscard]] inline foundation::ServiceError permissionDenied(std::string reason) {
    return foundation::ServiceError(foundation::ErrorCode::PermissionDenied, std::move(reason));
}

/// Convert an internal failure into what an external caller may see.
///
/// AccountNotActive collapses into the generic credential failure.
/// AccountLocked keeps its retry window. Store failures keep their code so
/// callers can retry.
[[nodiscard]] inline foundation::ServiceError toPublicError(const foundation::ServiceError& error) {
    using foundation::ErrorCode;
    switch (error.code()) {
        case ErrorCode::AccountNotActive:
        case ErrorCode::InvalidCredentials:
        case ErrorCode::AuthenticationFailed:
            return invalidCredentials();
        case ErrorCode::AccountLocked: {
            const auto* notice = error.context<LockoutNotice>();
            return accountLocked(notice ? notice->retryAfter : std::chrono::seconds{0});
        }
        default:
            break;
    }
    if (foundation::isStoreFailure(error.code())) {
        return foundation::ServiceError(error.code(), "service temporarily unavailable");
    }
    return error;
}

}  // namespace oas::service
