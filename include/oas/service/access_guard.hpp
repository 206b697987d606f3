#pragma once

/// @file access_guard.hpp
/// @brief Explicit authorization checks called at the start of guarded
///        operations.

#include "oas/foundation/types.hpp"
#include "oas/service/auth_types.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace oas::service {

/// Outcome of an authorization check.
struct AccessDecision {
    bool allowed;
    std::string reason;

    explicit operator bool() const noexcept { return allowed; }

    static AccessDecision allow() { return {true, {}}; }
    static AccessDecision deny(std::string why) { return {false, std::move(why)}; }
};

/// Stateless guard functions.
class AccessGuard {
public:
    static constexpr std::string_view kAdminRole = "admin";

    /// Caller holds the admin role.
    [[nodiscard]] static AccessDecision requireAdmin(const Principal& caller) {
        if (caller.hasRole(kAdminRole)) {
            return AccessDecision::allow();
        }
        return AccessDecision::deny("admin role required");
    }

    /// Caller acts on its own identity, or holds the admin role.
    [[nodiscard]] static AccessDecision requireSelfOrAdmin(const Principal& caller,
                                                           foundation::IdentityId target) {
        if (caller.identityId.isValid() && caller.identityId == target) {
            return AccessDecision::allow();
        }
        if (caller.hasRole(kAdminRole)) {
            return AccessDecision::allow();
        }
        return AccessDecision::deny("caller may only act on its own identity");
    }
};

}  // namespace oas::service
