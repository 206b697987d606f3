#pragma once

/// @file lockout_store.hpp
/// @brief Storage contract for per-identity failure counters and lock windows.

#include "oas/foundation/service_result.hpp"
#include "oas/foundation/types.hpp"
#include "oas/service/auth_types.hpp"

#include <cstdint>
#include <optional>

namespace oas::service {

/// Snapshot of an identity's lockout fields.
struct LockoutState {
    uint32_t failedAttempts = 0;
    std::optional<TimePoint> lockedUntil;

    [[nodiscard]] bool lockedAt(TimePoint now) const noexcept {
        return lockedUntil.has_value() && *lockedUntil > now;
    }
};

/// Outcome of one atomic failure increment.
struct FailureOutcome {
    uint32_t failedAttempts = 0;

    /// True only for the increment that moved the identity into the locked
    /// state. Concurrent failures observe it exactly once.
    bool lockedNow = false;

    std::optional<TimePoint> lockedUntil;
};

/// Abstract lockout state store.
///
/// Every mutating operation is a single atomic step at the store so that
/// concurrent attempts against the same identity cannot lose updates or
/// lock an identity twice. Implementations must be thread-safe.
class ILockoutStore {
public:
    virtual ~ILockoutStore() = default;

    /// Read the current counter and lock window. Unknown ids read as zero.
    [[nodiscard]] virtual foundation::ServiceResult<LockoutState> state(
        foundation::IdentityId id) = 0;

    /// Increment the failure counter unless a lock is in effect at @p now.
    ///
    /// When the counter reaches @p threshold the lock window is set to
    /// @p now + @p lockDuration and the outcome reports lockedNow.
    [[nodiscard]] virtual foundation::ServiceResult<FailureOutcome> incrementFailures(
        foundation::IdentityId id, uint32_t threshold, TimePoint now,
        std::chrono::seconds lockDuration) = 0;

    /// Reset the counter and clear the lock unless a lock is in effect at
    /// @p now. Returns false when the identity is locked.
    [[nodiscard]] virtual foundation::ServiceResult<bool> resetIfUnlocked(
        foundation::IdentityId id, TimePoint now) = 0;

    /// Clear a lock whose window ended at or before @p now, resetting the
    /// counter. Returns true if a lock was cleared.
    [[nodiscard]] virtual foundation::ServiceResult<bool> clearExpiredLock(
        foundation::IdentityId id, TimePoint now) = 0;

    /// Unconditionally reset counter and lock (administrative unlock).
    [[nodiscard]] virtual foundation::ServiceResult<void> reset(foundation::IdentityId id) = 0;
};

}  // namespace oas::service
