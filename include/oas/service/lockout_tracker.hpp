#pragma once

/// @file lockout_tracker.hpp
/// @brief Per-identity brute-force lockout.
///
/// State machine per identity:
///   unlocked --(failure reaching threshold)--> locked
///   locked   --(attempt after lockedUntil)---> unlocked (counter reset)
/// A locked identity rejects every attempt until its window passes,
/// whether or not the secret is correct.

#include "oas/foundation/clock.hpp"
#include "oas/foundation/service_result.hpp"
#include "oas/foundation/types.hpp"
#include "oas/service/auth_types.hpp"
#include "oas/service/lockout_store.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace oas::service {

/// Lockout gate consulted before and updated after every attempt.
///
/// Holds no state of its own; every decision is read from or written to the
/// shared ILockoutStore.
///
/// Example:
/// @code
///   LockoutTracker tracker(store, clock, 5, std::chrono::minutes{30});
///   auto gate = tracker.check(id);
///   if (gate.hasValue() && gate.value().locked) { ... }
/// @endcode
class LockoutTracker {
public:
    LockoutTracker(std::shared_ptr<ILockoutStore> store,
                   std::shared_ptr<foundation::IClock> clock,
                   uint32_t threshold,
                   std::chrono::seconds lockDuration);

    /// Gate an attempt. Clears a lock whose window has passed.
    [[nodiscard]] foundation::ServiceResult<LockoutStatus> check(foundation::IdentityId id);

    /// Record a failed attempt.
    [[nodiscard]] foundation::ServiceResult<FailureOutcome> recordFailure(
        foundation::IdentityId id);

    /// Record a successful attempt. Returns false if a concurrent failure
    /// locked the identity in the meantime.
    [[nodiscard]] foundation::ServiceResult<bool> recordSuccess(foundation::IdentityId id);

    /// Read-only view of the lock, without the failure count.
    [[nodiscard]] foundation::ServiceResult<LockoutStatus> status(foundation::IdentityId id);

    /// Administrative reset of counter and lock.
    [[nodiscard]] foundation::ServiceResult<void> unlock(foundation::IdentityId id);

    [[nodiscard]] uint32_t threshold() const noexcept { return threshold_; }
    [[nodiscard]] std::chrono::seconds lockDuration() const noexcept { return lockDuration_; }

private:
    [[nodiscard]] LockoutStatus toStatus(const LockoutState& state, TimePoint now) const;

    std::shared_ptr<ILockoutStore> store_;
    std::shared_ptr<foundation::IClock> clock_;
    uint32_t threshold_;
    std::chrono::seconds lockDuration_;
};

}  // namespace oas::service
