/// @file lockout_tracker.cpp
/// @brief LockoutTracker implementation.

#include "oas/service/lockout_tracker.hpp"

#include "oas/foundation/service_logger.hpp"

#include <algorithm>

namespace oas::service {

using foundation::IdentityId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceResult;

LockoutTracker::LockoutTracker(std::shared_ptr<ILockoutStore> store,
                               std::shared_ptr<foundation::IClock> clock,
                               uint32_t threshold,
                               std::chrono::seconds lockDuration)
    : store_(std::move(store)),
      clock_(std::move(clock)),
      threshold_(std::max<uint32_t>(threshold, 1)),
      lockDuration_(lockDuration) {}

LockoutStatus LockoutTracker::toStatus(const LockoutState& state, TimePoint now) const {
    LockoutStatus status;
    if (state.lockedAt(now)) {
        status.locked = true;
        status.retryAfter = std::chrono::ceil<std::chrono::seconds>(*state.lockedUntil - now);
    }
    return status;
}

ServiceResult<LockoutStatus> LockoutTracker::check(IdentityId id) {
    auto now = clock_->now();
    auto state = store_->state(id);
    if (state.hasError()) {
        return ServiceResult<LockoutStatus>::err(state.error());
    }

    if (state.value().lockedAt(now)) {
        return ServiceResult<LockoutStatus>::ok(toStatus(state.value(), now));
    }

    if (state.value().lockedUntil.has_value()) {
        auto cleared = store_->clearExpiredLock(id, now);
        if (cleared.hasError()) {
            return ServiceResult<LockoutStatus>::err(cleared.error());
        }
        if (cleared.value()) {
            LogContext ctx;
            ctx.identityId = id;
            OAS_LOG_CTX(LogLevel::Info, LogCategory::Lockout, "lock window expired", ctx);
        }
    }
    return ServiceResult<LockoutStatus>::ok(LockoutStatus{});
}

ServiceResult<FailureOutcome> LockoutTracker::recordFailure(IdentityId id) {
    auto outcome = store_->incrementFailures(id, threshold_, clock_->now(), lockDuration_);
    if (outcome.hasValue() && outcome.value().lockedNow) {
        LogContext ctx;
        ctx.identityId = id;
        ctx.extra["lock_seconds"] = std::to_string(lockDuration_.count());
        OAS_LOG_CTX(LogLevel::Warning, LogCategory::Lockout, "identity locked", ctx);
    }
    return outcome;
}

ServiceResult<bool> LockoutTracker::recordSuccess(IdentityId id) {
    return store_->resetIfUnlocked(id, clock_->now());
}

ServiceResult<LockoutStatus> LockoutTracker::status(IdentityId id) {
    auto now = clock_->now();
    auto state = store_->state(id);
    if (state.hasError()) {
        return ServiceResult<LockoutStatus>::err(state.error());
    }
    return ServiceResult<LockoutStatus>::ok(toStatus(state.value(), now));
}

ServiceResult<void> LockoutTracker::unlock(IdentityId id) {
    auto result = store_->reset(id);
    if (result.hasValue()) {
        LogContext ctx;
        ctx.identityId = id;
        OAS_LOG_CTX(LogLevel::Info, LogCategory::Lockout, "identity unlocked by administrator", ctx);
    }
    return result;
}

}  // namespace oas::service
