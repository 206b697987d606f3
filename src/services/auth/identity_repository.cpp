/// @file identity_repository.cpp
/// @brief InMemoryIdentityRepository implementation.

#include "oas/service/identity_repository.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace oas::service {

using foundation::ErrorCode;
using foundation::IdentityId;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

std::string normalizeEmail(std::string_view email) {
    std::string lower(email.size(), '\0');
    std::transform(email.begin(), email.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

ServiceError unknownIdentity(IdentityId id) {
    return ServiceError(ErrorCode::NotFound, "identity not found: " + id.toString());
}

}  // namespace

// -- IIdentityRepository ------------------------------------------------------

std::optional<Identity> InMemoryIdentityRepository::findById(IdentityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(id);
    if (it == identities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Identity> InMemoryIdentityRepository::findByEmail(std::string_view email) const {
    auto wanted = normalizeEmail(email);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, identity] : identities_) {
        if (normalizeEmail(identity.email) == wanted) {
            return identity;
        }
    }
    return std::nullopt;
}

ServiceResult<IdentityId> InMemoryIdentityRepository::create(Identity identity) {
    auto wanted = normalizeEmail(identity.email);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, existing] : identities_) {
        if (normalizeEmail(existing.email) == wanted) {
            return ServiceResult<IdentityId>::err(
                ServiceError(ErrorCode::AlreadyExists, "email already registered"));
        }
    }
    auto id = IdentityId(nextId_++);
    identity.id = id;
    identity.failedAttempts = 0;
    identity.lockedUntil.reset();
    auto now = std::chrono::system_clock::now();
    identity.createdAt = now;
    identity.updatedAt = now;
    identities_.emplace(id, std::move(identity));
    return ServiceResult<IdentityId>::ok(id);
}

bool InMemoryIdentityRepository::update(const Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(identity.id);
    if (it == identities_.end()) {
        return false;
    }
    auto& stored = it->second;
    stored.email = identity.email;
    stored.displayName = identity.displayName;
    stored.secretHash = identity.secretHash;
    stored.status = identity.status;
    stored.roles = identity.roles;
    stored.updatedAt = std::chrono::system_clock::now();
    return true;
}

bool InMemoryIdentityRepository::markDeleted(IdentityId id, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(id);
    if (it == identities_.end()) {
        return false;
    }
    it->second.status = IdentityStatus::Deleted;
    it->second.deletedAt = at;
    it->second.updatedAt = at;
    return true;
}

// -- ILockoutStore ------------------------------------------------------------

ServiceResult<LockoutState> InMemoryIdentityRepository::state(IdentityId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(id);
    if (it == identities_.end()) {
        return ServiceResult<LockoutState>::ok(LockoutState{});
    }
    return ServiceResult<LockoutState>::ok(
        LockoutState{it->second.failedAttempts, it->second.lockedUntil});
}

ServiceResult<FailureOutcome> InMemoryIdentityRepository::incrementFailures(
    IdentityId id, uint32_t threshold, TimePoint now, std::chrono::seconds lockDuration) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(id);
    if (it == identities_.end()) {
        return ServiceResult<FailureOutcome>::err(unknownIdentity(id));
    }
    auto& identity = it->second;

    FailureOutcome outcome;
    if (identity.lockedUntil && *identity.lockedUntil > now) {
        outcome.failedAttempts = identity.failedAttempts;
        outcome.lockedUntil = identity.lockedUntil;
        return ServiceResult<FailureOutcome>::ok(outcome);
    }

    ++identity.failedAttempts;
    if (identity.failedAttempts >= threshold) {
        identity.lockedUntil = now + lockDuration;
        outcome.lockedNow = true;
    }
    outcome.failedAttempts = identity.failedAttempts;
    outcome.lockedUntil = identity.lockedUntil;
    return ServiceResult<FailureOutcome>::ok(outcome);
}

ServiceResult<bool> InMemoryIdentityRepository::resetIfUnlocked(IdentityId id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(id);
    if (it == identities_.end()) {
        return ServiceResult<bool>::err(unknownIdentity(id));
    }
    auto& identity = it->second;
    if (identity.lockedUntil && *identity.lockedUntil > now) {
        return ServiceResult<bool>::ok(false);
    }
    identity.failedAttempts = 0;
    identity.lockedUntil.reset();
    return ServiceResult<bool>::ok(true);
}

ServiceResult<bool> InMemoryIdentityRepository::clearExpiredLock(IdentityId id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(id);
    if (it == identities_.end()) {
        return ServiceResult<bool>::ok(false);
    }
    auto& identity = it->second;
    if (!identity.lockedUntil || *identity.lockedUntil > now) {
        return ServiceResult<bool>::ok(false);
    }
    identity.failedAttempts = 0;
    identity.lockedUntil.reset();
    return ServiceResult<bool>::ok(true);
}

ServiceResult<void> InMemoryIdentityRepository::reset(IdentityId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identities_.find(id);
    if (it == identities_.end()) {
        return ServiceResult<void>::err(unknownIdentity(id));
    }
    it->second.failedAttempts = 0;
    it->second.lockedUntil.reset();
    return ServiceResult<void>::ok();
}

}  // namespace oas::service
