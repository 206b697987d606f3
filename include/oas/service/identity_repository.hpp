#pragma once

/// @file identity_repository.hpp
/// @brief Identity persistence interface and in-memory implementation.
///
/// The core reads identities by id and by email. Status changes and
/// deletion belong to collaborators (registration, administration).

#include "oas/foundation/service_result.hpp"
#include "oas/service/auth_types.hpp"
#include "oas/service/lockout_store.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace oas::service {

/// Abstract interface for identity persistence.
///
/// Reads return tombstoned identities too; callers in the core pass every
/// result through liveIdentity(). Implementations must be thread-safe.
class IIdentityRepository {
public:
    virtual ~IIdentityRepository() = default;

    [[nodiscard]] virtual std::optional<Identity> findById(foundation::IdentityId id) const = 0;

    /// Find by login email (case-insensitive).
    [[nodiscard]] virtual std::optional<Identity> findByEmail(std::string_view email) const = 0;

    /// Create an identity, returning the assigned id.
    /// Fails with AlreadyExists when the email is taken.
    [[nodiscard]] virtual foundation::ServiceResult<foundation::IdentityId> create(
        Identity identity) = 0;

    /// Update profile fields (email, display name, secret hash, status,
    /// roles). Lockout fields are owned by ILockoutStore and left untouched.
    /// Returns false if the identity does not exist.
    virtual bool update(const Identity& identity) = 0;

    /// Tombstone an identity. Returns false if it does not exist.
    virtual bool markDeleted(foundation::IdentityId id, TimePoint at) = 0;
};

/// Thread-safe in-memory identity repository for tests and development.
///
/// Also serves as the lockout store so that Identity::failedAttempts and
/// Identity::lockedUntil reflect the tracker's view.
class InMemoryIdentityRepository : public IIdentityRepository, public ILockoutStore {
public:
    // IIdentityRepository
    [[nodiscard]] std::optional<Identity> findById(foundation::IdentityId id) const override;

    [[nodiscard]] std::optional<Identity> findByEmail(std::string_view email) const override;

    [[nodiscard]] foundation::ServiceResult<foundation::IdentityId> create(
        Identity identity) override;

    bool update(const Identity& identity) override;

    bool markDeleted(foundation::IdentityId id, TimePoint at) override;

    // ILockoutStore
    [[nodiscard]] foundation::ServiceResult<LockoutState> state(
        foundation::IdentityId id) override;

    [[nodiscard]] foundation::ServiceResult<FailureOutcome> incrementFailures(
        foundation::IdentityId id, uint32_t threshold, TimePoint now,
        std::chrono::seconds lockDuration) override;

    [[nodiscard]] foundation::ServiceResult<bool> resetIfUnlocked(
        foundation::IdentityId id, TimePoint now) override;

    [[nodiscard]] foundation::ServiceResult<bool> clearExpiredLock(
        foundation::IdentityId id, TimePoint now) override;

    [[nodiscard]] foundation::ServiceResult<void> reset(foundation::IdentityId id) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<foundation::IdentityId, Identity> identities_;
    uint64_t nextId_ = 1;
};

}  // namespace oas::service
