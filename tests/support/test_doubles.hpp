#pragma once

/// @file test_doubles.hpp
/// @brief Store and sink doubles shared by the service tests.

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "oas/foundation/service_result.hpp"
#include "oas/service/auth_events.hpp"
#include "oas/service/credential_verifier.hpp"
#include "oas/service/identity_repository.hpp"
#include "oas/service/lockout_store.hpp"
#include "oas/service/token_store.hpp"

namespace oas::testing {

using foundation::ErrorCode;
using foundation::IdentityId;
using foundation::ServiceError;
using foundation::ServiceResult;
using service::FailureOutcome;
using service::LockoutState;
using service::TimePoint;
using service::TokenRecord;

/// Token store that delegates to an InMemoryTokenStore until told to fail,
/// then answers every call with a store error.
class FailingTokenStore : public service::ITokenStore {
public:
    explicit FailingTokenStore(ErrorCode code = ErrorCode::StoreUnavailable) : code_(code) {}

    void setFailing(bool failing) { failing_.store(failing); }

    service::InMemoryTokenStore& inner() { return inner_; }

    ServiceResult<void> insert(const TokenRecord& record) override {
        if (failing_) return ServiceResult<void>::err(error());
        return inner_.insert(record);
    }

    ServiceResult<std::optional<TokenRecord>> findByLookupHash(std::string_view lookupHash,
                                                               TimePoint now) override {
        if (failing_) return ServiceResult<std::optional<TokenRecord>>::err(error());
        return inner_.findByLookupHash(lookupHash, now);
    }

    ServiceResult<std::optional<TokenRecord>> findByKey(std::string_view key,
                                                        TimePoint now) override {
        if (failing_) return ServiceResult<std::optional<TokenRecord>>::err(error());
        return inner_.findByKey(key, now);
    }

    ServiceResult<std::vector<TokenRecord>> findByOwner(std::string_view ownerRef,
                                                        TimePoint now) override {
        if (failing_) return ServiceResult<std::vector<TokenRecord>>::err(error());
        return inner_.findByOwner(ownerRef, now);
    }

    ServiceResult<service::UnindexedPage> listUnindexed(TimePoint now,
                                                        std::string_view cursor,
                                                        std::size_t limit) override {
        if (failing_) return ServiceResult<service::UnindexedPage>::err(error());
        return inner_.listUnindexed(now, cursor, limit);
    }

    ServiceResult<std::optional<TokenRecord>> getAndRefresh(std::string_view key,
                                                            TimePoint now,
                                                            TimePoint newExpiry) override {
        if (failing_) return ServiceResult<std::optional<TokenRecord>>::err(error());
        return inner_.getAndRefresh(key, now, newExpiry);
    }

    ServiceResult<bool> attachLookupHash(std::string_view key,
                                         std::string_view lookupHash,
                                         TimePoint now) override {
        if (failing_) return ServiceResult<bool>::err(error());
        return inner_.attachLookupHash(key, lookupHash, now);
    }

    ServiceResult<bool> remove(std::string_view key) override {
        if (failing_) return ServiceResult<bool>::err(error());
        return inner_.remove(key);
    }

    ServiceResult<std::size_t> removeAllForOwner(std::string_view ownerRef,
                                                 TimePoint now) override {
        if (failing_) return ServiceResult<std::size_t>::err(error());
        return inner_.removeAllForOwner(ownerRef, now);
    }

    ServiceResult<std::size_t> purgeExpired(TimePoint now) override {
        if (failing_) return ServiceResult<std::size_t>::err(error());
        return inner_.purgeExpired(now);
    }

    ServiceResult<std::size_t> countLive(std::string_view ownerRef, TimePoint now) override {
        if (failing_) return ServiceResult<std::size_t>::err(error());
        return inner_.countLive(ownerRef, now);
    }

private:
    ServiceError error() const { return ServiceError(code_, "store offline"); }

    ErrorCode code_;
    std::atomic<bool> failing_{false};
    service::InMemoryTokenStore inner_;
};

/// Lockout store wrapper with the same switch.
class FailingLockoutStore : public service::ILockoutStore {
public:
    explicit FailingLockoutStore(std::shared_ptr<service::ILockoutStore> inner)
        : inner_(std::move(inner)) {}

    void setFailing(bool failing) { failing_.store(failing); }

    ServiceResult<LockoutState> state(IdentityId id) override {
        if (failing_) return ServiceResult<LockoutState>::err(error());
        return inner_->state(id);
    }

    ServiceResult<FailureOutcome> incrementFailures(IdentityId id, uint32_t threshold,
                                                    TimePoint now,
                                                    std::chrono::seconds lockDuration) override {
        if (failing_) return ServiceResult<FailureOutcome>::err(error());
        return inner_->incrementFailures(id, threshold, now, lockDuration);
    }

    ServiceResult<bool> resetIfUnlocked(IdentityId id, TimePoint now) override {
        if (failing_) return ServiceResult<bool>::err(error());
        return inner_->resetIfUnlocked(id, now);
    }

    ServiceResult<bool> clearExpiredLock(IdentityId id, TimePoint now) override {
        if (failing_) return ServiceResult<bool>::err(error());
        return inner_->clearExpiredLock(id, now);
    }

    ServiceResult<void> reset(IdentityId id) override {
        if (failing_) return ServiceResult<void>::err(error());
        return inner_->reset(id);
    }

private:
    static ServiceError error() { return ServiceError(ErrorCode::StoreTimeout, "store timed out"); }

    std::shared_ptr<service::ILockoutStore> inner_;
    std::atomic<bool> failing_{false};
};

/// Captures every published event.
class RecordingEventSink : public service::IAuthEventSink {
public:
    void publish(const service::AuthEvent& event) override {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
    }

    std::vector<service::AuthEvent> events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    std::size_t count(service::AuthEventType type) const {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : events_) {
            if (e.type == type) {
                ++n;
            }
        }
        return n;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<service::AuthEvent> events_;
};

/// Register an identity whose secret is hashed with @p verifier.
inline IdentityId addIdentity(service::InMemoryIdentityRepository& repo,
                              const service::CredentialVerifier& verifier,
                              const std::string& email,
                              const std::string& secret,
                              service::IdentityStatus status = service::IdentityStatus::Active,
                              std::vector<std::string> roles = {}) {
    service::Identity identity;
    identity.email = email;
    identity.displayName = email.substr(0, email.find('@'));
    identity.secretHash = verifier.hash(secret).value();
    identity.status = status;
    identity.roles = std::move(roles);
    return repo.create(std::move(identity)).value();
}

}  // namespace oas::testing
