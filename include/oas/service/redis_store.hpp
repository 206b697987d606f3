#pragma once

/// @file redis_store.hpp
/// @brief Redis-backed token and lockout stores (redis-plus-plus).
///
/// Key layout under the configured prefix P:
///   P:token:<key>       hash   one token record, PEXPIREAT expires_at
///   P:lookup:<hash>     string lookup hash -> record key, same expiry
///   P:owner:<owner>     set    record keys of an owner
///   P:unindexed         zset   keys of records without a lookup hash, all
///                              scored 0 so they page in lexical order
///   P:lockout:<id>      hash   failures, locked_until
/// Operations that read and write together run as Lua scripts so that each
/// is a single atomic server-side step.

#include "oas/foundation/service_result.hpp"
#include "oas/service/auth_config.hpp"
#include "oas/service/lockout_store.hpp"
#include "oas/service/token_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sw::redis {
class Redis;
}

namespace oas::service {

/// Open a pooled connection with connect and socket timeouts from
/// @p config. Fails with StoreUnavailable for an unusable URI.
[[nodiscard]] foundation::ServiceResult<std::shared_ptr<sw::redis::Redis>> connectRedis(
    const StoreConfig& config);

class RedisTokenStore : public ITokenStore {
public:
    RedisTokenStore(std::shared_ptr<sw::redis::Redis> redis, std::string keyPrefix);

    [[nodiscard]] foundation::ServiceResult<void> insert(const TokenRecord& record) override;

    [[nodiscard]] foundation::ServiceResult<std::optional<TokenRecord>> findByLookupHash(
        std::string_view lookupHash, TimePoint now) override;

    [[nodiscard]] foundation::ServiceResult<std::optional<TokenRecord>> findByKey(
        std::string_view key, TimePoint now) override;

    [[nodiscard]] foundation::ServiceResult<std::vector<TokenRecord>> findByOwner(
        std::string_view ownerRef, TimePoint now) override;

    [[nodiscard]] foundation::ServiceResult<UnindexedPage> listUnindexed(
        TimePoint now, std::string_view cursor, std::size_t limit) override;

    [[nodiscard]] foundation::ServiceResult<std::optional<TokenRecord>> getAndRefresh(
        std::string_view key, TimePoint now, TimePoint newExpiry) override;

    [[nodiscard]] foundation::ServiceResult<bool> attachLookupHash(
        std::string_view key, std::string_view lookupHash, TimePoint now) override;

    [[nodiscard]] foundation::ServiceResult<bool> remove(std::string_view key) override;

    [[nodiscard]] foundation::ServiceResult<std::size_t> removeAllForOwner(
        std::string_view ownerRef, TimePoint now) override;

    /// Redis evicts expired records itself; this drops dangling index
    /// entries and reports how many were removed.
    [[nodiscard]] foundation::ServiceResult<std::size_t> purgeExpired(TimePoint now) override;

    [[nodiscard]] foundation::ServiceResult<std::size_t> countLive(
        std::string_view ownerRef, TimePoint now) override;

private:
    [[nodiscard]] std::string tokenKey(std::string_view key) const;
    [[nodiscard]] std::string lookupKey(std::string_view lookupHash) const;
    [[nodiscard]] std::string ownerKey(std::string_view ownerRef) const;
    [[nodiscard]] std::string unindexedKey() const;

    /// Delete a record and its index entries.
    void evict(std::string_view key);

    /// Decode @p fields of record @p key. Undecodable records are evicted;
    /// expired ones read as absent.
    [[nodiscard]] std::optional<TokenRecord> liveRecord(
        std::string_view key, const std::unordered_map<std::string, std::string>& fields,
        TimePoint now);

    std::shared_ptr<sw::redis::Redis> redis_;
    std::string prefix_;
};

class RedisLockoutStore : public ILockoutStore {
public:
    RedisLockoutStore(std::shared_ptr<sw::redis::Redis> redis, std::string keyPrefix);

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
    [[nodiscard]] std::string lockoutKey(foundation::IdentityId id) const;

    std::shared_ptr<sw::redis::Redis> redis_;
    std::string prefix_;
};

}  // namespace oas::service
