#pragma once

/// @file token_store.hpp
/// @brief Token record persistence interface and in-memory implementation.
///
/// Abstracts the shared TTL store so that validation, refresh and
/// revocation work against any backend (in-memory, Redis).

#include "oas/foundation/service_result.hpp"
#include "oas/service/auth_types.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace oas::service {

/// One batch of a resumable walk over records that have no lookup hash.
struct UnindexedPage {
    /// Live unindexed records among the members examined.
    std::vector<TokenRecord> records;

    /// Resume position for the next batch; empty once the walk is done.
    std::string nextCursor;
};

/// Abstract interface for token record persistence.
///
/// Expired records are non-existent for every reader, whether or not they
/// have been purged. Infrastructure failures are reported as store errors
/// (StoreUnavailable, StoreTimeout) and never as an absent record.
/// Implementations must be thread-safe.
class ITokenStore {
public:
    virtual ~ITokenStore() = default;

    /// Insert a new record with TTL up to its expiresAt.
    /// Fails with AlreadyExists on key or lookup-hash collision.
    [[nodiscard]] virtual foundation::ServiceResult<void> insert(const TokenRecord& record) = 0;

    /// Point lookup through the lookup-hash index.
    [[nodiscard]] virtual foundation::ServiceResult<std::optional<TokenRecord>> findByLookupHash(
        std::string_view lookupHash, TimePoint now) = 0;

    [[nodiscard]] virtual foundation::ServiceResult<std::optional<TokenRecord>> findByKey(
        std::string_view key, TimePoint now) = 0;

    /// Live records of an owner.
    [[nodiscard]] virtual foundation::ServiceResult<std::vector<TokenRecord>> findByOwner(
        std::string_view ownerRef, TimePoint now) = 0;

    /// Walk the records not reachable through the lookup-hash index in key
    /// order, starting after @p cursor (empty for the first batch).
    ///
    /// Each batch examines at most @p limit members of the unindexed set;
    /// expired or stale members count toward the limit but are not returned.
    /// nextCursor is set only when the batch used its whole limit. Backfill
    /// removes members, so a walk over a shrinking set still terminates.
    [[nodiscard]] virtual foundation::ServiceResult<UnindexedPage> listUnindexed(
        TimePoint now, std::string_view cursor, std::size_t limit) = 0;

    /// Atomically confirm a record is live and touch it.
    ///
    /// Sets lastUsed to @p now and, for sliding kinds, moves expiresAt to
    /// @p newExpiry. Api-key records keep their absolute expiry. Returns the
    /// updated record, or nullopt if it was deleted or expired before the
    /// call committed.
    [[nodiscard]] virtual foundation::ServiceResult<std::optional<TokenRecord>> getAndRefresh(
        std::string_view key, TimePoint now, TimePoint newExpiry) = 0;

    /// Add the lookup hash to a record that lacks one. Leaves every other
    /// field, including expiresAt, untouched. Returns false if the record is
    /// gone or already indexed.
    [[nodiscard]] virtual foundation::ServiceResult<bool> attachLookupHash(
        std::string_view key, std::string_view lookupHash, TimePoint now) = 0;

    /// Delete one record. Returns true if it existed.
    [[nodiscard]] virtual foundation::ServiceResult<bool> remove(std::string_view key) = 0;

    /// Delete every record of an owner, returning how many were live.
    [[nodiscard]] virtual foundation::ServiceResult<std::size_t> removeAllForOwner(
        std::string_view ownerRef, TimePoint now) = 0;

    /// Physically drop expired records, returning how many were dropped.
    [[nodiscard]] virtual foundation::ServiceResult<std::size_t> purgeExpired(TimePoint now) = 0;

    /// Number of live records of an owner.
    [[nodiscard]] virtual foundation::ServiceResult<std::size_t> countLive(
        std::string_view ownerRef, TimePoint now) = 0;
};

/// Thread-safe in-memory token store for tests and development.
///
/// One mutex serializes every operation, which makes each of them atomic
/// with respect to the others.
class InMemoryTokenStore : public ITokenStore {
public:
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

    [[nodiscard]] foundation::ServiceResult<std::size_t> purgeExpired(TimePoint now) override;

    [[nodiscard]] foundation::ServiceResult<std::size_t> countLive(
        std::string_view ownerRef, TimePoint now) override;

    /// Total records held, expired ones included.
    [[nodiscard]] std::size_t size() const;

private:
    void eraseLocked(std::unordered_map<std::string, TokenRecord>::iterator it);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TokenRecord> records_;
    std::unordered_map<std::string, std::string> lookupIndex_;
    std::unordered_map<std::string, std::set<std::string>> ownerIndex_;
    std::set<std::string, std::less<>> unindexed_;
};

}  // namespace oas::service
