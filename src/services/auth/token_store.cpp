/// @file token_store.cpp
/// @brief InMemoryTokenStore implementation.

#include "oas/service/token_store.hpp"

#include <iterator>

namespace oas::service {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

using OptionalRecord = std::optional<TokenRecord>;

void InMemoryTokenStore::eraseLocked(std::unordered_map<std::string, TokenRecord>::iterator it) {
    const auto& record = it->second;
    if (!record.lookupHash.empty()) {
        auto idx = lookupIndex_.find(record.lookupHash);
        if (idx != lookupIndex_.end() && idx->second == it->first) {
            lookupIndex_.erase(idx);
        }
    }
    unindexed_.erase(it->first);
    auto owner = ownerIndex_.find(record.ownerRef);
    if (owner != ownerIndex_.end()) {
        owner->second.erase(it->first);
        if (owner->second.empty()) {
            ownerIndex_.erase(owner);
        }
    }
    records_.erase(it);
}

ServiceResult<void> InMemoryTokenStore::insert(const TokenRecord& record) {
    if (record.key.empty()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "token record without key"));
    }
    if (record.expiresAt <= record.issuedAt) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidExpiry, "token record expires before it is issued"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(record.key) > 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "token record key already present"));
    }
    if (!record.lookupHash.empty() && lookupIndex_.count(record.lookupHash) > 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyExists, "lookup hash already indexed"));
    }

    if (record.lookupHash.empty()) {
        unindexed_.insert(record.key);
    } else {
        lookupIndex_.emplace(record.lookupHash, record.key);
    }
    ownerIndex_[record.ownerRef].insert(record.key);
    records_.emplace(record.key, record);
    return ServiceResult<void>::ok();
}

ServiceResult<OptionalRecord> InMemoryTokenStore::findByLookupHash(std::string_view lookupHash,
                                                                  TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = lookupIndex_.find(std::string(lookupHash));
    if (idx == lookupIndex_.end()) {
        return ServiceResult<OptionalRecord>::ok(std::nullopt);
    }
    auto it = records_.find(idx->second);
    if (it == records_.end() || !it->second.isLive(now)) {
        return ServiceResult<OptionalRecord>::ok(std::nullopt);
    }
    return ServiceResult<OptionalRecord>::ok(it->second);
}

ServiceResult<OptionalRecord> InMemoryTokenStore::findByKey(std::string_view key, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(std::string(key));
    if (it == records_.end() || !it->second.isLive(now)) {
        return ServiceResult<OptionalRecord>::ok(std::nullopt);
    }
    return ServiceResult<OptionalRecord>::ok(it->second);
}

ServiceResult<std::vector<TokenRecord>> InMemoryTokenStore::findByOwner(std::string_view ownerRef,
                                                                        TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TokenRecord> out;
    auto owner = ownerIndex_.find(std::string(ownerRef));
    if (owner == ownerIndex_.end()) {
        return ServiceResult<std::vector<TokenRecord>>::ok(std::move(out));
    }
    for (const auto& key : owner->second) {
        auto it = records_.find(key);
        if (it != records_.end() && it->second.isLive(now)) {
            out.push_back(it->second);
        }
    }
    return ServiceResult<std::vector<TokenRecord>>::ok(std::move(out));
}

ServiceResult<UnindexedPage> InMemoryTokenStore::listUnindexed(TimePoint now,
                                                               std::string_view cursor,
                                                               std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    UnindexedPage page;
    auto member = cursor.empty() ? unindexed_.begin() : unindexed_.upper_bound(cursor);
    std::size_t examined = 0;
    for (; member != unindexed_.end() && examined < limit; ++member, ++examined) {
        auto it = records_.find(*member);
        if (it != records_.end() && it->second.isLive(now)) {
            page.records.push_back(it->second);
        }
        page.nextCursor = *member;
    }
    if (examined < limit) {
        page.nextCursor.clear();
    }
    return ServiceResult<UnindexedPage>::ok(std::move(page));
}

ServiceResult<OptionalRecord> InMemoryTokenStore::getAndRefresh(std::string_view key,
                                                               TimePoint now,
                                                               TimePoint newExpiry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(std::string(key));
    if (it == records_.end() || !it->second.isLive(now)) {
        return ServiceResult<OptionalRecord>::ok(std::nullopt);
    }
    auto& record = it->second;
    record.lastUsed = now;
    if (record.slides() && newExpiry > record.issuedAt) {
        record.expiresAt = newExpiry;
    }
    return ServiceResult<OptionalRecord>::ok(record);
}

ServiceResult<bool> InMemoryTokenStore::attachLookupHash(std::string_view key,
                                                         std::string_view lookupHash,
                                                         TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(std::string(key));
    if (it == records_.end() || !it->second.isLive(now) || !it->second.lookupHash.empty()) {
        return ServiceResult<bool>::ok(false);
    }
    auto [idx, inserted] = lookupIndex_.emplace(std::string(lookupHash), it->first);
    if (!inserted) {
        return ServiceResult<bool>::ok(false);
    }
    it->second.lookupHash = std::string(lookupHash);
    unindexed_.erase(it->first);
    return ServiceResult<bool>::ok(true);
}

ServiceResult<bool> InMemoryTokenStore::remove(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(std::string(key));
    if (it == records_.end()) {
        return ServiceResult<bool>::ok(false);
    }
    eraseLocked(it);
    return ServiceResult<bool>::ok(true);
}

ServiceResult<std::size_t> InMemoryTokenStore::removeAllForOwner(std::string_view ownerRef,
                                                                 TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto owner = ownerIndex_.find(std::string(ownerRef));
    if (owner == ownerIndex_.end()) {
        return ServiceResult<std::size_t>::ok(0);
    }
    // Copy: eraseLocked() mutates the owner index.
    auto keys = owner->second;
    std::size_t removed = 0;
    for (const auto& key : keys) {
        auto it = records_.find(key);
        if (it == records_.end()) {
            continue;
        }
        if (it->second.isLive(now)) {
            ++removed;
        }
        eraseLocked(it);
    }
    return ServiceResult<std::size_t>::ok(removed);
}

ServiceResult<std::size_t> InMemoryTokenStore::purgeExpired(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t purged = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (!it->second.isLive(now)) {
            auto next = std::next(it);
            eraseLocked(it);
            it = next;
            ++purged;
        } else {
            ++it;
        }
    }
    return ServiceResult<std::size_t>::ok(purged);
}

ServiceResult<std::size_t> InMemoryTokenStore::countLive(std::string_view ownerRef,
                                                         TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    auto owner = ownerIndex_.find(std::string(ownerRef));
    if (owner != ownerIndex_.end()) {
        for (const auto& key : owner->second) {
            auto it = records_.find(key);
            if (it != records_.end() && it->second.isLive(now)) {
                ++count;
            }
        }
    }
    return ServiceResult<std::size_t>::ok(count);
}

std::size_t InMemoryTokenStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace oas::service
