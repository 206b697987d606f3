/// @file redis_store.cpp
/// @brief RedisTokenStore and RedisLockoutStore using redis-plus-plus.

#include "oas/service/redis_store.hpp"

#include "oas/foundation/service_logger.hpp"

#include <sw/redis++/redis++.h>

#include <charconv>
#include <chrono>
#include <iterator>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace oas::service {

using foundation::ErrorCode;
using foundation::IdentityId;
using foundation::LogCategory;
using foundation::LogLevel;
using foundation::ServiceError;
using foundation::ServiceResult;

using OptionalRecord = std::optional<TokenRecord>;
using FieldMap = std::unordered_map<std::string, std::string>;

namespace {

// -- Lua scripts --------------------------------------------------------------

// KEYS: token, lookup, owner, unindexed
// ARGV: key, lookup_hash, expires_at_ms, field, value, ...
constexpr const char* kInsertScript = R"lua(
if redis.call('EXISTS', KEYS[1]) == 1 then return 0 end
if ARGV[2] ~= '' and redis.call('EXISTS', KEYS[2]) == 1 then return -1 end
redis.call('HSET', KEYS[1], unpack(ARGV, 4))
redis.call('PEXPIREAT', KEYS[1], ARGV[3])
if ARGV[2] ~= '' then
  redis.call('SET', KEYS[2], ARGV[1])
  redis.call('PEXPIREAT', KEYS[2], ARGV[3])
else
  redis.call('ZADD', KEYS[4], 0, ARGV[1])
end
redis.call('SADD', KEYS[3], ARGV[1])
return 1
)lua";

// KEYS: lookup
// ARGV: token_prefix, now_ms
// Reply: record key followed by the record's field/value pairs.
constexpr const char* kFindByLookupScript = R"lua(
local key = redis.call('GET', KEYS[1])
if not key then return {} end
local tk = ARGV[1] .. key
local exp = tonumber(redis.call('HGET', tk, 'expires_at'))
if exp and exp <= tonumber(ARGV[2]) then return {} end
local r = redis.call('HGETALL', tk)
if #r == 0 then return {} end
table.insert(r, 1, key)
return r
)lua";

// KEYS: token
// ARGV: now_ms, new_expiry_ms, lookup_prefix
constexpr const char* kGetAndRefreshScript = R"lua(
local exp = tonumber(redis.call('HGET', KEYS[1], 'expires_at'))
if not exp then return redis.call('HGETALL', KEYS[1]) end
if exp <= tonumber(ARGV[1]) then return {} end
redis.call('HSET', KEYS[1], 'last_used', ARGV[1])
if redis.call('HGET', KEYS[1], 'kind') ~= 'api-key' then
  redis.call('HSET', KEYS[1], 'expires_at', ARGV[2])
  redis.call('PEXPIREAT', KEYS[1], ARGV[2])
  local lh = redis.call('HGET', KEYS[1], 'lookup_hash')
  if lh and lh ~= '' then redis.call('PEXPIREAT', ARGV[3] .. lh, ARGV[2]) end
end
return redis.call('HGETALL', KEYS[1])
)lua";

// KEYS: token, lookup, unindexed
// ARGV: key, lookup_hash, now_ms
constexpr const char* kAttachLookupScript = R"lua(
local exp = redis.call('HGET', KEYS[1], 'expires_at')
if not exp or tonumber(exp) <= tonumber(ARGV[3]) then return 0 end
local cur = redis.call('HGET', KEYS[1], 'lookup_hash')
if cur and cur ~= '' then return 0 end
if not redis.call('SET', KEYS[2], ARGV[1], 'NX') then return 0 end
redis.call('PEXPIREAT', KEYS[2], exp)
redis.call('HSET', KEYS[1], 'lookup_hash', ARGV[2])
redis.call('ZREM', KEYS[3], ARGV[1])
return 1
)lua";

// KEYS: token
// ARGV: lookup_prefix, owner_prefix, unindexed_key, key
constexpr const char* kRemoveScript = R"lua(
local f = redis.call('HMGET', KEYS[1], 'lookup_hash', 'owner')
if redis.call('DEL', KEYS[1]) == 0 then return 0 end
if f[1] and f[1] ~= '' then
  local lk = ARGV[1] .. f[1]
  if redis.call('GET', lk) == ARGV[4] then redis.call('DEL', lk) end
end
if f[2] then redis.call('SREM', ARGV[2] .. f[2], ARGV[4]) end
redis.call('ZREM', ARGV[3], ARGV[4])
return 1
)lua";

// KEYS: owner
// ARGV: token_prefix, lookup_prefix, unindexed_key, now_ms
constexpr const char* kRemoveAllScript = R"lua(
local keys = redis.call('SMEMBERS', KEYS[1])
local live = 0
for _, k in ipairs(keys) do
  local tk = ARGV[1] .. k
  local f = redis.call('HMGET', tk, 'lookup_hash', 'expires_at')
  local exp = tonumber(f[2])
  if exp and exp > tonumber(ARGV[4]) then live = live + 1 end
  if f[1] and f[1] ~= '' then
    local lk = ARGV[2] .. f[1]
    if redis.call('GET', lk) == k then redis.call('DEL', lk) end
  end
  redis.call('DEL', tk)
  redis.call('ZREM', ARGV[3], k)
end
redis.call('DEL', KEYS[1])
return live
)lua";

// KEYS: lockout
// ARGV: threshold, now_ms, lock_until_ms
constexpr const char* kIncrementFailuresScript = R"lua(
local lu = redis.call('HGET', KEYS[1], 'locked_until')
if lu and tonumber(lu) > tonumber(ARGV[2]) then
  return {redis.call('HGET', KEYS[1], 'failures') or '0', '0', lu}
end
local n = redis.call('HINCRBY', KEYS[1], 'failures', 1)
if n >= tonumber(ARGV[1]) then
  redis.call('HSET', KEYS[1], 'locked_until', ARGV[3])
  return {tostring(n), '1', ARGV[3]}
end
return {tostring(n), '0', lu or ''}
)lua";

// KEYS: lockout
// ARGV: now_ms
constexpr const char* kResetIfUnlockedScript = R"lua(
local lu = redis.call('HGET', KEYS[1], 'locked_until')
if lu and tonumber(lu) > tonumber(ARGV[1]) then return 0 end
redis.call('DEL', KEYS[1])
return 1
)lua";

// KEYS: lockout
// ARGV: now_ms
constexpr const char* kClearExpiredLockScript = R"lua(
local lu = redis.call('HGET', KEYS[1], 'locked_until')
if not lu or tonumber(lu) > tonumber(ARGV[1]) then return 0 end
redis.call('DEL', KEYS[1])
return 1
)lua";

// -- Encoding -----------------------------------------------------------------

int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

std::optional<int64_t> parseInt(std::string_view text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string> encodeFields(const TokenRecord& record) {
    std::vector<std::string> out = {
        "key",         record.key,
        "token_hash",  record.tokenHash,
        "lookup_hash", record.lookupHash,
        "salt",        record.salt,
        "owner",       record.ownerRef,
        "issued_at",   std::to_string(toMillis(record.issuedAt)),
        "expires_at",  std::to_string(toMillis(record.expiresAt)),
        "last_used",   std::to_string(toMillis(record.lastUsed)),
        "kind",        std::string(tokenKindName(record.kind)),
        "source_ip",   record.sourceIp,
        "user_agent",  record.userAgent,
    };
    if (record.provider) {
        out.emplace_back("provider");
        out.push_back(*record.provider);
    }
    if (record.apiKeyName) {
        out.emplace_back("api_key_name");
        out.push_back(*record.apiKeyName);
    }
    return out;
}

FieldMap pairsToMap(const std::vector<std::string>& flat, std::size_t offset = 0) {
    FieldMap fields;
    for (std::size_t i = offset; i + 1 < flat.size(); i += 2) {
        fields.emplace(flat[i], flat[i + 1]);
    }
    return fields;
}

/// Decode a stored hash. Returns nullopt for missing or unparsable required
/// fields; the owner reference is carried verbatim and checked by callers.
OptionalRecord decodeFields(const FieldMap& fields) {
    auto field = [&](const char* name) -> std::optional<std::string> {
        auto it = fields.find(name);
        if (it == fields.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    auto key = field("key");
    auto tokenHash = field("token_hash");
    auto salt = field("salt");
    auto owner = field("owner");
    auto issued = field("issued_at");
    auto expires = field("expires_at");
    if (!key || !tokenHash || !salt || !owner || !issued || !expires) {
        return std::nullopt;
    }
    auto issuedMs = parseInt(*issued);
    auto expiresMs = parseInt(*expires);
    if (!issuedMs || !expiresMs) {
        return std::nullopt;
    }

    TokenRecord record;
    record.key = std::move(*key);
    record.tokenHash = std::move(*tokenHash);
    record.lookupHash = field("lookup_hash").value_or("");
    record.salt = std::move(*salt);
    record.ownerRef = std::move(*owner);
    record.issuedAt = fromMillis(*issuedMs);
    record.expiresAt = fromMillis(*expiresMs);
    auto lastUsedMs = parseInt(field("last_used").value_or(""));
    record.lastUsed = lastUsedMs ? fromMillis(*lastUsedMs) : record.issuedAt;
    record.kind = parseTokenKind(field("kind").value_or("session")).value_or(TokenKind::Session);
    record.sourceIp = field("source_ip").value_or("");
    record.userAgent = field("user_agent").value_or("");
    record.provider = field("provider");
    record.apiKeyName = field("api_key_name");
    return record;
}

/// Run @p fn, converting redis-plus-plus exceptions into store errors.
template <typename T, typename Fn>
ServiceResult<T> guarded(std::string_view operation, Fn&& fn) {
    try {
        return fn();
    } catch (const sw::redis::TimeoutError& e) {
        OAS_LOG_ERROR(LogCategory::Store, std::string(operation) + " timed out: " + e.what());
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::StoreTimeout, std::string(operation) + " timed out"));
    } catch (const sw::redis::Error& e) {
        OAS_LOG_ERROR(LogCategory::Store, std::string(operation) + " failed: " + e.what());
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::StoreUnavailable, std::string(operation) + " failed"));
    }
}

}  // namespace

// -- Connection ---------------------------------------------------------------

ServiceResult<std::shared_ptr<sw::redis::Redis>> connectRedis(const StoreConfig& config) {
    using Result = ServiceResult<std::shared_ptr<sw::redis::Redis>>;
    return guarded<std::shared_ptr<sw::redis::Redis>>("redis connect", [&]() -> Result {
        sw::redis::ConnectionOptions options(config.redisUri);
        options.connect_timeout = config.timeout;
        options.socket_timeout = config.timeout;

        sw::redis::ConnectionPoolOptions pool;
        pool.size = 8;
        pool.wait_timeout = config.timeout;

        auto redis = std::make_shared<sw::redis::Redis>(options, pool);
        redis->ping();
        return Result::ok(std::move(redis));
    });
}

// -- RedisTokenStore ----------------------------------------------------------

RedisTokenStore::RedisTokenStore(std::shared_ptr<sw::redis::Redis> redis, std::string keyPrefix)
    : redis_(std::move(redis)), prefix_(std::move(keyPrefix)) {}

std::string RedisTokenStore::tokenKey(std::string_view key) const {
    return prefix_ + ":token:" + std::string(key);
}

std::string RedisTokenStore::lookupKey(std::string_view lookupHash) const {
    return prefix_ + ":lookup:" + std::string(lookupHash);
}

std::string RedisTokenStore::ownerKey(std::string_view ownerRef) const {
    return prefix_ + ":owner:" + std::string(ownerRef);
}

std::string RedisTokenStore::unindexedKey() const {
    return prefix_ + ":unindexed";
}

void RedisTokenStore::evict(std::string_view key) {
    std::vector<std::string> keys = {tokenKey(key)};
    std::vector<std::string> args = {prefix_ + ":lookup:", prefix_ + ":owner:", unindexedKey(),
                                     std::string(key)};
    redis_->eval<long long>(kRemoveScript, keys.begin(), keys.end(), args.begin(), args.end());
}

OptionalRecord RedisTokenStore::liveRecord(std::string_view key, const FieldMap& fields,
                                           TimePoint now) {
    if (fields.empty()) {
        return std::nullopt;
    }
    auto record = decodeFields(fields);
    if (!record) {
        OAS_LOG_WARN(LogCategory::Store, "evicting undecodable token record");
        evict(key);
        return std::nullopt;
    }
    if (!record->isLive(now)) {
        return std::nullopt;
    }
    return record;
}

ServiceResult<void> RedisTokenStore::insert(const TokenRecord& record) {
    if (record.key.empty()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidArgument, "token record without key"));
    }
    if (record.expiresAt <= record.issuedAt) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidExpiry, "token record expires before it is issued"));
    }

    return guarded<void>("token insert", [&]() {
        std::vector<std::string> keys = {tokenKey(record.key), lookupKey(record.lookupHash),
                                         ownerKey(record.ownerRef), unindexedKey()};
        std::vector<std::string> args = {record.key, record.lookupHash,
                                         std::to_string(toMillis(record.expiresAt))};
        auto fields = encodeFields(record);
        args.insert(args.end(), fields.begin(), fields.end());

        auto rc = redis_->eval<long long>(kInsertScript, keys.begin(), keys.end(), args.begin(),
                                          args.end());
        if (rc == 0) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::AlreadyExists, "token record key already present"));
        }
        if (rc < 0) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::AlreadyExists, "lookup hash already indexed"));
        }
        return ServiceResult<void>::ok();
    });
}

ServiceResult<OptionalRecord> RedisTokenStore::findByLookupHash(std::string_view lookupHash,
                                                               TimePoint now) {
    return guarded<OptionalRecord>("token lookup", [&]() {
        std::vector<std::string> keys = {lookupKey(lookupHash)};
        std::vector<std::string> args = {prefix_ + ":token:", std::to_string(toMillis(now))};
        std::vector<std::string> flat;
        redis_->eval(kFindByLookupScript, keys.begin(), keys.end(), args.begin(), args.end(),
                     std::back_inserter(flat));
        if (flat.empty()) {
            return ServiceResult<OptionalRecord>::ok(std::nullopt);
        }
        return ServiceResult<OptionalRecord>::ok(liveRecord(flat.front(), pairsToMap(flat, 1), now));
    });
}

ServiceResult<OptionalRecord> RedisTokenStore::findByKey(std::string_view key, TimePoint now) {
    return guarded<OptionalRecord>("token read", [&]() {
        FieldMap fields;
        redis_->hgetall(tokenKey(key), std::inserter(fields, fields.end()));
        return ServiceResult<OptionalRecord>::ok(liveRecord(key, fields, now));
    });
}

ServiceResult<std::vector<TokenRecord>> RedisTokenStore::findByOwner(std::string_view ownerRef,
                                                                     TimePoint now) {
    return guarded<std::vector<TokenRecord>>("owner scan", [&]() {
        std::unordered_set<std::string> members;
        auto setKey = ownerKey(ownerRef);
        redis_->smembers(setKey, std::inserter(members, members.end()));

        std::vector<TokenRecord> out;
        for (const auto& member : members) {
            FieldMap fields;
            redis_->hgetall(tokenKey(member), std::inserter(fields, fields.end()));
            if (fields.empty()) {
                // Evicted by TTL; drop the dangling index entry.
                redis_->srem(setKey, member);
                continue;
            }
            if (auto record = liveRecord(member, fields, now)) {
                out.push_back(std::move(*record));
            }
        }
        return ServiceResult<std::vector<TokenRecord>>::ok(std::move(out));
    });
}

ServiceResult<UnindexedPage> RedisTokenStore::listUnindexed(TimePoint now,
                                                            std::string_view cursor,
                                                            std::size_t limit) {
    return guarded<UnindexedPage>("unindexed scan", [&]() {
        UnindexedPage page;
        if (limit == 0) {
            return ServiceResult<UnindexedPage>::ok(std::move(page));
        }
        auto setKey = unindexedKey();
        auto from = cursor.empty() ? std::string("-") : "(" + std::string(cursor);
        std::vector<std::string> members;
        redis_->command("ZRANGEBYLEX", setKey, from, "+", "LIMIT", "0",
                        std::to_string(limit), std::back_inserter(members));

        for (const auto& member : members) {
            FieldMap fields;
            redis_->hgetall(tokenKey(member), std::inserter(fields, fields.end()));
            if (fields.empty()) {
                redis_->zrem(setKey, member);
                continue;
            }
            auto record = liveRecord(member, fields, now);
            if (!record) {
                continue;
            }
            if (!record->lookupHash.empty()) {
                redis_->zrem(setKey, member);
                continue;
            }
            page.records.push_back(std::move(*record));
        }
        if (members.size() == limit) {
            page.nextCursor = members.back();
        }
        return ServiceResult<UnindexedPage>::ok(std::move(page));
    });
}

ServiceResult<OptionalRecord> RedisTokenStore::getAndRefresh(std::string_view key,
                                                            TimePoint now,
                                                            TimePoint newExpiry) {
    return guarded<OptionalRecord>("token refresh", [&]() {
        std::vector<std::string> keys = {tokenKey(key)};
        std::vector<std::string> args = {std::to_string(toMillis(now)),
                                         std::to_string(toMillis(newExpiry)),
                                         prefix_ + ":lookup:"};
        std::vector<std::string> flat;
        redis_->eval(kGetAndRefreshScript, keys.begin(), keys.end(), args.begin(), args.end(),
                     std::back_inserter(flat));
        return ServiceResult<OptionalRecord>::ok(liveRecord(key, pairsToMap(flat), now));
    });
}

ServiceResult<bool> RedisTokenStore::attachLookupHash(std::string_view key,
                                                      std::string_view lookupHash,
                                                      TimePoint now) {
    return guarded<bool>("lookup backfill", [&]() {
        std::vector<std::string> keys = {tokenKey(key), lookupKey(lookupHash), unindexedKey()};
        std::vector<std::string> args = {std::string(key), std::string(lookupHash),
                                         std::to_string(toMillis(now))};
        auto rc = redis_->eval<long long>(kAttachLookupScript, keys.begin(), keys.end(),
                                          args.begin(), args.end());
        return ServiceResult<bool>::ok(rc == 1);
    });
}

ServiceResult<bool> RedisTokenStore::remove(std::string_view key) {
    return guarded<bool>("token delete", [&]() {
        std::vector<std::string> keys = {tokenKey(key)};
        std::vector<std::string> args = {prefix_ + ":lookup:", prefix_ + ":owner:", unindexedKey(),
                                         std::string(key)};
        auto rc = redis_->eval<long long>(kRemoveScript, keys.begin(), keys.end(), args.begin(),
                                          args.end());
        return ServiceResult<bool>::ok(rc == 1);
    });
}

ServiceResult<std::size_t> RedisTokenStore::removeAllForOwner(std::string_view ownerRef,
                                                              TimePoint now) {
    return guarded<std::size_t>("owner delete", [&]() {
        std::vector<std::string> keys = {ownerKey(ownerRef)};
        std::vector<std::string> args = {prefix_ + ":token:", prefix_ + ":lookup:", unindexedKey(),
                                         std::to_string(toMillis(now))};
        auto live = redis_->eval<long long>(kRemoveAllScript, keys.begin(), keys.end(),
                                            args.begin(), args.end());
        return ServiceResult<std::size_t>::ok(static_cast<std::size_t>(live));
    });
}

ServiceResult<std::size_t> RedisTokenStore::purgeExpired(TimePoint /*now*/) {
    return guarded<std::size_t>("index purge", [&]() {
        std::size_t dropped = 0;
        auto dropDanglingOwners = [&](const std::string& setKey) {
            long long cursor = 0;
            do {
                std::vector<std::string> members;
                cursor = redis_->sscan(setKey, cursor, 100, std::back_inserter(members));
                for (const auto& member : members) {
                    if (redis_->exists(tokenKey(member)) == 0) {
                        dropped += static_cast<std::size_t>(redis_->srem(setKey, member));
                    }
                }
            } while (cursor != 0);
        };

        long long cursor = 0;
        auto pattern = prefix_ + ":owner:*";
        do {
            std::vector<std::string> ownerSets;
            cursor = redis_->scan(cursor, pattern, 100, std::back_inserter(ownerSets));
            for (const auto& setKey : ownerSets) {
                dropDanglingOwners(setKey);
            }
        } while (cursor != 0);

        auto unindexed = unindexedKey();
        cursor = 0;
        do {
            std::vector<std::pair<std::string, double>> members;
            cursor = redis_->zscan(unindexed, cursor, 100, std::back_inserter(members));
            for (const auto& member : members) {
                if (redis_->exists(tokenKey(member.first)) == 0) {
                    dropped += static_cast<std::size_t>(redis_->zrem(unindexed, member.first));
                }
            }
        } while (cursor != 0);

        return ServiceResult<std::size_t>::ok(dropped);
    });
}

ServiceResult<std::size_t> RedisTokenStore::countLive(std::string_view ownerRef, TimePoint now) {
    auto records = findByOwner(ownerRef, now);
    if (records.hasError()) {
        return ServiceResult<std::size_t>::err(records.error());
    }
    return ServiceResult<std::size_t>::ok(records.value().size());
}

// -- RedisLockoutStore --------------------------------------------------------

RedisLockoutStore::RedisLockoutStore(std::shared_ptr<sw::redis::Redis> redis,
                                     std::string keyPrefix)
    : redis_(std::move(redis)), prefix_(std::move(keyPrefix)) {}

std::string RedisLockoutStore::lockoutKey(IdentityId id) const {
    return prefix_ + ":lockout:" + id.toString();
}

ServiceResult<LockoutState> RedisLockoutStore::state(IdentityId id) {
    return guarded<LockoutState>("lockout read", [&]() {
        FieldMap fields;
        redis_->hgetall(lockoutKey(id), std::inserter(fields, fields.end()));

        LockoutState state;
        if (auto it = fields.find("failures"); it != fields.end()) {
            state.failedAttempts = static_cast<uint32_t>(parseInt(it->second).value_or(0));
        }
        if (auto it = fields.find("locked_until"); it != fields.end()) {
            if (auto ms = parseInt(it->second)) {
                state.lockedUntil = fromMillis(*ms);
            }
        }
        return ServiceResult<LockoutState>::ok(state);
    });
}

ServiceResult<FailureOutcome> RedisLockoutStore::incrementFailures(IdentityId id,
                                                                   uint32_t threshold,
                                                                   TimePoint now,
                                                                   std::chrono::seconds lockDuration) {
    return guarded<FailureOutcome>("lockout increment", [&]() {
        std::vector<std::string> keys = {lockoutKey(id)};
        std::vector<std::string> args = {std::to_string(threshold), std::to_string(toMillis(now)),
                                         std::to_string(toMillis(now + lockDuration))};
        std::vector<std::string> reply;
        redis_->eval(kIncrementFailuresScript, keys.begin(), keys.end(), args.begin(), args.end(),
                     std::back_inserter(reply));
        if (reply.size() != 3) {
            return ServiceResult<FailureOutcome>::err(
                ServiceError(ErrorCode::StoreCorruptRecord, "unexpected lockout reply"));
        }

        FailureOutcome outcome;
        outcome.failedAttempts = static_cast<uint32_t>(parseInt(reply[0]).value_or(0));
        outcome.lockedNow = reply[1] == "1";
        if (auto ms = parseInt(reply[2])) {
            outcome.lockedUntil = fromMillis(*ms);
        }
        return ServiceResult<FailureOutcome>::ok(outcome);
    });
}

ServiceResult<bool> RedisLockoutStore::resetIfUnlocked(IdentityId id, TimePoint now) {
    return guarded<bool>("lockout reset", [&]() {
        std::vector<std::string> keys = {lockoutKey(id)};
        std::vector<std::string> args = {std::to_string(toMillis(now))};
        auto rc = redis_->eval<long long>(kResetIfUnlockedScript, keys.begin(), keys.end(),
                                          args.begin(), args.end());
        return ServiceResult<bool>::ok(rc == 1);
    });
}

ServiceResult<bool> RedisLockoutStore::clearExpiredLock(IdentityId id, TimePoint now) {
    return guarded<bool>("lockout expiry", [&]() {
        std::vector<std::string> keys = {lockoutKey(id)};
        std::vector<std::string> args = {std::to_string(toMillis(now))};
        auto rc = redis_->eval<long long>(kClearExpiredLockScript, keys.begin(), keys.end(),
                                          args.begin(), args.end());
        return ServiceResult<bool>::ok(rc == 1);
    });
}

ServiceResult<void> RedisLockoutStore::reset(IdentityId id) {
    return guarded<void>("lockout unlock", [&]() {
        redis_->del(lockoutKey(id));
        return ServiceResult<void>::ok();
    });
}

}  // namespace oas::service
