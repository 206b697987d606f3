/// @file revocation_manager.cpp
/// @brief RevocationManager implementation.

#include "oas/service/revocation_manager.hpp"

#include "oas/foundation/service_logger.hpp"
#include "oas/service/auth_events.hpp"
#include "oas/service/auth_metrics.hpp"
#include "oas/service/token_store.hpp"

namespace oas::service {

using foundation::IdentityId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceResult;

RevocationManager::RevocationManager(std::shared_ptr<ITokenStore> store,
                                     std::shared_ptr<IAuthEventSink> events,
                                     std::shared_ptr<foundation::IClock> clock,
                                     const AuthConfig& config,
                                     foundation::ServiceMetrics& metrics)
    : store_(store),
      events_(std::move(events)),
      clock_(std::move(clock)),
      locator_(std::move(store), config, metrics),
      metrics_(metrics) {}

void RevocationManager::publishRevoked(const TokenRecord& record,
                                       TimePoint now,
                                       std::string_view reason) {
    metrics_.incrementCounter(metrics::kTokenRevoked);
    if (!events_) {
        return;
    }
    AuthEvent event;
    event.type = AuthEventType::TokenRevoked;
    event.identityId = IdentityId::parse(record.ownerRef);
    event.timestamp = now;
    event.outcome = std::string(reason);
    event.attributes["kind"] = std::string(tokenKindName(record.kind));
    events_->publish(event);
}

ServiceResult<bool> RevocationManager::revoke(std::string_view rawToken) {
    auto now = clock_->now();
    auto located = locator_.locate(rawToken, now);
    if (located.hasError()) {
        return ServiceResult<bool>::err(located.error());
    }
    if (!located.value()) {
        return ServiceResult<bool>::ok(false);
    }

    auto removed = store_->remove(located.value()->key);
    if (removed.hasError()) {
        metrics_.incrementCounter(metrics::kStoreError);
        return removed;
    }
    if (removed.value()) {
        publishRevoked(*located.value(), now, "revoked");
    }
    return removed;
}

ServiceResult<bool> RevocationManager::revokeSession(IdentityId owner, std::string_view sessionId) {
    auto now = clock_->now();
    auto record = store_->findByKey(sessionId, now);
    if (record.hasError()) {
        metrics_.incrementCounter(metrics::kStoreError);
        return ServiceResult<bool>::err(record.error());
    }
    if (!record.value() || record.value()->ownerRef != owner.toString()) {
        return ServiceResult<bool>::ok(false);
    }

    auto removed = store_->remove(record.value()->key);
    if (removed.hasError()) {
        metrics_.incrementCounter(metrics::kStoreError);
        return removed;
    }
    if (removed.value()) {
        publishRevoked(*record.value(), now, "revoked");
    }
    return removed;
}

ServiceResult<std::size_t> RevocationManager::revokeAll(IdentityId identity) {
    auto now = clock_->now();
    auto removed = store_->removeAllForOwner(identity.toString(), now);
    if (removed.hasError()) {
        metrics_.incrementCounter(metrics::kStoreError);
        return removed;
    }

    metrics_.incrementCounter(metrics::kTokenRevoked, removed.value());

    LogContext ctx;
    ctx.identityId = identity;
    ctx.extra["count"] = std::to_string(removed.value());
    OAS_LOG_CTX(LogLevel::Info, LogCategory::Token, "all tokens revoked", ctx);

    if (events_) {
        AuthEvent event;
        event.type = AuthEventType::TokenRevoked;
        event.identityId = identity;
        event.timestamp = now;
        event.outcome = "revoked_all";
        event.attributes["count"] = std::to_string(removed.value());
        events_->publish(event);
    }
    return removed;
}

}  // namespace oas::service
