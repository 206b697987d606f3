/// @file session_validator.cpp
/// @brief SessionValidator implementation.

#include "oas/service/session_validator.hpp"

#include "oas/foundation/service_logger.hpp"
#include "oas/service/auth_metrics.hpp"
#include "oas/service/identity_repository.hpp"
#include "oas/service/token_store.hpp"

namespace oas::service {

using foundation::IdentityId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceResult;

using OptionalPrincipal = std::optional<Principal>;

SessionValidator::SessionValidator(std::shared_ptr<ITokenStore> store,
                                   std::shared_ptr<IIdentityRepository> identities,
                                   std::shared_ptr<foundation::IClock> clock,
                                   const AuthConfig& config,
                                   foundation::ServiceMetrics& metrics)
    : store_(store),
      identities_(std::move(identities)),
      clock_(std::move(clock)),
      locator_(std::move(store), config, metrics),
      metrics_(metrics),
      sessionLifetime_(config.sessionLifetime) {}

ServiceResult<OptionalPrincipal> SessionValidator::validate(std::string_view rawToken) {
    auto now = clock_->now();

    auto located = locator_.locate(rawToken, now);
    if (located.hasError()) {
        return ServiceResult<OptionalPrincipal>::err(located.error());
    }
    if (!located.value()) {
        return ServiceResult<OptionalPrincipal>::ok(std::nullopt);
    }
    const auto& record = *located.value();

    auto ownerId = IdentityId::parse(record.ownerRef);
    if (!ownerId) {
        OAS_LOG_WARN(LogCategory::Token, "deleting token record with malformed owner reference");
        auto removed = store_->remove(record.key);
        if (removed.hasError()) {
            metrics_.incrementCounter(metrics::kStoreError);
            OAS_LOG_ERROR(LogCategory::Store, "failed to delete corrupt token record");
        }
        return ServiceResult<OptionalPrincipal>::ok(std::nullopt);
    }

    auto identity = liveIdentity(identities_->findById(*ownerId));
    if (!identity || identity->status == IdentityStatus::Disabled) {
        LogContext ctx;
        ctx.identityId = *ownerId;
        OAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "token owner no longer usable", ctx);
        return ServiceResult<OptionalPrincipal>::ok(std::nullopt);
    }

    auto refreshed = store_->getAndRefresh(record.key, now, now + sessionLifetime_);
    if (refreshed.hasError()) {
        metrics_.incrementCounter(metrics::kStoreError);
        return ServiceResult<OptionalPrincipal>::err(refreshed.error());
    }
    if (!refreshed.value()) {
        // Revoked or expired between lookup and refresh.
        return ServiceResult<OptionalPrincipal>::ok(std::nullopt);
    }

    Principal principal;
    principal.identityId = identity->id;
    principal.email = identity->email;
    principal.displayName = identity->displayName;
    principal.roles = identity->roles;
    principal.tokenKind = refreshed.value()->kind;
    principal.expiresAt = refreshed.value()->expiresAt;
    return ServiceResult<OptionalPrincipal>::ok(std::move(principal));
}

}  // namespace oas::service
