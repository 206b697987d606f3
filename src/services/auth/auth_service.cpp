/// @file auth_service.cpp
/// @brief AuthService implementation orchestrating the authentication flow.

#include "oas/service/auth_service.hpp"

#include "oas/foundation/error_code.hpp"
#include "oas/foundation/json_log_formatter.hpp"
#include "oas/foundation/service_error.hpp"
#include "oas/foundation/service_logger.hpp"
#include "oas/foundation/service_metrics.hpp"
#include "oas/service/access_guard.hpp"
#include "oas/service/auth_errors.hpp"
#include "oas/service/auth_events.hpp"
#include "oas/service/auth_metrics.hpp"
#include "oas/service/credential_verifier.hpp"
#include "oas/service/identity_repository.hpp"
#include "oas/service/input_validator.hpp"
#include "oas/service/lockout_tracker.hpp"
#include "oas/service/revocation_manager.hpp"
#include "oas/service/session_validator.hpp"
#include "oas/service/token_issuer.hpp"
#include "oas/service/token_locator.hpp"
#include "oas/service/token_store.hpp"

#include <algorithm>
#include <optional>

namespace oas::service {

using foundation::ErrorCode;
using foundation::IdentityId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ScopedLatency;
using foundation::ServiceError;
using foundation::ServiceMetrics;
using foundation::ServiceResult;

// -- Construction / destruction -----------------------------------------------

AuthService::AuthService(AuthConfig config,
                         std::shared_ptr<IIdentityRepository> identities,
                         std::shared_ptr<ILockoutStore> lockouts,
                         std::shared_ptr<ITokenStore> tokens,
                         std::shared_ptr<IAuthEventSink> events,
                         std::shared_ptr<foundation::IClock> clock)
    : config_(std::move(config)),
      identities_(std::move(identities)),
      tokens_(std::move(tokens)),
      events_(std::move(events)),
      clock_(clock ? std::move(clock) : foundation::SystemClock::shared()),
      metrics_(&ServiceMetrics::instance()),
      verifier_(std::make_unique<CredentialVerifier>(config_.credentialHashIterations)),
      lockout_(std::make_unique<LockoutTracker>(
          std::move(lockouts), clock_, config_.lockoutThreshold, config_.lockoutDuration)),
      issuer_(std::make_unique<TokenIssuer>(tokens_, clock_, config_)),
      locator_(std::make_unique<TokenLocator>(tokens_, config_, *metrics_)),
      validator_(std::make_unique<SessionValidator>(
          tokens_, identities_, clock_, config_, *metrics_)),
      revocation_(std::make_unique<RevocationManager>(
          tokens_, events_, clock_, config_, *metrics_)) {
    metrics::registerAuthMetrics(*metrics_);
}

AuthService::~AuthService() = default;
AuthService::AuthService(AuthService&&) noexcept = default;
AuthService& AuthService::operator=(AuthService&&) noexcept = default;

// -- Helpers ------------------------------------------------------------------

void AuthService::emit(AuthEventType type,
                       std::optional<IdentityId> identity,
                       std::string outcome,
                       std::unordered_map<std::string, std::string> attributes) {
    if (!events_) {
        return;
    }
    AuthEvent event;
    event.type = type;
    event.identityId = identity;
    event.timestamp = clock_->now();
    event.outcome = std::move(outcome);
    event.attributes = std::move(attributes);
    events_->publish(event);
}

ServiceResult<IssuedToken> AuthService::rejectCredentials(std::optional<IdentityId> identity,
                                                          std::string_view reason) {
    metrics_->incrementCounter(metrics::kAuthFailure);
    emit(AuthEventType::AuthenticationFailed, identity, std::string(reason));

    LogContext ctx;
    ctx.identityId = identity;
    ctx.extra["reason"] = std::string(reason);
    OAS_LOG_CTX(LogLevel::Info, LogCategory::Auth, "authentication rejected", ctx);

    return ServiceResult<IssuedToken>::err(invalidCredentials());
}

ServiceResult<IssuedToken> AuthService::issueFor(const Identity& identity,
                                                 const IssueRequest& request) {
    auto issued = issuer_->issue(identity.id, request);
    if (issued.hasError()) {
        if (foundation::isStoreFailure(issued.error().code())) {
            metrics_->incrementCounter(metrics::kStoreError);
        }
        return issued;
    }
    metrics_->incrementCounter(metrics::kTokenIssued);
    emit(AuthEventType::TokenIssued, identity.id, "ok",
         {{"kind", std::string(tokenKindName(request.kind))}});
    return issued;
}

SessionInfo AuthService::toSessionInfo(const TokenRecord& record) {
    SessionInfo info;
    info.sessionId = record.key;
    info.kind = record.kind;
    info.issuedAt = record.issuedAt;
    info.expiresAt = record.expiresAt;
    info.lastUsed = record.lastUsed;
    info.sourceIp = record.sourceIp;
    info.userAgent = record.userAgent;
    info.provider = record.provider;
    info.apiKeyName = record.apiKeyName;
    return info;
}

// -- Login --------------------------------------------------------------------

ServiceResult<IssuedToken> AuthService::authenticate(std::string_view identifier,
                                                     std::string_view secret,
                                                     const RequestContext& context) {
    // Every event of one attempt shares a correlation id; a caller's id wins.
    std::optional<foundation::CorrelationScope> correlation;
    if (foundation::CorrelationScope::current().empty()) {
        correlation.emplace(foundation::generateCorrelationId());
    }

    // Bounded input keeps oversized secrets away from the key derivation.
    auto boundedSecret = secret.substr(0, InputValidator::kMaxSecretLength);

    if (!InputValidator::validateEmail(identifier) || !InputValidator::validateSecret(secret)) {
        verifier_->verifyDummy(boundedSecret);
        return rejectCredentials(std::nullopt, "malformed_input");
    }

    auto identity = liveIdentity(identities_->findByEmail(identifier));
    if (!identity) {
        verifier_->verifyDummy(boundedSecret);
        return rejectCredentials(std::nullopt, "unknown_identifier");
    }
    const auto id = identity->id;

    auto gate = lockout_->check(id);
    if (gate.hasError()) {
        metrics_->incrementCounter(metrics::kStoreError);
        return ServiceResult<IssuedToken>::err(gate.error());
    }
    if (gate.value().locked) {
        metrics_->incrementCounter(metrics::kAuthFailure);
        emit(AuthEventType::AuthenticationFailed, id, "account_locked");
        return ServiceResult<IssuedToken>::err(accountLocked(gate.value().retryAfter));
    }

    bool verified = false;
    {
        ScopedLatency timer(*metrics_, metrics::kCredentialVerifyMs);
        verified = verifier_->verify(secret, identity->secretHash);
    }

    if (!verified) {
        auto failure = lockout_->recordFailure(id);
        if (failure.hasError()) {
            metrics_->incrementCounter(metrics::kStoreError);
            return ServiceResult<IssuedToken>::err(failure.error());
        }
        if (failure.value().lockedNow) {
            metrics_->incrementCounter(metrics::kAuthFailure);
            metrics_->incrementCounter(metrics::kAccountLocked);
            emit(AuthEventType::AuthenticationFailed, id, "invalid_credentials");
            emit(AuthEventType::AccountLocked, id, "locked",
                 {{"lock_seconds", std::to_string(config_.lockoutDuration.count())}});
            return ServiceResult<IssuedToken>::err(accountLocked(config_.lockoutDuration));
        }
        return rejectCredentials(id, "invalid_credentials");
    }

    if (identity->status != IdentityStatus::Active) {
        return rejectCredentials(id, "account_not_active");
    }

    auto reset = lockout_->recordSuccess(id);
    if (reset.hasError()) {
        metrics_->incrementCounter(metrics::kStoreError);
        return ServiceResult<IssuedToken>::err(reset.error());
    }
    if (!reset.value()) {
        // A concurrent failure locked the identity after our gate check.
        auto status = lockout_->status(id);
        auto retryAfter = status.hasValue() ? status.value().retryAfter : config_.lockoutDuration;
        metrics_->incrementCounter(metrics::kAuthFailure);
        emit(AuthEventType::AuthenticationFailed, id, "account_locked");
        return ServiceResult<IssuedToken>::err(accountLocked(retryAfter));
    }

    IssueRequest request;
    request.kind = TokenKind::Session;
    request.context = context;
    auto issued = issueFor(*identity, request);
    if (issued.hasError()) {
        return issued;
    }

    metrics_->incrementCounter(metrics::kAuthSuccess);
    emit(AuthEventType::AuthenticationSucceeded, id, "ok",
         {{"source_ip", context.sourceIp}});

    LogContext ctx;
    ctx.identityId = id;
    OAS_LOG_CTX(LogLevel::Info, LogCategory::Auth, "authentication succeeded", ctx);
    return issued;
}

ServiceResult<IssuedToken> AuthService::issueProviderSession(IdentityId identity,
                                                             std::string_view provider,
                                                             const RequestContext& context) {
    if (provider.empty()) {
        return ServiceResult<IssuedToken>::err(
            ServiceError(ErrorCode::InvalidArgument, "provider must not be empty"));
    }
    auto found = liveIdentity(identities_->findById(identity));
    if (!found || found->status != IdentityStatus::Active) {
        return ServiceResult<IssuedToken>::err(
            ServiceError(ErrorCode::AccountNotActive, "identity cannot hold sessions"));
    }

    IssueRequest request;
    request.kind = TokenKind::OAuthSession;
    request.context = context;
    request.provider = std::string(provider);
    return issueFor(*found, request);
}

ServiceResult<IssuedToken> AuthService::issueApiToken(const Principal& caller,
                                                      std::string_view name,
                                                      TimePoint expiresAt,
                                                      const RequestContext& context) {
    auto nameCheck = InputValidator::validateApiKeyName(name);
    if (!nameCheck) {
        return ServiceResult<IssuedToken>::err(
            ServiceError(ErrorCode::InvalidArgument, nameCheck.message));
    }
    auto found = liveIdentity(identities_->findById(caller.identityId));
    if (!found || found->status != IdentityStatus::Active) {
        return ServiceResult<IssuedToken>::err(
            ServiceError(ErrorCode::AccountNotActive, "identity cannot hold api keys"));
    }

    IssueRequest request;
    request.kind = TokenKind::ApiKey;
    request.context = context;
    request.apiKeyName = std::string(name);
    request.expiresAt = expiresAt;
    return issueFor(*found, request);
}

// -- Validation ---------------------------------------------------------------

ServiceResult<std::optional<Principal>> AuthService::validateToken(std::string_view rawToken) {
    return validator_->validate(rawToken);
}

ServiceResult<std::optional<SessionInfo>> AuthService::tokenInfo(std::string_view rawToken) {
    auto located = locator_->locate(rawToken, clock_->now());
    if (located.hasError()) {
        return ServiceResult<std::optional<SessionInfo>>::err(located.error());
    }
    if (!located.value()) {
        return ServiceResult<std::optional<SessionInfo>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<SessionInfo>>::ok(toSessionInfo(*located.value()));
}

// -- Revocation ---------------------------------------------------------------

ServiceResult<bool> AuthService::revokeToken(std::string_view rawToken) {
    return revocation_->revoke(rawToken);
}

ServiceResult<std::size_t> AuthService::revokeAllTokens(IdentityId identity) {
    return revocation_->revokeAll(identity);
}

ServiceResult<std::size_t> AuthService::revokeAllTokens(const Principal& caller,
                                                        IdentityId identity) {
    auto decision = AccessGuard::requireSelfOrAdmin(caller, identity);
    if (!decision) {
        return ServiceResult<std::size_t>::err(permissionDenied(decision.reason));
    }
    return revocation_->revokeAll(identity);
}

ServiceResult<bool> AuthService::revokeSession(const Principal& caller, std::string_view sessionId) {
    return revocation_->revokeSession(caller.identityId, sessionId);
}

// -- Administration -----------------------------------------------------------

ServiceResult<std::vector<SessionInfo>> AuthService::listSessions(const Principal& caller,
                                                                  IdentityId identity) {
    auto decision = AccessGuard::requireSelfOrAdmin(caller, identity);
    if (!decision) {
        return ServiceResult<std::vector<SessionInfo>>::err(permissionDenied(decision.reason));
    }

    auto records = tokens_->findByOwner(identity.toString(), clock_->now());
    if (records.hasError()) {
        metrics_->incrementCounter(metrics::kStoreError);
        return ServiceResult<std::vector<SessionInfo>>::err(records.error());
    }

    std::vector<SessionInfo> sessions;
    sessions.reserve(records.value().size());
    for (const auto& record : records.value()) {
        sessions.push_back(toSessionInfo(record));
    }
    std::sort(sessions.begin(), sessions.end(), [](const SessionInfo& a, const SessionInfo& b) {
        return a.issuedAt > b.issuedAt;
    });
    return ServiceResult<std::vector<SessionInfo>>::ok(std::move(sessions));
}

ServiceResult<std::size_t> AuthService::countActiveSessions(const Principal& caller,
                                                           IdentityId identity) {
    auto decision = AccessGuard::requireSelfOrAdmin(caller, identity);
    if (!decision) {
        return ServiceResult<std::size_t>::err(permissionDenied(decision.reason));
    }
    auto live = tokens_->countLive(identity.toString(), clock_->now());
    if (live.hasError()) {
        metrics_->incrementCounter(metrics::kStoreError);
    }
    return live;
}

ServiceResult<LockoutStatus> AuthService::lockoutStatus(IdentityId identity) {
    return lockout_->status(identity);
}

ServiceResult<void> AuthService::unlock(const Principal& caller, IdentityId identity) {
    auto decision = AccessGuard::requireAdmin(caller);
    if (!decision) {
        return ServiceResult<void>::err(permissionDenied(decision.reason));
    }
    return lockout_->unlock(identity);
}

ServiceResult<std::size_t> AuthService::purgeExpiredTokens() {
    auto purged = tokens_->purgeExpired(clock_->now());
    if (purged.hasError()) {
        metrics_->incrementCounter(metrics::kStoreError);
        return purged;
    }
    if (purged.value() > 0) {
        LogContext ctx;
        ctx.extra["count"] = std::to_string(purged.value());
        OAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "expired tokens purged", ctx);
    }
    return purged;
}

ServiceResult<std::string> AuthService::hashSecret(std::string_view secret) const {
    auto check = InputValidator::validateSecret(secret);
    if (!check) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::InvalidArgument, check.message));
    }
    return verifier_->hash(secret);
}

}  // namespace oas::service
