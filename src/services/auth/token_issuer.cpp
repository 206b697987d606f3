/// @file token_issuer.cpp
/// @brief TokenIssuer implementation.

#include "oas/service/token_issuer.hpp"

#include "crypto_utils.hpp"
#include "oas/foundation/service_logger.hpp"
#include "oas/service/token_store.hpp"

#include <algorithm>

namespace oas::service {

using foundation::ErrorCode;
using foundation::IdentityId;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

constexpr std::size_t kMinTokenBytes = 32;
constexpr std::size_t kSaltBytes = 16;

}  // namespace

TokenIssuer::TokenIssuer(std::shared_ptr<ITokenStore> store,
                         std::shared_ptr<foundation::IClock> clock,
                         const AuthConfig& config)
    : store_(std::move(store)),
      clock_(std::move(clock)),
      tokenBytes_(std::max(config.tokenBytes, kMinTokenBytes)),
      sessionLifetime_(config.sessionLifetime),
      maxApiKeyLifetime_(config.maxApiKeyLifetime) {}

ServiceResult<std::string> TokenIssuer::generateRawToken() const {
    auto bytes = detail::secureRandomBytes(tokenBytes_);
    if (!bytes) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::CryptoFailure, "random source unavailable"));
    }
    return ServiceResult<std::string>::ok(detail::base64urlEncode(*bytes));
}

std::string TokenIssuer::lookupHashOf(std::string_view rawToken) {
    return detail::toHex(detail::sha256(rawToken));
}

std::string TokenIssuer::saltedHashOf(std::string_view salt, std::string_view rawToken) {
    std::string combined;
    combined.reserve(salt.size() + rawToken.size());
    combined.append(salt);
    combined.append(rawToken);
    return detail::toHex(detail::sha256(combined));
}

bool TokenIssuer::matches(std::string_view rawToken, const TokenRecord& record) {
    if (record.salt.empty() || record.tokenHash.empty()) {
        return false;
    }
    return detail::constantTimeEqual(saltedHashOf(record.salt, rawToken), record.tokenHash);
}

ServiceResult<TimePoint> TokenIssuer::expiryFor(const IssueRequest& request, TimePoint now) const {
    if (request.kind != TokenKind::ApiKey) {
        return ServiceResult<TimePoint>::ok(now + sessionLifetime_);
    }
    if (!request.expiresAt) {
        return ServiceResult<TimePoint>::err(
            ServiceError(ErrorCode::InvalidExpiry, "api key requires an expiry"));
    }
    if (*request.expiresAt <= now) {
        return ServiceResult<TimePoint>::err(
            ServiceError(ErrorCode::InvalidExpiry, "api key expiry must be in the future"));
    }
    if (*request.expiresAt > now + maxApiKeyLifetime_) {
        return ServiceResult<TimePoint>::err(
            ServiceError(ErrorCode::InvalidExpiry, "api key expiry exceeds maximum lifetime"));
    }
    return ServiceResult<TimePoint>::ok(*request.expiresAt);
}

ServiceResult<IssuedToken> TokenIssuer::issue(IdentityId owner, const IssueRequest& request) {
    if (!owner.isValid()) {
        return ServiceResult<IssuedToken>::err(
            ServiceError(ErrorCode::InvalidArgument, "token owner is not a valid identity"));
    }

    auto now = clock_->now();
    auto expiry = expiryFor(request, now);
    if (expiry.hasError()) {
        return ServiceResult<IssuedToken>::err(expiry.error());
    }

    auto raw = generateRawToken();
    if (raw.hasError()) {
        return ServiceResult<IssuedToken>::err(raw.error());
    }
    auto saltBytes = detail::secureRandomBytes(kSaltBytes);
    if (!saltBytes) {
        return ServiceResult<IssuedToken>::err(
            ServiceError(ErrorCode::CryptoFailure, "random source unavailable"));
    }

    TokenRecord record;
    record.lookupHash = lookupHashOf(raw.value());
    record.key = record.lookupHash;
    record.salt = detail::base64urlEncode(*saltBytes);
    record.tokenHash = saltedHashOf(record.salt, raw.value());
    record.ownerRef = owner.toString();
    record.issuedAt = now;
    record.expiresAt = expiry.value();
    record.lastUsed = now;
    record.kind = request.kind;
    record.sourceIp = request.context.sourceIp;
    record.userAgent = request.context.userAgent;
    if (request.kind == TokenKind::OAuthSession) {
        record.provider = request.provider;
    }
    if (request.kind == TokenKind::ApiKey) {
        record.apiKeyName = request.apiKeyName;
    }

    auto stored = store_->insert(record);
    if (stored.hasError()) {
        return ServiceResult<IssuedToken>::err(stored.error());
    }

    LogContext ctx;
    ctx.identityId = owner;
    ctx.extra["kind"] = std::string(tokenKindName(request.kind));
    OAS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "token issued", ctx);

    return ServiceResult<IssuedToken>::ok(
        IssuedToken{std::move(raw).value(), request.kind, record.expiresAt});
}

}  // namespace oas::service
