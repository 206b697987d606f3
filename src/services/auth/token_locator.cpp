/// @file token_locator.cpp
/// @brief TokenLocator implementation.

#include "oas/service/token_locator.hpp"

#include "oas/foundation/service_logger.hpp"
#include "oas/service/auth_metrics.hpp"
#include "oas/service/input_validator.hpp"
#include "oas/service/token_issuer.hpp"
#include "oas/service/token_store.hpp"

#include <string>

namespace oas::service {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceResult;

using OptionalRecord = std::optional<TokenRecord>;

TokenLocator::TokenLocator(std::shared_ptr<ITokenStore> store,
                           const AuthConfig& config,
                           foundation::ServiceMetrics& metrics)
    : store_(std::move(store)),
      metrics_(metrics),
      legacyLookupEnabled_(config.legacyLookupEnabled),
      legacyScanBatch_(config.legacyScanLimit) {}

ServiceResult<OptionalRecord> TokenLocator::locate(std::string_view rawToken, TimePoint now) {
    if (!InputValidator::validateTokenFormat(rawToken)) {
        return ServiceResult<OptionalRecord>::ok(std::nullopt);
    }

    auto lookupHash = TokenIssuer::lookupHashOf(rawToken);
    auto indexed = store_->findByLookupHash(lookupHash, now);
    if (indexed.hasError()) {
        metrics_.incrementCounter(metrics::kStoreError);
        return indexed;
    }

    if (indexed.value().has_value()) {
        if (!TokenIssuer::matches(rawToken, *indexed.value())) {
            OAS_LOG_WARN(LogCategory::Token, "indexed record failed salted hash check");
            return ServiceResult<OptionalRecord>::ok(std::nullopt);
        }
        metrics_.incrementCounter(metrics::kTokenFastPath);
        return indexed;
    }

    if (!legacyLookupEnabled_) {
        return ServiceResult<OptionalRecord>::ok(std::nullopt);
    }
    return scanUnindexed(rawToken, lookupHash, now);
}

ServiceResult<OptionalRecord> TokenLocator::scanUnindexed(std::string_view rawToken,
                                                         std::string_view lookupHash,
                                                         TimePoint now) {
    std::string cursor;
    std::size_t batches = 0;
    OptionalRecord match;
    do {
        auto page = store_->listUnindexed(now, cursor, legacyScanBatch_);
        if (page.hasError()) {
            metrics_.incrementCounter(metrics::kStoreError);
            return ServiceResult<OptionalRecord>::err(page.error());
        }
        ++batches;
        metrics_.incrementCounter(metrics::kLegacyScanBatches);

        for (auto& candidate : page.value().records) {
            if (TokenIssuer::matches(rawToken, candidate)) {
                match = std::move(candidate);
                break;
            }
        }
        cursor = std::move(page.value().nextCursor);
    } while (!match && !cursor.empty());

    if (batches > 1) {
        LogContext ctx;
        ctx.extra["batches"] = std::to_string(batches);
        ctx.extra["matched"] = match ? "true" : "false";
        OAS_LOG_CTX(LogLevel::Info, LogCategory::Token, "legacy scan spanned several batches", ctx);
    }
    if (!match) {
        return ServiceResult<OptionalRecord>::ok(std::nullopt);
    }

    metrics_.incrementCounter(metrics::kTokenSlowPath);
    auto backfilled = store_->attachLookupHash(match->key, lookupHash, now);
    if (backfilled.hasError()) {
        // The match stands; the next call simply scans again.
        metrics_.incrementCounter(metrics::kStoreError);
        OAS_LOG_WARN(LogCategory::Store, "lookup hash backfill failed");
    } else if (backfilled.value()) {
        metrics_.incrementCounter(metrics::kTokenBackfill);
        match->lookupHash = std::string(lookupHash);
        OAS_LOG_DEBUG(LogCategory::Token, "lookup hash backfilled");
    }
    return ServiceResult<OptionalRecord>::ok(std::move(match));
}

}  // namespace oas::service
