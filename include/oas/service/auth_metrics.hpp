#pragma once

/// @file auth_metrics.hpp
/// @brief Metric names published by the authentication core.

#include "oas/foundation/service_metrics.hpp"

#include <string_view>

namespace oas::service::metrics {

inline constexpr std::string_view kAuthSuccess = "oas_auth_success_total";
inline constexpr std::string_view kAuthFailure = "oas_auth_failure_total";
inline constexpr std::string_view kAccountLocked = "oas_account_locked_total";
inline constexpr std::string_view kTokenIssued = "oas_token_issued_total";
inline constexpr std::string_view kTokenRevoked = "oas_token_revoked_total";
inline constexpr std::string_view kTokenFastPath = "oas_token_fast_path_total";
inline constexpr std::string_view kTokenSlowPath = "oas_token_slow_path_total";
inline constexpr std::string_view kTokenBackfill = "oas_token_backfill_total";
inline constexpr std::string_view kLegacyScanBatches = "oas_token_legacy_scan_batches_total";
inline constexpr std::string_view kStoreError = "oas_store_error_total";
inline constexpr std::string_view kCredentialVerifyMs = "oas_credential_verify_ms";

/// Register histograms. Counters are created on first increment.
inline void registerAuthMetrics(foundation::ServiceMetrics& registry) {
    registry.registerHistogram(kCredentialVerifyMs,
                               foundation::HistogramBuckets::defaultLatency());
}

}  // namespace oas::service::metrics
