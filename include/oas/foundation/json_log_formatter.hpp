#pragma once

/// @file json_log_formatter.hpp
/// @brief One JSON object per line for the audit stream, tagged with the
///        request's correlation id.

#include "oas/foundation/service_logger.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace oas::foundation {

/// Random version 4 UUID in canonical 8-4-4-4-12 form.
[[nodiscard]] std::string generateCorrelationId();

/// Binds a correlation id to the calling thread until the scope ends. Scopes
/// nest; the outer id comes back when the inner one is destroyed.
class CorrelationScope {
public:
    explicit CorrelationScope(std::string correlationId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

    /// Empty outside any scope.
    [[nodiscard]] static const std::string& current();

private:
    std::string previous_;
};

/// Field order is fixed; `correlation_id` and `identity_id` are omitted when
/// unknown and `extra` keys are sorted:
/// @code
///   {"timestamp":"2026-02-14T12:00:00.000Z","level":"INFO",
///    "category":"Audit","correlation_id":"uuid","message":"...",
///    "identity_id":42,"extra":{"event":"token_issued"}}
/// @endcode
class JsonLogFormatter {
public:
    [[nodiscard]] static std::string format(LogLevel level,
                                            LogCategory category,
                                            std::string_view message,
                                            const LogContext& ctx = {});

    /// Deterministic variant for tests and replays.
    [[nodiscard]] static std::string format(std::chrono::system_clock::time_point timestamp,
                                            LogLevel level,
                                            LogCategory category,
                                            std::string_view message,
                                            const LogContext& ctx = {});
};

/// `YYYY-MM-DDTHH:MM:SS.mmmZ`, always UTC.
[[nodiscard]] std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp);

}  // namespace oas::foundation
