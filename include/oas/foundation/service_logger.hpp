#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping kcenon logger_system for structured,
///        category-filtered logging of the auth core.
///
/// Secrets never reach this layer: callers log identity ids, token kinds
/// and outcomes, never raw tokens, salts, hashes or submitted secrets.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "oas/foundation/service_result.hpp"
#include "oas/foundation/types.hpp"

namespace oas::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per component of the auth core.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Startup, configuration, shutdown
    Auth    = 1, ///< Authentication orchestration
    Lockout = 2, ///< Failure counters and lock windows
    Token   = 3, ///< Issuance, validation, revocation
    Store   = 4, ///< Backing store access
    Audit   = 5  ///< Audit event stream
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Auth", "Lockout", "Token", "Store", "Audit"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.identityId = IdentityId(42);
///   ctx.extra["kind"] = "session";
///   logger.logWithContext(LogLevel::Info, LogCategory::Token,
///                         "token issued", ctx);
/// @endcode
struct LogContext {
    std::optional<IdentityId> identityId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Each category resolves a named logger ("oas.<Category>") and falls back to
/// the registry's default logger. PIMPL keeps the kcenon headers out of the
/// public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Auth     | Info          |
/// | Lockout  | Info          |
/// | Token    | Info          |
/// | Store    | Warning       |
/// | Audit    | Info          |
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry's default logger.
    ServiceResult<void> flush();

    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse a level name ("debug", "INFO", ...) as used in configuration files.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace oas::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name OAS_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// OAS_MIN_LOG_LEVEL removes calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef OAS_MIN_LOG_LEVEL
    #define OAS_MIN_LOG_LEVEL 0
#endif

#define OAS_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= OAS_MIN_LOG_LEVEL &&                         \
            ::oas::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::oas::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define OAS_LOG_CTX(level, cat, msg, ctx)                                           \
    do {                                                                            \
        if (static_cast<int>(level) >= OAS_MIN_LOG_LEVEL &&                         \
            ::oas::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::oas::foundation::ServiceLogger::instance().logWithContext(             \
                (level), (cat), (msg), (ctx));                                      \
        }                                                                           \
    } while (0)

#define OAS_LOG_DEBUG(cat, msg) \
    OAS_LOG(::oas::foundation::LogLevel::Debug, (cat), (msg))

#define OAS_LOG_INFO(cat, msg) \
    OAS_LOG(::oas::foundation::LogLevel::Info, (cat), (msg))

#define OAS_LOG_WARN(cat, msg) \
    OAS_LOG(::oas::foundation::LogLevel::Warning, (cat), (msg))

#define OAS_LOG_ERROR(cat, msg) \
    OAS_LOG(::oas::foundation::LogLevel::Error, (cat), (msg))

/// @}
