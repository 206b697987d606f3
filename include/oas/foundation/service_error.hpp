#pragma once

/// @file service_error.hpp
/// @brief Error type used with Result<T, ServiceError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "oas/foundation/error_code.hpp"

namespace oas::foundation {

/// Error carrying a code, a human-readable message, and optional
/// type-erased context (e.g. the retry window of a lockout).
class ServiceError {
public:
    ServiceError() = default;

    explicit ServiceError(ErrorCode code)
        : code_(code) {}

    ServiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ServiceError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr if the type does not match or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True when the backing store could not answer; callers should retry
    /// rather than treat the request as unauthenticated.
    [[nodiscard]] bool isRetriable() const noexcept { return isStoreFailure(code_); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace oas::foundation
