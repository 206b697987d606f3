#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T> alias used by every fallible service operation.

#include "oas/core/result.hpp"
#include "oas/foundation/service_error.hpp"

namespace oas::foundation {

/// Result type specialized with ServiceError.
///
/// Example:
/// @code
///   ServiceResult<std::size_t> purge() {
///       if (!connected_) {
///           return ServiceResult<std::size_t>::err(
///               ServiceError(ErrorCode::StoreUnavailable, "store offline"));
///       }
///       return ServiceResult<std::size_t>::ok(removed);
///   }
/// @endcode
template <typename T>
using ServiceResult = oas::Result<T, ServiceError>;

}  // namespace oas::foundation
