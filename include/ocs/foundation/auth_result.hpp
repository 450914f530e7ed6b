#pragma once

/// @file auth_result.hpp
/// @brief AuthResult<T> type alias for authorization server operations.

#include "ocs/core/result.hpp"
#include "ocs/foundation/auth_error.hpp"

namespace ocs::foundation {

/// Result type specialized with AuthError.
///
/// Example:
/// @code
///   AuthResult<std::vector<std::string>> checkScopes(const ScopeList& requested) {
///       if (requested.empty()) {
///           return AuthResult<std::vector<std::string>>::err(
///               AuthError(ErrorCode::InvalidScope, "no scope requested"));
///       }
///       return AuthResult<std::vector<std::string>>::ok(requested);
///   }
/// @endcode
template <typename T>
using AuthResult = ocs::Result<T, AuthError>;

}  // namespace ocs::foundation
