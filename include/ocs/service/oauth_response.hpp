#pragma once

/// @file oauth_response.hpp
/// @brief JSON bodies for the token, introspection and metadata endpoints.

#include <string>

#include "ocs/foundation/auth_error.hpp"
#include "ocs/service/authorization_server.hpp"
#include "ocs/service/oauth_types.hpp"

namespace ocs::service {

/// `{"access_token":..,"token_type":"Bearer","expires_in":..,"refresh_token":..,"scope":..}`
[[nodiscard]] std::string toJson(const TokenResponse& response);

/// An inactive result renders as exactly `{"active":false}`.
[[nodiscard]] std::string toJson(const IntrospectionResult& result);

[[nodiscard]] std::string toJson(const ServerMetadata& metadata);

/// RFC 6749 section 5.2 error object.
///
/// Errors outside the OAuth range render as `server_error` with the fixed
/// description "internal server error".
[[nodiscard]] std::string errorToJson(const foundation::AuthError& error);

} // namespace ocs::service
