/// @file oauth_response.cpp
/// @brief JSON renderers for endpoint responses.

#include "ocs/service/oauth_response.hpp"

#include "ocs/service/scope_manager.hpp"

#include "json_utils.hpp"
#include "oauth_errors.hpp"

namespace ocs::service {

using detail::JsonObjectWriter;

std::string toJson(const TokenResponse& response) {
    JsonObjectWriter json;
    json.field("access_token", response.accessToken)
        .field("token_type", response.tokenType)
        .field("expires_in", static_cast<int64_t>(response.expiresIn.count()))
        .optionalField("refresh_token", response.refreshToken)
        .field("scope", ScopeManager::join(response.scopes));
    return json.str();
}

std::string toJson(const IntrospectionResult& result) {
    JsonObjectWriter json;
    json.field("active", result.active);
    if (!result.active) {
        return json.str();
    }
    json.optionalField("scope", result.scope)
        .optionalField("client_id", result.clientId)
        .optionalField("username", result.username)
        .optionalField("token_type", result.tokenType)
        .optionalField("exp", result.exp)
        .optionalField("iat", result.iat)
        .optionalField("nbf", result.nbf)
        .optionalField("sub", result.sub)
        .optionalField("iss", result.iss)
        .optionalField("jti", result.jti);
    return json.str();
}

std::string toJson(const ServerMetadata& metadata) {
    JsonObjectWriter json;
    json.field("issuer", metadata.issuer)
        .field("grant_types_supported", metadata.grantTypesSupported)
        .field("response_types_supported", metadata.responseTypesSupported)
        .field("code_challenge_methods_supported", metadata.codeChallengeMethodsSupported)
        .field("token_endpoint_auth_methods_supported",
               metadata.tokenEndpointAuthMethodsSupported)
        .field("scopes_supported", metadata.scopesSupported);
    return json.str();
}

std::string errorToJson(const foundation::AuthError& error) {
    JsonObjectWriter json;
    if (!foundation::isOAuthError(error.code()) ||
        error.code() == foundation::ErrorCode::ServerError) {
        json.field("error", "server_error")
            .field("error_description", detail::kInternalErrorDescription);
        return json.str();
    }
    json.field("error", foundation::oauthErrorName(error.code()));
    if (!error.message().empty()) {
        json.field("error_description", error.message());
    }
    return json.str();
}

}  // namespace ocs::service
