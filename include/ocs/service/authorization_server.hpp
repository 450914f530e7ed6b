#pragma once

/// @file authorization_server.hpp
/// @brief OAuth2 authorization server facade.
///
/// Orchestrates ClientRegistry, AuthorizationCodeService, TokenIssuer,
/// RefreshRotation, IntrospectionService and PersonalAccessTokenService per
/// grant type, over a caller-supplied set of storage backends.

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/clock.hpp"
#include "ocs/service/oauth_config.hpp"
#include "ocs/service/oauth_types.hpp"
#include "ocs/service/storage.hpp"

namespace ocs::service {

class ClientRegistry;
class PersonalAccessTokenService;
class ScopeManager;

/// Rate-limit hook consulted by the token endpoint, keyed by client id.
///
/// The core ships no implementation; a refusal surfaces as
/// TemporarilyUnavailable.
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /// True if a request for @p key may proceed.
    [[nodiscard]] virtual bool allow(std::string_view key) = 0;
};

/// Token endpoint parameters, already decoded by the transport.
struct TokenRequest {
    std::string grantType;
    std::string clientId;
    std::optional<std::string> clientSecret;

    std::optional<std::string> code;
    std::optional<std::string> redirectUri;
    std::optional<std::string> codeVerifier;
    std::optional<std::string> refreshToken;
    std::optional<std::string> scope;  ///< Space-delimited.
    std::optional<std::string> username;
    std::optional<std::string> password;
};

/// Authorization endpoint parameters for a resource owner the transport
/// has already authenticated.
struct AuthorizeRequest {
    std::string responseType;
    std::string clientId;
    std::string redirectUri;
    std::optional<std::string> scope;
    std::optional<std::string> state;
    std::optional<std::string> codeChallenge;
    std::optional<std::string> codeChallengeMethod;  ///< Defaults to "plain".
    std::string subject;
};

/// Where to send the user agent after a successful authorization.
struct AuthorizeResponse {
    std::string redirectUri;
    std::string code;
    std::optional<std::string> state;
};

/// RFC 8414 authorization server metadata.
struct ServerMetadata {
    std::string issuer;
    std::vector<std::string> grantTypesSupported;
    std::vector<std::string> responseTypesSupported;
    std::vector<std::string> codeChallengeMethodsSupported;
    std::vector<std::string> tokenEndpointAuthMethodsSupported;
    std::vector<std::string> scopesSupported;
};

/// OAuth2 authorization server.
///
/// Configuration is fixed at construction and shared read-only; all
/// mutable state lives in the storage backends, so one instance may serve
/// concurrent requests and several instances may share one store.
///
/// Example:
/// @code
///   InMemoryStorage storage;
///   OAuthConfig config;
///   config.signingKey = loadKey();
///   auto server = AuthorizationServer::create(config, storage.view());
///
///   TokenRequest req;
///   req.grantType = "client_credentials";
///   req.clientId = id;
///   req.clientSecret = secret;
///   auto tokens = server.value().token(req);
/// @endcode
class AuthorizationServer {
public:
    /// Build a server.
    ///
    /// @param scopes Scope registry; nullptr means ScopeManager::withDefaults().
    /// @param clock  Time source; nullptr means the system clock.
    /// @return InvalidArgument for an invalid configuration or missing store.
    [[nodiscard]] static foundation::AuthResult<AuthorizationServer> create(
        OAuthConfig config,
        OAuthStorage storage,
        std::shared_ptr<ScopeManager> scopes = nullptr,
        std::shared_ptr<foundation::IClock> clock = nullptr,
        std::shared_ptr<IRateLimiter> rateLimiter = nullptr);

    ~AuthorizationServer();

    AuthorizationServer(const AuthorizationServer&) = delete;
    AuthorizationServer& operator=(const AuthorizationServer&) = delete;
    AuthorizationServer(AuthorizationServer&&) noexcept;
    AuthorizationServer& operator=(AuthorizationServer&&) noexcept;

    // -- Endpoints ------------------------------------------------------------

    /// Authorization endpoint: issue a code and echo `state`.
    [[nodiscard]] foundation::AuthResult<AuthorizeResponse> authorize(
        const AuthorizeRequest& request) const;

    /// Token endpoint: authenticate the client and dispatch on grant_type.
    [[nodiscard]] foundation::AuthResult<TokenResponse> token(const TokenRequest& request) const;

    /// Introspection endpoint.
    [[nodiscard]] foundation::AuthResult<IntrospectionResult> introspect(
        std::string_view token, std::optional<TokenTypeHint> hint = std::nullopt) const;

    /// Revocation endpoint; the caller authenticates as the owning client.
    [[nodiscard]] foundation::AuthResult<void> revoke(
        std::string_view clientId,
        const std::optional<std::string>& clientSecret,
        std::string_view token,
        std::optional<TokenTypeHint> hint = std::nullopt) const;

    [[nodiscard]] ServerMetadata metadata() const;

    // -- Resource-server helpers ---------------------------------------------

    /// Validate a bearer token and check it carries @p requiredScopes.
    /// @return Claims, InvalidToken, or InvalidScope if scopes are missing.
    [[nodiscard]] foundation::AuthResult<AccessTokenClaims> validateAccessToken(
        std::string_view token, const ScopeList& requiredScopes = {}) const;

    // -- Components -----------------------------------------------------------

    [[nodiscard]] ClientRegistry& clients() const;
    [[nodiscard]] PersonalAccessTokenService& personalAccessTokens() const;
    [[nodiscard]] ScopeManager& scopes() const;
    [[nodiscard]] const OAuthConfig& config() const;

private:
    struct Impl;
    explicit AuthorizationServer(std::unique_ptr<Impl> impl);

    [[nodiscard]] foundation::AuthResult<TokenResponse> clientCredentialsGrant(
        const Client& client, const TokenRequest& request) const;
    [[nodiscard]] foundation::AuthResult<TokenResponse> passwordGrant(
        const Client& client, const TokenRequest& request) const;

    std::unique_ptr<Impl> impl_;
};

} // namespace ocs::service
