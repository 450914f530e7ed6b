/// @file authorization_server.cpp
/// @brief AuthorizationServer implementation.

#include "ocs/service/authorization_server.hpp"

#include "ocs/foundation/server_logger.hpp"
#include "ocs/service/authorization_code_service.hpp"
#include "ocs/service/client_registry.hpp"
#include "ocs/service/input_validator.hpp"
#include "ocs/service/introspection_service.hpp"
#include "ocs/service/personal_access_tokens.hpp"
#include "ocs/service/refresh_rotation.hpp"
#include "ocs/service/scope_manager.hpp"
#include "ocs/service/secret_hasher.hpp"
#include "ocs/service/token_issuer.hpp"
#include "ocs/service/token_signer.hpp"

#include "oauth_errors.hpp"

namespace ocs::service {

using ocs::foundation::AuthError;
using ocs::foundation::AuthResult;
using ocs::foundation::ErrorCode;
using ocs::foundation::LogCategory;
using ocs::foundation::LogContext;
using ocs::foundation::LogLevel;

namespace {

AuthError missingParameter(std::string_view name) {
    return AuthError(ErrorCode::InvalidRequest, std::string(name) + " is required");
}

bool present(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

}  // namespace

// =============================================================================
// Impl
// =============================================================================

struct AuthorizationServer::Impl {
    std::shared_ptr<const OAuthConfig> config;
    OAuthStorage storage;
    std::shared_ptr<ScopeManager> scopes;
    std::shared_ptr<foundation::IClock> clock;
    std::shared_ptr<IRateLimiter> rateLimiter;

    SecretHasher hasher;
    std::shared_ptr<ClientRegistry> clients;
    std::shared_ptr<const TokenIssuer> issuer;
    std::unique_ptr<AuthorizationCodeService> codes;
    std::unique_ptr<RefreshRotation> rotation;
    std::unique_ptr<IntrospectionService> introspection;
    std::unique_ptr<PersonalAccessTokenService> personalTokens;

    /// Verified for unknown usernames in the password grant.
    std::string dummyPasswordHash;

    explicit Impl(ScryptParams cost) : hasher(cost) {}
};

AuthResult<AuthorizationServer> AuthorizationServer::create(
    OAuthConfig config,
    OAuthStorage storage,
    std::shared_ptr<ScopeManager> scopes,
    std::shared_ptr<foundation::IClock> clock,
    std::shared_ptr<IRateLimiter> rateLimiter) {
    using Created = AuthResult<AuthorizationServer>;

    if (!storage.clients || !storage.codes || !storage.accessTokens ||
        !storage.refreshTokens || !storage.personalTokens) {
        return Created::err(AuthError(ErrorCode::InvalidArgument, "storage backend missing"));
    }
    config.requirePkceForPublicClients = true;
    if (auto valid = validateOAuthConfig(config); !valid) {
        return Created::err(std::move(valid).error());
    }
    auto signer = TokenSigner::create(config);
    if (!signer) {
        return Created::err(std::move(signer).error());
    }

    if (!scopes) {
        scopes = std::make_shared<ScopeManager>(ScopeManager::withDefaults());
    }
    if (!clock) {
        clock = foundation::SystemClock::shared();
    }

    auto impl = std::make_unique<Impl>(config.secretHashCost);
    impl->config = std::make_shared<const OAuthConfig>(std::move(config));
    impl->storage = std::move(storage);
    impl->scopes = std::move(scopes);
    impl->clock = std::move(clock);
    impl->rateLimiter = std::move(rateLimiter);

    impl->clients = std::make_shared<ClientRegistry>(
        impl->storage.clients, impl->scopes, impl->hasher, impl->clock);
    impl->issuer = std::make_shared<const TokenIssuer>(
        impl->config, std::move(signer).value(), impl->storage.accessTokens,
        impl->storage.refreshTokens, impl->clock);
    impl->codes = std::make_unique<AuthorizationCodeService>(
        impl->config, impl->storage.codes, impl->scopes, impl->issuer, impl->clock);
    impl->rotation = std::make_unique<RefreshRotation>(
        impl->storage.refreshTokens, impl->scopes, impl->issuer, impl->clock);
    impl->introspection = std::make_unique<IntrospectionService>(
        impl->config, impl->issuer, impl->storage.accessTokens, impl->storage.refreshTokens,
        impl->storage.personalTokens, impl->clock);
    impl->personalTokens = std::make_unique<PersonalAccessTokenService>(
        impl->config, impl->storage.personalTokens, impl->scopes, impl->clock);

    if (impl->storage.users) {
        auto dummy = impl->hasher.hash("ocs-unknown-user");
        if (dummy) {
            impl->dummyPasswordHash = std::move(dummy).value();
        } else {
            OCS_LOG_WARN(LogCategory::Core, "could not prepare timing-equalisation hash");
        }
    }

    LogContext ctx;
    ctx.extra["issuer"] = impl->config->issuer;
    ctx.extra["alg"] = std::string(jwtAlgorithmName(impl->config->jwtAlgorithm));
    OCS_LOG_CTX(LogLevel::Info, LogCategory::Core, "authorization server ready", ctx);

    return Created::ok(AuthorizationServer(std::move(impl)));
}

AuthorizationServer::AuthorizationServer(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

AuthorizationServer::~AuthorizationServer() = default;
AuthorizationServer::AuthorizationServer(AuthorizationServer&&) noexcept = default;
AuthorizationServer& AuthorizationServer::operator=(AuthorizationServer&&) noexcept = default;

// =============================================================================
// Authorization endpoint
// =============================================================================

AuthResult<AuthorizeResponse> AuthorizationServer::authorize(
    const AuthorizeRequest& request) const {
    using Response = AuthResult<AuthorizeResponse>;

    if (request.clientId.empty()) {
        return Response::err(missingParameter("client_id"));
    }
    if (request.redirectUri.empty()) {
        return Response::err(missingParameter("redirect_uri"));
    }
    if (request.responseType != "code") {
        return Response::err(
            AuthError(ErrorCode::UnsupportedResponseType, "response_type must be code"));
    }
    if (request.state) {
        if (auto v = InputValidator::validateState(*request.state); !v) {
            return Response::err(AuthError(ErrorCode::InvalidRequest, v.message));
        }
    }

    auto client = impl_->clients->findActive(request.clientId);
    if (!client) {
        return Response::err(std::move(client).error());
    }

    std::optional<PkceChallenge> pkce;
    if (present(request.codeChallenge)) {
        PkceChallenge challenge;
        challenge.challenge = *request.codeChallenge;
        // RFC 7636 section 4.3: absent method means plain.
        challenge.method = CodeChallengeMethod::Plain;
        if (request.codeChallengeMethod) {
            auto method = parseCodeChallengeMethod(*request.codeChallengeMethod);
            if (!method) {
                return Response::err(AuthError(ErrorCode::InvalidRequest,
                                               "unsupported code_challenge_method"));
            }
            challenge.method = *method;
        }
        pkce = std::move(challenge);
    } else if (request.codeChallengeMethod) {
        return Response::err(missingParameter("code_challenge"));
    }

    auto scopes = ScopeManager::parse(request.scope.value_or(std::string()));
    auto code = impl_->codes->issue(client.value(), request.subject, request.redirectUri,
                                    scopes, pkce);
    if (!code) {
        return Response::err(std::move(code).error());
    }
    return Response::ok(AuthorizeResponse{request.redirectUri, std::move(code).value(),
                                          request.state});
}

// =============================================================================
// Token endpoint
// =============================================================================

AuthResult<TokenResponse> AuthorizationServer::token(const TokenRequest& request) const {
    using Response = AuthResult<TokenResponse>;

    if (request.grantType.empty()) {
        return Response::err(missingParameter("grant_type"));
    }
    if (request.clientId.empty()) {
        return Response::err(detail::invalidClient());
    }
    if (impl_->rateLimiter && !impl_->rateLimiter->allow(request.clientId)) {
        LogContext ctx;
        ctx.clientId = request.clientId;
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Grant, "token request rate limited", ctx);
        return Response::err(
            AuthError(ErrorCode::TemporarilyUnavailable, "too many requests, retry later"));
    }

    auto grant = parseGrantType(request.grantType);
    if (!grant) {
        return Response::err(AuthError(ErrorCode::UnsupportedGrantType,
                                       "unsupported grant_type: " + request.grantType));
    }

    auto authenticated = impl_->clients->authenticate(request.clientId, request.clientSecret);
    if (!authenticated) {
        return Response::err(std::move(authenticated).error());
    }
    const Client& client = authenticated.value();

    if (!client.allowsGrant(*grant)) {
        LogContext ctx;
        ctx.clientId = client.id;
        ctx.extra["grant_type"] = request.grantType;
        OCS_LOG_CTX(LogLevel::Info, LogCategory::Grant, "grant type not allowed for client", ctx);
        return Response::err(AuthError(ErrorCode::UnsupportedGrantType,
                                       "grant_type is not enabled for this client: " +
                                           request.grantType));
    }

    switch (*grant) {
        case GrantType::AuthorizationCode:
            if (!present(request.code)) {
                return Response::err(missingParameter("code"));
            }
            if (!present(request.redirectUri)) {
                return Response::err(missingParameter("redirect_uri"));
            }
            return impl_->codes->exchange(client, *request.code, *request.redirectUri,
                                          request.codeVerifier);

        case GrantType::ClientCredentials:
            return clientCredentialsGrant(client, request);

        case GrantType::Password:
            return passwordGrant(client, request);

        case GrantType::RefreshToken: {
            if (!present(request.refreshToken)) {
                return Response::err(missingParameter("refresh_token"));
            }
            std::optional<ScopeList> narrowed;
            if (request.scope) {
                narrowed = ScopeManager::parse(*request.scope);
            }
            return impl_->rotation->refresh(client, *request.refreshToken, narrowed);
        }
    }
    return Response::err(AuthError(ErrorCode::UnsupportedGrantType, "unsupported grant_type"));
}

AuthResult<TokenResponse> AuthorizationServer::clientCredentialsGrant(
    const Client& client, const TokenRequest& request) const {
    if (client.isPublic()) {
        return AuthResult<TokenResponse>::err(AuthError(
            ErrorCode::UnauthorizedClient, "client_credentials requires a confidential client"));
    }
    auto scopes = impl_->scopes->resolve(ScopeManager::parse(request.scope.value_or("")),
                                         client.scopes);
    if (!scopes) {
        return AuthResult<TokenResponse>::err(std::move(scopes).error());
    }
    return impl_->issuer->issueTokenPair(std::nullopt, client, scopes.value(), false);
}

AuthResult<TokenResponse> AuthorizationServer::passwordGrant(
    const Client& client, const TokenRequest& request) const {
    using Response = AuthResult<TokenResponse>;

    if (!impl_->storage.users) {
        return Response::err(
            AuthError(ErrorCode::UnsupportedGrantType, "password grant is not configured"));
    }
    if (!present(request.username)) {
        return Response::err(missingParameter("username"));
    }
    if (!request.password) {
        return Response::err(missingParameter("password"));
    }

    LogContext ctx;
    ctx.clientId = client.id;

    auto user = impl_->storage.users->findByUsername(*request.username);
    if (!user) {
        return Response::err(detail::internalError(user.error(), "look up user", ctx));
    }
    bool verified = false;
    if (user.value()) {
        verified = impl_->hasher.verify(*request.password, user.value()->passwordHash);
    } else {
        (void)impl_->hasher.verify(*request.password, impl_->dummyPasswordHash);
    }
    if (!verified || user.value()->disabled) {
        OCS_LOG_CTX(LogLevel::Info, LogCategory::Grant, "resource owner authentication failed",
                    ctx);
        return Response::err(
            AuthError(ErrorCode::InvalidGrant, "invalid resource owner credentials"));
    }

    auto scopes = impl_->scopes->resolve(ScopeManager::parse(request.scope.value_or("")),
                                         client.scopes);
    if (!scopes) {
        return Response::err(std::move(scopes).error());
    }
    return impl_->issuer->issueTokenPair(user.value()->subject, client, scopes.value(),
                                         client.allowsGrant(GrantType::RefreshToken));
}

// =============================================================================
// Introspection and revocation
// =============================================================================

AuthResult<IntrospectionResult> AuthorizationServer::introspect(
    std::string_view token, std::optional<TokenTypeHint> hint) const {
    return impl_->introspection->introspect(token, hint);
}

AuthResult<void> AuthorizationServer::revoke(std::string_view clientId,
                                             const std::optional<std::string>& clientSecret,
                                             std::string_view token,
                                             std::optional<TokenTypeHint> hint) const {
    auto client = impl_->clients->authenticate(clientId, clientSecret);
    if (!client) {
        return AuthResult<void>::err(std::move(client).error());
    }
    return impl_->introspection->revoke(client.value(), token, hint);
}

AuthResult<AccessTokenClaims> AuthorizationServer::validateAccessToken(
    std::string_view token, const ScopeList& requiredScopes) const {
    auto claims = impl_->issuer->validateAccessToken(token);
    if (!claims) {
        return claims;
    }
    if (!ScopeManager::satisfies(claims.value().scopes, requiredScopes)) {
        return AuthResult<AccessTokenClaims>::err(
            AuthError(ErrorCode::InvalidScope, "insufficient scope"));
    }
    return claims;
}

// =============================================================================
// Metadata and accessors
// =============================================================================

ServerMetadata AuthorizationServer::metadata() const {
    ServerMetadata meta;
    meta.issuer = impl_->config->issuer;
    for (auto grant : {GrantType::AuthorizationCode, GrantType::ClientCredentials,
                       GrantType::Password, GrantType::RefreshToken}) {
        if (grant == GrantType::Password && !impl_->storage.users) {
            continue;
        }
        meta.grantTypesSupported.emplace_back(grantTypeName(grant));
    }
    meta.responseTypesSupported = {"code"};
    meta.codeChallengeMethodsSupported = {"S256"};
    if (impl_->config->allowPlainPkce) {
        meta.codeChallengeMethodsSupported.emplace_back("plain");
    }
    meta.tokenEndpointAuthMethodsSupported = {"client_secret_post", "none"};
    for (const auto& scope : impl_->scopes->all()) {
        meta.scopesSupported.push_back(scope.id);
    }
    return meta;
}

ClientRegistry& AuthorizationServer::clients() const { return *impl_->clients; }

PersonalAccessTokenService& AuthorizationServer::personalAccessTokens() const {
    return *impl_->personalTokens;
}

ScopeManager& AuthorizationServer::scopes() const { return *impl_->scopes; }

const OAuthConfig& AuthorizationServer::config() const { return *impl_->config; }

}  // namespace ocs::service
