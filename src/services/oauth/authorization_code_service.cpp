/// @file authorization_code_service.cpp
/// @brief AuthorizationCodeService implementation.

#include "ocs/service/authorization_code_service.hpp"

#include "ocs/foundation/server_logger.hpp"
#include "ocs/service/token_codec.hpp"

#include "oauth_errors.hpp"

namespace ocs::service {

using ocs::foundation::AuthError;
using ocs::foundation::AuthResult;
using ocs::foundation::ErrorCode;
using ocs::foundation::LogCategory;
using ocs::foundation::LogContext;
using ocs::foundation::LogLevel;

namespace {

constexpr std::size_t kHashPrefixLength = 12;

AuthResult<TokenResponse> invalidGrant(std::string message) {
    return AuthResult<TokenResponse>::err(AuthError(ErrorCode::InvalidGrant, std::move(message)));
}

AuthResult<std::string> invalidRequest(std::string message) {
    return AuthResult<std::string>::err(AuthError(ErrorCode::InvalidRequest, std::move(message)));
}

LogContext codeContext(std::string_view clientId, std::string_view codeHash) {
    LogContext ctx;
    ctx.clientId = std::string(clientId);
    ctx.tokenId = std::string(codeHash.substr(0, kHashPrefixLength));
    return ctx;
}

}  // namespace

AuthorizationCodeService::AuthorizationCodeService(
    std::shared_ptr<const OAuthConfig> config,
    std::shared_ptr<IAuthorizationCodeStore> codes,
    std::shared_ptr<const ScopeManager> scopes,
    std::shared_ptr<const TokenIssuer> issuer,
    std::shared_ptr<foundation::IClock> clock)
    : config_(std::move(config)),
      codes_(std::move(codes)),
      scopes_(std::move(scopes)),
      issuer_(std::move(issuer)),
      clock_(std::move(clock)) {}

bool AuthorizationCodeService::pkceRequired(const Client& client) const noexcept {
    // Public clients cannot keep a secret, so PKCE is their only proof.
    if (client.isPublic()) {
        return true;
    }
    return config_->requirePkceForConfidentialClients;
}

// ============================================================================
// Issuance
// ============================================================================

AuthResult<std::string> AuthorizationCodeService::issue(
    const Client& client,
    std::string_view subject,
    std::string_view redirectUri,
    const ScopeList& scopes,
    const std::optional<PkceChallenge>& pkce) const {
    if (!client.allowsGrant(GrantType::AuthorizationCode)) {
        return AuthResult<std::string>::err(AuthError(
            ErrorCode::UnauthorizedClient, "client is not allowed to use authorization_code"));
    }
    if (subject.empty()) {
        return invalidRequest("resource owner is not authenticated");
    }
    if (!client.hasRedirectUri(redirectUri)) {
        return invalidRequest("redirect_uri is not registered for this client");
    }

    auto granted = scopes_->resolve(scopes, client.scopes);
    if (!granted) {
        return AuthResult<std::string>::err(std::move(granted).error());
    }

    if (pkce) {
        if (pkce->method == CodeChallengeMethod::Plain && !config_->allowPlainPkce) {
            return invalidRequest("code_challenge_method plain is not allowed");
        }
        if (!codec::isValidPkceValue(pkce->challenge)) {
            return invalidRequest("code_challenge is malformed");
        }
    } else if (pkceRequired(client)) {
        return invalidRequest("code_challenge is required");
    }

    auto raw = codec::generateOpaqueToken(codec::kTokenBytes);
    if (!raw) {
        LogContext ctx;
        ctx.clientId = client.id;
        return AuthResult<std::string>::err(
            detail::internalError(raw.error(), "generate authorization code", std::move(ctx)));
    }

    const auto now = clock_->now();
    AuthorizationCodeRecord record;
    record.codeHash = codec::hashToken(raw.value());
    record.clientId = client.id;
    record.subject = std::string(subject);
    record.redirectUri = std::string(redirectUri);
    record.scopes = std::move(granted).value();
    record.pkce = pkce;
    record.createdAt = now;
    record.expiresAt = now + config_->authCodeLifetime;

    LogContext ctx = codeContext(client.id, record.codeHash);
    ctx.subject = record.subject;

    auto stored = codes_->insert(std::move(record));
    if (!stored) {
        return AuthResult<std::string>::err(
            detail::internalError(stored.error(), "store authorization code", std::move(ctx)));
    }

    OCS_LOG_CTX(LogLevel::Debug, LogCategory::Grant, "authorization code issued", ctx);
    return AuthResult<std::string>::ok(std::move(raw).value());
}

// ============================================================================
// Exchange
// ============================================================================

AuthResult<TokenResponse> AuthorizationCodeService::exchange(
    const Client& client,
    std::string_view code,
    std::string_view redirectUri,
    const std::optional<std::string>& codeVerifier) const {
    if (code.empty()) {
        return AuthResult<TokenResponse>::err(
            AuthError(ErrorCode::InvalidRequest, "code is required"));
    }

    const std::string codeHash = codec::hashToken(code);
    LogContext ctx = codeContext(client.id, codeHash);

    auto found = codes_->findByHash(codeHash);
    if (!found) {
        return AuthResult<TokenResponse>::err(
            detail::internalError(found.error(), "look up authorization code", ctx));
    }
    if (!found.value()) {
        return invalidGrant("authorization code is invalid");
    }
    const AuthorizationCodeRecord& record = *found.value();
    ctx.subject = record.subject;

    if (record.consumed) {
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit, "authorization code replay", ctx);
        return invalidGrant("authorization code is invalid");
    }
    if (clock_->now() >= record.expiresAt) {
        return invalidGrant("authorization code has expired");
    }
    if (!codec::constantTimeEqual(record.clientId, client.id)) {
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit,
                    "authorization code presented by another client", ctx);
        return invalidGrant("authorization code is invalid");
    }
    if (record.redirectUri != redirectUri) {
        return invalidGrant("redirect_uri does not match the authorization request");
    }

    if (record.pkce) {
        if (!codeVerifier) {
            return AuthResult<TokenResponse>::err(
                AuthError(ErrorCode::InvalidRequest, "code_verifier is required"));
        }
        if (!codec::verifyPkce(*record.pkce, *codeVerifier)) {
            OCS_LOG_CTX(LogLevel::Info, LogCategory::Grant, "PKCE verification failed", ctx);
            return invalidGrant("code_verifier does not match the code_challenge");
        }
    } else if (codeVerifier) {
        return invalidGrant("code_verifier supplied but no code_challenge was bound");
    }

    auto consumed = codes_->markConsumed(codeHash);
    if (!consumed) {
        return AuthResult<TokenResponse>::err(
            detail::internalError(consumed.error(), "consume authorization code", ctx));
    }
    if (!consumed.value()) {
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit,
                    "authorization code redeemed concurrently", ctx);
        return invalidGrant("authorization code is invalid");
    }

    auto tokens = issuer_->issueTokenPair(record.subject, client, record.scopes,
                                          client.allowsGrant(GrantType::RefreshToken));
    if (!tokens) {
        return tokens;
    }
    OCS_LOG_CTX(LogLevel::Info, LogCategory::Grant, "authorization code exchanged", ctx);
    return tokens;
}

}  // namespace ocs::service
