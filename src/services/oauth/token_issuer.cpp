/// @file token_issuer.cpp
/// @brief TokenIssuer implementation.

#include "ocs/service/token_issuer.hpp"

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

AuthResult<AccessTokenClaims> invalidToken(std::string message) {
    return AuthResult<AccessTokenClaims>::err(
        AuthError(ErrorCode::InvalidToken, std::move(message)));
}

LogContext clientContext(const Client& client) {
    LogContext ctx;
    ctx.clientId = client.id;
    return ctx;
}

}  // namespace

TokenIssuer::TokenIssuer(std::shared_ptr<const OAuthConfig> config,
                         TokenSigner signer,
                         std::shared_ptr<IAccessTokenStore> accessTokens,
                         std::shared_ptr<IRefreshTokenStore> refreshTokens,
                         std::shared_ptr<foundation::IClock> clock)
    : config_(std::move(config)),
      signer_(std::move(signer)),
      accessTokens_(std::move(accessTokens)),
      refreshTokens_(std::move(refreshTokens)),
      clock_(std::move(clock)) {}

AuthResult<IssuedAccessToken> TokenIssuer::issueAccessToken(
    const std::optional<std::string>& subject,
    const Client& client,
    const ScopeList& scopes,
    std::optional<std::string> refreshTokenHash) const {
    auto jti = codec::generateOpaqueToken(16);
    if (!jti) {
        return AuthResult<IssuedAccessToken>::err(
            detail::internalError(jti.error(), "generate jti", clientContext(client)));
    }

    const auto now = clock_->now();
    AccessTokenClaims claims;
    claims.issuer = config_->issuer;
    claims.subject = subject;
    claims.clientId = client.id;
    claims.scopes = scopes;
    claims.jti = std::move(jti).value();
    claims.issuedAt = now;
    claims.notBefore = now;
    claims.expiresAt = now + config_->accessTokenLifetime;

    auto signedToken = signer_.sign(claims);
    if (!signedToken) {
        return AuthResult<IssuedAccessToken>::err(
            detail::internalError(signedToken.error(), "sign access token", clientContext(client)));
    }

    AccessTokenRecord record;
    record.jti = claims.jti;
    record.clientId = client.id;
    record.subject = subject;
    record.scopes = scopes;
    record.issuedAt = claims.issuedAt;
    record.expiresAt = claims.expiresAt;
    record.refreshTokenHash = std::move(refreshTokenHash);

    auto stored = accessTokens_->insert(std::move(record));
    if (!stored) {
        return AuthResult<IssuedAccessToken>::err(
            detail::internalError(stored.error(), "store access token", clientContext(client)));
    }

    return AuthResult<IssuedAccessToken>::ok(
        IssuedAccessToken{std::move(signedToken).value(), std::move(claims)});
}

AuthResult<IssuedRefreshToken> TokenIssuer::issueRefreshToken(
    const std::optional<std::string>& subject,
    const Client& client,
    const ScopeList& scopes,
    std::string_view accessTokenId) const {
    auto raw = codec::generateOpaqueToken(codec::kTokenBytes);
    if (!raw) {
        return AuthResult<IssuedRefreshToken>::err(
            detail::internalError(raw.error(), "generate refresh token", clientContext(client)));
    }

    const auto now = clock_->now();
    RefreshTokenRecord record;
    record.tokenHash = codec::hashToken(raw.value());
    record.clientId = client.id;
    record.subject = subject;
    record.scopes = scopes;
    record.accessTokenId = std::string(accessTokenId);
    record.issuedAt = now;
    record.expiresAt = now + config_->refreshTokenLifetime;

    auto stored = persistRefreshToken(record);
    if (!stored) {
        return AuthResult<IssuedRefreshToken>::err(std::move(stored).error());
    }
    return AuthResult<IssuedRefreshToken>::ok(
        IssuedRefreshToken{std::move(raw).value(), std::move(record)});
}

AuthResult<TokenResponse> TokenIssuer::issueTokenPair(
    const std::optional<std::string>& subject,
    const Client& client,
    const ScopeList& scopes,
    bool withRefreshToken) const {
    // The refresh value is drawn first so the access record can point at it.
    std::optional<std::string> rawRefresh;
    std::optional<std::string> refreshHash;
    if (withRefreshToken) {
        auto raw = codec::generateOpaqueToken(codec::kTokenBytes);
        if (!raw) {
            return AuthResult<TokenResponse>::err(
                detail::internalError(raw.error(), "generate refresh token", clientContext(client)));
        }
        refreshHash = codec::hashToken(raw.value());
        rawRefresh = std::move(raw).value();
    }

    auto access = issueAccessToken(subject, client, scopes, refreshHash);
    if (!access) {
        return AuthResult<TokenResponse>::err(std::move(access).error());
    }

    TokenResponse response;
    response.expiresIn = config_->accessTokenLifetime;
    response.scopes = scopes;

    if (withRefreshToken) {
        RefreshTokenRecord record;
        record.tokenHash = *refreshHash;
        record.clientId = client.id;
        record.subject = subject;
        record.scopes = scopes;
        record.accessTokenId = access.value().claims.jti;
        record.issuedAt = access.value().claims.issuedAt;
        record.expiresAt = record.issuedAt + config_->refreshTokenLifetime;

        auto stored = persistRefreshToken(record);
        if (!stored) {
            // Do not leave a usable access token behind a failed pair.
            auto rolledBack = accessTokens_->revokeIfActive(access.value().claims.jti);
            if (!rolledBack) {
                OCS_LOG_ERROR(LogCategory::Storage, "failed to revoke orphaned access token");
            }
            return AuthResult<TokenResponse>::err(std::move(stored).error());
        }
        response.refreshToken = std::move(rawRefresh);
    }

    LogContext ctx = clientContext(client);
    ctx.subject = subject;
    ctx.tokenId = access.value().claims.jti;
    OCS_LOG_CTX(LogLevel::Debug, LogCategory::Token, "issued access token", ctx);

    response.accessToken = std::move(access).value().token;
    return AuthResult<TokenResponse>::ok(std::move(response));
}

AuthResult<AccessTokenClaims> TokenIssuer::validateAccessToken(std::string_view token) const {
    auto verified = signer_.verify(token);
    if (!verified) {
        return verified;
    }
    auto claims = std::move(verified).value();

    if (claims.issuer != config_->issuer) {
        return invalidToken("issuer mismatch");
    }
    if (claims.tokenType != "Bearer") {
        return invalidToken("unexpected token type");
    }
    const auto now = clock_->now();
    if (now < claims.notBefore) {
        return invalidToken("access token not yet valid");
    }
    if (now >= claims.expiresAt) {
        return invalidToken("access token has expired");
    }

    auto record = accessTokens_->findByJti(claims.jti);
    if (!record) {
        LogContext ctx;
        ctx.tokenId = claims.jti;
        return AuthResult<AccessTokenClaims>::err(
            detail::internalError(record.error(), "look up access token", std::move(ctx)));
    }
    if (!record.value() || record.value()->revoked) {
        return invalidToken("access token has been revoked");
    }
    return AuthResult<AccessTokenClaims>::ok(std::move(claims));
}

AuthResult<void> TokenIssuer::persistRefreshToken(const RefreshTokenRecord& record) const {
    auto stored = refreshTokens_->insert(record);
    if (!stored) {
        LogContext ctx;
        ctx.clientId = record.clientId;
        return AuthResult<void>::err(
            detail::internalError(stored.error(), "store refresh token", std::move(ctx)));
    }
    return AuthResult<void>::ok();
}

}  // namespace ocs::service
