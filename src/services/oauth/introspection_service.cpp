/// @file introspection_service.cpp
/// @brief IntrospectionService implementation.

#include "ocs/service/introspection_service.hpp"

#include <array>

#include "ocs/foundation/server_logger.hpp"
#include "ocs/service/scope_manager.hpp"
#include "ocs/service/token_codec.hpp"

#include "oauth_errors.hpp"

namespace ocs::service {

using ocs::foundation::AuthResult;
using ocs::foundation::ErrorCode;
using ocs::foundation::LogCategory;
using ocs::foundation::LogContext;
using ocs::foundation::LogLevel;
using ocs::foundation::toEpochSeconds;

namespace {

constexpr std::string_view kRefreshTokenType = "refresh_token";
constexpr std::string_view kPersonalTokenType = "personal_access_token";

enum class TokenKind { Access, Refresh, Personal };

/// Lookup order, hinted kind first.
std::array<TokenKind, 3> lookupOrder(std::optional<TokenTypeHint> hint) {
    if (hint == TokenTypeHint::RefreshToken) {
        return {TokenKind::Refresh, TokenKind::Access, TokenKind::Personal};
    }
    return {TokenKind::Access, TokenKind::Refresh, TokenKind::Personal};
}

}  // namespace

IntrospectionService::IntrospectionService(
    std::shared_ptr<const OAuthConfig> config,
    std::shared_ptr<const TokenIssuer> issuer,
    std::shared_ptr<IAccessTokenStore> accessTokens,
    std::shared_ptr<IRefreshTokenStore> refreshTokens,
    std::shared_ptr<IPersonalAccessTokenStore> personalTokens,
    std::shared_ptr<foundation::IClock> clock)
    : config_(std::move(config)),
      issuer_(std::move(issuer)),
      accessTokens_(std::move(accessTokens)),
      refreshTokens_(std::move(refreshTokens)),
      personalTokens_(std::move(personalTokens)),
      clock_(std::move(clock)) {}

// ============================================================================
// Introspection
// ============================================================================

AuthResult<IntrospectionResult> IntrospectionService::introspect(
    std::string_view token, std::optional<TokenTypeHint> hint) const {
    if (token.empty()) {
        return AuthResult<IntrospectionResult>::ok(IntrospectionResult::inactive());
    }

    const std::string tokenHash = codec::hashToken(token);
    for (auto kind : lookupOrder(hint)) {
        Lookup found = Lookup::ok(std::nullopt);
        switch (kind) {
            case TokenKind::Access:   found = introspectAccessToken(token); break;
            case TokenKind::Refresh:  found = introspectRefreshToken(tokenHash); break;
            case TokenKind::Personal: found = introspectPersonalToken(tokenHash); break;
        }
        if (!found) {
            return AuthResult<IntrospectionResult>::err(std::move(found).error());
        }
        if (found.value()) {
            return AuthResult<IntrospectionResult>::ok(std::move(*found.value()));
        }
    }
    return AuthResult<IntrospectionResult>::ok(IntrospectionResult::inactive());
}

IntrospectionService::Lookup IntrospectionService::introspectAccessToken(
    std::string_view token) const {
    auto claims = issuer_->validateAccessToken(token);
    if (!claims) {
        if (claims.error().code() == ErrorCode::InvalidToken) {
            return Lookup::ok(std::nullopt);
        }
        return Lookup::err(std::move(claims).error());
    }

    const auto& c = claims.value();
    IntrospectionResult result;
    result.active = true;
    result.scope = ScopeManager::join(c.scopes);
    result.clientId = c.clientId;
    result.username = c.subject;
    result.tokenType = c.tokenType;
    result.exp = toEpochSeconds(c.expiresAt);
    result.iat = toEpochSeconds(c.issuedAt);
    result.nbf = toEpochSeconds(c.notBefore);
    result.sub = c.subject;
    result.iss = c.issuer;
    result.jti = c.jti;
    return Lookup::ok(std::move(result));
}

IntrospectionService::Lookup IntrospectionService::introspectRefreshToken(
    std::string_view tokenHash) const {
    auto found = refreshTokens_->findByHash(tokenHash);
    if (!found) {
        return Lookup::err(detail::internalError(found.error(), "look up refresh token"));
    }
    if (!found.value()) {
        return Lookup::ok(std::nullopt);
    }
    const auto& record = *found.value();
    if (record.revoked || clock_->now() >= record.expiresAt) {
        return Lookup::ok(std::nullopt);
    }

    IntrospectionResult result;
    result.active = true;
    result.scope = ScopeManager::join(record.scopes);
    result.clientId = record.clientId;
    result.username = record.subject;
    result.tokenType = std::string(kRefreshTokenType);
    result.exp = toEpochSeconds(record.expiresAt);
    result.iat = toEpochSeconds(record.issuedAt);
    result.nbf = result.iat;
    result.sub = record.subject;
    result.iss = config_->issuer;
    return Lookup::ok(std::move(result));
}

IntrospectionService::Lookup IntrospectionService::introspectPersonalToken(
    std::string_view tokenHash) const {
    auto found = personalTokens_->findByHash(tokenHash);
    if (!found) {
        return Lookup::err(detail::internalError(found.error(), "look up personal access token"));
    }
    if (!found.value()) {
        return Lookup::ok(std::nullopt);
    }
    const auto& record = *found.value();
    if (record.revoked || (record.expiresAt && clock_->now() >= *record.expiresAt)) {
        return Lookup::ok(std::nullopt);
    }

    IntrospectionResult result;
    result.active = true;
    result.scope = ScopeManager::join(record.scopes);
    result.username = record.userId;
    result.tokenType = std::string(kPersonalTokenType);
    if (record.expiresAt) {
        result.exp = toEpochSeconds(*record.expiresAt);
    }
    result.iat = toEpochSeconds(record.createdAt);
    result.nbf = result.iat;
    result.sub = record.userId;
    result.iss = config_->issuer;
    result.jti = record.id;
    return Lookup::ok(std::move(result));
}

// ============================================================================
// Revocation
// ============================================================================

AuthResult<void> IntrospectionService::revoke(const Client& client,
                                              std::string_view token,
                                              std::optional<TokenTypeHint> hint) const {
    if (token.empty()) {
        return AuthResult<void>::err(
            foundation::AuthError(ErrorCode::InvalidRequest, "token is required"));
    }

    const std::string tokenHash = codec::hashToken(token);
    for (auto kind : lookupOrder(hint)) {
        Revocation handled = Revocation::ok(false);
        switch (kind) {
            case TokenKind::Access:   handled = revokeAccessToken(client, token); break;
            case TokenKind::Refresh:  handled = revokeRefreshToken(client, tokenHash); break;
            case TokenKind::Personal: break;  // Revoked by their owner only.
        }
        if (!handled) {
            return AuthResult<void>::err(std::move(handled).error());
        }
        if (handled.value()) {
            break;
        }
    }
    return AuthResult<void>::ok();
}

IntrospectionService::Revocation IntrospectionService::revokeAccessToken(
    const Client& client, std::string_view token) const {
    // Signature only: an expired token may still be revoked.
    auto claims = issuer_->signer().verify(token);
    if (!claims) {
        return Revocation::ok(false);
    }

    LogContext ctx;
    ctx.clientId = client.id;
    ctx.tokenId = claims.value().jti;

    auto found = accessTokens_->findByJti(claims.value().jti);
    if (!found) {
        return Revocation::err(detail::internalError(found.error(), "look up access token", ctx));
    }
    if (!found.value()) {
        return Revocation::ok(false);
    }
    if (!codec::constantTimeEqual(found.value()->clientId, client.id)) {
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit,
                    "revocation of a foreign access token ignored", ctx);
        return Revocation::ok(true);
    }

    auto revoked = accessTokens_->revokeIfActive(claims.value().jti);
    if (!revoked) {
        return Revocation::err(detail::internalError(revoked.error(), "revoke access token", ctx));
    }
    if (revoked.value()) {
        OCS_LOG_CTX(LogLevel::Info, LogCategory::Audit, "access token revoked", ctx);
    }
    return Revocation::ok(true);
}

IntrospectionService::Revocation IntrospectionService::revokeRefreshToken(
    const Client& client, std::string_view tokenHash) const {
    LogContext ctx;
    ctx.clientId = client.id;
    ctx.tokenId = std::string(tokenHash.substr(0, 12));

    auto found = refreshTokens_->findByHash(tokenHash);
    if (!found) {
        return Revocation::err(detail::internalError(found.error(), "look up refresh token", ctx));
    }
    if (!found.value()) {
        return Revocation::ok(false);
    }
    if (!codec::constantTimeEqual(found.value()->clientId, client.id)) {
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit,
                    "revocation of a foreign refresh token ignored", ctx);
        return Revocation::ok(true);
    }

    auto revoked = refreshTokens_->revokeIfActive(tokenHash);
    if (!revoked) {
        return Revocation::err(detail::internalError(revoked.error(), "revoke refresh token", ctx));
    }
    if (revoked.value()) {
        OCS_LOG_CTX(LogLevel::Info, LogCategory::Audit, "refresh token revoked", ctx);
    }

    if (config_->revokeAccessTokensOnRefreshRevocation) {
        auto cascaded = accessTokens_->revokeByRefreshHash(tokenHash);
        if (!cascaded) {
            return Revocation::err(
                detail::internalError(cascaded.error(), "revoke access tokens of refresh token", ctx));
        }
        if (cascaded.value() > 0) {
            ctx.extra["access_tokens"] = std::to_string(cascaded.value());
            OCS_LOG_CTX(LogLevel::Info, LogCategory::Audit,
                        "access tokens revoked with their refresh token", ctx);
        }
    }
    return Revocation::ok(true);
}

}  // namespace ocs::service
