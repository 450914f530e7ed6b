/// @file refresh_rotation.cpp
/// @brief RefreshRotation implementation.

#include "ocs/service/refresh_rotation.hpp"

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

AuthResult<TokenResponse> invalidGrant(std::string message) {
    return AuthResult<TokenResponse>::err(AuthError(ErrorCode::InvalidGrant, std::move(message)));
}

}  // namespace

RefreshRotation::RefreshRotation(std::shared_ptr<IRefreshTokenStore> refreshTokens,
                                 std::shared_ptr<const ScopeManager> scopes,
                                 std::shared_ptr<const TokenIssuer> issuer,
                                 std::shared_ptr<foundation::IClock> clock)
    : refreshTokens_(std::move(refreshTokens)),
      scopes_(std::move(scopes)),
      issuer_(std::move(issuer)),
      clock_(std::move(clock)) {}

AuthResult<TokenResponse> RefreshRotation::refresh(
    const Client& client,
    std::string_view refreshToken,
    const std::optional<ScopeList>& requestedScopes) const {
    if (refreshToken.empty()) {
        return AuthResult<TokenResponse>::err(
            AuthError(ErrorCode::InvalidRequest, "refresh_token is required"));
    }

    const std::string tokenHash = codec::hashToken(refreshToken);
    LogContext ctx;
    ctx.clientId = client.id;
    ctx.tokenId = tokenHash.substr(0, 12);

    auto found = refreshTokens_->findByHash(tokenHash);
    if (!found) {
        return AuthResult<TokenResponse>::err(
            detail::internalError(found.error(), "look up refresh token", ctx));
    }
    if (!found.value()) {
        return invalidGrant("refresh token is invalid");
    }
    const RefreshTokenRecord& record = *found.value();
    ctx.subject = record.subject;

    if (record.revoked) {
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit, "refresh token replay", ctx);
        return invalidGrant("refresh token is invalid");
    }
    if (clock_->now() >= record.expiresAt) {
        return invalidGrant("refresh token has expired");
    }
    if (!codec::constantTimeEqual(record.clientId, client.id)) {
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit,
                    "refresh token presented by another client", ctx);
        return invalidGrant("refresh token is invalid");
    }

    ScopeList scopes = record.scopes;
    if (requestedScopes && !requestedScopes->empty()) {
        auto narrowed = scopes_->validate(*requestedScopes, record.scopes);
        if (!narrowed) {
            return AuthResult<TokenResponse>::err(AuthError(
                ErrorCode::InvalidScope, "requested scope exceeds the original grant"));
        }
        scopes = std::move(narrowed).value();
    }

    auto revoked = refreshTokens_->revokeIfActive(tokenHash);
    if (!revoked) {
        return AuthResult<TokenResponse>::err(
            detail::internalError(revoked.error(), "revoke refresh token", ctx));
    }
    if (!revoked.value()) {
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit,
                    "refresh token rotated concurrently", ctx);
        return invalidGrant("refresh token is invalid");
    }

    auto tokens = issuer_->issueTokenPair(record.subject, client, scopes, true);
    if (!tokens) {
        return tokens;
    }
    OCS_LOG_CTX(LogLevel::Info, LogCategory::Grant, "refresh token rotated", ctx);
    return tokens;
}

}  // namespace ocs::service
