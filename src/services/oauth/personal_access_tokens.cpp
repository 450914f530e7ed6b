/// @file personal_access_tokens.cpp
/// @brief PersonalAccessTokenService implementation.

#include "ocs/service/personal_access_tokens.hpp"

#include "ocs/foundation/server_logger.hpp"
#include "ocs/service/input_validator.hpp"
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

AuthResult<PersonalAccessTokenRecord> invalidToken() {
    return AuthResult<PersonalAccessTokenRecord>::err(
        AuthError(ErrorCode::InvalidToken, "personal access token is invalid"));
}

LogContext tokenContext(std::string_view userId, std::string_view tokenId) {
    LogContext ctx;
    ctx.subject = std::string(userId);
    ctx.tokenId = std::string(tokenId);
    return ctx;
}

}  // namespace

PersonalAccessTokenService::PersonalAccessTokenService(
    std::shared_ptr<const OAuthConfig> config,
    std::shared_ptr<IPersonalAccessTokenStore> store,
    std::shared_ptr<const ScopeManager> scopes,
    std::shared_ptr<foundation::IClock> clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      scopes_(std::move(scopes)),
      clock_(std::move(clock)) {}

AuthResult<CreatedPersonalAccessToken> PersonalAccessTokenService::create(
    std::string_view userId,
    std::string_view name,
    const ScopeList& scopes,
    std::optional<std::chrono::seconds> lifetime) const {
    using Created = AuthResult<CreatedPersonalAccessToken>;

    if (userId.empty()) {
        return Created::err(AuthError(ErrorCode::InvalidRequest, "user id is required"));
    }
    if (auto v = InputValidator::validateName(name, "token name"); !v) {
        return Created::err(AuthError(ErrorCode::InvalidRequest, v.message));
    }
    const auto ttl = lifetime.value_or(config_->personalAccessTokenLifetime);
    if (ttl.count() < 0) {
        return Created::err(AuthError(ErrorCode::InvalidRequest, "lifetime must not be negative"));
    }

    auto granted = scopes_->validate(scopes, {std::string(kWildcardScope)});
    if (!granted) {
        return Created::err(std::move(granted).error());
    }

    auto id = codec::generateUuid();
    if (!id) {
        return Created::err(detail::internalError(id.error(), "generate token id"));
    }
    auto raw = codec::generateOpaqueToken(codec::kTokenBytes);
    if (!raw) {
        return Created::err(detail::internalError(raw.error(), "generate personal access token"));
    }

    PersonalAccessTokenRecord record;
    record.id = std::move(id).value();
    record.tokenHash = codec::hashToken(raw.value());
    record.userId = std::string(userId);
    record.name = std::string(name);
    record.scopes = std::move(granted).value();
    record.createdAt = clock_->now();
    if (ttl.count() > 0) {
        record.expiresAt = record.createdAt + ttl;
    }

    LogContext ctx = tokenContext(userId, record.id);
    auto stored = store_->insert(record);
    if (!stored) {
        return Created::err(
            detail::internalError(stored.error(), "store personal access token", std::move(ctx)));
    }
    OCS_LOG_CTX(LogLevel::Info, LogCategory::Token, "personal access token created", ctx);

    record.tokenHash.clear();
    return Created::ok(CreatedPersonalAccessToken{std::move(raw).value(), std::move(record)});
}

AuthResult<PersonalAccessTokenRecord> PersonalAccessTokenService::authenticate(
    std::string_view token) const {
    if (token.empty()) {
        return invalidToken();
    }
    auto found = store_->findByHash(codec::hashToken(token));
    if (!found) {
        return AuthResult<PersonalAccessTokenRecord>::err(
            detail::internalError(found.error(), "look up personal access token"));
    }
    if (!found.value()) {
        return invalidToken();
    }

    PersonalAccessTokenRecord record = std::move(*found.value());
    const auto now = clock_->now();
    if (record.revoked || (record.expiresAt && now >= *record.expiresAt)) {
        return invalidToken();
    }

    auto touched = store_->touch(record.id, now);
    if (!touched) {
        // Usage tracking is best effort; the token itself is valid.
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Storage,
                    "failed to record personal access token use",
                    tokenContext(record.userId, record.id));
    } else {
        record.lastUsedAt = now;
    }
    record.tokenHash.clear();
    return AuthResult<PersonalAccessTokenRecord>::ok(std::move(record));
}

AuthResult<std::vector<PersonalAccessTokenRecord>> PersonalAccessTokenService::listForUser(
    std::string_view userId) const {
    auto records = store_->listByUser(userId);
    if (!records) {
        return AuthResult<std::vector<PersonalAccessTokenRecord>>::err(
            detail::internalError(records.error(), "list personal access tokens"));
    }
    auto out = std::move(records).value();
    for (auto& record : out) {
        record.tokenHash.clear();
    }
    return AuthResult<std::vector<PersonalAccessTokenRecord>>::ok(std::move(out));
}

AuthResult<void> PersonalAccessTokenService::revoke(std::string_view userId,
                                                    std::string_view tokenId) const {
    LogContext ctx = tokenContext(userId, tokenId);

    auto found = store_->findById(tokenId);
    if (!found) {
        return AuthResult<void>::err(
            detail::internalError(found.error(), "look up personal access token", ctx));
    }
    if (!found.value()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::NotFound, "personal access token not found"));
    }
    if (found.value()->userId != userId) {
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit,
                    "personal access token revocation by non-owner refused", ctx);
        return AuthResult<void>::err(
            AuthError(ErrorCode::AccessDenied, "personal access token belongs to another user"));
    }

    auto revoked = store_->revokeIfActive(tokenId);
    if (!revoked) {
        return AuthResult<void>::err(
            detail::internalError(revoked.error(), "revoke personal access token", ctx));
    }
    if (revoked.value()) {
        OCS_LOG_CTX(LogLevel::Info, LogCategory::Audit, "personal access token revoked", ctx);
    }
    return AuthResult<void>::ok();
}

}  // namespace ocs::service
