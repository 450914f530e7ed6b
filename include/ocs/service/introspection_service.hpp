#pragma once

/// @file introspection_service.hpp
/// @brief Token introspection (RFC 7662) and revocation (RFC 7009).

#include <memory>
#include <optional>
#include <string_view>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/clock.hpp"
#include "ocs/service/oauth_config.hpp"
#include "ocs/service/oauth_types.hpp"
#include "ocs/service/storage.hpp"
#include "ocs/service/token_issuer.hpp"

namespace ocs::service {

/// Reports token state and revokes tokens.
///
/// Introspection understands signed access tokens, refresh tokens and
/// personal access tokens. Every token that is not currently usable
/// (unknown, malformed, expired, revoked) yields the same
/// IntrospectionResult::inactive().
///
/// Revocation of a refresh token leaves the access tokens minted alongside
/// it untouched unless OAuthConfig::revokeAccessTokensOnRefreshRevocation
/// is set. Revoking an access token never touches its refresh token.
class IntrospectionService {
public:
    IntrospectionService(std::shared_ptr<const OAuthConfig> config,
                         std::shared_ptr<const TokenIssuer> issuer,
                         std::shared_ptr<IAccessTokenStore> accessTokens,
                         std::shared_ptr<IRefreshTokenStore> refreshTokens,
                         std::shared_ptr<IPersonalAccessTokenStore> personalTokens,
                         std::shared_ptr<foundation::IClock> clock);

    /// @param hint Which lookup to try first; all kinds are tried regardless.
    /// @return ServerError only if storage failed.
    [[nodiscard]] foundation::AuthResult<IntrospectionResult> introspect(
        std::string_view token, std::optional<TokenTypeHint> hint = std::nullopt) const;

    /// Revoke a token owned by @p client.
    ///
    /// Unknown, already revoked and foreign tokens all succeed without
    /// effect, so the response reveals nothing about the token.
    [[nodiscard]] foundation::AuthResult<void> revoke(
        const Client& client,
        std::string_view token,
        std::optional<TokenTypeHint> hint = std::nullopt) const;

private:
    using Lookup = foundation::AuthResult<std::optional<IntrospectionResult>>;
    using Revocation = foundation::AuthResult<bool>;

    Lookup introspectAccessToken(std::string_view token) const;
    Lookup introspectRefreshToken(std::string_view tokenHash) const;
    Lookup introspectPersonalToken(std::string_view tokenHash) const;

    Revocation revokeAccessToken(const Client& client, std::string_view token) const;
    Revocation revokeRefreshToken(const Client& client, std::string_view tokenHash) const;

    std::shared_ptr<const OAuthConfig> config_;
    std::shared_ptr<const TokenIssuer> issuer_;
    std::shared_ptr<IAccessTokenStore> accessTokens_;
    std::shared_ptr<IRefreshTokenStore> refreshTokens_;
    std::shared_ptr<IPersonalAccessTokenStore> personalTokens_;
    std::shared_ptr<foundation::IClock> clock_;
};

} // namespace ocs::service
