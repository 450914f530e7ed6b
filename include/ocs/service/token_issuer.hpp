#pragma once

/// @file token_issuer.hpp
/// @brief Mints access/refresh token pairs and validates bearer tokens.

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/clock.hpp"
#include "ocs/service/oauth_config.hpp"
#include "ocs/service/oauth_types.hpp"
#include "ocs/service/storage.hpp"
#include "ocs/service/token_signer.hpp"

namespace ocs::service {

/// A signed access token with the claims it carries.
struct IssuedAccessToken {
    std::string token;
    AccessTokenClaims claims;
};

/// A raw refresh token and the record persisted for it.
struct IssuedRefreshToken {
    std::string token;
    RefreshTokenRecord record;
};

/// Mints signed access tokens and opaque refresh tokens.
///
/// Every access token gets a random `jti` and an AccessTokenRecord so that
/// it can be revoked and introspected. Refresh tokens are 256-bit random
/// values of which only the SHA-256 hash is stored. All timestamps come
/// from the injected clock.
class TokenIssuer {
public:
    TokenIssuer(std::shared_ptr<const OAuthConfig> config,
                TokenSigner signer,
                std::shared_ptr<IAccessTokenStore> accessTokens,
                std::shared_ptr<IRefreshTokenStore> refreshTokens,
                std::shared_ptr<foundation::IClock> clock);

    /// Sign and record an access token for @p client. @p subject is absent
    /// for client_credentials.
    [[nodiscard]] foundation::AuthResult<IssuedAccessToken> issueAccessToken(
        const std::optional<std::string>& subject,
        const Client& client,
        const ScopeList& scopes,
        std::optional<std::string> refreshTokenHash = std::nullopt) const;

    /// Generate and persist a refresh token linked to @p accessTokenId.
    [[nodiscard]] foundation::AuthResult<IssuedRefreshToken> issueRefreshToken(
        const std::optional<std::string>& subject,
        const Client& client,
        const ScopeList& scopes,
        std::string_view accessTokenId) const;

    /// Mint an access token, plus a linked refresh token when
    /// @p withRefreshToken is set, and build the token endpoint response.
    [[nodiscard]] foundation::AuthResult<TokenResponse> issueTokenPair(
        const std::optional<std::string>& subject,
        const Client& client,
        const ScopeList& scopes,
        bool withRefreshToken) const;

    /// Full bearer validation: signature, issuer, token_type, not-before,
    /// expiry and the server-side revoked flag.
    /// @return Claims, InvalidToken, or ServerError if storage failed.
    [[nodiscard]] foundation::AuthResult<AccessTokenClaims> validateAccessToken(
        std::string_view token) const;

    [[nodiscard]] const TokenSigner& signer() const noexcept { return signer_; }

private:
    foundation::AuthResult<void> persistRefreshToken(const RefreshTokenRecord& record) const;

    std::shared_ptr<const OAuthConfig> config_;
    TokenSigner signer_;
    std::shared_ptr<IAccessTokenStore> accessTokens_;
    std::shared_ptr<IRefreshTokenStore> refreshTokens_;
    std::shared_ptr<foundation::IClock> clock_;
};

} // namespace ocs::service
