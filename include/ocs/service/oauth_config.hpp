#pragma once

/// @file oauth_config.hpp
/// @brief Immutable authorization server configuration and its YAML loader.

#include <chrono>
#include <string>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/config_manager.hpp"
#include "ocs/service/oauth_types.hpp"
#include "ocs/service/secret_hasher.hpp"

namespace ocs::service {

/// Minimum HS256 key length in bytes.
inline constexpr std::size_t kMinHs256KeyBytes = 32;

/// Authorization server configuration.
///
/// Built once at startup and passed by value into the AuthorizationServer,
/// after which it is read-only and shared across threads without locking.
struct OAuthConfig {
    std::string issuer = "ocs";

    JwtAlgorithm jwtAlgorithm = JwtAlgorithm::HS256;
    std::string signingKey;        ///< HS256 shared secret.
    std::string rsaPrivateKeyPem;  ///< RS256 signing key.
    std::string rsaPublicKeyPem;   ///< RS256 verification key.

    std::chrono::seconds accessTokenLifetime{3600};
    std::chrono::seconds refreshTokenLifetime{2592000};
    std::chrono::seconds authCodeLifetime{600};

    /// Zero means personal access tokens never expire.
    std::chrono::seconds personalAccessTokenLifetime{0};

    /// Always enforced for public clients; the flag cannot relax it.
    bool requirePkceForPublicClients = true;
    bool requirePkceForConfidentialClients = false;
    bool allowPlainPkce = true;

    /// Revoking a refresh token also revokes the access tokens minted from it.
    bool revokeAccessTokensOnRefreshRevocation = false;

    ScryptParams secretHashCost;
};

/// Check cross-field constraints: key material for the chosen algorithm,
/// HS256 key length, positive lifetimes and a valid scrypt cost.
[[nodiscard]] foundation::AuthResult<void> validateOAuthConfig(const OAuthConfig& config);

/// Read `oauth.*` keys over the defaults, then validate.
///
/// Recognised keys: issuer, jwt_algorithm, signing_key, rsa_private_key_pem,
/// rsa_public_key_pem, access_token_lifetime, refresh_token_lifetime,
/// auth_code_lifetime, personal_access_token_lifetime,
/// require_pkce_for_public_clients, require_pkce_for_confidential_clients,
/// allow_plain_pkce, revoke_access_tokens_on_refresh_revocation,
/// scrypt.n, scrypt.r, scrypt.p.
[[nodiscard]] foundation::AuthResult<OAuthConfig> loadOAuthConfig(
    const foundation::ConfigManager& config);

} // namespace ocs::service
