/// @file oauth_config.cpp
/// @brief OAuthConfig validation and YAML loading.

#include "ocs/service/oauth_config.hpp"

#include "ocs/foundation/server_logger.hpp"

#include <cstdint>

namespace ocs::service {

using ocs::foundation::AuthError;
using ocs::foundation::AuthResult;
using ocs::foundation::ConfigManager;
using ocs::foundation::ErrorCode;
using ocs::foundation::LogCategory;

namespace {

/// Copy an optional key into @p out; a missing key keeps the default.
template <typename T>
AuthResult<void> readKey(const ConfigManager& config, const std::string& key, T& out) {
    if (!config.hasKey(key)) {
        return AuthResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return AuthResult<void>::err(std::move(value).error());
    }
    out = std::move(value).value();
    return AuthResult<void>::ok();
}

AuthResult<void> readSeconds(const ConfigManager& config, const std::string& key,
                             std::chrono::seconds& out) {
    int64_t secs = out.count();
    auto r = readKey(config, key, secs);
    if (!r) {
        return r;
    }
    out = std::chrono::seconds(secs);
    return AuthResult<void>::ok();
}

AuthResult<void> invalid(std::string message) {
    return AuthResult<void>::err(AuthError(ErrorCode::InvalidArgument, std::move(message)));
}

}  // namespace

AuthResult<void> validateOAuthConfig(const OAuthConfig& config) {
    if (config.issuer.empty()) {
        return invalid("issuer must not be empty");
    }
    if (config.jwtAlgorithm == JwtAlgorithm::HS256) {
        if (config.signingKey.size() < kMinHs256KeyBytes) {
            return invalid("HS256 signing key must be at least 32 bytes");
        }
    } else if (config.rsaPrivateKeyPem.empty() || config.rsaPublicKeyPem.empty()) {
        return invalid("RS256 requires both a private and a public key");
    }
    if (config.accessTokenLifetime.count() <= 0 || config.refreshTokenLifetime.count() <= 0 ||
        config.authCodeLifetime.count() <= 0) {
        return invalid("token lifetimes must be positive");
    }
    if (config.personalAccessTokenLifetime.count() < 0) {
        return invalid("personal access token lifetime must not be negative");
    }
    if (!SecretHasher::isSupported(config.secretHashCost)) {
        return invalid(
            "scrypt cost must have N a power of two up to 2^20, r in 1..32 and p in 1..16");
    }
    return AuthResult<void>::ok();
}

AuthResult<OAuthConfig> loadOAuthConfig(const ConfigManager& config) {
    OAuthConfig out;
    std::string algorithm(jwtAlgorithmName(out.jwtAlgorithm));
    uint64_t scryptN = out.secretHashCost.n;
    uint32_t scryptR = out.secretHashCost.r;
    uint32_t scryptP = out.secretHashCost.p;

    for (auto result : {
             readKey(config, "oauth.issuer", out.issuer),
             readKey(config, "oauth.jwt_algorithm", algorithm),
             readKey(config, "oauth.signing_key", out.signingKey),
             readKey(config, "oauth.rsa_private_key_pem", out.rsaPrivateKeyPem),
             readKey(config, "oauth.rsa_public_key_pem", out.rsaPublicKeyPem),
             readSeconds(config, "oauth.access_token_lifetime", out.accessTokenLifetime),
             readSeconds(config, "oauth.refresh_token_lifetime", out.refreshTokenLifetime),
             readSeconds(config, "oauth.auth_code_lifetime", out.authCodeLifetime),
             readSeconds(config, "oauth.personal_access_token_lifetime",
                         out.personalAccessTokenLifetime),
             readKey(config, "oauth.require_pkce_for_public_clients",
                     out.requirePkceForPublicClients),
             readKey(config, "oauth.require_pkce_for_confidential_clients",
                     out.requirePkceForConfidentialClients),
             readKey(config, "oauth.allow_plain_pkce", out.allowPlainPkce),
             readKey(config, "oauth.revoke_access_tokens_on_refresh_revocation",
                     out.revokeAccessTokensOnRefreshRevocation),
             readKey(config, "oauth.scrypt.n", scryptN),
             readKey(config, "oauth.scrypt.r", scryptR),
             readKey(config, "oauth.scrypt.p", scryptP),
         }) {
        if (!result) {
            return AuthResult<OAuthConfig>::err(result.error());
        }
    }

    if (algorithm == "HS256") {
        out.jwtAlgorithm = JwtAlgorithm::HS256;
    } else if (algorithm == "RS256") {
        out.jwtAlgorithm = JwtAlgorithm::RS256;
    } else {
        return AuthResult<OAuthConfig>::err(
            AuthError(ErrorCode::InvalidArgument, "unsupported jwt_algorithm: " + algorithm));
    }
    out.secretHashCost = ScryptParams{scryptN, scryptR, scryptP};

    if (!out.requirePkceForPublicClients) {
        OCS_LOG_WARN(LogCategory::Config,
                     "require_pkce_for_public_clients=false ignored; public clients always use PKCE");
        out.requirePkceForPublicClients = true;
    }

    auto valid = validateOAuthConfig(out);
    if (!valid) {
        return AuthResult<OAuthConfig>::err(valid.error());
    }
    return AuthResult<OAuthConfig>::ok(std::move(out));
}

}  // namespace ocs::service
