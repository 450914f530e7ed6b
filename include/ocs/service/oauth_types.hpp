#pragma once

/// @file oauth_types.hpp
/// @brief Data model for clients, codes, tokens and endpoint payloads.
///
/// Records hold only hashes of opaque credentials. Raw authorization codes,
/// refresh tokens and personal access tokens exist in memory only long
/// enough to be handed back to the caller once.

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ocs/foundation/clock.hpp"

namespace ocs::service {

using ocs::foundation::Timestamp;

/// Ordered, duplicate-free list of scope identifiers.
using ScopeList = std::vector<std::string>;

// ============================================================================
// Enumerations
// ============================================================================

/// OAuth2 grant types supported by the token endpoint.
enum class GrantType : uint8_t {
    AuthorizationCode,
    ClientCredentials,
    Password,
    RefreshToken
};

/// Wire name of a grant type ("authorization_code", ...).
constexpr std::string_view grantTypeName(GrantType grant) {
    switch (grant) {
        case GrantType::AuthorizationCode: return "authorization_code";
        case GrantType::ClientCredentials: return "client_credentials";
        case GrantType::Password:          return "password";
        case GrantType::RefreshToken:      return "refresh_token";
    }
    return "unknown";
}

constexpr std::optional<GrantType> parseGrantType(std::string_view name) {
    if (name == "authorization_code") return GrantType::AuthorizationCode;
    if (name == "client_credentials") return GrantType::ClientCredentials;
    if (name == "password")           return GrantType::Password;
    if (name == "refresh_token")      return GrantType::RefreshToken;
    return std::nullopt;
}

/// PKCE transform applied to the code verifier (RFC 7636).
enum class CodeChallengeMethod : uint8_t {
    Plain,
    S256
};

constexpr std::string_view codeChallengeMethodName(CodeChallengeMethod method) {
    return method == CodeChallengeMethod::S256 ? "S256" : "plain";
}

constexpr std::optional<CodeChallengeMethod> parseCodeChallengeMethod(std::string_view name) {
    if (name == "S256")  return CodeChallengeMethod::S256;
    if (name == "plain") return CodeChallengeMethod::Plain;
    return std::nullopt;
}

/// JWT signing algorithm for access tokens.
enum class JwtAlgorithm : uint8_t {
    HS256,
    RS256
};

constexpr std::string_view jwtAlgorithmName(JwtAlgorithm alg) {
    return alg == JwtAlgorithm::RS256 ? "RS256" : "HS256";
}

// ============================================================================
// Clients
// ============================================================================

/// A registered OAuth2 client.
///
/// A public client never carries a secret hash. Clients are soft-revoked
/// and never deleted.
struct Client {
    std::string id;
    std::string name;
    std::optional<std::string> secretHash;
    std::vector<std::string> redirectUris;
    std::vector<GrantType> grantTypes;
    ScopeList scopes;
    bool confidential = true;
    bool revoked = false;
    Timestamp createdAt{};
    Timestamp updatedAt{};

    [[nodiscard]] bool isPublic() const noexcept { return !confidential; }

    [[nodiscard]] bool allowsGrant(GrantType grant) const {
        return std::find(grantTypes.begin(), grantTypes.end(), grant) != grantTypes.end();
    }

    /// Exact, case-sensitive match against the registered redirect URIs.
    [[nodiscard]] bool hasRedirectUri(std::string_view uri) const {
        return std::find(redirectUris.begin(), redirectUris.end(), uri) != redirectUris.end();
    }
};

/// Administrative registration request for a new client.
struct ClientRegistration {
    std::string name;
    std::vector<std::string> redirectUris;
    std::vector<GrantType> grantTypes{GrantType::AuthorizationCode, GrantType::RefreshToken};
    ScopeList scopes;
    bool confidential = true;

    /// Caller-chosen secret; a confidential client without one gets a
    /// generated secret.
    std::optional<std::string> secret;
};

/// Result of a registration or secret rotation.
///
/// `plainSecret` is the only time the secret is ever visible.
struct RegisteredClient {
    Client client;
    std::optional<std::string> plainSecret;
};

// ============================================================================
// Authorization codes
// ============================================================================

struct PkceChallenge {
    std::string challenge;
    CodeChallengeMethod method = CodeChallengeMethod::S256;
};

/// Persisted authorization code state (Issued -> Consumed | Expired).
struct AuthorizationCodeRecord {
    std::string codeHash;
    std::string clientId;
    std::string subject;
    std::string redirectUri;
    ScopeList scopes;
    std::optional<PkceChallenge> pkce;
    Timestamp createdAt{};
    Timestamp expiresAt{};
    bool consumed = false;
};

// ============================================================================
// Tokens
// ============================================================================

/// Claims carried inside a signed access token.
struct AccessTokenClaims {
    std::string issuer;
    std::optional<std::string> subject;  ///< Absent for client_credentials.
    std::string clientId;
    ScopeList scopes;
    std::string jti;
    std::string tokenType = "Bearer";
    Timestamp issuedAt{};
    Timestamp notBefore{};
    Timestamp expiresAt{};
};

/// Server-side record of a minted access token, keyed by jti.
struct AccessTokenRecord {
    std::string jti;
    std::string clientId;
    std::optional<std::string> subject;
    ScopeList scopes;
    Timestamp issuedAt{};
    Timestamp expiresAt{};
    bool revoked = false;

    /// Hash of the refresh token issued alongside this token, if any.
    std::optional<std::string> refreshTokenHash;
};

struct RefreshTokenRecord {
    std::string tokenHash;
    std::string clientId;
    std::optional<std::string> subject;
    ScopeList scopes;
    std::string accessTokenId;  ///< jti of the access token issued alongside.
    Timestamp issuedAt{};
    Timestamp expiresAt{};
    bool revoked = false;
};

/// User-created long-lived token outside the grant state machine.
struct PersonalAccessTokenRecord {
    std::string id;
    std::string tokenHash;
    std::string userId;
    std::string name;
    ScopeList scopes;
    Timestamp createdAt{};
    std::optional<Timestamp> expiresAt;  ///< nullopt = never expires.
    std::optional<Timestamp> lastUsedAt;
    bool revoked = false;
};

/// A freshly created personal access token. `token` is shown once.
struct CreatedPersonalAccessToken {
    std::string token;
    PersonalAccessTokenRecord record;
};

/// Successful token endpoint response body.
struct TokenResponse {
    std::string accessToken;
    std::string tokenType = "Bearer";
    std::chrono::seconds expiresIn{0};
    std::optional<std::string> refreshToken;
    ScopeList scopes;
};

/// RFC 7662 introspection response.
///
/// Every non-active outcome is the default-constructed value so that
/// expired, revoked and unknown tokens are indistinguishable.
struct IntrospectionResult {
    bool active = false;
    std::optional<std::string> scope;
    std::optional<std::string> clientId;
    std::optional<std::string> username;
    std::optional<std::string> tokenType;
    std::optional<int64_t> exp;
    std::optional<int64_t> iat;
    std::optional<int64_t> nbf;
    std::optional<std::string> sub;
    std::optional<std::string> iss;
    std::optional<std::string> jti;

    static IntrospectionResult inactive() { return {}; }
};

/// Which kind of token a revocation or introspection caller believes it holds.
enum class TokenTypeHint : uint8_t {
    AccessToken,
    RefreshToken
};

constexpr std::optional<TokenTypeHint> parseTokenTypeHint(std::string_view name) {
    if (name == "access_token")  return TokenTypeHint::AccessToken;
    if (name == "refresh_token") return TokenTypeHint::RefreshToken;
    return std::nullopt;
}

// ============================================================================
// Resource owners
// ============================================================================

/// Credentials of a resource owner for the password grant.
struct UserCredential {
    std::string subject;
    std::string username;
    std::string passwordHash;  ///< Encoded by SecretHasher.
    bool disabled = false;
};

} // namespace ocs::service
