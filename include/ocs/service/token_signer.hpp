#pragma once

/// @file token_signer.hpp
/// @brief JWT encoding of access-token claims with HS256 or RS256.
///
/// Token format (RFC 7519):
///   base64url(header) . base64url(payload) . base64url(signature)
///
/// Payload: {"iss","sub"?,"client_id","scope","jti","token_type","iat","nbf","exp"}

#include <memory>
#include <string>
#include <string_view>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/service/oauth_config.hpp"
#include "ocs/service/oauth_types.hpp"

namespace ocs::service {

/// Stateless signer/verifier for self-contained access tokens.
///
/// Only the algorithm configured at construction is accepted on
/// verification; a token whose header names any other algorithm (including
/// "none") is rejected. Copies share the parsed key material.
///
/// @code
///   auto signer = TokenSigner::create(config);
///   auto jwt = signer.value().sign(claims);
///   auto decoded = signer.value().verify(jwt.value());
/// @endcode
class TokenSigner {
public:
    /// Load key material for the configured algorithm.
    /// @return InvalidArgument if the keys are missing or unparsable.
    [[nodiscard]] static foundation::AuthResult<TokenSigner> create(const OAuthConfig& config);

    /// Encode and sign claims. SigningFailed on OpenSSL failure.
    [[nodiscard]] foundation::AuthResult<std::string> sign(const AccessTokenClaims& claims) const;

    /// Check structure, algorithm and signature, then decode the claims.
    /// Expiry and revocation are not checked here.
    /// @return InvalidToken on any failure.
    [[nodiscard]] foundation::AuthResult<AccessTokenClaims> verify(std::string_view token) const;

    [[nodiscard]] JwtAlgorithm algorithm() const noexcept { return algorithm_; }

private:
    struct Keys;

    TokenSigner(JwtAlgorithm algorithm, std::shared_ptr<const Keys> keys);

    JwtAlgorithm algorithm_;
    std::shared_ptr<const Keys> keys_;
};

} // namespace ocs::service
