#pragma once

/// @file token_codec.hpp
/// @brief Opaque credential generation, lookup hashing and PKCE transforms.

#include <cstddef>
#include <string>
#include <string_view>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/service/oauth_types.hpp"

namespace ocs::service::codec {

/// Entropy of refresh tokens, authorization codes and personal access tokens.
inline constexpr std::size_t kTokenBytes = 32;

/// Entropy of generated client secrets.
inline constexpr std::size_t kClientSecretBytes = 40;

/// Generate @p numBytes of CSPRNG output, base64url encoded without padding.
[[nodiscard]] foundation::AuthResult<std::string> generateOpaqueToken(
    std::size_t numBytes = kTokenBytes);

/// Random RFC 4122 version 4 UUID in canonical lowercase form.
[[nodiscard]] foundation::AuthResult<std::string> generateUuid();

/// Lowercase hex SHA-256 of a raw credential; the only form ever persisted.
/// Empty if hashing failed, which matches no stored record.
[[nodiscard]] std::string hashToken(std::string_view rawToken);

/// Constant-time equality for secrets, hashes and PKCE values.
[[nodiscard]] bool constantTimeEqual(std::string_view a, std::string_view b);

/// base64url(SHA-256(verifier)), the S256 code challenge.
[[nodiscard]] std::string pkceS256(std::string_view verifier);

/// Check a verifier against a stored challenge.
[[nodiscard]] bool verifyPkce(const PkceChallenge& challenge, std::string_view verifier);

/// RFC 7636 verifier/challenge syntax: 43-128 chars of [A-Za-z0-9-._~].
[[nodiscard]] bool isValidPkceValue(std::string_view value);

} // namespace ocs::service::codec
