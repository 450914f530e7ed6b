/// @file token_codec.cpp
/// @brief Opaque credential generation and PKCE verification.

#include "ocs/service/token_codec.hpp"

#include "crypto_utils.hpp"

namespace ocs::service::codec {

using ocs::foundation::AuthError;
using ocs::foundation::AuthResult;
using ocs::foundation::ErrorCode;

AuthResult<std::string> generateOpaqueToken(std::size_t numBytes) {
    auto bytes = detail::randomBytes(numBytes);
    if (bytes.size() != numBytes) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::RandomFailed, "CSPRNG failure"));
    }
    return AuthResult<std::string>::ok(detail::base64urlEncode(bytes));
}

AuthResult<std::string> generateUuid() {
    auto bytes = detail::randomBytes(16);
    if (bytes.size() != 16) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::RandomFailed, "CSPRNG failure"));
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    auto hex = detail::toHex(bytes);
    std::string uuid;
    uuid.reserve(36);
    uuid.append(hex, 0, 8).push_back('-');
    uuid.append(hex, 8, 4).push_back('-');
    uuid.append(hex, 12, 4).push_back('-');
    uuid.append(hex, 16, 4).push_back('-');
    uuid.append(hex, 20, 12);
    return AuthResult<std::string>::ok(std::move(uuid));
}

std::string hashToken(std::string_view rawToken) {
    return detail::toHex(detail::sha256(rawToken));
}

bool constantTimeEqual(std::string_view a, std::string_view b) {
    return detail::constantTimeEqual(a, b);
}

std::string pkceS256(std::string_view verifier) {
    return detail::base64urlEncode(detail::sha256(verifier));
}

bool verifyPkce(const PkceChallenge& challenge, std::string_view verifier) {
    if (!isValidPkceValue(verifier)) {
        return false;
    }
    switch (challenge.method) {
        case CodeChallengeMethod::S256: {
            auto computed = pkceS256(verifier);
            return !computed.empty() && detail::constantTimeEqual(computed, challenge.challenge);
        }
        case CodeChallengeMethod::Plain:
            return detail::constantTimeEqual(verifier, challenge.challenge);
    }
    return false;
}

bool isValidPkceValue(std::string_view value) {
    if (value.size() < 43 || value.size() > 128) {
        return false;
    }
    for (char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
        if (!unreserved) {
            return false;
        }
    }
    return true;
}

}  // namespace ocs::service::codec
