/// @file secret_hasher.cpp
/// @brief SecretHasher implementation using OpenSSL scrypt.

#include "ocs/service/secret_hasher.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <optional>
#include <vector>

namespace ocs::service {

using ocs::foundation::AuthError;
using ocs::foundation::AuthResult;
using ocs::foundation::ErrorCode;

namespace {

constexpr std::string_view kScheme = "scrypt";

struct ParsedHash {
    uint64_t n = 0;
    uint64_t r = 0;
    uint64_t p = 0;
    detail::Bytes salt;
    detail::Bytes hash;
};

bool parseUint(std::string_view text, uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

bool isPowerOfTwo(uint64_t v) {
    return v > 1 && (v & (v - 1)) == 0;
}

std::optional<ParsedHash> parse(std::string_view encoded) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = encoded.find('$', start);
        if (pos == std::string_view::npos) {
            parts.push_back(encoded.substr(start));
            break;
        }
        parts.push_back(encoded.substr(start, pos - start));
        start = pos + 1;
    }
    if (parts.size() != 6 || parts[0] != kScheme) {
        return std::nullopt;
    }

    ParsedHash parsed;
    if (!parseUint(parts[1], parsed.n) || !parseUint(parts[2], parsed.r) ||
        !parseUint(parts[3], parsed.p)) {
        return std::nullopt;
    }
    if (!isPowerOfTwo(parsed.n) || parsed.n > kMaxScryptN || parsed.r == 0 ||
        parsed.r > kMaxScryptR || parsed.p == 0 || parsed.p > kMaxScryptP) {
        return std::nullopt;
    }
    if (!detail::base64urlDecode(parts[4], parsed.salt) ||
        !detail::base64urlDecode(parts[5], parsed.hash)) {
        return std::nullopt;
    }
    if (parsed.salt.empty() || parsed.hash.empty()) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

SecretHasher::SecretHasher(ScryptParams params) : params_(params) {}

bool SecretHasher::isSupported(const ScryptParams& params) noexcept {
    return isPowerOfTwo(params.n) && params.n <= kMaxScryptN && params.r > 0 &&
           params.r <= kMaxScryptR && params.p > 0 && params.p <= kMaxScryptP;
}

AuthResult<std::string> SecretHasher::hash(std::string_view secret) const {
    auto salt = detail::randomBytes(kSaltBytes);
    if (salt.size() != kSaltBytes) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::RandomFailed, "failed to generate salt"));
    }

    auto derived = detail::scrypt(secret, salt, params_.n, params_.r, params_.p, kHashBytes);
    if (derived.size() != kHashBytes) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::HashFailed, "scrypt derivation failed"));
    }

    std::string encoded(kScheme);
    encoded += '$';
    encoded += std::to_string(params_.n);
    encoded += '$';
    encoded += std::to_string(params_.r);
    encoded += '$';
    encoded += std::to_string(params_.p);
    encoded += '$';
    encoded += detail::base64urlEncode(salt);
    encoded += '$';
    encoded += detail::base64urlEncode(derived);
    return AuthResult<std::string>::ok(std::move(encoded));
}

bool SecretHasher::verify(std::string_view secret, std::string_view encoded) const {
    auto parsed = parse(encoded);
    if (!parsed) {
        return false;
    }
    auto derived = detail::scrypt(secret, parsed->salt, parsed->n, parsed->r, parsed->p,
                                  parsed->hash.size());
    if (derived.size() != parsed->hash.size()) {
        return false;
    }
    return detail::constantTimeEqual(
        std::string_view(reinterpret_cast<const char*>(derived.data()), derived.size()),
        std::string_view(reinterpret_cast<const char*>(parsed->hash.data()), parsed->hash.size()));
}

bool SecretHasher::isWellFormed(std::string_view encoded) {
    return parse(encoded).has_value();
}

}  // namespace ocs::service
