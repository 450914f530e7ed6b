#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic primitives on top of OpenSSL 3.x.
///
/// SHA-256, HMAC-SHA256, scrypt, CSPRNG bytes, constant-time comparison
/// and base64url/hex encoders. Failures are reported as empty results.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace ocs::service::detail {

using Bytes = std::vector<uint8_t>;

// =============================================================================
// Digests
// =============================================================================

/// SHA-256 digest (32 bytes), or empty on failure.
[[nodiscard]] inline Bytes sha256(std::string_view data) {
    Bytes digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    digest.resize(len);
    return digest;
}

/// HMAC-SHA256 of @p message under @p key, or empty on failure.
[[nodiscard]] inline Bytes hmacSha256(std::string_view key, std::string_view message) {
    Bytes mac(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    auto* out = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                     reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                     mac.data(), &len);
    if (out == nullptr) {
        return {};
    }
    mac.resize(len);
    return mac;
}

/// scrypt key derivation (RFC 7914), or empty on failure.
[[nodiscard]] inline Bytes scrypt(std::string_view password, const Bytes& salt,
                                  uint64_t n, uint64_t r, uint64_t p, std::size_t keyLen) {
    // Working set is 128 * r * (n + p) bytes; leave headroom above it.
    const uint64_t maxMem = 128 * r * (n + p + 2) + (1u << 20);
    Bytes key(keyLen);
    if (EVP_PBE_scrypt(password.data(), password.size(), salt.data(), salt.size(),
                       n, r, p, maxMem, key.data(), key.size()) != 1) {
        return {};
    }
    return key;
}

// =============================================================================
// Secure random generation
// =============================================================================

/// @p numBytes bytes from the OpenSSL CSPRNG, or empty on failure.
[[nodiscard]] inline Bytes randomBytes(std::size_t numBytes) {
    Bytes buf(numBytes);
    if (numBytes == 0) {
        return buf;
    }
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return {};
    }
    return buf;
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Compare two byte strings without data-dependent early exit.
/// Only the length is observable.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// =============================================================================
// Base64URL (RFC 4648 section 5, unpadded)
// =============================================================================

[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve(((length + 2) / 3) * 4);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }
        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(const Bytes& data) {
    return base64urlEncode(data.data(), data.size());
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Decode unpadded base64url. Returns false on any character outside the
/// alphabet or on an impossible length.
[[nodiscard]] inline bool base64urlDecode(std::string_view input, Bytes& out) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-') {
            return 62;
        }
        if (c == '_') {
            return 63;
        }
        return -1;
    };

    if (input.size() % 4 == 1) {
        return false;
    }

    out.clear();
    out.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        int val = decodeChar(c);
        if (val < 0) {
            return false;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    // Leftover bits must be zero so every byte string has one encoding.
    if (bits > 0 && (buf & ((uint32_t{1} << bits) - 1)) != 0) {
        return false;
    }
    return true;
}

[[nodiscard]] inline bool base64urlDecodeString(std::string_view input, std::string& out) {
    Bytes bytes;
    if (!base64urlDecode(input, bytes)) {
        return false;
    }
    out.assign(bytes.begin(), bytes.end());
    return true;
}

// =============================================================================
// Hex encoding
// =============================================================================

/// Lowercase hex encoding.
[[nodiscard]] inline std::string toHex(const Bytes& data) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (auto b : data) {
        result.push_back(hexChars[(b >> 4) & 0x0F]);
        result.push_back(hexChars[b & 0x0F]);
    }
    return result;
}

}  // namespace ocs::service::detail
