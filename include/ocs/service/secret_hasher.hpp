#pragma once

/// @file secret_hasher.hpp
/// @brief Memory-hard hashing of client secrets and user passwords.

#include <cstdint>
#include <string>
#include <string_view>

#include "ocs/foundation/auth_result.hpp"

namespace ocs::service {

/// Upper bounds on accepted scrypt parameters. Hashes outside them never
/// verify, so configurations outside them are rejected up front.
inline constexpr uint64_t kMaxScryptN = uint64_t{1} << 20;
inline constexpr uint64_t kMaxScryptR = 32;
inline constexpr uint64_t kMaxScryptP = 16;

/// scrypt cost parameters (RFC 7914).
struct ScryptParams {
    uint64_t n = 16384;  ///< CPU/memory cost, power of two.
    uint32_t r = 8;      ///< Block size.
    uint32_t p = 1;      ///< Parallelization.
};

/// Hashes secrets with scrypt into a self-describing string:
///
///   scrypt$<N>$<r>$<p>$<base64url salt>$<base64url hash>
///
/// The parameters travel with the hash, so raising the cost later keeps
/// existing hashes verifiable.
///
/// @code
///   SecretHasher hasher;
///   auto encoded = hasher.hash("s3cr3t");
///   bool ok = hasher.verify("s3cr3t", encoded.value());
/// @endcode
class SecretHasher {
public:
    static constexpr std::size_t kSaltBytes = 16;
    static constexpr std::size_t kHashBytes = 32;

    explicit SecretHasher(ScryptParams params = {});

    /// Hash a secret with a fresh random salt.
    /// @return Encoded hash, or HashFailed/RandomFailed on OpenSSL failure.
    [[nodiscard]] foundation::AuthResult<std::string> hash(std::string_view secret) const;

    /// Verify a secret against an encoded hash in constant time.
    /// Malformed encodings never verify.
    [[nodiscard]] bool verify(std::string_view secret, std::string_view encoded) const;

    /// True if @p encoded parses as a hash produced by this class.
    [[nodiscard]] static bool isWellFormed(std::string_view encoded);

    [[nodiscard]] const ScryptParams& params() const noexcept { return params_; }

    /// True if @p params are within the bounds verify() accepts.
    [[nodiscard]] static bool isSupported(const ScryptParams& params) noexcept;

private:
    ScryptParams params_;
};

} // namespace ocs::service
