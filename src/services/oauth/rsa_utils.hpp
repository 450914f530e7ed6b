#pragma once

/// @file rsa_utils.hpp
/// @brief RSA-SHA256 signing and verification using the OpenSSL 3.x EVP API.
///
/// Keys are read from PEM strings through memory BIOs so configuration can
/// carry them inline.

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

namespace ocs::service::detail {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

/// Parse a PEM private key. Null on failure.
[[nodiscard]] inline PkeyPtr loadPrivateKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    return PkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

/// Parse a PEM SubjectPublicKeyInfo key. Null on failure.
[[nodiscard]] inline PkeyPtr loadPublicKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    return PkeyPtr(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
}

/// Sign @p message with RSA-SHA256 (PKCS#1 v1.5).
/// @return Raw signature bytes, or empty vector on failure.
[[nodiscard]] inline std::vector<uint8_t> rsaSha256Sign(EVP_PKEY* key, std::string_view message) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || key == nullptr) {
        return {};
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
        return {};
    }
    if (EVP_DigestSignUpdate(ctx.get(), message.data(), message.size()) != 1) {
        return {};
    }
    std::size_t sigLen = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &sigLen) != 1) {
        return {};
    }
    std::vector<uint8_t> signature(sigLen);
    if (EVP_DigestSignFinal(ctx.get(), signature.data(), &sigLen) != 1) {
        return {};
    }
    signature.resize(sigLen);
    return signature;
}

/// Verify an RSA-SHA256 signature.
[[nodiscard]] inline bool rsaSha256Verify(EVP_PKEY* key, std::string_view message,
                                          const std::vector<uint8_t>& signature) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || key == nullptr) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
        return false;
    }
    if (EVP_DigestVerifyUpdate(ctx.get(), message.data(), message.size()) != 1) {
        return false;
    }
    return EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size()) == 1;
}

}  // namespace ocs::service::detail
