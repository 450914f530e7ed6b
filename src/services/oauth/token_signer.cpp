/// @file token_signer.cpp
/// @brief TokenSigner implementation with HS256 and RS256 JWT signing.

#include "ocs/service/token_signer.hpp"

#include "ocs/service/scope_manager.hpp"

#include "crypto_utils.hpp"
#include "json_utils.hpp"
#include "rsa_utils.hpp"

#include <vector>

namespace ocs::service {

using ocs::foundation::AuthError;
using ocs::foundation::AuthResult;
using ocs::foundation::ErrorCode;
using ocs::foundation::fromEpochSeconds;
using ocs::foundation::toEpochSeconds;

struct TokenSigner::Keys {
    std::string hmacKey;
    detail::PkeyPtr privateKey;
    detail::PkeyPtr publicKey;
};

namespace {

AuthResult<AccessTokenClaims> rejected(std::string message) {
    return AuthResult<AccessTokenClaims>::err(
        AuthError(ErrorCode::InvalidToken, std::move(message)));
}

std::string headerFor(JwtAlgorithm alg) {
    return detail::JsonObjectWriter()
        .field("alg", jwtAlgorithmName(alg))
        .field("typ", "JWT")
        .str();
}

}  // namespace

TokenSigner::TokenSigner(JwtAlgorithm algorithm, std::shared_ptr<const Keys> keys)
    : algorithm_(algorithm), keys_(std::move(keys)) {}

AuthResult<TokenSigner> TokenSigner::create(const OAuthConfig& config) {
    auto keys = std::make_shared<Keys>();
    if (config.jwtAlgorithm == JwtAlgorithm::HS256) {
        if (config.signingKey.size() < kMinHs256KeyBytes) {
            return AuthResult<TokenSigner>::err(
                AuthError(ErrorCode::InvalidArgument, "HS256 signing key too short"));
        }
        keys->hmacKey = config.signingKey;
    } else {
        keys->privateKey = detail::loadPrivateKey(config.rsaPrivateKeyPem);
        keys->publicKey = detail::loadPublicKey(config.rsaPublicKeyPem);
        if (!keys->privateKey || !keys->publicKey) {
            return AuthResult<TokenSigner>::err(
                AuthError(ErrorCode::InvalidArgument, "failed to parse RS256 key pair"));
        }
    }
    return AuthResult<TokenSigner>::ok(TokenSigner(config.jwtAlgorithm, std::move(keys)));
}

AuthResult<std::string> TokenSigner::sign(const AccessTokenClaims& claims) const {
    detail::JsonObjectWriter payload;
    payload.field("iss", claims.issuer)
        .optionalField("sub", claims.subject)
        .field("client_id", claims.clientId)
        .field("scope", ScopeManager::join(claims.scopes))
        .field("jti", claims.jti)
        .field("token_type", claims.tokenType)
        .field("iat", toEpochSeconds(claims.issuedAt))
        .field("nbf", toEpochSeconds(claims.notBefore))
        .field("exp", toEpochSeconds(claims.expiresAt));

    std::string signingInput = detail::base64urlEncode(headerFor(algorithm_)) + "." +
                               detail::base64urlEncode(payload.str());

    std::vector<uint8_t> signature;
    if (algorithm_ == JwtAlgorithm::RS256) {
        signature = detail::rsaSha256Sign(keys_->privateKey.get(), signingInput);
    } else {
        signature = detail::hmacSha256(keys_->hmacKey, signingInput);
    }
    if (signature.empty()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::SigningFailed, "failed to sign access token"));
    }
    return AuthResult<std::string>::ok(signingInput + "." + detail::base64urlEncode(signature));
}

AuthResult<AccessTokenClaims> TokenSigner::verify(std::string_view token) const {
    auto firstDot = token.find('.');
    auto secondDot = firstDot == std::string_view::npos ? firstDot : token.find('.', firstDot + 1);
    if (secondDot == std::string_view::npos ||
        token.find('.', secondDot + 1) != std::string_view::npos) {
        return rejected("malformed JWT: expected 3 parts");
    }
    auto encodedHeader = token.substr(0, firstDot);
    auto encodedPayload = token.substr(firstDot + 1, secondDot - firstDot - 1);
    auto encodedSignature = token.substr(secondDot + 1);
    auto signingInput = token.substr(0, secondDot);

    std::string headerJson;
    if (!detail::base64urlDecodeString(encodedHeader, headerJson)) {
        return rejected("malformed JWT header");
    }
    auto header = detail::parseFlatJson(headerJson);
    const auto* alg = header ? detail::jsonGet<std::string>(*header, "alg") : nullptr;
    if (alg == nullptr || *alg != jwtAlgorithmName(algorithm_)) {
        return rejected("unexpected JWT algorithm");
    }

    detail::Bytes signature;
    if (!detail::base64urlDecode(encodedSignature, signature)) {
        return rejected("malformed JWT signature");
    }
    if (algorithm_ == JwtAlgorithm::RS256) {
        if (!detail::rsaSha256Verify(keys_->publicKey.get(), signingInput, signature)) {
            return rejected("invalid RS256 signature");
        }
    } else {
        auto expected = detail::hmacSha256(keys_->hmacKey, signingInput);
        if (expected.empty() ||
            !detail::constantTimeEqual(
                std::string_view(reinterpret_cast<const char*>(expected.data()), expected.size()),
                std::string_view(reinterpret_cast<const char*>(signature.data()),
                                 signature.size()))) {
            return rejected("invalid HS256 signature");
        }
    }

    std::string payloadJson;
    if (!detail::base64urlDecodeString(encodedPayload, payloadJson)) {
        return rejected("malformed JWT payload");
    }
    auto payload = detail::parseFlatJson(payloadJson);
    if (!payload) {
        return rejected("malformed JWT payload");
    }

    const auto* iss = detail::jsonGet<std::string>(*payload, "iss");
    const auto* clientId = detail::jsonGet<std::string>(*payload, "client_id");
    const auto* jti = detail::jsonGet<std::string>(*payload, "jti");
    const auto* scope = detail::jsonGet<std::string>(*payload, "scope");
    const auto* tokenType = detail::jsonGet<std::string>(*payload, "token_type");
    const auto* iat = detail::jsonGet<int64_t>(*payload, "iat");
    const auto* exp = detail::jsonGet<int64_t>(*payload, "exp");
    if (!iss || !clientId || !jti || !scope || !tokenType || !iat || !exp) {
        return rejected("JWT is missing required claims");
    }

    AccessTokenClaims claims;
    claims.issuer = *iss;
    if (const auto* sub = detail::jsonGet<std::string>(*payload, "sub")) {
        claims.subject = *sub;
    }
    claims.clientId = *clientId;
    claims.scopes = ScopeManager::parse(*scope);
    claims.jti = *jti;
    claims.tokenType = *tokenType;
    claims.issuedAt = fromEpochSeconds(*iat);
    const auto* nbf = detail::jsonGet<int64_t>(*payload, "nbf");
    claims.notBefore = fromEpochSeconds(nbf ? *nbf : *iat);
    claims.expiresAt = fromEpochSeconds(*exp);
    return AuthResult<AccessTokenClaims>::ok(std::move(claims));
}

}  // namespace ocs::service
