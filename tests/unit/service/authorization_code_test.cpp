#include <gtest/gtest.h>

#include "ocs/service/authorization_code_service.hpp"
#include "ocs/service/token_codec.hpp"

#include <optional>
#include <string>

#include "support/mock_logger.hpp"
#include "support/service_harness.hpp"

using namespace ocs::service;
using ocs::foundation::ErrorCode;
using ocs::test::testVerifier;

namespace {

const std::string kRedirect = "https://app.example.com/cb";
const std::string kPublicRedirect = "com.example.app://oauth";

PkceChallenge s256Challenge() {
    return PkceChallenge{codec::pkceS256(testVerifier()), CodeChallengeMethod::S256};
}

}  // namespace

class AuthorizationCodeTest : public ::testing::Test {
protected:
    explicit AuthorizationCodeTest(OAuthConfig config = ocs::test::testConfig())
        : harness_(std::move(config)),
          codes_(harness_.config, harness_.storage.codes, harness_.scopes, harness_.issuer,
                 harness_.clock) {}

    std::string mustIssue(const Client& client, const std::string& redirect,
                          std::optional<PkceChallenge> pkce, ScopeList scopes = {}) {
        auto code = codes_.issue(client, "alice", redirect, scopes, pkce);
        EXPECT_TRUE(code.hasValue());
        return code.hasValue() ? code.value() : std::string();
    }

    ocs::test::ServiceHarness harness_;
    AuthorizationCodeService codes_;
    Client confidential_ = ocs::test::confidentialClient();
    Client public_ = ocs::test::publicClient();
};

// =============================================================================
// Issuance
// =============================================================================

TEST_F(AuthorizationCodeTest, IssueStoresHashedRecord) {
    auto code = mustIssue(confidential_, kRedirect, s256Challenge(), {"api:read"});
    EXPECT_EQ(code.size(), 43u);

    EXPECT_FALSE(harness_.storage.codes->findByHash(code).value().has_value());
    auto record = harness_.storage.codes->findByHash(codec::hashToken(code)).value();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->clientId, confidential_.id);
    EXPECT_EQ(record->subject, "alice");
    EXPECT_EQ(record->redirectUri, kRedirect);
    EXPECT_EQ(record->scopes, (ScopeList{"api:read"}));
    EXPECT_EQ(record->expiresAt, harness_.clock->now() + std::chrono::seconds{600});
    EXPECT_FALSE(record->consumed);
    ASSERT_TRUE(record->pkce.has_value());
    EXPECT_EQ(record->pkce->method, CodeChallengeMethod::S256);
}

TEST_F(AuthorizationCodeTest, EmptyScopeResolvesToClientScopes) {
    auto code = mustIssue(confidential_, kRedirect, std::nullopt);
    auto record = harness_.storage.codes->findByHash(codec::hashToken(code)).value();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->scopes, confidential_.scopes);
}

TEST_F(AuthorizationCodeTest, IssueRejections) {
    auto noCodeFlow = confidential_;
    noCodeFlow.grantTypes = {GrantType::ClientCredentials};
    auto r1 = codes_.issue(noCodeFlow, "alice", kRedirect, {}, std::nullopt);
    ASSERT_TRUE(r1.hasError());
    EXPECT_EQ(r1.error().code(), ErrorCode::UnauthorizedClient);

    auto r2 = codes_.issue(confidential_, "", kRedirect, {}, std::nullopt);
    ASSERT_TRUE(r2.hasError());
    EXPECT_EQ(r2.error().code(), ErrorCode::InvalidRequest);

    // Exact match only: a trailing slash is a different URI.
    auto r3 = codes_.issue(confidential_, "alice", kRedirect + "/", {}, std::nullopt);
    ASSERT_TRUE(r3.hasError());
    EXPECT_EQ(r3.error().code(), ErrorCode::InvalidRequest);

    auto r4 = codes_.issue(confidential_, "alice", kRedirect, {"admin"}, std::nullopt);
    ASSERT_TRUE(r4.hasError());
    EXPECT_EQ(r4.error().code(), ErrorCode::InvalidScope);

    auto r5 = codes_.issue(confidential_, "alice", kRedirect, {},
                           PkceChallenge{"too-short", CodeChallengeMethod::S256});
    ASSERT_TRUE(r5.hasError());
    EXPECT_EQ(r5.error().message(), "code_challenge is malformed");

    EXPECT_EQ(harness_.storage.codes->size(), 0u);
}

TEST_F(AuthorizationCodeTest, PublicClientRequiresPkce) {
    auto result = codes_.issue(public_, "alice", kPublicRedirect, {}, std::nullopt);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(result.error().message(), "code_challenge is required");

    EXPECT_TRUE(codes_.issue(public_, "alice", kPublicRedirect, {}, s256Challenge()).hasValue());
}

TEST_F(AuthorizationCodeTest, ConfidentialClientPkceOptionalByDefault) {
    EXPECT_TRUE(codes_.issue(confidential_, "alice", kRedirect, {}, std::nullopt).hasValue());
}

// =============================================================================
// Exchange
// =============================================================================

TEST_F(AuthorizationCodeTest, ExchangeWithS256) {
    auto code = mustIssue(public_, kPublicRedirect, s256Challenge());
    auto tokens = codes_.exchange(public_, code, kPublicRedirect, testVerifier());
    ASSERT_TRUE(tokens.hasValue());

    EXPECT_FALSE(tokens.value().accessToken.empty());
    EXPECT_TRUE(tokens.value().refreshToken.has_value());
    EXPECT_EQ(tokens.value().scopes, public_.scopes);

    auto claims = harness_.issuer->validateAccessToken(tokens.value().accessToken);
    ASSERT_TRUE(claims.hasValue());
    EXPECT_EQ(claims.value().subject, std::optional<std::string>("alice"));
    EXPECT_EQ(claims.value().clientId, public_.id);

    EXPECT_TRUE(harness_.storage.codes->findByHash(codec::hashToken(code)).value()->consumed);
}

TEST_F(AuthorizationCodeTest, ExchangeWithPlain) {
    auto code = mustIssue(public_, kPublicRedirect,
                          PkceChallenge{testVerifier(), CodeChallengeMethod::Plain});
    EXPECT_TRUE(codes_.exchange(public_, code, kPublicRedirect, testVerifier()).hasValue());
}

TEST_F(AuthorizationCodeTest, NoRefreshTokenWithoutRefreshGrant) {
    auto client = confidential_;
    client.grantTypes = {GrantType::AuthorizationCode};
    auto code = mustIssue(client, kRedirect, std::nullopt);
    auto tokens = codes_.exchange(client, code, kRedirect, std::nullopt);
    ASSERT_TRUE(tokens.hasValue());
    EXPECT_FALSE(tokens.value().refreshToken.has_value());
}

TEST_F(AuthorizationCodeTest, ReplayRejectedAndAudited) {
    ocs::test::ScopedMockLogger logger;
    auto code = mustIssue(confidential_, kRedirect, std::nullopt);
    ASSERT_TRUE(codes_.exchange(confidential_, code, kRedirect, std::nullopt).hasValue());

    auto replay = codes_.exchange(confidential_, code, kRedirect, std::nullopt);
    ASSERT_TRUE(replay.hasError());
    EXPECT_EQ(replay.error().code(), ErrorCode::InvalidGrant);
    EXPECT_TRUE(logger->contains({"[Audit] authorization code replay",
                                  "client_id=" + confidential_.id}));
}

TEST_F(AuthorizationCodeTest, ExpiredCodeRejected) {
    auto code = mustIssue(confidential_, kRedirect, std::nullopt);
    harness_.clock->advance(std::chrono::seconds{600});

    auto result = codes_.exchange(confidential_, code, kRedirect, std::nullopt);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidGrant);
    EXPECT_EQ(result.error().message(), "authorization code has expired");
}

TEST_F(AuthorizationCodeTest, CodeUsableJustBeforeExpiry) {
    auto code = mustIssue(confidential_, kRedirect, std::nullopt);
    harness_.clock->advance(std::chrono::seconds{599});
    EXPECT_TRUE(codes_.exchange(confidential_, code, kRedirect, std::nullopt).hasValue());
}

TEST_F(AuthorizationCodeTest, UnknownAndEmptyCodes) {
    auto unknown = codes_.exchange(confidential_, "not-a-code", kRedirect, std::nullopt);
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(unknown.error().code(), ErrorCode::InvalidGrant);

    auto empty = codes_.exchange(confidential_, "", kRedirect, std::nullopt);
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code(), ErrorCode::InvalidRequest);
}

TEST_F(AuthorizationCodeTest, OtherClientCannotRedeem) {
    auto code = mustIssue(confidential_, kRedirect, std::nullopt);
    auto thief = ocs::test::confidentialClient("thief");

    auto result = codes_.exchange(thief, code, kRedirect, std::nullopt);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidGrant);

    // The rightful client can still redeem it.
    EXPECT_TRUE(codes_.exchange(confidential_, code, kRedirect, std::nullopt).hasValue());
}

TEST_F(AuthorizationCodeTest, FailedValidationLeavesCodeUsable) {
    auto code = mustIssue(public_, kPublicRedirect, s256Challenge());

    auto wrongRedirect = codes_.exchange(public_, code, "com.example.app://other", testVerifier());
    ASSERT_TRUE(wrongRedirect.hasError());
    EXPECT_EQ(wrongRedirect.error().code(), ErrorCode::InvalidGrant);

    auto wrongVerifier = codes_.exchange(public_, code, kPublicRedirect, std::string(43, 'x'));
    ASSERT_TRUE(wrongVerifier.hasError());
    EXPECT_EQ(wrongVerifier.error().code(), ErrorCode::InvalidGrant);
    EXPECT_EQ(wrongVerifier.error().message(), "code_verifier does not match the code_challenge");

    auto missingVerifier = codes_.exchange(public_, code, kPublicRedirect, std::nullopt);
    ASSERT_TRUE(missingVerifier.hasError());
    EXPECT_EQ(missingVerifier.error().code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(missingVerifier.error().message(), "code_verifier is required");

    EXPECT_TRUE(codes_.exchange(public_, code, kPublicRedirect, testVerifier()).hasValue());
}

TEST_F(AuthorizationCodeTest, VerifierWithoutBoundChallengeRejected) {
    auto code = mustIssue(confidential_, kRedirect, std::nullopt);
    auto result = codes_.exchange(confidential_, code, kRedirect, testVerifier());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidGrant);
}

// =============================================================================
// Configuration variants
// =============================================================================

namespace {

OAuthConfig strictConfig() {
    auto config = ocs::test::testConfig();
    config.allowPlainPkce = false;
    config.requirePkceForConfidentialClients = true;
    return config;
}

}  // namespace

class StrictPkceTest : public AuthorizationCodeTest {
protected:
    StrictPkceTest() : AuthorizationCodeTest(strictConfig()) {}
};

TEST_F(StrictPkceTest, PlainRejectedWhenDisabled) {
    auto result = codes_.issue(public_, "alice", kPublicRedirect, {},
                               PkceChallenge{testVerifier(), CodeChallengeMethod::Plain});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message(), "code_challenge_method plain is not allowed");
}

TEST_F(StrictPkceTest, ConfidentialClientsNeedPkce) {
    auto result = codes_.issue(confidential_, "alice", kRedirect, {}, std::nullopt);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message(), "code_challenge is required");
    EXPECT_TRUE(codes_.issue(confidential_, "alice", kRedirect, {}, s256Challenge()).hasValue());
}
