#include <gtest/gtest.h>

#include "ocs/service/introspection_service.hpp"
#include "ocs/service/personal_access_tokens.hpp"
#include "ocs/service/token_codec.hpp"

#include <memory>
#include <optional>
#include <string>

#include "support/mock_logger.hpp"
#include "support/service_harness.hpp"

using namespace ocs::service;
using ocs::foundation::AuthError;
using ocs::foundation::ErrorCode;
using ocs::foundation::toEpochSeconds;

namespace {

/// Refresh store whose reads always fail.
class UnreachableRefreshStore final : public IRefreshTokenStore {
public:
    StoreResult<void> insert(RefreshTokenRecord) override { return StoreResult<void>::err(down()); }
    StoreResult<std::optional<RefreshTokenRecord>> findByHash(std::string_view) const override {
        return StoreResult<std::optional<RefreshTokenRecord>>::err(down());
    }
    StoreResult<bool> revokeIfActive(std::string_view) override {
        return StoreResult<bool>::err(down());
    }
    StoreResult<std::size_t> purgeExpired(ocs::foundation::Timestamp) override {
        return StoreResult<std::size_t>::err(down());
    }

private:
    static AuthError down() { return AuthError(ErrorCode::StorageError, "database unavailable"); }
};

}  // namespace

class IntrospectionServiceTest : public ::testing::Test {
protected:
    explicit IntrospectionServiceTest(OAuthConfig config = ocs::test::testConfig())
        : harness_(std::move(config)),
          service_(harness_.config, harness_.issuer, harness_.storage.accessTokens,
                   harness_.storage.refreshTokens, harness_.storage.personalTokens,
                   harness_.clock) {}

    TokenResponse pairFor(const Client& client, const ScopeList& scopes = {"api:read"}) {
        auto pair = harness_.issuer->issueTokenPair(std::string("alice"), client, scopes, true);
        EXPECT_TRUE(pair.hasValue());
        return pair.value();
    }

    bool isActive(const std::string& token, std::optional<TokenTypeHint> hint = std::nullopt) {
        auto result = service_.introspect(token, hint);
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() && result.value().active;
    }

    ocs::test::ServiceHarness harness_;
    IntrospectionService service_;
    Client client_ = ocs::test::confidentialClient();
};

// =============================================================================
// Introspection
// =============================================================================

TEST_F(IntrospectionServiceTest, ActiveAccessToken) {
    auto pair = pairFor(client_, {"api:read", "users:read"});
    auto result = service_.introspect(pair.accessToken);
    ASSERT_TRUE(result.hasValue());

    const auto& info = result.value();
    EXPECT_TRUE(info.active);
    EXPECT_EQ(info.scope, std::optional<std::string>("api:read users:read"));
    EXPECT_EQ(info.clientId, std::optional<std::string>(client_.id));
    EXPECT_EQ(info.sub, std::optional<std::string>("alice"));
    EXPECT_EQ(info.username, std::optional<std::string>("alice"));
    EXPECT_EQ(info.tokenType, std::optional<std::string>("Bearer"));
    EXPECT_EQ(info.iss, std::optional<std::string>(ocs::test::kTestIssuer));
    EXPECT_TRUE(info.jti.has_value());

    const auto now = toEpochSeconds(harness_.clock->now());
    EXPECT_EQ(info.iat, std::optional<int64_t>(now));
    EXPECT_EQ(info.exp, std::optional<int64_t>(now + 300));
}

TEST_F(IntrospectionServiceTest, ActiveRefreshToken) {
    auto pair = pairFor(client_);
    auto result = service_.introspect(*pair.refreshToken, TokenTypeHint::RefreshToken);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().active);
    EXPECT_EQ(result.value().tokenType, std::optional<std::string>("refresh_token"));
    EXPECT_EQ(result.value().exp,
              std::optional<int64_t>(toEpochSeconds(harness_.clock->now()) + 3600));
    EXPECT_FALSE(result.value().jti.has_value());
}

TEST_F(IntrospectionServiceTest, HintIsOnlyAnOptimisation) {
    auto pair = pairFor(client_);
    EXPECT_TRUE(isActive(pair.accessToken, TokenTypeHint::RefreshToken));
    EXPECT_TRUE(isActive(*pair.refreshToken, TokenTypeHint::AccessToken));
}

TEST_F(IntrospectionServiceTest, ActivePersonalAccessToken) {
    PersonalAccessTokenService pats(harness_.config, harness_.storage.personalTokens,
                                    harness_.scopes, harness_.clock);
    auto created = pats.create("bob", "ci", {"api:read"});
    ASSERT_TRUE(created.hasValue());

    auto result = service_.introspect(created.value().token);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().active);
    EXPECT_EQ(result.value().tokenType, std::optional<std::string>("personal_access_token"));
    EXPECT_EQ(result.value().sub, std::optional<std::string>("bob"));
    EXPECT_EQ(result.value().jti, std::optional<std::string>(created.value().record.id));
    EXPECT_FALSE(result.value().exp.has_value());
    EXPECT_FALSE(result.value().clientId.has_value());
}

TEST_F(IntrospectionServiceTest, InactiveOutcomesAreIndistinguishable) {
    auto expired = pairFor(client_);
    auto revoked = pairFor(client_);
    ASSERT_TRUE(service_.revoke(client_, revoked.accessToken).hasValue());
    harness_.clock->advance(std::chrono::seconds{300});

    const IntrospectionResult blank = IntrospectionResult::inactive();
    for (const std::string& token :
         {expired.accessToken, revoked.accessToken, std::string("garbage"), std::string()}) {
        auto result = service_.introspect(token);
        ASSERT_TRUE(result.hasValue());
        EXPECT_FALSE(result.value().active);
        EXPECT_EQ(result.value().scope, blank.scope);
        EXPECT_EQ(result.value().clientId, blank.clientId);
        EXPECT_EQ(result.value().exp, blank.exp);
        EXPECT_EQ(result.value().jti, blank.jti);
    }
}

TEST_F(IntrospectionServiceTest, ExpiredRefreshTokenInactive) {
    auto pair = pairFor(client_);
    harness_.clock->advance(std::chrono::seconds{3600});
    EXPECT_FALSE(isActive(*pair.refreshToken));
}

TEST_F(IntrospectionServiceTest, StorageFailureIsServerError) {
    auto failing = std::make_shared<UnreachableRefreshStore>();
    IntrospectionService service(harness_.config, harness_.issuer, harness_.storage.accessTokens,
                                 failing, harness_.storage.personalTokens, harness_.clock);

    auto result = service.introspect("opaque-token");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ServerError);
}

// =============================================================================
// Revocation
// =============================================================================

TEST_F(IntrospectionServiceTest, RevokeAccessTokenKeepsRefreshToken) {
    ocs::test::ScopedMockLogger logger;
    auto pair = pairFor(client_);

    ASSERT_TRUE(service_.revoke(client_, pair.accessToken, TokenTypeHint::AccessToken).hasValue());
    EXPECT_FALSE(isActive(pair.accessToken));
    EXPECT_TRUE(isActive(*pair.refreshToken));
    EXPECT_TRUE(logger->contains({"[Audit] access token revoked"}));

    auto validated = harness_.issuer->validateAccessToken(pair.accessToken);
    ASSERT_TRUE(validated.hasError());
    EXPECT_EQ(validated.error().message(), "access token has been revoked");
}

TEST_F(IntrospectionServiceTest, RevokeRefreshTokenLeavesAccessTokenByDefault) {
    ocs::test::ScopedMockLogger logger;
    auto pair = pairFor(client_);

    ASSERT_TRUE(service_.revoke(client_, *pair.refreshToken).hasValue());
    EXPECT_FALSE(isActive(*pair.refreshToken));
    EXPECT_TRUE(isActive(pair.accessToken));
    EXPECT_TRUE(logger->contains({"[Audit] refresh token revoked"}));
    EXPECT_FALSE(logger->contains({"access tokens revoked with their refresh token"}));
}

TEST_F(IntrospectionServiceTest, RevocationIsIdempotent) {
    auto pair = pairFor(client_);
    EXPECT_TRUE(service_.revoke(client_, *pair.refreshToken).hasValue());
    EXPECT_TRUE(service_.revoke(client_, *pair.refreshToken).hasValue());
    EXPECT_TRUE(service_.revoke(client_, "never-issued").hasValue());
}

TEST_F(IntrospectionServiceTest, ForeignTokenRevocationIsSilentNoOp) {
    ocs::test::ScopedMockLogger logger;
    auto pair = pairFor(client_);
    auto other = ocs::test::confidentialClient("other-client");

    EXPECT_TRUE(service_.revoke(other, pair.accessToken).hasValue());
    EXPECT_TRUE(service_.revoke(other, *pair.refreshToken).hasValue());

    EXPECT_TRUE(isActive(pair.accessToken));
    EXPECT_TRUE(isActive(*pair.refreshToken));
    EXPECT_TRUE(logger->contains({"revocation of a foreign access token ignored"}));
    EXPECT_TRUE(logger->contains({"revocation of a foreign refresh token ignored"}));
}

TEST_F(IntrospectionServiceTest, ExpiredAccessTokenCanStillBeRevoked) {
    auto pair = pairFor(client_);
    harness_.clock->advance(std::chrono::seconds{400});
    ASSERT_TRUE(service_.revoke(client_, pair.accessToken).hasValue());

    auto claims = harness_.issuer->signer().verify(pair.accessToken);
    ASSERT_TRUE(claims.hasValue());
    auto record = harness_.storage.accessTokens->findByJti(claims.value().jti);
    ASSERT_TRUE(record.hasValue());
    ASSERT_TRUE(record.value().has_value());
    EXPECT_TRUE(record.value()->revoked);
}

TEST_F(IntrospectionServiceTest, EmptyTokenRejected) {
    auto result = service_.revoke(client_, "");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(result.error().message(), "token is required");
}

TEST_F(IntrospectionServiceTest, PersonalTokensNotRevocableByClients) {
    PersonalAccessTokenService pats(harness_.config, harness_.storage.personalTokens,
                                    harness_.scopes, harness_.clock);
    auto created = pats.create("bob", "ci", {"api:read"});
    ASSERT_TRUE(created.hasValue());

    EXPECT_TRUE(service_.revoke(client_, created.value().token).hasValue());
    EXPECT_TRUE(isActive(created.value().token));
}

// =============================================================================
// Cascading revocation
// =============================================================================

namespace {

OAuthConfig cascadingConfig() {
    auto config = ocs::test::testConfig();
    config.revokeAccessTokensOnRefreshRevocation = true;
    return config;
}

}  // namespace

class CascadingRevocationTest : public IntrospectionServiceTest {
protected:
    CascadingRevocationTest() : IntrospectionServiceTest(cascadingConfig()) {}
};

TEST_F(CascadingRevocationTest, RefreshRevocationRevokesLinkedAccessToken) {
    ocs::test::ScopedMockLogger logger;
    auto pair = pairFor(client_);
    auto unrelated = pairFor(client_);

    ASSERT_TRUE(service_.revoke(client_, *pair.refreshToken).hasValue());
    EXPECT_FALSE(isActive(*pair.refreshToken));
    EXPECT_FALSE(isActive(pair.accessToken));
    EXPECT_TRUE(isActive(unrelated.accessToken));
    EXPECT_TRUE(logger->contains({"access tokens revoked with their refresh token",
                                  "access_tokens=1"}));
}
