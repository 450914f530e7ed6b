#include <gtest/gtest.h>

#include "ocs/service/personal_access_tokens.hpp"
#include "ocs/service/token_codec.hpp"

#include <chrono>
#include <optional>
#include <string>

#include "support/mock_logger.hpp"
#include "support/service_harness.hpp"

using namespace ocs::service;
using ocs::foundation::ErrorCode;

class PersonalAccessTokenTest : public ::testing::Test {
protected:
    PersonalAccessTokenTest()
        : pats_(harness_.config, harness_.storage.personalTokens, harness_.scopes,
                harness_.clock) {}

    CreatedPersonalAccessToken mustCreate(const std::string& user, const std::string& name,
                                          std::optional<std::chrono::seconds> lifetime =
                                              std::nullopt) {
        auto created = pats_.create(user, name, {"api:read"}, lifetime);
        EXPECT_TRUE(created.hasValue());
        return created.value();
    }

    ocs::test::ServiceHarness harness_;
    PersonalAccessTokenService pats_;
};

TEST_F(PersonalAccessTokenTest, CreateReturnsTokenOnce) {
    auto created = mustCreate("alice", "deploy");
    EXPECT_EQ(created.token.size(), 43u);
    EXPECT_TRUE(created.record.tokenHash.empty());
    EXPECT_EQ(created.record.userId, "alice");
    EXPECT_EQ(created.record.name, "deploy");
    EXPECT_EQ(created.record.scopes, (ScopeList{"api:read"}));
    EXPECT_EQ(created.record.createdAt, harness_.clock->now());
    // Default lifetime of zero never expires.
    EXPECT_FALSE(created.record.expiresAt.has_value());

    auto stored = harness_.storage.personalTokens->findById(created.record.id);
    ASSERT_TRUE(stored.hasValue());
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->tokenHash, codec::hashToken(created.token));
}

TEST_F(PersonalAccessTokenTest, ExplicitLifetimeSetsExpiry) {
    auto created = mustCreate("alice", "short", std::chrono::seconds{60});
    ASSERT_TRUE(created.record.expiresAt.has_value());
    EXPECT_EQ(*created.record.expiresAt, harness_.clock->now() + std::chrono::seconds{60});
}

TEST_F(PersonalAccessTokenTest, CreateRejections) {
    auto noUser = pats_.create("", "deploy", {"api:read"});
    ASSERT_TRUE(noUser.hasError());
    EXPECT_EQ(noUser.error().message(), "user id is required");

    auto noName = pats_.create("alice", "", {"api:read"});
    ASSERT_TRUE(noName.hasError());
    EXPECT_EQ(noName.error().code(), ErrorCode::InvalidRequest);

    auto negative = pats_.create("alice", "deploy", {"api:read"}, std::chrono::seconds{-1});
    ASSERT_TRUE(negative.hasError());
    EXPECT_EQ(negative.error().message(), "lifetime must not be negative");

    auto unknownScope = pats_.create("alice", "deploy", {"billing:read"});
    ASSERT_TRUE(unknownScope.hasError());
    EXPECT_EQ(unknownScope.error().code(), ErrorCode::InvalidScope);
}

TEST_F(PersonalAccessTokenTest, AuthenticateRecordsUse) {
    auto created = mustCreate("alice", "deploy");
    harness_.clock->advance(std::chrono::seconds{30});

    auto record = pats_.authenticate(created.token);
    ASSERT_TRUE(record.hasValue());
    EXPECT_EQ(record.value().id, created.record.id);
    EXPECT_TRUE(record.value().tokenHash.empty());
    EXPECT_EQ(record.value().lastUsedAt, std::optional(harness_.clock->now()));

    auto stored = harness_.storage.personalTokens->findById(created.record.id);
    ASSERT_TRUE(stored.hasValue());
    EXPECT_EQ(stored.value()->lastUsedAt, std::optional(harness_.clock->now()));
}

TEST_F(PersonalAccessTokenTest, AuthenticateRejectsUnusableTokens) {
    auto expiring = mustCreate("alice", "expiring", std::chrono::seconds{60});
    auto revoked = mustCreate("alice", "revoked");
    ASSERT_TRUE(pats_.revoke("alice", revoked.record.id).hasValue());
    harness_.clock->advance(std::chrono::seconds{60});

    for (const std::string& token :
         {expiring.token, revoked.token, std::string("unknown"), std::string()}) {
        auto result = pats_.authenticate(token);
        ASSERT_TRUE(result.hasError()) << token;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidToken);
        EXPECT_EQ(result.error().message(), "personal access token is invalid");
    }
}

TEST_F(PersonalAccessTokenTest, ListForUserHidesHashes) {
    mustCreate("alice", "first");
    mustCreate("alice", "second");
    mustCreate("bob", "other");

    auto listed = pats_.listForUser("alice");
    ASSERT_TRUE(listed.hasValue());
    ASSERT_EQ(listed.value().size(), 2u);
    for (const auto& record : listed.value()) {
        EXPECT_EQ(record.userId, "alice");
        EXPECT_TRUE(record.tokenHash.empty());
    }

    auto none = pats_.listForUser("carol");
    ASSERT_TRUE(none.hasValue());
    EXPECT_TRUE(none.value().empty());
}

TEST_F(PersonalAccessTokenTest, RevokeOwnership) {
    ocs::test::ScopedMockLogger logger;
    auto created = mustCreate("alice", "deploy");

    auto foreign = pats_.revoke("bob", created.record.id);
    ASSERT_TRUE(foreign.hasError());
    EXPECT_EQ(foreign.error().code(), ErrorCode::AccessDenied);
    EXPECT_TRUE(logger->contains({"revocation by non-owner refused", "sub=bob"}));
    EXPECT_TRUE(pats_.authenticate(created.token).hasValue());

    auto missing = pats_.revoke("alice", "no-such-id");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);

    ASSERT_TRUE(pats_.revoke("alice", created.record.id).hasValue());
    EXPECT_TRUE(logger->contains({"[Audit] personal access token revoked"}));
    EXPECT_TRUE(pats_.authenticate(created.token).hasError());

    // A second revocation succeeds quietly.
    const auto before = logger->logCount();
    EXPECT_TRUE(pats_.revoke("alice", created.record.id).hasValue());
    EXPECT_EQ(logger->logCount(), before);
}
