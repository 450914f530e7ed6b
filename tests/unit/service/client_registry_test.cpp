#include <gtest/gtest.h>

#include "ocs/service/client_registry.hpp"
#include "ocs/service/memory_storage.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "support/mock_logger.hpp"
#include "support/oauth_test_support.hpp"

using namespace ocs::service;
using ocs::foundation::AuthError;
using ocs::foundation::ErrorCode;

namespace {

/// Client store whose every call fails, for internal-error paths.
class FailingClientStore final : public IClientStore {
public:
    StoreResult<void> insert(Client) override { return StoreResult<void>::err(fail()); }
    StoreResult<std::optional<Client>> findById(std::string_view) const override {
        return StoreResult<std::optional<Client>>::err(fail());
    }
    StoreResult<std::vector<Client>> list() const override {
        return StoreResult<std::vector<Client>>::err(fail());
    }
    StoreResult<bool> updateSecretHash(std::string_view, std::string, Timestamp) override {
        return StoreResult<bool>::err(fail());
    }
    StoreResult<bool> markRevoked(std::string_view, Timestamp) override {
        return StoreResult<bool>::err(fail());
    }

private:
    static AuthError fail() { return AuthError(ErrorCode::StorageError, "connection refused"); }
};

ClientRegistration confidentialRegistration() {
    ClientRegistration reg;
    reg.name = "Billing Service";
    reg.redirectUris = {"https://billing.example.com/cb"};
    reg.grantTypes = {GrantType::AuthorizationCode, GrantType::ClientCredentials,
                      GrantType::RefreshToken};
    reg.scopes = {"api:read", "api:write"};
    return reg;
}

ClientRegistration publicRegistration() {
    ClientRegistration reg;
    reg.name = "Mobile App";
    reg.redirectUris = {"com.example.app://oauth"};
    reg.grantTypes = {GrantType::AuthorizationCode, GrantType::RefreshToken};
    reg.scopes = {"users:read"};
    reg.confidential = false;
    return reg;
}

}  // namespace

class ClientRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<ocs::test::ManualClock> clock_ = std::make_shared<ocs::test::ManualClock>();
    std::shared_ptr<InMemoryClientStore> store_ = std::make_shared<InMemoryClientStore>();
    std::shared_ptr<const ScopeManager> scopes_ =
        std::make_shared<const ScopeManager>(ScopeManager::withDefaults());
    ClientRegistry registry_{store_, scopes_, SecretHasher(ocs::test::fastScrypt()), clock_};

    RegisteredClient mustRegister(const ClientRegistration& reg) {
        auto result = registry_.registerClient(reg);
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() ? std::move(result).value() : RegisteredClient{};
    }
};

// =============================================================================
// Registration
// =============================================================================

TEST_F(ClientRegistryTest, RegisterConfidentialGeneratesSecret) {
    auto created = mustRegister(confidentialRegistration());

    EXPECT_EQ(created.client.id.size(), 36u);
    ASSERT_TRUE(created.plainSecret.has_value());
    EXPECT_EQ(created.plainSecret->size(), 54u);
    EXPECT_FALSE(created.client.secretHash.has_value());  // redacted
    EXPECT_TRUE(created.client.confidential);
    EXPECT_EQ(created.client.createdAt, clock_->now());

    // Only the hash is persisted.
    auto stored = store_->findById(created.client.id).value();
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->secretHash.has_value());
    EXPECT_NE(*stored->secretHash, *created.plainSecret);
    EXPECT_TRUE(SecretHasher::isWellFormed(*stored->secretHash));
}

TEST_F(ClientRegistryTest, RegisterWithChosenSecret) {
    auto reg = confidentialRegistration();
    reg.secret = "chosen-secret";
    auto created = mustRegister(reg);
    EXPECT_EQ(created.plainSecret, std::optional<std::string>("chosen-secret"));
    EXPECT_TRUE(registry_.authenticate(created.client.id, std::string("chosen-secret")).hasValue());
}

TEST_F(ClientRegistryTest, RegisterPublicHasNoSecret) {
    auto created = mustRegister(publicRegistration());
    EXPECT_FALSE(created.plainSecret.has_value());
    EXPECT_TRUE(created.client.isPublic());
    EXPECT_FALSE(store_->findById(created.client.id).value()->secretHash.has_value());
}

TEST_F(ClientRegistryTest, RegisterDeduplicatesGrants) {
    auto reg = confidentialRegistration();
    reg.grantTypes = {GrantType::ClientCredentials, GrantType::ClientCredentials};
    reg.redirectUris.clear();
    auto created = mustRegister(reg);
    ASSERT_EQ(created.client.grantTypes.size(), 1u);
    EXPECT_EQ(created.client.grantTypes[0], GrantType::ClientCredentials);
}

TEST_F(ClientRegistryTest, RegisterRejectsInvalidInput) {
    auto expectInvalid = [this](const ClientRegistration& reg, ErrorCode code) {
        auto result = registry_.registerClient(reg);
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), code);
    };

    auto reg = confidentialRegistration();
    reg.name.clear();
    expectInvalid(reg, ErrorCode::InvalidRequest);

    reg = confidentialRegistration();
    reg.grantTypes.clear();
    expectInvalid(reg, ErrorCode::InvalidRequest);

    reg = confidentialRegistration();
    reg.redirectUris.clear();
    expectInvalid(reg, ErrorCode::InvalidRequest);

    reg = confidentialRegistration();
    reg.redirectUris = {"https://billing.example.com/cb#fragment"};
    expectInvalid(reg, ErrorCode::InvalidRequest);

    reg = confidentialRegistration();
    reg.secret = "";
    expectInvalid(reg, ErrorCode::InvalidRequest);

    reg = publicRegistration();
    reg.grantTypes.push_back(GrantType::ClientCredentials);
    expectInvalid(reg, ErrorCode::InvalidRequest);

    reg = publicRegistration();
    reg.secret = "not-allowed";
    expectInvalid(reg, ErrorCode::InvalidRequest);

    reg = confidentialRegistration();
    reg.scopes = {"billing:everything"};
    expectInvalid(reg, ErrorCode::InvalidScope);

    EXPECT_TRUE(store_->list().value().empty());
}

TEST_F(ClientRegistryTest, RegisterLogsClient) {
    ocs::test::ScopedMockLogger logger;
    auto created = mustRegister(confidentialRegistration());
    EXPECT_TRUE(logger->contains({"[Client] client registered", "client_id=" + created.client.id}));
    ASSERT_TRUE(created.plainSecret.has_value());
    EXPECT_FALSE(logger->contains({*created.plainSecret}));
}

// =============================================================================
// Authentication
// =============================================================================

TEST_F(ClientRegistryTest, AuthenticateConfidential) {
    auto created = mustRegister(confidentialRegistration());
    auto client = registry_.authenticate(created.client.id, created.plainSecret);
    ASSERT_TRUE(client.hasValue());
    EXPECT_EQ(client.value().id, created.client.id);
}

TEST_F(ClientRegistryTest, AuthenticationFailuresAreUniform) {
    auto confidential = mustRegister(confidentialRegistration());
    auto pub = mustRegister(publicRegistration());
    auto revoked = mustRegister(confidentialRegistration());
    ASSERT_TRUE(registry_.revoke(revoked.client.id).hasValue());

    std::vector<ocs::foundation::AuthResult<Client>> failures;
    failures.push_back(registry_.authenticate("no-such-client", std::string("secret")));
    failures.push_back(registry_.authenticate(confidential.client.id, std::string("wrong")));
    failures.push_back(registry_.authenticate(confidential.client.id, std::nullopt));
    failures.push_back(registry_.authenticate(pub.client.id, std::string("anything")));
    failures.push_back(registry_.authenticate(revoked.client.id, revoked.plainSecret));

    for (const auto& failure : failures) {
        ASSERT_TRUE(failure.hasError());
        EXPECT_EQ(failure.error().code(), ErrorCode::InvalidClient);
        EXPECT_EQ(failure.error().message(), "client authentication failed");
    }
}

TEST_F(ClientRegistryTest, AuthenticatePublicWithoutSecret) {
    auto pub = mustRegister(publicRegistration());
    EXPECT_TRUE(registry_.authenticate(pub.client.id, std::nullopt).hasValue());
}

TEST_F(ClientRegistryTest, AuthenticationFailureLogsReason) {
    ocs::test::ScopedMockLogger logger;
    auto created = mustRegister(confidentialRegistration());
    ASSERT_TRUE(registry_.authenticate(created.client.id, std::string("wrong")).hasError());
    EXPECT_TRUE(logger->contains({"client authentication failed", "reason=secret mismatch"}));
}

TEST_F(ClientRegistryTest, FindActive) {
    auto created = mustRegister(publicRegistration());
    EXPECT_TRUE(registry_.findActive(created.client.id).hasValue());
    EXPECT_TRUE(registry_.findActive("missing").hasError());

    ASSERT_TRUE(registry_.revoke(created.client.id).hasValue());
    auto revoked = registry_.findActive(created.client.id);
    ASSERT_TRUE(revoked.hasError());
    EXPECT_EQ(revoked.error().code(), ErrorCode::InvalidClient);
}

// =============================================================================
// Reads
// =============================================================================

TEST_F(ClientRegistryTest, FindAndListAreRedacted) {
    auto a = mustRegister(confidentialRegistration());
    clock_->advance(std::chrono::seconds{1});
    auto b = mustRegister(publicRegistration());

    auto found = registry_.find(a.client.id);
    ASSERT_TRUE(found.hasValue());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_FALSE(found.value()->secretHash.has_value());

    EXPECT_FALSE(registry_.find("missing").value().has_value());

    auto list = registry_.list();
    ASSERT_TRUE(list.hasValue());
    ASSERT_EQ(list.value().size(), 2u);
    EXPECT_EQ(list.value()[0].id, a.client.id);
    EXPECT_EQ(list.value()[1].id, b.client.id);
    for (const auto& client : list.value()) {
        EXPECT_FALSE(client.secretHash.has_value());
    }
}

// =============================================================================
// Secret rotation and revocation
// =============================================================================

TEST_F(ClientRegistryTest, RotateSecretInvalidatesOld) {
    ocs::test::ScopedMockLogger logger;
    auto created = mustRegister(confidentialRegistration());
    clock_->advance(std::chrono::seconds{30});

    auto rotated = registry_.rotateSecret(created.client.id);
    ASSERT_TRUE(rotated.hasValue());
    ASSERT_TRUE(rotated.value().plainSecret.has_value());
    EXPECT_NE(*rotated.value().plainSecret, *created.plainSecret);
    EXPECT_FALSE(rotated.value().client.secretHash.has_value());
    EXPECT_EQ(rotated.value().client.updatedAt, clock_->now());

    EXPECT_TRUE(registry_.authenticate(created.client.id, created.plainSecret).hasError());
    EXPECT_TRUE(registry_.authenticate(created.client.id, rotated.value().plainSecret).hasValue());
    EXPECT_TRUE(logger->contains({"[Audit] client secret rotated"}));
}

TEST_F(ClientRegistryTest, RotateSecretToChosenValue) {
    auto created = mustRegister(confidentialRegistration());
    auto rotated = registry_.rotateSecret(created.client.id, std::string("new-secret"));
    ASSERT_TRUE(rotated.hasValue());
    EXPECT_TRUE(registry_.authenticate(created.client.id, std::string("new-secret")).hasValue());

    auto empty = registry_.rotateSecret(created.client.id, std::string());
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code(), ErrorCode::InvalidRequest);
}

TEST_F(ClientRegistryTest, RotateSecretRejections) {
    auto pub = mustRegister(publicRegistration());
    auto publicRotate = registry_.rotateSecret(pub.client.id);
    ASSERT_TRUE(publicRotate.hasError());
    EXPECT_EQ(publicRotate.error().code(), ErrorCode::InvalidRequest);

    auto unknown = registry_.rotateSecret("missing");
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(unknown.error().code(), ErrorCode::InvalidClient);

    auto conf = mustRegister(confidentialRegistration());
    ASSERT_TRUE(registry_.revoke(conf.client.id).hasValue());
    auto revoked = registry_.rotateSecret(conf.client.id);
    ASSERT_TRUE(revoked.hasError());
    EXPECT_EQ(revoked.error().code(), ErrorCode::InvalidClient);
}

TEST_F(ClientRegistryTest, RevokeIsIdempotent) {
    ocs::test::ScopedMockLogger logger;
    auto created = mustRegister(confidentialRegistration());

    EXPECT_TRUE(registry_.revoke(created.client.id).hasValue());
    EXPECT_TRUE(registry_.revoke(created.client.id).hasValue());
    EXPECT_TRUE(store_->findById(created.client.id).value()->revoked);

    auto records = logger->records();
    auto revokedLogs = std::count_if(records.begin(), records.end(), [](const auto& r) {
        return r.message.find("[Audit] client revoked") != std::string::npos;
    });
    EXPECT_EQ(revokedLogs, 1);

    auto unknown = registry_.revoke("missing");
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(unknown.error().code(), ErrorCode::InvalidClient);
}

// =============================================================================
// Storage failures
// =============================================================================

TEST(ClientRegistryStorageTest, StorageFailureIsOpaque) {
    ocs::test::ScopedMockLogger logger;
    ClientRegistry registry(std::make_shared<FailingClientStore>(),
                            std::make_shared<const ScopeManager>(ScopeManager::withDefaults()),
                            SecretHasher(ocs::test::fastScrypt()),
                            std::make_shared<ocs::test::ManualClock>());

    auto auth = registry.authenticate("any", std::string("secret"));
    ASSERT_TRUE(auth.hasError());
    EXPECT_EQ(auth.error().code(), ErrorCode::ServerError);
    EXPECT_EQ(auth.error().message(), "internal server error");
    EXPECT_TRUE(logger->contains({"internal failure", "cause=connection refused"}));

    auto reg = confidentialRegistration();
    auto created = registry.registerClient(reg);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::ServerError);

    auto list = registry.list();
    ASSERT_TRUE(list.hasError());
    EXPECT_EQ(list.error().code(), ErrorCode::ServerError);
}
