#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "ocs/foundation/common_adapter.hpp"

using namespace ocs::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidGrant), "OAuth");
    EXPECT_EQ(errorSubsystem(ErrorCode::RandomFailed), "Crypto");
    EXPECT_EQ(errorSubsystem(ErrorCode::DuplicateKey), "Storage");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, OAuthWireNames) {
    EXPECT_EQ(oauthErrorName(ErrorCode::InvalidRequest), "invalid_request");
    EXPECT_EQ(oauthErrorName(ErrorCode::InvalidClient), "invalid_client");
    EXPECT_EQ(oauthErrorName(ErrorCode::InvalidGrant), "invalid_grant");
    EXPECT_EQ(oauthErrorName(ErrorCode::UnauthorizedClient), "unauthorized_client");
    EXPECT_EQ(oauthErrorName(ErrorCode::UnsupportedGrantType), "unsupported_grant_type");
    EXPECT_EQ(oauthErrorName(ErrorCode::InvalidScope), "invalid_scope");
    EXPECT_EQ(oauthErrorName(ErrorCode::AccessDenied), "access_denied");
    EXPECT_EQ(oauthErrorName(ErrorCode::TemporarilyUnavailable), "temporarily_unavailable");
    EXPECT_EQ(oauthErrorName(ErrorCode::InvalidToken), "invalid_token");
}

TEST(ErrorCodeTest, InternalCodesAreServerError) {
    EXPECT_EQ(oauthErrorName(ErrorCode::ServerError), "server_error");
    EXPECT_EQ(oauthErrorName(ErrorCode::SigningFailed), "server_error");
    EXPECT_EQ(oauthErrorName(ErrorCode::StorageError), "server_error");
    EXPECT_EQ(oauthErrorName(ErrorCode::ConfigLoadFailed), "server_error");
    EXPECT_EQ(oauthErrorName(ErrorCode::Unknown), "server_error");

    EXPECT_TRUE(isOAuthError(ErrorCode::InvalidScope));
    EXPECT_FALSE(isOAuthError(ErrorCode::HashFailed));
}

TEST(ErrorCodeTest, HttpStatus) {
    EXPECT_EQ(httpStatusFor(ErrorCode::InvalidRequest), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::InvalidGrant), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::InvalidScope), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::UnsupportedGrantType), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::InvalidClient), 401);
    EXPECT_EQ(httpStatusFor(ErrorCode::UnauthorizedClient), 401);
    EXPECT_EQ(httpStatusFor(ErrorCode::AccessDenied), 403);
    EXPECT_EQ(httpStatusFor(ErrorCode::TemporarilyUnavailable), 503);
    EXPECT_EQ(httpStatusFor(ErrorCode::ServerError), 500);
    EXPECT_EQ(httpStatusFor(ErrorCode::StorageError), 500);
}

// --- AuthError tests ---

TEST(AuthErrorTest, DefaultConstruction) {
    AuthError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(AuthErrorTest, CodeAndMessage) {
    AuthError err(ErrorCode::InvalidGrant, "code expired");
    EXPECT_EQ(err.code(), ErrorCode::InvalidGrant);
    EXPECT_EQ(err.message(), "code expired");
    EXPECT_EQ(err.subsystem(), "OAuth");
    EXPECT_EQ(err.oauthName(), "invalid_grant");
    EXPECT_FALSE(err.isSuccess());
}

TEST(AuthErrorTest, WithContext) {
    struct DebugInfo {
        int line = 42;
    };
    AuthError err(ErrorCode::StorageError, "write failed", DebugInfo{99});
    EXPECT_TRUE(err.hasContext());
    auto* info = err.context<DebugInfo>();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->line, 99);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(AuthErrorTest, SuccessCheck) {
    AuthError success(ErrorCode::Success);
    EXPECT_TRUE(success.isSuccess());
}

// --- AuthResult tests ---

TEST(AuthResultTest, OkValue) {
    auto result = AuthResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(AuthResultTest, ErrorValue) {
    auto result = AuthResult<int>::err(AuthError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(AuthResultTest, VoidOk) {
    auto result = AuthResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(AuthResultTest, VoidError) {
    auto result = AuthResult<void>::err(AuthError(ErrorCode::NotFound, "gone"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

// --- Clock tests ---

TEST(ClockTest, EpochSecondsRoundTrip) {
    auto tp = fromEpochSeconds(1'700'000'000);
    EXPECT_EQ(toEpochSeconds(tp), 1'700'000'000);
    EXPECT_EQ(toEpochSeconds(tp + std::chrono::milliseconds(999)), 1'700'000'000);
}

TEST(ClockTest, SystemClockIsShared) {
    auto a = SystemClock::shared();
    auto b = SystemClock::shared();
    EXPECT_EQ(a.get(), b.get());
    EXPECT_GT(toEpochSeconds(a->now()), 0);
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("ocs_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("test.yaml", R"(
oauth:
  issuer: "https://auth.example.test"
  access_token_lifetime: 900
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto lifetime = config.get<int>("oauth.access_token_lifetime");
    ASSERT_TRUE(lifetime.hasValue());
    EXPECT_EQ(lifetime.value(), 900);

    auto issuer = config.get<std::string>("oauth.issuer");
    ASSERT_TRUE(issuer.hasValue());
    EXPECT_EQ(issuer.value(), "https://auth.example.test");
}

TEST_F(ConfigManagerTest, LoadFromString) {
    ConfigManager config;
    auto loadResult = config.loadFromString("oauth:\n  scrypt:\n    n: 1024\n");
    ASSERT_TRUE(loadResult.hasValue());

    auto n = config.get<uint64_t>("oauth.scrypt.n");
    ASSERT_TRUE(n.hasValue());
    EXPECT_EQ(n.value(), 1024u);
}

TEST_F(ConfigManagerTest, NonMapRootRejected) {
    ConfigManager config;
    auto result = config.loadFromString("- just\n- a\n- list\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "value: hello");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("oauth.auth_code_lifetime", 120);

    auto result = config.get<int>("oauth.auth_code_lifetime");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 120);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "key: value");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, KeysWithPrefix) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
oauth:
  issuer: a
  scrypt:
    n: 1024
logging:
  level: info
)").hasValue());

    auto keys = config.keysWithPrefix("oauth.");
    EXPECT_EQ(keys.size(), 2u);
    EXPECT_NE(std::find(keys.begin(), keys.end(), "oauth.issuer"), keys.end());
    EXPECT_NE(std::find(keys.begin(), keys.end(), "oauth.scrypt.n"), keys.end());
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("oauth.issuer", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<std::string>("oauth.issuer", "https://other.example.test");
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "oauth.issuer");
}
