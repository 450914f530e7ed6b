#pragma once

/// @file memory_storage.hpp
/// @brief Thread-safe in-memory implementations of every storage interface.
///
/// Intended for tests and the development server. Each store guards its map
/// with one mutex, which makes the conditional updates trivially atomic.

#include <mutex>
#include <string>
#include <unordered_map>

#include "ocs/service/storage.hpp"

namespace ocs::service {

class InMemoryClientStore final : public IClientStore {
public:
    StoreResult<void> insert(Client client) override;
    [[nodiscard]] StoreResult<std::optional<Client>> findById(std::string_view id) const override;
    [[nodiscard]] StoreResult<std::vector<Client>> list() const override;
    StoreResult<bool> updateSecretHash(std::string_view id, std::string secretHash,
                                       Timestamp updatedAt) override;
    StoreResult<bool> markRevoked(std::string_view id, Timestamp updatedAt) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Client> clients_;
};

class InMemoryAuthorizationCodeStore final : public IAuthorizationCodeStore {
public:
    StoreResult<void> insert(AuthorizationCodeRecord record) override;
    [[nodiscard]] StoreResult<std::optional<AuthorizationCodeRecord>> findByHash(
        std::string_view codeHash) const override;
    StoreResult<bool> markConsumed(std::string_view codeHash) override;
    StoreResult<std::size_t> purgeExpired(Timestamp now) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AuthorizationCodeRecord> codes_;
};

class InMemoryAccessTokenStore final : public IAccessTokenStore {
public:
    StoreResult<void> insert(AccessTokenRecord record) override;
    [[nodiscard]] StoreResult<std::optional<AccessTokenRecord>> findByJti(
        std::string_view jti) const override;
    StoreResult<bool> revokeIfActive(std::string_view jti) override;
    StoreResult<std::size_t> revokeByRefreshHash(std::string_view refreshHash) override;
    StoreResult<std::size_t> purgeExpired(Timestamp now) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AccessTokenRecord> tokens_;
};

class InMemoryRefreshTokenStore final : public IRefreshTokenStore {
public:
    StoreResult<void> insert(RefreshTokenRecord record) override;
    [[nodiscard]] StoreResult<std::optional<RefreshTokenRecord>> findByHash(
        std::string_view tokenHash) const override;
    StoreResult<bool> revokeIfActive(std::string_view tokenHash) override;
    StoreResult<std::size_t> purgeExpired(Timestamp now) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RefreshTokenRecord> tokens_;
};

class InMemoryPersonalAccessTokenStore final : public IPersonalAccessTokenStore {
public:
    StoreResult<void> insert(PersonalAccessTokenRecord record) override;
    [[nodiscard]] StoreResult<std::optional<PersonalAccessTokenRecord>> findByHash(
        std::string_view tokenHash) const override;
    [[nodiscard]] StoreResult<std::optional<PersonalAccessTokenRecord>> findById(
        std::string_view id) const override;
    [[nodiscard]] StoreResult<std::vector<PersonalAccessTokenRecord>> listByUser(
        std::string_view userId) const override;
    StoreResult<bool> revokeIfActive(std::string_view id) override;
    StoreResult<void> touch(std::string_view id, Timestamp usedAt) override;
    StoreResult<std::size_t> purgeExpired(Timestamp now) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PersonalAccessTokenRecord> tokens_;  // keyed by id
    std::unordered_map<std::string, std::string> idByHash_;
};

class InMemoryUserCredentialStore final : public IUserCredentialStore {
public:
    /// Add or replace a user. @p credential.passwordHash must already be
    /// encoded by SecretHasher.
    void upsert(UserCredential credential);

    [[nodiscard]] StoreResult<std::optional<UserCredential>> findByUsername(
        std::string_view username) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, UserCredential> users_;
};

/// In-memory stores bundled for wiring an AuthorizationServer.
struct InMemoryStorage {
    std::shared_ptr<InMemoryClientStore> clients = std::make_shared<InMemoryClientStore>();
    std::shared_ptr<InMemoryAuthorizationCodeStore> codes =
        std::make_shared<InMemoryAuthorizationCodeStore>();
    std::shared_ptr<InMemoryAccessTokenStore> accessTokens =
        std::make_shared<InMemoryAccessTokenStore>();
    std::shared_ptr<InMemoryRefreshTokenStore> refreshTokens =
        std::make_shared<InMemoryRefreshTokenStore>();
    std::shared_ptr<InMemoryPersonalAccessTokenStore> personalTokens =
        std::make_shared<InMemoryPersonalAccessTokenStore>();
    std::shared_ptr<InMemoryUserCredentialStore> users =
        std::make_shared<InMemoryUserCredentialStore>();

    [[nodiscard]] OAuthStorage view() const;

    /// Sweep expired rows from every store. Returns the total removed.
    StoreResult<std::size_t> purgeExpired(Timestamp now);
};

} // namespace ocs::service
