#pragma once

/// @file storage.hpp
/// @brief Persistence collaborator interfaces consumed by the OAuth core.
///
/// Each interface exposes find/insert plus the conditional updates the core
/// needs. The single-use and rotation guarantees rest on the conditional
/// updates (markConsumed, revokeIfActive): they must succeed for exactly one
/// caller even across server instances, e.g. as
/// `UPDATE ... SET consumed = 1 WHERE code_hash = ? AND consumed = 0`.
///
/// Validation (expiry, ownership, PKCE) belongs to the core, never to the
/// store. Every method may fail with a Storage-range error.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/service/oauth_types.hpp"

namespace ocs::service {

template <typename T>
using StoreResult = foundation::AuthResult<T>;

class IClientStore {
public:
    virtual ~IClientStore() = default;

    /// Fails DuplicateKey if the id is taken.
    virtual StoreResult<void> insert(Client client) = 0;

    [[nodiscard]] virtual StoreResult<std::optional<Client>> findById(std::string_view id) const = 0;

    [[nodiscard]] virtual StoreResult<std::vector<Client>> list() const = 0;

    /// Replace the secret hash of an existing client. False if absent.
    virtual StoreResult<bool> updateSecretHash(std::string_view id, std::string secretHash,
                                               Timestamp updatedAt) = 0;

    /// Set the revoked flag. False if absent or already revoked.
    virtual StoreResult<bool> markRevoked(std::string_view id, Timestamp updatedAt) = 0;
};

class IAuthorizationCodeStore {
public:
    virtual ~IAuthorizationCodeStore() = default;

    virtual StoreResult<void> insert(AuthorizationCodeRecord record) = 0;

    [[nodiscard]] virtual StoreResult<std::optional<AuthorizationCodeRecord>> findByHash(
        std::string_view codeHash) const = 0;

    /// Atomically flip consumed false -> true.
    /// @return true for exactly one caller; false if absent or already consumed.
    virtual StoreResult<bool> markConsumed(std::string_view codeHash) = 0;

    /// Delete records that expired at or before @p now. Returns the count.
    virtual StoreResult<std::size_t> purgeExpired(Timestamp now) = 0;
};

class IAccessTokenStore {
public:
    virtual ~IAccessTokenStore() = default;

    virtual StoreResult<void> insert(AccessTokenRecord record) = 0;

    [[nodiscard]] virtual StoreResult<std::optional<AccessTokenRecord>> findByJti(
        std::string_view jti) const = 0;

    /// Atomically flip revoked false -> true. False if absent or already revoked.
    virtual StoreResult<bool> revokeIfActive(std::string_view jti) = 0;

    /// Revoke every access token minted from the given refresh token.
    virtual StoreResult<std::size_t> revokeByRefreshHash(std::string_view refreshHash) = 0;

    virtual StoreResult<std::size_t> purgeExpired(Timestamp now) = 0;
};

class IRefreshTokenStore {
public:
    virtual ~IRefreshTokenStore() = default;

    virtual StoreResult<void> insert(RefreshTokenRecord record) = 0;

    [[nodiscard]] virtual StoreResult<std::optional<RefreshTokenRecord>> findByHash(
        std::string_view tokenHash) const = 0;

    /// Atomically flip revoked false -> true.
    /// @return true for exactly one caller; false if absent or already revoked.
    virtual StoreResult<bool> revokeIfActive(std::string_view tokenHash) = 0;

    virtual StoreResult<std::size_t> purgeExpired(Timestamp now) = 0;
};

class IPersonalAccessTokenStore {
public:
    virtual ~IPersonalAccessTokenStore() = default;

    virtual StoreResult<void> insert(PersonalAccessTokenRecord record) = 0;

    [[nodiscard]] virtual StoreResult<std::optional<PersonalAccessTokenRecord>> findByHash(
        std::string_view tokenHash) const = 0;

    [[nodiscard]] virtual StoreResult<std::optional<PersonalAccessTokenRecord>> findById(
        std::string_view id) const = 0;

    [[nodiscard]] virtual StoreResult<std::vector<PersonalAccessTokenRecord>> listByUser(
        std::string_view userId) const = 0;

    virtual StoreResult<bool> revokeIfActive(std::string_view id) = 0;

    /// Record a successful use.
    virtual StoreResult<void> touch(std::string_view id, Timestamp usedAt) = 0;

    virtual StoreResult<std::size_t> purgeExpired(Timestamp now) = 0;
};

/// Resource-owner credential lookup for the password grant.
class IUserCredentialStore {
public:
    virtual ~IUserCredentialStore() = default;

    [[nodiscard]] virtual StoreResult<std::optional<UserCredential>> findByUsername(
        std::string_view username) const = 0;
};

/// The full set of stores the authorization server is built over.
struct OAuthStorage {
    std::shared_ptr<IClientStore> clients;
    std::shared_ptr<IAuthorizationCodeStore> codes;
    std::shared_ptr<IAccessTokenStore> accessTokens;
    std::shared_ptr<IRefreshTokenStore> refreshTokens;
    std::shared_ptr<IPersonalAccessTokenStore> personalTokens;
    std::shared_ptr<IUserCredentialStore> users;  ///< Optional; password grant only.
};

} // namespace ocs::service
