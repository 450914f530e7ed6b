/// @file memory_storage.cpp
/// @brief In-memory storage implementations.

#include "ocs/service/memory_storage.hpp"

#include <algorithm>

namespace ocs::service {

using ocs::foundation::AuthError;
using ocs::foundation::ErrorCode;

namespace {

template <typename Map, typename Pred>
std::size_t eraseIf(Map& map, Pred pred) {
    std::size_t removed = 0;
    for (auto it = map.begin(); it != map.end();) {
        if (pred(it->second)) {
            it = map.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

StoreResult<void> duplicate(std::string_view what) {
    return StoreResult<void>::err(
        AuthError(ErrorCode::DuplicateKey, "duplicate " + std::string(what)));
}

}  // namespace

// =============================================================================
// Clients
// =============================================================================

StoreResult<void> InMemoryClientStore::insert(Client client) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = client.id;
    if (!clients_.emplace(std::move(key), std::move(client)).second) {
        return duplicate("client id");
    }
    return StoreResult<void>::ok();
}

StoreResult<std::optional<Client>> InMemoryClientStore::findById(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(std::string(id));
    if (it == clients_.end()) {
        return StoreResult<std::optional<Client>>::ok(std::nullopt);
    }
    return StoreResult<std::optional<Client>>::ok(it->second);
}

StoreResult<std::vector<Client>> InMemoryClientStore::list() const {
    std::vector<Client> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(clients_.size());
        for (const auto& [id, client] : clients_) {
            out.push_back(client);
        }
    }
    std::sort(out.begin(), out.end(), [](const Client& a, const Client& b) {
        return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.id < b.id;
    });
    return StoreResult<std::vector<Client>>::ok(std::move(out));
}

StoreResult<bool> InMemoryClientStore::updateSecretHash(std::string_view id,
                                                        std::string secretHash,
                                                        Timestamp updatedAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(std::string(id));
    if (it == clients_.end()) {
        return StoreResult<bool>::ok(false);
    }
    it->second.secretHash = std::move(secretHash);
    it->second.updatedAt = updatedAt;
    return StoreResult<bool>::ok(true);
}

StoreResult<bool> InMemoryClientStore::markRevoked(std::string_view id, Timestamp updatedAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(std::string(id));
    if (it == clients_.end() || it->second.revoked) {
        return StoreResult<bool>::ok(false);
    }
    it->second.revoked = true;
    it->second.updatedAt = updatedAt;
    return StoreResult<bool>::ok(true);
}

// =============================================================================
// Authorization codes
// =============================================================================

StoreResult<void> InMemoryAuthorizationCodeStore::insert(AuthorizationCodeRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = record.codeHash;
    if (!codes_.emplace(std::move(key), std::move(record)).second) {
        return duplicate("authorization code");
    }
    return StoreResult<void>::ok();
}

StoreResult<std::optional<AuthorizationCodeRecord>> InMemoryAuthorizationCodeStore::findByHash(
    std::string_view codeHash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codes_.find(std::string(codeHash));
    if (it == codes_.end()) {
        return StoreResult<std::optional<AuthorizationCodeRecord>>::ok(std::nullopt);
    }
    return StoreResult<std::optional<AuthorizationCodeRecord>>::ok(it->second);
}

StoreResult<bool> InMemoryAuthorizationCodeStore::markConsumed(std::string_view codeHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codes_.find(std::string(codeHash));
    if (it == codes_.end() || it->second.consumed) {
        return StoreResult<bool>::ok(false);
    }
    it->second.consumed = true;
    return StoreResult<bool>::ok(true);
}

StoreResult<std::size_t> InMemoryAuthorizationCodeStore::purgeExpired(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return StoreResult<std::size_t>::ok(
        eraseIf(codes_, [&](const AuthorizationCodeRecord& r) { return r.expiresAt <= now; }));
}

std::size_t InMemoryAuthorizationCodeStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return codes_.size();
}

// =============================================================================
// Access tokens
// =============================================================================

StoreResult<void> InMemoryAccessTokenStore::insert(AccessTokenRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = record.jti;
    if (!tokens_.emplace(std::move(key), std::move(record)).second) {
        return duplicate("access token id");
    }
    return StoreResult<void>::ok();
}

StoreResult<std::optional<AccessTokenRecord>> InMemoryAccessTokenStore::findByJti(
    std::string_view jti) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(jti));
    if (it == tokens_.end()) {
        return StoreResult<std::optional<AccessTokenRecord>>::ok(std::nullopt);
    }
    return StoreResult<std::optional<AccessTokenRecord>>::ok(it->second);
}

StoreResult<bool> InMemoryAccessTokenStore::revokeIfActive(std::string_view jti) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(jti));
    if (it == tokens_.end() || it->second.revoked) {
        return StoreResult<bool>::ok(false);
    }
    it->second.revoked = true;
    return StoreResult<bool>::ok(true);
}

StoreResult<std::size_t> InMemoryAccessTokenStore::revokeByRefreshHash(
    std::string_view refreshHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (auto& [jti, record] : tokens_) {
        if (!record.revoked && record.refreshTokenHash && *record.refreshTokenHash == refreshHash) {
            record.revoked = true;
            ++count;
        }
    }
    return StoreResult<std::size_t>::ok(count);
}

StoreResult<std::size_t> InMemoryAccessTokenStore::purgeExpired(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return StoreResult<std::size_t>::ok(
        eraseIf(tokens_, [&](const AccessTokenRecord& r) { return r.expiresAt <= now; }));
}

std::size_t InMemoryAccessTokenStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

// =============================================================================
// Refresh tokens
// =============================================================================

StoreResult<void> InMemoryRefreshTokenStore::insert(RefreshTokenRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = record.tokenHash;
    if (!tokens_.emplace(std::move(key), std::move(record)).second) {
        return duplicate("refresh token");
    }
    return StoreResult<void>::ok();
}

StoreResult<std::optional<RefreshTokenRecord>> InMemoryRefreshTokenStore::findByHash(
    std::string_view tokenHash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(tokenHash));
    if (it == tokens_.end()) {
        return StoreResult<std::optional<RefreshTokenRecord>>::ok(std::nullopt);
    }
    return StoreResult<std::optional<RefreshTokenRecord>>::ok(it->second);
}

StoreResult<bool> InMemoryRefreshTokenStore::revokeIfActive(std::string_view tokenHash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(tokenHash));
    if (it == tokens_.end() || it->second.revoked) {
        return StoreResult<bool>::ok(false);
    }
    it->second.revoked = true;
    return StoreResult<bool>::ok(true);
}

StoreResult<std::size_t> InMemoryRefreshTokenStore::purgeExpired(Timestamp now) {
    // Revoked but unexpired rows stay so that replays are still recognised.
    std::lock_guard<std::mutex> lock(mutex_);
    return StoreResult<std::size_t>::ok(
        eraseIf(tokens_, [&](const RefreshTokenRecord& r) { return r.expiresAt <= now; }));
}

std::size_t InMemoryRefreshTokenStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

// =============================================================================
// Personal access tokens
// =============================================================================

StoreResult<void> InMemoryPersonalAccessTokenStore::insert(PersonalAccessTokenRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tokens_.count(record.id) > 0 || idByHash_.count(record.tokenHash) > 0) {
        return duplicate("personal access token");
    }
    idByHash_.emplace(record.tokenHash, record.id);
    auto key = record.id;
    tokens_.emplace(std::move(key), std::move(record));
    return StoreResult<void>::ok();
}

StoreResult<std::optional<PersonalAccessTokenRecord>>
InMemoryPersonalAccessTokenStore::findByHash(std::string_view tokenHash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idIt = idByHash_.find(std::string(tokenHash));
    if (idIt == idByHash_.end()) {
        return StoreResult<std::optional<PersonalAccessTokenRecord>>::ok(std::nullopt);
    }
    auto it = tokens_.find(idIt->second);
    if (it == tokens_.end()) {
        return StoreResult<std::optional<PersonalAccessTokenRecord>>::ok(std::nullopt);
    }
    return StoreResult<std::optional<PersonalAccessTokenRecord>>::ok(it->second);
}

StoreResult<std::optional<PersonalAccessTokenRecord>>
InMemoryPersonalAccessTokenStore::findById(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(id));
    if (it == tokens_.end()) {
        return StoreResult<std::optional<PersonalAccessTokenRecord>>::ok(std::nullopt);
    }
    return StoreResult<std::optional<PersonalAccessTokenRecord>>::ok(it->second);
}

StoreResult<std::vector<PersonalAccessTokenRecord>>
InMemoryPersonalAccessTokenStore::listByUser(std::string_view userId) const {
    std::vector<PersonalAccessTokenRecord> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, record] : tokens_) {
            if (record.userId == userId) {
                out.push_back(record);
            }
        }
    }
    std::sort(out.begin(), out.end(),
              [](const PersonalAccessTokenRecord& a, const PersonalAccessTokenRecord& b) {
                  return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.id < b.id;
              });
    return StoreResult<std::vector<PersonalAccessTokenRecord>>::ok(std::move(out));
}

StoreResult<bool> InMemoryPersonalAccessTokenStore::revokeIfActive(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(id));
    if (it == tokens_.end() || it->second.revoked) {
        return StoreResult<bool>::ok(false);
    }
    it->second.revoked = true;
    return StoreResult<bool>::ok(true);
}

StoreResult<void> InMemoryPersonalAccessTokenStore::touch(std::string_view id, Timestamp usedAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(std::string(id));
    if (it == tokens_.end()) {
        return StoreResult<void>::err(
            AuthError(ErrorCode::RecordNotFound, "personal access token not found"));
    }
    it->second.lastUsedAt = usedAt;
    return StoreResult<void>::ok();
}

StoreResult<std::size_t> InMemoryPersonalAccessTokenStore::purgeExpired(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = tokens_.begin(); it != tokens_.end();) {
        if (it->second.expiresAt && *it->second.expiresAt <= now) {
            idByHash_.erase(it->second.tokenHash);
            it = tokens_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return StoreResult<std::size_t>::ok(removed);
}

// =============================================================================
// Users
// =============================================================================

void InMemoryUserCredentialStore::upsert(UserCredential credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = credential.username;
    users_[std::move(key)] = std::move(credential);
}

StoreResult<std::optional<UserCredential>> InMemoryUserCredentialStore::findByUsername(
    std::string_view username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(std::string(username));
    if (it == users_.end()) {
        return StoreResult<std::optional<UserCredential>>::ok(std::nullopt);
    }
    return StoreResult<std::optional<UserCredential>>::ok(it->second);
}

// =============================================================================
// Bundle
// =============================================================================

OAuthStorage InMemoryStorage::view() const {
    return OAuthStorage{clients, codes, accessTokens, refreshTokens, personalTokens, users};
}

StoreResult<std::size_t> InMemoryStorage::purgeExpired(Timestamp now) {
    std::size_t total = 0;
    for (auto removed : {codes->purgeExpired(now), accessTokens->purgeExpired(now),
                         refreshTokens->purgeExpired(now), personalTokens->purgeExpired(now)}) {
        if (!removed) {
            return removed;
        }
        total += removed.value();
    }
    return StoreResult<std::size_t>::ok(total);
}

}  // namespace ocs::service
