#pragma once

/// @file personal_access_tokens.hpp
/// @brief User-created long-lived tokens outside the grant flows.

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/clock.hpp"
#include "ocs/service/oauth_config.hpp"
#include "ocs/service/oauth_types.hpp"
#include "ocs/service/scope_manager.hpp"
#include "ocs/service/storage.hpp"

namespace ocs::service {

/// Creates, authenticates, lists and revokes personal access tokens.
///
/// Only the SHA-256 hash of a token is stored; the raw value is returned
/// once from create(). Records returned by listForUser() carry no hash.
class PersonalAccessTokenService {
public:
    PersonalAccessTokenService(std::shared_ptr<const OAuthConfig> config,
                               std::shared_ptr<IPersonalAccessTokenStore> store,
                               std::shared_ptr<const ScopeManager> scopes,
                               std::shared_ptr<foundation::IClock> clock);

    /// @param lifetime nullopt uses the configured default; zero never expires.
    [[nodiscard]] foundation::AuthResult<CreatedPersonalAccessToken> create(
        std::string_view userId,
        std::string_view name,
        const ScopeList& scopes,
        std::optional<std::chrono::seconds> lifetime = std::nullopt) const;

    /// Resolve a raw token and record its use.
    /// @return InvalidToken for unknown, revoked or expired tokens.
    [[nodiscard]] foundation::AuthResult<PersonalAccessTokenRecord> authenticate(
        std::string_view token) const;

    [[nodiscard]] foundation::AuthResult<std::vector<PersonalAccessTokenRecord>> listForUser(
        std::string_view userId) const;

    /// Revoke one of @p userId's tokens. NotFound for an unknown id,
    /// AccessDenied for a token owned by someone else.
    [[nodiscard]] foundation::AuthResult<void> revoke(std::string_view userId,
                                                      std::string_view tokenId) const;

private:
    std::shared_ptr<const OAuthConfig> config_;
    std::shared_ptr<IPersonalAccessTokenStore> store_;
    std::shared_ptr<const ScopeManager> scopes_;
    std::shared_ptr<foundation::IClock> clock_;
};

} // namespace ocs::service
