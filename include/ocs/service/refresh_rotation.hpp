#pragma once

/// @file refresh_rotation.hpp
/// @brief Refresh-token exchange with rotation on every use.

#include <memory>
#include <optional>
#include <string_view>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/clock.hpp"
#include "ocs/service/oauth_types.hpp"
#include "ocs/service/scope_manager.hpp"
#include "ocs/service/storage.hpp"
#include "ocs/service/token_issuer.hpp"

namespace ocs::service {

/// Exchanges a refresh token for a new access/refresh pair.
///
/// The presented token is revoked through IRefreshTokenStore::revokeIfActive
/// before anything is minted, so concurrent refreshes with one token yield
/// one success and InvalidGrant for the rest. Presenting an already rotated
/// token is logged to the Audit category as a replay.
class RefreshRotation {
public:
    RefreshRotation(std::shared_ptr<IRefreshTokenStore> refreshTokens,
                    std::shared_ptr<const ScopeManager> scopes,
                    std::shared_ptr<const TokenIssuer> issuer,
                    std::shared_ptr<foundation::IClock> clock);

    /// @param requestedScopes Optional narrowing; nullopt or empty keeps the
    ///        original scopes. Any scope outside the original grant fails
    ///        InvalidScope.
    [[nodiscard]] foundation::AuthResult<TokenResponse> refresh(
        const Client& client,
        std::string_view refreshToken,
        const std::optional<ScopeList>& requestedScopes = std::nullopt) const;

private:
    std::shared_ptr<IRefreshTokenStore> refreshTokens_;
    std::shared_ptr<const ScopeManager> scopes_;
    std::shared_ptr<const TokenIssuer> issuer_;
    std::shared_ptr<foundation::IClock> clock_;
};

} // namespace ocs::service
