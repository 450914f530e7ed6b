#pragma once

/// @file authorization_code_service.hpp
/// @brief Authorization code issuance and single-use exchange with PKCE.

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/clock.hpp"
#include "ocs/service/oauth_config.hpp"
#include "ocs/service/oauth_types.hpp"
#include "ocs/service/scope_manager.hpp"
#include "ocs/service/storage.hpp"
#include "ocs/service/token_issuer.hpp"

namespace ocs::service {

/// Issues authorization codes and redeems them exactly once.
///
/// A code moves Issued -> Consumed on a successful exchange or
/// Issued -> Expired when its lifetime passes; both are terminal. The
/// exchange validates everything first and only then flips the consumed
/// flag through IAuthorizationCodeStore::markConsumed, so a failed
/// exchange (wrong verifier, wrong redirect URI) leaves the code usable
/// while two racing exchanges still produce exactly one token pair.
class AuthorizationCodeService {
public:
    AuthorizationCodeService(std::shared_ptr<const OAuthConfig> config,
                             std::shared_ptr<IAuthorizationCodeStore> codes,
                             std::shared_ptr<const ScopeManager> scopes,
                             std::shared_ptr<const TokenIssuer> issuer,
                             std::shared_ptr<foundation::IClock> clock);

    /// Issue a code for an authenticated resource owner.
    ///
    /// @param scopes Requested scopes; empty means the client's allowed set.
    /// @return The raw code, shown once. UnauthorizedClient if the client may
    ///         not use authorization_code, InvalidRequest for an unregistered
    ///         redirect URI or a missing/malformed PKCE challenge,
    ///         InvalidScope for scopes outside the client's allow-list.
    [[nodiscard]] foundation::AuthResult<std::string> issue(
        const Client& client,
        std::string_view subject,
        std::string_view redirectUri,
        const ScopeList& scopes,
        const std::optional<PkceChallenge>& pkce) const;

    /// Redeem a code for a token pair.
    ///
    /// Every failure concerning the code itself is InvalidGrant.
    [[nodiscard]] foundation::AuthResult<TokenResponse> exchange(
        const Client& client,
        std::string_view code,
        std::string_view redirectUri,
        const std::optional<std::string>& codeVerifier) const;

private:
    [[nodiscard]] bool pkceRequired(const Client& client) const noexcept;

    std::shared_ptr<const OAuthConfig> config_;
    std::shared_ptr<IAuthorizationCodeStore> codes_;
    std::shared_ptr<const ScopeManager> scopes_;
    std::shared_ptr<const TokenIssuer> issuer_;
    std::shared_ptr<foundation::IClock> clock_;
};

} // namespace ocs::service
