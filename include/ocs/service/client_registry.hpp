#pragma once

/// @file client_registry.hpp
/// @brief Registration, authentication and lifecycle of OAuth2 clients.

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/foundation/clock.hpp"
#include "ocs/service/oauth_types.hpp"
#include "ocs/service/scope_manager.hpp"
#include "ocs/service/secret_hasher.hpp"
#include "ocs/service/storage.hpp"

namespace ocs::service {

/// Stores and authenticates OAuth2 clients.
///
/// Secrets are hashed with SecretHasher at registration and rotation, and
/// the plaintext is returned exactly once. Reads through find()/list()
/// redact the hash.
///
/// Authentication failures are deliberately uniform: unknown client, wrong
/// secret, a secret sent by a public client, a missing secret from a
/// confidential client and a revoked client all yield the same
/// InvalidClient error. Unknown clients still pay for one scrypt
/// evaluation so response timing does not reveal which ids exist.
///
/// @code
///   ClientRegistration reg;
///   reg.name = "billing";
///   reg.grantTypes = {GrantType::ClientCredentials};
///   reg.scopes = {"api:read"};
///   auto created = registry.registerClient(reg);
///   auto client = registry.authenticate(created.value().client.id,
///                                        *created.value().plainSecret);
/// @endcode
class ClientRegistry {
public:
    ClientRegistry(std::shared_ptr<IClientStore> store,
                   std::shared_ptr<const ScopeManager> scopes,
                   SecretHasher hasher,
                   std::shared_ptr<foundation::IClock> clock);

    /// Validate and persist a new client.
    ///
    /// InvalidRequest for a bad name, redirect URI or grant list (including a
    /// secret supplied for a public client); InvalidScope for an unregistered
    /// scope.
    [[nodiscard]] foundation::AuthResult<RegisteredClient> registerClient(
        const ClientRegistration& registration);

    /// Authenticate a client by id and optional secret.
    [[nodiscard]] foundation::AuthResult<Client> authenticate(
        std::string_view clientId, const std::optional<std::string>& secret) const;

    /// Look up an active client without authenticating it (public-client
    /// authorization requests). Revoked and unknown clients fail InvalidClient.
    [[nodiscard]] foundation::AuthResult<Client> findActive(std::string_view clientId) const;

    /// Redacted client, or nullopt.
    [[nodiscard]] foundation::AuthResult<std::optional<Client>> find(
        std::string_view clientId) const;

    /// All clients, redacted, in registration order.
    [[nodiscard]] foundation::AuthResult<std::vector<Client>> list() const;

    /// Replace the secret of a confidential client.
    /// @return Redacted client plus the new plaintext secret.
    [[nodiscard]] foundation::AuthResult<RegisteredClient> rotateSecret(
        std::string_view clientId, std::optional<std::string> newSecret = std::nullopt);

    /// Soft-revoke a client. Revoking twice succeeds.
    [[nodiscard]] foundation::AuthResult<void> revoke(std::string_view clientId);

    /// Copy of @p client without its secret hash.
    [[nodiscard]] static Client redact(Client client);

private:
    foundation::AuthResult<std::string> hashSecret(std::string_view secret) const;

    std::shared_ptr<IClientStore> store_;
    std::shared_ptr<const ScopeManager> scopes_;
    SecretHasher hasher_;
    std::shared_ptr<foundation::IClock> clock_;

    /// Hash verified when the client id is unknown.
    std::string dummyHash_;
};

} // namespace ocs::service
