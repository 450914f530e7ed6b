/// @file client_registry.cpp
/// @brief ClientRegistry implementation.

#include "ocs/service/client_registry.hpp"

#include "ocs/foundation/server_logger.hpp"
#include "ocs/service/input_validator.hpp"
#include "ocs/service/token_codec.hpp"

#include "oauth_errors.hpp"

#include <algorithm>

namespace ocs::service {

using ocs::foundation::AuthError;
using ocs::foundation::AuthResult;
using ocs::foundation::ErrorCode;
using ocs::foundation::LogCategory;
using ocs::foundation::LogContext;
using ocs::foundation::LogLevel;

namespace {

AuthError invalidRequest(std::string message) {
    return AuthError(ErrorCode::InvalidRequest, std::move(message));
}

void logAuthFailure(std::string_view clientId, std::string_view reason) {
    LogContext ctx;
    ctx.clientId = std::string(clientId);
    ctx.extra["reason"] = std::string(reason);
    OCS_LOG_CTX(LogLevel::Info, LogCategory::Client, "client authentication failed", ctx);
}

}  // namespace

ClientRegistry::ClientRegistry(std::shared_ptr<IClientStore> store,
                               std::shared_ptr<const ScopeManager> scopes,
                               SecretHasher hasher,
                               std::shared_ptr<foundation::IClock> clock)
    : store_(std::move(store)),
      scopes_(std::move(scopes)),
      hasher_(hasher),
      clock_(std::move(clock)) {
    auto dummy = hasher_.hash("ocs-unknown-client");
    if (dummy) {
        dummyHash_ = std::move(dummy).value();
    } else {
        OCS_LOG_WARN(LogCategory::Client, "could not prepare timing-equalisation hash");
    }
}

AuthResult<RegisteredClient> ClientRegistry::registerClient(
    const ClientRegistration& registration) {
    if (auto v = InputValidator::validateName(registration.name, "client name"); !v) {
        return AuthResult<RegisteredClient>::err(invalidRequest(v.message));
    }

    std::vector<GrantType> grants;
    for (auto grant : registration.grantTypes) {
        if (std::find(grants.begin(), grants.end(), grant) == grants.end()) {
            grants.push_back(grant);
        }
    }
    if (grants.empty()) {
        return AuthResult<RegisteredClient>::err(
            invalidRequest("at least one grant type is required"));
    }
    const bool usesCodeFlow =
        std::find(grants.begin(), grants.end(), GrantType::AuthorizationCode) != grants.end();
    if (usesCodeFlow && registration.redirectUris.empty()) {
        return AuthResult<RegisteredClient>::err(
            invalidRequest("authorization_code clients need at least one redirect URI"));
    }
    for (const auto& uri : registration.redirectUris) {
        if (auto v = InputValidator::validateRedirectUri(uri); !v) {
            return AuthResult<RegisteredClient>::err(invalidRequest(v.message));
        }
    }
    if (!registration.confidential) {
        if (std::find(grants.begin(), grants.end(), GrantType::ClientCredentials) != grants.end()) {
            return AuthResult<RegisteredClient>::err(
                invalidRequest("client_credentials requires a confidential client"));
        }
        if (registration.secret) {
            return AuthResult<RegisteredClient>::err(
                invalidRequest("public clients cannot have a secret"));
        }
    } else if (registration.secret && registration.secret->empty()) {
        return AuthResult<RegisteredClient>::err(invalidRequest("client secret must not be empty"));
    }

    auto scopes = scopes_->validate(registration.scopes, {std::string(kWildcardScope)});
    if (!scopes) {
        return AuthResult<RegisteredClient>::err(std::move(scopes).error());
    }

    auto id = codec::generateUuid();
    if (!id) {
        return AuthResult<RegisteredClient>::err(
            detail::internalError(id.error(), "generate client id"));
    }

    std::optional<std::string> plainSecret;
    if (registration.confidential) {
        if (registration.secret) {
            plainSecret = *registration.secret;
        } else {
            auto generated = codec::generateOpaqueToken(codec::kClientSecretBytes);
            if (!generated) {
                return AuthResult<RegisteredClient>::err(
                    detail::internalError(generated.error(), "generate client secret"));
            }
            plainSecret = std::move(generated).value();
        }
    }

    Client client;
    client.id = std::move(id).value();
    client.name = registration.name;
    client.redirectUris = registration.redirectUris;
    client.grantTypes = std::move(grants);
    client.scopes = std::move(scopes).value();
    client.confidential = registration.confidential;
    client.createdAt = clock_->now();
    client.updatedAt = client.createdAt;

    if (plainSecret) {
        auto hashed = hashSecret(*plainSecret);
        if (!hashed) {
            return AuthResult<RegisteredClient>::err(std::move(hashed).error());
        }
        client.secretHash = std::move(hashed).value();
    }

    auto stored = store_->insert(client);
    if (!stored) {
        LogContext ctx;
        ctx.clientId = client.id;
        return AuthResult<RegisteredClient>::err(
            detail::internalError(stored.error(), "store client", std::move(ctx)));
    }

    LogContext ctx;
    ctx.clientId = client.id;
    ctx.extra["confidential"] = client.confidential ? "true" : "false";
    OCS_LOG_CTX(LogLevel::Info, LogCategory::Client, "client registered", ctx);

    return AuthResult<RegisteredClient>::ok(
        RegisteredClient{redact(std::move(client)), std::move(plainSecret)});
}

AuthResult<Client> ClientRegistry::authenticate(std::string_view clientId,
                                                const std::optional<std::string>& secret) const {
    auto found = store_->findById(clientId);
    if (!found) {
        LogContext ctx;
        ctx.clientId = std::string(clientId);
        return AuthResult<Client>::err(
            detail::internalError(found.error(), "look up client", std::move(ctx)));
    }

    const std::string presented = secret.value_or(std::string());
    if (!found.value()) {
        (void)hasher_.verify(presented, dummyHash_);
        logAuthFailure(clientId, "unknown client");
        return AuthResult<Client>::err(detail::invalidClient());
    }

    Client client = std::move(*found.value());
    bool ok = false;
    std::string_view reason;
    if (client.isPublic()) {
        ok = !secret.has_value();
        reason = "secret presented by public client";
    } else if (!secret || !client.secretHash) {
        (void)hasher_.verify(presented, dummyHash_);
        reason = "missing secret";
    } else {
        ok = hasher_.verify(*secret, *client.secretHash);
        reason = "secret mismatch";
    }

    if (client.revoked) {
        logAuthFailure(clientId, "revoked client");
        return AuthResult<Client>::err(detail::invalidClient());
    }
    if (!ok) {
        logAuthFailure(clientId, reason);
        return AuthResult<Client>::err(detail::invalidClient());
    }
    return AuthResult<Client>::ok(std::move(client));
}

AuthResult<Client> ClientRegistry::findActive(std::string_view clientId) const {
    auto found = store_->findById(clientId);
    if (!found) {
        LogContext ctx;
        ctx.clientId = std::string(clientId);
        return AuthResult<Client>::err(
            detail::internalError(found.error(), "look up client", std::move(ctx)));
    }
    if (!found.value() || found.value()->revoked) {
        return AuthResult<Client>::err(detail::invalidClient());
    }
    return AuthResult<Client>::ok(std::move(*found.value()));
}

AuthResult<std::optional<Client>> ClientRegistry::find(std::string_view clientId) const {
    auto found = store_->findById(clientId);
    if (!found) {
        return AuthResult<std::optional<Client>>::err(
            detail::internalError(found.error(), "look up client"));
    }
    if (!found.value()) {
        return AuthResult<std::optional<Client>>::ok(std::nullopt);
    }
    return AuthResult<std::optional<Client>>::ok(redact(std::move(*found.value())));
}

AuthResult<std::vector<Client>> ClientRegistry::list() const {
    auto all = store_->list();
    if (!all) {
        return AuthResult<std::vector<Client>>::err(
            detail::internalError(all.error(), "list clients"));
    }
    std::vector<Client> out;
    out.reserve(all.value().size());
    for (auto& client : all.value()) {
        out.push_back(redact(std::move(client)));
    }
    return AuthResult<std::vector<Client>>::ok(std::move(out));
}

AuthResult<RegisteredClient> ClientRegistry::rotateSecret(std::string_view clientId,
                                                          std::optional<std::string> newSecret) {
    auto found = store_->findById(clientId);
    if (!found) {
        return AuthResult<RegisteredClient>::err(
            detail::internalError(found.error(), "look up client"));
    }
    if (!found.value()) {
        return AuthResult<RegisteredClient>::err(
            AuthError(ErrorCode::InvalidClient, "unknown client"));
    }
    Client client = std::move(*found.value());
    if (client.isPublic()) {
        return AuthResult<RegisteredClient>::err(
            invalidRequest("public clients have no secret to rotate"));
    }
    if (client.revoked) {
        return AuthResult<RegisteredClient>::err(
            AuthError(ErrorCode::InvalidClient, "client is revoked"));
    }
    if (newSecret && newSecret->empty()) {
        return AuthResult<RegisteredClient>::err(invalidRequest("client secret must not be empty"));
    }

    if (!newSecret) {
        auto generated = codec::generateOpaqueToken(codec::kClientSecretBytes);
        if (!generated) {
            return AuthResult<RegisteredClient>::err(
                detail::internalError(generated.error(), "generate client secret"));
        }
        newSecret = std::move(generated).value();
    }

    auto hashed = hashSecret(*newSecret);
    if (!hashed) {
        return AuthResult<RegisteredClient>::err(std::move(hashed).error());
    }
    const auto now = clock_->now();
    auto updated = store_->updateSecretHash(client.id, hashed.value(), now);
    if (!updated) {
        return AuthResult<RegisteredClient>::err(
            detail::internalError(updated.error(), "update client secret"));
    }
    if (!updated.value()) {
        return AuthResult<RegisteredClient>::err(
            AuthError(ErrorCode::InvalidClient, "unknown client"));
    }

    LogContext ctx;
    ctx.clientId = client.id;
    OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit, "client secret rotated", ctx);

    client.updatedAt = now;
    return AuthResult<RegisteredClient>::ok(
        RegisteredClient{redact(std::move(client)), std::move(newSecret)});
}

AuthResult<void> ClientRegistry::revoke(std::string_view clientId) {
    auto found = store_->findById(clientId);
    if (!found) {
        return AuthResult<void>::err(detail::internalError(found.error(), "look up client"));
    }
    if (!found.value()) {
        return AuthResult<void>::err(AuthError(ErrorCode::InvalidClient, "unknown client"));
    }
    auto revoked = store_->markRevoked(clientId, clock_->now());
    if (!revoked) {
        return AuthResult<void>::err(detail::internalError(revoked.error(), "revoke client"));
    }
    if (revoked.value()) {
        LogContext ctx;
        ctx.clientId = std::string(clientId);
        OCS_LOG_CTX(LogLevel::Warning, LogCategory::Audit, "client revoked", ctx);
    }
    return AuthResult<void>::ok();
}

Client ClientRegistry::redact(Client client) {
    client.secretHash.reset();
    return client;
}

AuthResult<std::string> ClientRegistry::hashSecret(std::string_view secret) const {
    auto hashed = hasher_.hash(secret);
    if (!hashed) {
        return AuthResult<std::string>::err(detail::internalError(hashed.error(), "hash secret"));
    }
    return hashed;
}

}  // namespace ocs::service
