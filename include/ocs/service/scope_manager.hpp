#pragma once

/// @file scope_manager.hpp
/// @brief Registry of known scopes and scope-set validation.

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ocs/foundation/auth_result.hpp"
#include "ocs/service/oauth_types.hpp"

namespace ocs::service {

/// Wildcard scope granting every registered scope.
inline constexpr std::string_view kWildcardScope = "*";

/// A named permission unit.
struct Scope {
    std::string id;
    std::string description;

    /// Elevated-consent marker. Metadata only; consent enforcement is the
    /// caller's job.
    bool dangerous = false;
};

/// Thread-safe registry of scopes.
///
/// Lookups take a shared lock, so a single instance is shared by every
/// component of the authorization server. Listing operations return copies
/// sorted by id.
///
/// @code
///   auto scopes = ScopeManager::withDefaults();
///   auto granted = scopes.validate({"users:read"}, client.scopes);
///   if (!granted) { ... granted.error().code() == ErrorCode::InvalidScope ... }
/// @endcode
class ScopeManager {
public:
    ScopeManager() = default;

    /// Registry preloaded with `*`, `users:read`, `users:write`,
    /// `users:delete`, `api:read`, `api:write` and `admin`.
    [[nodiscard]] static ScopeManager withDefaults();

    ScopeManager(const ScopeManager& other);
    ScopeManager& operator=(const ScopeManager& other);

    /// Add or replace a scope.
    void registerScope(Scope scope);

    [[nodiscard]] std::optional<Scope> get(std::string_view id) const;
    [[nodiscard]] bool exists(std::string_view id) const;
    [[nodiscard]] std::vector<Scope> all() const;
    [[nodiscard]] std::vector<Scope> dangerous() const;

    /// Scopes whose id starts with @p prefix.
    [[nodiscard]] std::vector<Scope> filter(std::string_view prefix) const;

    /// Validate a requested scope set against an allow-list.
    ///
    /// Fails InvalidScope if a scope is unknown or not covered by
    /// @p allowed (a `*` entry in @p allowed covers every registered scope).
    /// Requesting `*` yields exactly `["*"]`. Duplicates are collapsed.
    [[nodiscard]] foundation::AuthResult<ScopeList> validate(const ScopeList& requested,
                                                             const ScopeList& allowed) const;

    /// validate(), except an empty request resolves to @p allowed.
    [[nodiscard]] foundation::AuthResult<ScopeList> resolve(const ScopeList& requested,
                                                            const ScopeList& allowed) const;

    /// True if @p granted covers every scope in @p required.
    [[nodiscard]] static bool satisfies(const ScopeList& granted, const ScopeList& required);

    /// Split the space-delimited wire form, dropping duplicates.
    [[nodiscard]] static ScopeList parse(std::string_view scopeString);

    /// Join to the space-delimited wire form.
    [[nodiscard]] static std::string join(const ScopeList& scopes);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Scope> scopes_;
};

} // namespace ocs::service
