/// @file scope_manager.cpp
/// @brief ScopeManager implementation.

#include "ocs/service/scope_manager.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace ocs::service {

using ocs::foundation::AuthError;
using ocs::foundation::AuthResult;
using ocs::foundation::ErrorCode;

namespace {

bool contains(const ScopeList& list, std::string_view id) {
    return std::find(list.begin(), list.end(), id) != list.end();
}

ScopeList dedupe(const ScopeList& scopes) {
    ScopeList out;
    std::unordered_set<std::string> seen;
    for (const auto& s : scopes) {
        if (!s.empty() && seen.insert(s).second) {
            out.push_back(s);
        }
    }
    return out;
}

std::vector<Scope> sortedById(std::vector<Scope> scopes) {
    std::sort(scopes.begin(), scopes.end(),
              [](const Scope& a, const Scope& b) { return a.id < b.id; });
    return scopes;
}

}  // namespace

ScopeManager ScopeManager::withDefaults() {
    ScopeManager manager;
    manager.registerScope({"*", "Full access to all resources", true});
    manager.registerScope({"users:read", "Read user information", false});
    manager.registerScope({"users:write", "Update user information", false});
    manager.registerScope({"users:delete", "Delete user accounts", true});
    manager.registerScope({"api:read", "Read API resources", false});
    manager.registerScope({"api:write", "Create and update API resources", false});
    manager.registerScope({"admin", "Administrative access", true});
    return manager;
}

ScopeManager::ScopeManager(const ScopeManager& other) {
    std::shared_lock lock(other.mutex_);
    scopes_ = other.scopes_;
}

ScopeManager& ScopeManager::operator=(const ScopeManager& other) {
    if (this != &other) {
        std::unordered_map<std::string, Scope> copy;
        {
            std::shared_lock lock(other.mutex_);
            copy = other.scopes_;
        }
        std::unique_lock lock(mutex_);
        scopes_ = std::move(copy);
    }
    return *this;
}

void ScopeManager::registerScope(Scope scope) {
    std::unique_lock lock(mutex_);
    auto id = scope.id;
    scopes_[std::move(id)] = std::move(scope);
}

std::optional<Scope> ScopeManager::get(std::string_view id) const {
    std::shared_lock lock(mutex_);
    auto it = scopes_.find(std::string(id));
    if (it == scopes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ScopeManager::exists(std::string_view id) const {
    std::shared_lock lock(mutex_);
    return scopes_.count(std::string(id)) > 0;
}

std::vector<Scope> ScopeManager::all() const {
    std::vector<Scope> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(scopes_.size());
        for (const auto& [id, scope] : scopes_) {
            out.push_back(scope);
        }
    }
    return sortedById(std::move(out));
}

std::vector<Scope> ScopeManager::dangerous() const {
    std::vector<Scope> out;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, scope] : scopes_) {
            if (scope.dangerous) {
                out.push_back(scope);
            }
        }
    }
    return sortedById(std::move(out));
}

std::vector<Scope> ScopeManager::filter(std::string_view prefix) const {
    std::vector<Scope> out;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, scope] : scopes_) {
            if (id.compare(0, prefix.size(), prefix) == 0) {
                out.push_back(scope);
            }
        }
    }
    return sortedById(std::move(out));
}

AuthResult<ScopeList> ScopeManager::validate(const ScopeList& requested,
                                             const ScopeList& allowed) const {
    auto unique = dedupe(requested);
    const bool allowsAll = contains(allowed, kWildcardScope);

    std::shared_lock lock(mutex_);
    for (const auto& id : unique) {
        if (scopes_.count(id) == 0) {
            return AuthResult<ScopeList>::err(
                AuthError(ErrorCode::InvalidScope, "unknown scope: " + id));
        }
        if (!allowsAll && !contains(allowed, id)) {
            return AuthResult<ScopeList>::err(
                AuthError(ErrorCode::InvalidScope, "scope not permitted: " + id));
        }
    }

    if (contains(unique, kWildcardScope)) {
        return AuthResult<ScopeList>::ok(ScopeList{std::string(kWildcardScope)});
    }
    return AuthResult<ScopeList>::ok(std::move(unique));
}

AuthResult<ScopeList> ScopeManager::resolve(const ScopeList& requested,
                                            const ScopeList& allowed) const {
    if (dedupe(requested).empty()) {
        return validate(allowed, allowed);
    }
    return validate(requested, allowed);
}

bool ScopeManager::satisfies(const ScopeList& granted, const ScopeList& required) {
    if (contains(granted, kWildcardScope)) {
        return true;
    }
    return std::all_of(required.begin(), required.end(),
                       [&](const std::string& s) { return contains(granted, s); });
}

ScopeList ScopeManager::parse(std::string_view scopeString) {
    ScopeList out;
    std::size_t start = 0;
    while (start < scopeString.size()) {
        auto end = scopeString.find(' ', start);
        if (end == std::string_view::npos) {
            end = scopeString.size();
        }
        if (end > start) {
            out.emplace_back(scopeString.substr(start, end - start));
        }
        start = end + 1;
    }
    return dedupe(out);
}

std::string ScopeManager::join(const ScopeList& scopes) {
    std::string out;
    for (const auto& s : scopes) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += s;
    }
    return out;
}

}  // namespace ocs::service
