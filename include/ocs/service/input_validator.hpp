#pragma once

/// @file input_validator.hpp
/// @brief Syntax checks for administrative and endpoint input.
///
/// Length limits are enforced on everything that ends up persisted.

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace ocs::service {

/// Result of a validation check.
struct ValidationResult {
    bool valid;
    std::string message;

    explicit operator bool() const noexcept { return valid; }

    static ValidationResult ok() { return {true, {}}; }
    static ValidationResult fail(std::string msg) {
        return {false, std::move(msg)};
    }
};

/// Stateless input validation utilities. All functions are thread-safe.
class InputValidator {
public:
    static constexpr std::size_t kMaxNameLength = 255;
    static constexpr std::size_t kMaxRedirectUriLength = 2048;
    static constexpr std::size_t kMaxStateLength = 512;

    // -- Names ----------------------------------------------------------------

    /// Client display names and personal access token labels.
    [[nodiscard]] static inline ValidationResult validateName(std::string_view name,
                                                              std::string_view what) {
        if (name.empty()) {
            return ValidationResult::fail(std::string(what) + " must not be empty");
        }
        if (name.size() > kMaxNameLength) {
            return ValidationResult::fail(std::string(what) + " exceeds 255 characters");
        }
        for (char c : name) {
            if (std::iscntrl(static_cast<unsigned char>(c))) {
                return ValidationResult::fail(std::string(what) +
                                              " contains control characters");
            }
        }
        return ValidationResult::ok();
    }

    // -- Redirect URIs --------------------------------------------------------

    /// Registered redirect URI: absolute (RFC 3986 scheme + "://" + authority),
    /// no fragment (RFC 6749 section 3.1.2), no whitespace.
    ///
    /// Custom schemes ("com.example.app://cb") are allowed for native clients.
    [[nodiscard]] static inline ValidationResult validateRedirectUri(std::string_view uri) {
        if (uri.empty()) {
            return ValidationResult::fail("redirect URI must not be empty");
        }
        if (uri.size() > kMaxRedirectUriLength) {
            return ValidationResult::fail("redirect URI exceeds maximum length");
        }
        for (char c : uri) {
            auto uc = static_cast<unsigned char>(c);
            if (std::isspace(uc) || std::iscntrl(uc)) {
                return ValidationResult::fail("redirect URI contains whitespace");
            }
        }
        if (uri.find('#') != std::string_view::npos) {
            return ValidationResult::fail("redirect URI must not contain a fragment");
        }

        auto sep = uri.find("://");
        if (sep == std::string_view::npos || sep == 0) {
            return ValidationResult::fail("redirect URI must be absolute");
        }
        auto scheme = uri.substr(0, sep);
        if (!std::isalpha(static_cast<unsigned char>(scheme.front()))) {
            return ValidationResult::fail("redirect URI scheme is invalid");
        }
        for (char c : scheme) {
            auto uc = static_cast<unsigned char>(c);
            if (!std::isalnum(uc) && c != '+' && c != '-' && c != '.') {
                return ValidationResult::fail("redirect URI scheme is invalid");
            }
        }

        auto rest = uri.substr(sep + 3);
        auto authorityEnd = rest.find_first_of("/?");
        auto authority = rest.substr(0, authorityEnd);
        if (authority.empty()) {
            return ValidationResult::fail("redirect URI must have a host");
        }
        return ValidationResult::ok();
    }

    // -- Endpoint parameters --------------------------------------------------

    /// The opaque `state` value echoed by the authorization endpoint.
    [[nodiscard]] static inline ValidationResult validateState(std::string_view state) {
        if (state.size() > kMaxStateLength) {
            return ValidationResult::fail("state exceeds maximum length");
        }
        for (char c : state) {
            if (std::iscntrl(static_cast<unsigned char>(c))) {
                return ValidationResult::fail("state contains control characters");
            }
        }
        return ValidationResult::ok();
    }
};

}  // namespace ocs::service
