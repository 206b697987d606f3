#pragma once

/// @file input_validator.hpp
/// @brief Input validation for login identifiers, secrets and raw tokens.
///
/// Rejecting malformed input early keeps oversized or hostile values away
/// from the hashing code and the store.

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace oas::service {

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

/// Stateless input validation utilities.
///
/// All functions are static and thread-safe.
class InputValidator {
public:
    // -- Limits ---------------------------------------------------------------

    static constexpr std::size_t kMaxEmailLength = 254;  // RFC 5321 path limit
    static constexpr std::size_t kMaxLocalPartLength = 64;
    static constexpr std::size_t kMaxLabelLength = 63;

    static constexpr std::size_t kMaxSecretLength = 128;

    /// Base64url of 32 bytes without padding.
    static constexpr std::size_t kMinTokenLength = 43;
    static constexpr std::size_t kMaxTokenLength = 512;

    static constexpr std::size_t kMaxApiKeyNameLength = 64;

    // -- Email ----------------------------------------------------------------

    /// Accept `local@domain` where local is dot-separated atext and domain is
    /// at least two dot-separated hostname labels.
    [[nodiscard]] static ValidationResult validateEmail(std::string_view email) {
        if (email.empty() || email.size() > kMaxEmailLength) {
            return ValidationResult::fail("email length out of range");
        }
        auto at = email.rfind('@');
        if (at == std::string_view::npos) {
            return ValidationResult::fail("email must contain '@'");
        }
        auto local = email.substr(0, at);
        auto domain = email.substr(at + 1);

        if (!isDotAtom(local, kMaxLocalPartLength, &isAtext)) {
            return ValidationResult::fail("email local part is invalid");
        }
        if (domain.find('.') == std::string_view::npos ||
            !isDotAtom(domain, kMaxEmailLength, &isHostChar)) {
            return ValidationResult::fail("email domain is invalid");
        }
        return ValidationResult::ok();
    }

    // -- Secret ---------------------------------------------------------------

    /// Bound the submitted secret. Complexity rules belong to registration,
    /// not to login.
    [[nodiscard]] static ValidationResult validateSecret(std::string_view secret) {
        if (secret.empty()) {
            return ValidationResult::fail("secret must not be empty");
        }
        if (secret.size() > kMaxSecretLength) {
            return ValidationResult::fail("secret must not exceed " +
                                          std::to_string(kMaxSecretLength) + " characters");
        }
        return ValidationResult::ok();
    }

    // -- Token ----------------------------------------------------------------

    /// Check that a raw token is unpadded base64url of plausible length.
    [[nodiscard]] static ValidationResult validateTokenFormat(std::string_view token) {
        if (token.size() < kMinTokenLength || token.size() > kMaxTokenLength) {
            return ValidationResult::fail("token length out of range");
        }
        for (char c : token) {
            if (!isAlnum(c) && c != '-' && c != '_') {
                return ValidationResult::fail("token contains invalid character");
            }
        }
        return ValidationResult::ok();
    }

    // -- Api key name ---------------------------------------------------------

    /// Names are 1-64 characters of [a-zA-Z0-9 ._-].
    [[nodiscard]] static ValidationResult validateApiKeyName(std::string_view name) {
        if (name.empty() || name.size() > kMaxApiKeyNameLength) {
            return ValidationResult::fail("api key name must be 1-64 characters");
        }
        for (char c : name) {
            if (!isAlnum(c) && c != ' ' && c != '.' && c != '_' && c != '-') {
                return ValidationResult::fail("api key name contains invalid character");
            }
        }
        return ValidationResult::ok();
    }

private:
    using CharPredicate = bool (*)(char);

    static bool isAlnum(char c) noexcept {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    }

    /// RFC 5322 atext.
    static bool isAtext(char c) noexcept {
        if (isAlnum(c)) {
            return true;
        }
        constexpr std::string_view kSpecials = "!#$%&'*+/=?^_`{|}~-";
        return kSpecials.find(c) != std::string_view::npos;
    }

    static bool isHostChar(char c) noexcept { return isAlnum(c) || c == '-'; }

    /// Non-empty labels separated by single dots, every character accepted
    /// by @p allowed. Hostname labels (isHostChar) may not start or end with
    /// '-' and are capped at kMaxLabelLength.
    static bool isDotAtom(std::string_view text, std::size_t maxLength, CharPredicate allowed) {
        if (text.empty() || text.size() > maxLength) {
            return false;
        }
        const bool hostname = allowed == &isHostChar;
        std::size_t start = 0;
        while (true) {
            auto dot = text.find('.', start);
            auto label = text.substr(start, dot == std::string_view::npos ? dot : dot - start);
            if (label.empty()) {
                return false;
            }
            if (hostname && (label.size() > kMaxLabelLength || label.front() == '-' ||
                             label.back() == '-')) {
                return false;
            }
            for (char c : label) {
                if (!allowed(c)) {
                    return false;
                }
            }
            if (dot == std::string_view::npos) {
                return true;
            }
            start = dot + 1;
        }
    }
};

}  // namespace oas::service
