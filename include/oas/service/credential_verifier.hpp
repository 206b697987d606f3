#pragma once

/// @file credential_verifier.hpp
/// @brief Slow salted one-way hashing of account secrets.
///
/// Hashes are PBKDF2-HMAC-SHA256 in the self-describing form
///   pbkdf2-sha256$<iterations>$<salt b64url>$<hash b64url>
/// so the iteration count can be raised without invalidating stored hashes.

#include "oas/foundation/service_result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace oas::service {

/// Credential hashing and verification.
///
/// verify() is pure: it never touches the store and never reveals why a
/// comparison failed. A malformed stored hash verifies as false.
///
/// Example:
/// @code
///   CredentialVerifier verifier(310000);
///   auto stored = verifier.hash("correct horse battery staple");
///   bool ok = verifier.verify("correct horse battery staple", stored.value());
/// @endcode
class CredentialVerifier {
public:
    static constexpr uint32_t kMinIterations = 1000;
    static constexpr uint32_t kMaxIterations = 10'000'000;
    static constexpr std::size_t kSaltBytes = 16;
    static constexpr std::size_t kHashBytes = 32;

    explicit CredentialVerifier(uint32_t iterations);

    /// Hash a secret with a fresh random salt.
    [[nodiscard]] foundation::ServiceResult<std::string> hash(std::string_view secret) const;

    /// Check a candidate secret against a stored hash.
    [[nodiscard]] bool verify(std::string_view candidate, std::string_view storedHash) const;

    /// Run a verification against a fixed hash so that unknown identifiers
    /// cost the same as known ones.
    void verifyDummy(std::string_view candidate) const;

    [[nodiscard]] uint32_t iterations() const noexcept { return iterations_; }

private:
    uint32_t iterations_;
    std::string dummyHash_;
};

}  // namespace oas::service
