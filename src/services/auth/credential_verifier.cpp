/// @file credential_verifier.cpp
/// @brief CredentialVerifier implementation using OpenSSL PBKDF2.

#include "oas/service/credential_verifier.hpp"

#include "crypto_utils.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <optional>
#include <vector>

namespace oas::service {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

constexpr std::string_view kScheme = "pbkdf2-sha256";

struct ParsedHash {
    uint32_t iterations = 0;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> hash;
};

std::optional<ParsedHash> parseStoredHash(std::string_view stored) {
    // scheme$iterations$salt$hash
    std::array<std::string_view, 4> parts;
    std::size_t start = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        auto pos = stored.find('$', start);
        if (i + 1 < parts.size()) {
            if (pos == std::string_view::npos) {
                return std::nullopt;
            }
            parts[i] = stored.substr(start, pos - start);
            start = pos + 1;
        } else {
            if (pos != std::string_view::npos) {
                return std::nullopt;
            }
            parts[i] = stored.substr(start);
        }
    }

    if (parts[0] != kScheme) {
        return std::nullopt;
    }

    ParsedHash parsed;
    auto [ptr, ec] = std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(),
                                     parsed.iterations);
    if (ec != std::errc{} || ptr != parts[1].data() + parts[1].size() ||
        parsed.iterations < CredentialVerifier::kMinIterations ||
        parsed.iterations > CredentialVerifier::kMaxIterations) {
        return std::nullopt;
    }

    auto salt = detail::base64urlDecode(parts[2]);
    auto hash = detail::base64urlDecode(parts[3]);
    if (!salt || !hash || salt->empty() || hash->empty()) {
        return std::nullopt;
    }
    parsed.salt = std::move(*salt);
    parsed.hash = std::move(*hash);
    return parsed;
}

std::string encode(uint32_t iterations,
                   const std::vector<uint8_t>& salt,
                   const std::vector<uint8_t>& hash) {
    std::string out(kScheme);
    out += '$';
    out += std::to_string(iterations);
    out += '$';
    out += detail::base64urlEncode(salt);
    out += '$';
    out += detail::base64urlEncode(hash);
    return out;
}

}  // namespace

CredentialVerifier::CredentialVerifier(uint32_t iterations)
    : iterations_(std::clamp(iterations, kMinIterations, kMaxIterations)) {
    // Fixed salt: the dummy only has to cost the same as a real verification.
    std::vector<uint8_t> salt(kSaltBytes, 0x5a);
    auto derived = detail::pbkdf2Sha256("oas-dummy-secret", salt, iterations_, kHashBytes);
    dummyHash_ = encode(iterations_, salt, derived.value_or(std::vector<uint8_t>(kHashBytes, 0)));
}

ServiceResult<std::string> CredentialVerifier::hash(std::string_view secret) const {
    auto salt = detail::secureRandomBytes(kSaltBytes);
    if (!salt) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::CryptoFailure, "random source unavailable"));
    }
    auto derived = detail::pbkdf2Sha256(secret, *salt, iterations_, kHashBytes);
    if (!derived) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::CryptoFailure, "key derivation failed"));
    }
    return ServiceResult<std::string>::ok(encode(iterations_, *salt, *derived));
}

bool CredentialVerifier::verify(std::string_view candidate, std::string_view storedHash) const {
    auto parsed = parseStoredHash(storedHash);
    if (!parsed) {
        return false;
    }
    auto derived = detail::pbkdf2Sha256(candidate, parsed->salt, parsed->iterations,
                                        parsed->hash.size());
    if (!derived) {
        return false;
    }
    return detail::constantTimeEqual(
        std::string_view(reinterpret_cast<const char*>(derived->data()), derived->size()),
        std::string_view(reinterpret_cast<const char*>(parsed->hash.data()), parsed->hash.size()));
}

void CredentialVerifier::verifyDummy(std::string_view candidate) const {
    [[maybe_unused]] bool ignored = verify(candidate, dummyHash_);
}

}  // namespace oas::service
