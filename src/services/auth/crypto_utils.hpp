#pragma once

/// @file crypto_utils.hpp
/// @brief Thin wrappers over OpenSSL libcrypto used by CredentialVerifier
///        and TokenIssuer.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace oas::service::detail {

using Sha256Digest = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

[[nodiscard]] inline Sha256Digest sha256(std::string_view input) {
    Sha256Digest digest{};
    unsigned int written = 0;
    EVP_Digest(input.data(), input.size(), digest.data(), &written, EVP_sha256(), nullptr);
    return digest;
}

/// PBKDF2-HMAC-SHA256. Empty optional when libcrypto fails.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> pbkdf2Sha256(
    std::string_view secret, const std::vector<uint8_t>& salt, uint32_t iterations,
    std::size_t length) {
    std::vector<uint8_t> key(length);
    if (PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()), salt.data(),
                          static_cast<int>(salt.size()), static_cast<int>(iterations),
                          EVP_sha256(), static_cast<int>(key.size()), key.data()) != 1) {
        return std::nullopt;
    }
    return key;
}

/// Base64url (RFC 4648 section 5) without padding, built on EVP_EncodeBlock.
[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    std::string text(4 * ((length + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(text.data()), data,
                                  static_cast<int>(length));
    text.resize(static_cast<std::size_t>(written));
    while (!text.empty() && text.back() == '=') {
        text.pop_back();
    }
    for (char& c : text) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    return text;
}

[[nodiscard]] inline std::string base64urlEncode(const std::vector<uint8_t>& data) {
    return base64urlEncode(data.data(), data.size());
}

/// Inverse of base64urlEncode. Padding and the standard alphabet's '+' and
/// '/' are rejected.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> base64urlDecode(std::string_view input) {
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }
    std::string block;
    block.reserve(input.size() + 3);
    for (char c : input) {
        if (c == '-') {
            block += '+';
        } else if (c == '_') {
            block += '/';
        } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            block += c;
        } else {
            return std::nullopt;
        }
    }
    const std::size_t padding = (4 - block.size() % 4) % 4;
    block.append(padding, '=');

    std::vector<uint8_t> bytes(block.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(bytes.data(), reinterpret_cast<const unsigned char*>(block.data()),
                                  static_cast<int>(block.size()));
    if (decoded < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by padding.
    bytes.resize(static_cast<std::size_t>(decoded) - padding);
    return bytes;
}

/// Lowercase hex.
[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    constexpr std::string_view kDigits = "0123456789abcdef";
    std::string hex(length * 2, '0');
    for (std::size_t i = 0; i < length; ++i) {
        hex[2 * i] = kDigits[data[i] >> 4];
        hex[2 * i + 1] = kDigits[data[i] & 0x0F];
    }
    return hex;
}

[[nodiscard]] inline std::string toHex(const Sha256Digest& digest) {
    return toHex(digest.data(), digest.size());
}

/// Bytes from OpenSSL's CSPRNG, or nullopt when it is unseeded or fails.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> secureRandomBytes(std::size_t count) {
    std::vector<uint8_t> bytes(count);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return std::nullopt;
    }
    return bytes;
}

/// Length leaks; contents do not.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace oas::service::detail
