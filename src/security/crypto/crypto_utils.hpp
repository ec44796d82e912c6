#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic primitives on the OpenSSL 3.x API:
///        digests, HMAC, key derivation, AES-256-GCM sealing, encodings.
///
/// Functions that can fail return an empty container (or std::nullopt),
/// mirroring the EVP error model; callers translate that into a
/// SecurityError with ErrorCode::CryptoFailure.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace warden::security::detail {

using Bytes = std::vector<uint8_t>;

inline const uint8_t* asBytes(std::string_view s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

// =============================================================================
// Random
// =============================================================================

/// Cryptographically secure random bytes; empty on RNG failure.
[[nodiscard]] inline Bytes randomBytes(std::size_t count) {
    Bytes out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        return {};
    }
    return out;
}

// =============================================================================
// Digests and MACs
// =============================================================================

[[nodiscard]] inline std::array<uint8_t, 32> sha256(std::string_view data) {
    std::array<uint8_t, 32> digest{};
    SHA256(asBytes(data), data.size(), digest.data());
    return digest;
}

/// HMAC with the given digest; empty on failure.
[[nodiscard]] inline Bytes hmac(const EVP_MD* md, const uint8_t* key, std::size_t keyLen,
                                const uint8_t* data, std::size_t dataLen) {
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int outLen = 0;
    if (HMAC(md, key, static_cast<int>(keyLen), data, dataLen, out.data(), &outLen) == nullptr) {
        return {};
    }
    out.resize(outLen);
    return out;
}

[[nodiscard]] inline Bytes hmacSha256(std::string_view key, std::string_view data) {
    return hmac(EVP_sha256(), asBytes(key), key.size(), asBytes(data), data.size());
}

[[nodiscard]] inline Bytes hmacSha1(const Bytes& key, const uint8_t* data, std::size_t dataLen) {
    return hmac(EVP_sha1(), key.data(), key.size(), data, dataLen);
}

// =============================================================================
// Key derivation
// =============================================================================

[[nodiscard]] inline Bytes pbkdf2Sha256(std::string_view secret, const Bytes& salt,
                                        uint32_t rounds, std::size_t outLen) {
    Bytes out(outLen);
    if (PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(rounds), EVP_sha256(),
                          static_cast<int>(outLen), out.data()) != 1) {
        return {};
    }
    return out;
}

/// scrypt with N = 2^logN. maxmem is sized to the parameters so that
/// OpenSSL's 32 MiB default ceiling does not reject valid high costs.
[[nodiscard]] inline Bytes scrypt(std::string_view secret, const Bytes& salt,
                                  uint32_t logN, uint32_t r, uint32_t p, std::size_t outLen) {
    if (logN == 0 || logN >= 63) {
        return {};
    }
    const uint64_t n = uint64_t{1} << logN;
    const uint64_t maxmem = 128ULL * r * (n + p + 2) + (1ULL << 20);
    Bytes out(outLen);
    if (EVP_PBE_scrypt(secret.data(), secret.size(), salt.data(), salt.size(),
                       n, r, p, maxmem, out.data(), outLen) != 1) {
        return {};
    }
    return out;
}

// =============================================================================
// AES-256-GCM
// =============================================================================

inline constexpr std::size_t kGcmNonceSize = 12;
inline constexpr std::size_t kGcmTagSize = 16;

/// Seal @p plaintext under a 32-byte key.
/// Output layout: nonce(12) || ciphertext || tag(16). Empty on failure.
[[nodiscard]] inline Bytes aesGcmSeal(const std::array<uint8_t, 32>& key,
                                      const Bytes& plaintext, std::string_view aad) {
    auto nonce = randomBytes(kGcmNonceSize);
    if (nonce.empty()) {
        return {};
    }

    auto* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return {};
    }

    Bytes out(kGcmNonceSize + plaintext.size() + kGcmTagSize);
    std::copy(nonce.begin(), nonce.end(), out.begin());
    int len = 0;
    int total = 0;
    bool ok = EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, key.data(), nonce.data()) == 1;
    if (ok && !aad.empty()) {
        ok = EVP_EncryptUpdate(ctx, nullptr, &len, asBytes(aad), static_cast<int>(aad.size())) == 1;
    }
    if (ok) {
        ok = EVP_EncryptUpdate(ctx, out.data() + kGcmNonceSize, &len, plaintext.data(),
                               static_cast<int>(plaintext.size())) == 1;
        total = len;
    }
    if (ok) {
        ok = EVP_EncryptFinal_ex(ctx, out.data() + kGcmNonceSize + total, &len) == 1;
        total += len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize),
                                 out.data() + kGcmNonceSize + total) == 1;
    }
    EVP_CIPHER_CTX_free(ctx);
    if (!ok) {
        return {};
    }
    out.resize(kGcmNonceSize + static_cast<std::size_t>(total) + kGcmTagSize);
    return out;
}

/// Open a sealed blob produced by aesGcmSeal(); nullopt on tag mismatch
/// or malformed input.
[[nodiscard]] inline std::optional<Bytes> aesGcmOpen(const std::array<uint8_t, 32>& key,
                                                     const Bytes& sealed, std::string_view aad) {
    if (sealed.size() < kGcmNonceSize + kGcmTagSize) {
        return std::nullopt;
    }
    const auto cipherLen = sealed.size() - kGcmNonceSize - kGcmTagSize;
    const uint8_t* nonce = sealed.data();
    const uint8_t* cipher = sealed.data() + kGcmNonceSize;
    Bytes tag(sealed.end() - static_cast<std::ptrdiff_t>(kGcmTagSize), sealed.end());

    auto* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return std::nullopt;
    }

    Bytes plain(cipherLen + 1);
    int len = 0;
    int total = 0;
    bool ok = EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, key.data(), nonce) == 1;
    if (ok && !aad.empty()) {
        ok = EVP_DecryptUpdate(ctx, nullptr, &len, asBytes(aad), static_cast<int>(aad.size())) == 1;
    }
    if (ok) {
        ok = EVP_DecryptUpdate(ctx, plain.data(), &len, cipher, static_cast<int>(cipherLen)) == 1;
        total = len;
    }
    if (ok) {
        ok = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kGcmTagSize),
                                 tag.data()) == 1;
    }
    if (ok) {
        ok = EVP_DecryptFinal_ex(ctx, plain.data() + total, &len) == 1;
        total += len;
    }
    EVP_CIPHER_CTX_free(ctx);
    if (!ok) {
        return std::nullopt;
    }
    plain.resize(static_cast<std::size_t>(total));
    return plain;
}

// =============================================================================
// Comparison
// =============================================================================

[[nodiscard]] inline bool constantTimeEqual(const uint8_t* a, std::size_t aLen,
                                            const uint8_t* b, std::size_t bLen) {
    if (aLen != bLen) {
        return false;
    }
    return aLen == 0 || CRYPTO_memcmp(a, b, aLen) == 0;
}

[[nodiscard]] inline bool constantTimeEqual(const Bytes& a, const Bytes& b) {
    return constantTimeEqual(a.data(), a.size(), b.data(), b.size());
}

[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    return constantTimeEqual(asBytes(a), a.size(), asBytes(b), b.size());
}

// =============================================================================
// Encodings
// =============================================================================

[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out += kDigits[data[i] >> 4];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

[[nodiscard]] inline std::string toHex(const Bytes& data) {
    return toHex(data.data(), data.size());
}

/// Base64url without padding (RFC 4648 section 5).
[[nodiscard]] inline std::string base64UrlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char kTable[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string out;
    out.reserve((length + 2) / 3 * 4);
    std::size_t i = 0;
    for (; i + 2 < length; i += 3) {
        uint32_t n = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8) | data[i + 2];
        out += kTable[(n >> 18) & 0x3F];
        out += kTable[(n >> 12) & 0x3F];
        out += kTable[(n >> 6) & 0x3F];
        out += kTable[n & 0x3F];
    }
    if (i + 1 == length) {
        uint32_t n = uint32_t{data[i]} << 16;
        out += kTable[(n >> 18) & 0x3F];
        out += kTable[(n >> 12) & 0x3F];
    } else if (i + 2 == length) {
        uint32_t n = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8);
        out += kTable[(n >> 18) & 0x3F];
        out += kTable[(n >> 12) & 0x3F];
        out += kTable[(n >> 6) & 0x3F];
    }
    return out;
}

[[nodiscard]] inline std::string base64UrlEncode(const Bytes& data) {
    return base64UrlEncode(data.data(), data.size());
}

[[nodiscard]] inline std::string base64UrlEncode(std::string_view data) {
    return base64UrlEncode(asBytes(data), data.size());
}

/// Decode unpadded base64url; nullopt on any invalid character or length.
[[nodiscard]] inline std::optional<Bytes> base64UrlDecode(std::string_view input) {
    auto value = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '-') return 62;
        if (c == '_') return 63;
        return -1;
    };
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    Bytes out;
    out.reserve(input.size() * 3 / 4);
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : input) {
        int v = value(c);
        if (v < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

/// RFC 4648 base32 (upper-case alphabet, no padding), the customary TOTP
/// secret encoding for authenticator apps.
[[nodiscard]] inline std::string base32Encode(const Bytes& data) {
    static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    std::string out;
    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out += kAlphabet[(buffer >> bits) & 0x1F];
        }
    }
    if (bits > 0) {
        out += kAlphabet[(buffer << (5 - bits)) & 0x1F];
    }
    return out;
}

} // namespace warden::security::detail
