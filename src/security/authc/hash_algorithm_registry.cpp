/// @file hash_algorithm_registry.cpp
/// @brief HashAlgorithmRegistry implementation.

#include "warden/security/hash_algorithm_registry.hpp"

#include "warden/foundation/security_logger.hpp"
#include "warden/security/security_config.hpp"

#include "../crypto/crypto_utils.hpp"

#include <charconv>

namespace warden::security {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SecurityResult;

namespace {

constexpr std::size_t kDerivedKeySize = 32;

/// Run the scheme's key derivation; empty on failure.
detail::Bytes derive(const HashAlgorithmSpec& spec, std::string_view plain,
                     const detail::Bytes& salt, const HashParameters& params) {
    switch (spec.scheme) {
        case HashScheme::Scrypt:
            return detail::scrypt(plain, salt, params.workFactor, params.blockSize,
                                  params.parallelism, kDerivedKeySize);
        case HashScheme::Pbkdf2Sha256:
            return detail::pbkdf2Sha256(plain, salt, params.workFactor, kDerivedKeySize);
        case HashScheme::Pbkdf2Sha256Peppered: {
            auto peppered = detail::hmacSha256(spec.pepper.value_or(""), plain);
            if (peppered.empty()) {
                return {};
            }
            std::string_view keyed(reinterpret_cast<const char*>(peppered.data()),
                                   peppered.size());
            return detail::pbkdf2Sha256(keyed, salt, params.workFactor, kDerivedKeySize);
        }
    }
    return {};
}

std::optional<uint32_t> parseUint(std::string_view text) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        parts.push_back(text.substr(start, pos - start));
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return parts;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HashAlgorithmRegistry::HashAlgorithmRegistry(
    std::map<std::string, HashAlgorithmSpec, std::less<>> specs, std::string preferred)
    : specs_(std::move(specs)), preferred_(std::move(preferred)) {}

SecurityResult<HashAlgorithmRegistry> HashAlgorithmRegistry::create(
    std::vector<HashAlgorithmSpec> specs, std::string preferredAlgorithm) {
    auto valid = validateHashAlgorithms(specs, preferredAlgorithm);
    if (!valid) {
        return SecurityResult<HashAlgorithmRegistry>::err(valid.error());
    }

    std::map<std::string, HashAlgorithmSpec, std::less<>> byId;
    for (auto& spec : specs) {
        auto id = spec.id;
        byId.emplace(std::move(id), std::move(spec));
    }
    return SecurityResult<HashAlgorithmRegistry>::ok(
        HashAlgorithmRegistry(std::move(byId), std::move(preferredAlgorithm)));
}

// ---------------------------------------------------------------------------
// verify / hash
// ---------------------------------------------------------------------------

SecurityResult<bool> HashAlgorithmRegistry::verify(std::string_view plain,
                                                   const CredentialRecord& record) const {
    const auto* spec = find(record.algorithmId);
    if (!spec) {
        return SecurityResult<bool>::err(
            ErrorCode::VerificationError,
            "unknown hash algorithm '" + record.algorithmId + "'");
    }

    auto computed = derive(*spec, plain, record.salt, record.params);
    if (computed.empty()) {
        WARDEN_LOG_ERROR(LogCategory::Crypto,
                         "key derivation failed for algorithm " + record.algorithmId);
        return SecurityResult<bool>::err(ErrorCode::CryptoFailure, "key derivation failed");
    }
    return SecurityResult<bool>::ok(detail::constantTimeEqual(computed, record.hash));
}

SecurityResult<CredentialRecord> HashAlgorithmRegistry::hash(
    std::string_view plain, std::string_view algorithmId,
    std::optional<uint32_t> workFactor) const {
    const auto* spec = find(algorithmId);
    if (!spec) {
        return SecurityResult<CredentialRecord>::err(
            ErrorCode::InvalidArgument,
            "unknown hash algorithm '" + std::string(algorithmId) + "'");
    }

    HashParameters params;
    params.workFactor = workFactor.value_or(spec->bounds.defaultValue);
    if (params.workFactor < spec->bounds.min || params.workFactor > spec->bounds.max) {
        return SecurityResult<CredentialRecord>::err(
            ErrorCode::InvalidArgument,
            "work factor " + std::to_string(params.workFactor) + " outside [" +
                std::to_string(spec->bounds.min) + ", " + std::to_string(spec->bounds.max) + "]");
    }
    if (spec->scheme == HashScheme::Scrypt) {
        params.blockSize = spec->blockSize;
        params.parallelism = spec->parallelism;
    }

    CredentialRecord record;
    record.algorithmId = spec->id;
    record.params = params;
    record.salt = detail::randomBytes(spec->saltSize);
    if (record.salt.empty()) {
        return SecurityResult<CredentialRecord>::err(ErrorCode::CryptoFailure,
                                                     "random salt generation failed");
    }
    record.hash = derive(*spec, plain, record.salt, params);
    if (record.hash.empty()) {
        WARDEN_LOG_ERROR(LogCategory::Crypto, "key derivation failed for algorithm " + spec->id);
        return SecurityResult<CredentialRecord>::err(ErrorCode::CryptoFailure,
                                                     "key derivation failed");
    }
    return SecurityResult<CredentialRecord>::ok(std::move(record));
}

SecurityResult<CredentialRecord> HashAlgorithmRegistry::hashPreferred(std::string_view plain) const {
    return hash(plain, preferred_);
}

bool HashAlgorithmRegistry::needsUpgrade(const CredentialRecord& record) const {
    if (record.algorithmId != preferred_) {
        return true;
    }
    const auto* spec = find(record.algorithmId);
    if (!spec) {
        return true;
    }
    if (record.params.workFactor < spec->bounds.min || record.salt.size() < spec->saltSize) {
        return true;
    }
    return spec->scheme == HashScheme::Scrypt &&
           (record.params.blockSize < spec->blockSize ||
            record.params.parallelism < spec->parallelism);
}

const HashAlgorithmSpec* HashAlgorithmRegistry::find(std::string_view algorithmId) const {
    auto it = specs_.find(algorithmId);
    return it == specs_.end() ? nullptr : &it->second;
}

std::vector<std::string> HashAlgorithmRegistry::algorithmIds() const {
    std::vector<std::string> ids;
    ids.reserve(specs_.size());
    for (const auto& [id, _] : specs_) {
        ids.push_back(id);
    }
    return ids;
}

// ---------------------------------------------------------------------------
// Text encoding
// ---------------------------------------------------------------------------

std::string HashAlgorithmRegistry::encode(const CredentialRecord& record) {
    std::string params = std::to_string(record.params.workFactor);
    if (record.params.blockSize != 0 || record.params.parallelism != 0) {
        params += "," + std::to_string(record.params.blockSize) + "," +
                  std::to_string(record.params.parallelism);
    }
    return "$" + record.algorithmId + "$" + params + "$" +
           detail::base64UrlEncode(record.salt) + "$" + detail::base64UrlEncode(record.hash);
}

SecurityResult<CredentialRecord> HashAlgorithmRegistry::decode(std::string_view encoded,
                                                               Principal principal) {
    auto fail = [] {
        return SecurityResult<CredentialRecord>::err(ErrorCode::InvalidArgument,
                                                     "malformed encoded credential");
    };

    auto parts = split(encoded, '$');
    if (parts.size() != 5 || !parts[0].empty() || parts[1].empty()) {
        return fail();
    }

    CredentialRecord record;
    record.principal = std::move(principal);
    record.algorithmId = std::string(parts[1]);

    auto params = split(parts[2], ',');
    if (params.size() != 1 && params.size() != 3) {
        return fail();
    }
    auto workFactor = parseUint(params[0]);
    if (!workFactor) {
        return fail();
    }
    record.params.workFactor = *workFactor;
    if (params.size() == 3) {
        auto r = parseUint(params[1]);
        auto p = parseUint(params[2]);
        if (!r || !p) {
            return fail();
        }
        record.params.blockSize = *r;
        record.params.parallelism = *p;
    }

    auto salt = detail::base64UrlDecode(parts[3]);
    auto hash = detail::base64UrlDecode(parts[4]);
    if (!salt || !hash || salt->empty() || hash->empty()) {
        return fail();
    }
    record.salt = std::move(*salt);
    record.hash = std::move(*hash);
    return SecurityResult<CredentialRecord>::ok(std::move(record));
}

} // namespace warden::security
