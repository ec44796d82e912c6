#pragma once

/// @file hash_algorithm_registry.hpp
/// @brief Configured credential hashing schemes: hash, verify and
///        migration-on-login detection.

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/foundation/security_result.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Registry of hash algorithms keyed by algorithm id.
///
/// Built once from validated HashAlgorithmSpecs and shared read-only by all
/// verification calls. Hashing is deliberately slow; callers run it on the
/// WorkerPool rather than on a request dispatch thread.
///
/// Example:
/// @code
///   auto registry = HashAlgorithmRegistry::create(specs, "scrypt");
///   auto record = registry.value().hash("s3cret", "scrypt");
///   bool ok = registry.value().verify("s3cret", record.value()).valueOr(false);
/// @endcode
class HashAlgorithmRegistry {
public:
    /// Validate @p specs and build the registry.
    /// @return ConfigurationError on bound violations, unknown schemes,
    ///         missing peppers, or an unconfigured preferred algorithm.
    static foundation::SecurityResult<HashAlgorithmRegistry> create(
        std::vector<HashAlgorithmSpec> specs, std::string preferredAlgorithm);

    /// Check @p plain against @p record in constant time.
    /// @return false on mismatch; VerificationError for an unknown algorithm id.
    [[nodiscard]] foundation::SecurityResult<bool> verify(std::string_view plain,
                                                          const CredentialRecord& record) const;

    /// Hash @p plain with a fresh salt. Without @p workFactor the algorithm's
    /// default is used; an explicit one must lie within [min, max].
    [[nodiscard]] foundation::SecurityResult<CredentialRecord> hash(
        std::string_view plain, std::string_view algorithmId,
        std::optional<uint32_t> workFactor = std::nullopt) const;

    /// Hash under the preferred algorithm's default parameters.
    [[nodiscard]] foundation::SecurityResult<CredentialRecord> hashPreferred(
        std::string_view plain) const;

    /// True when @p record uses another algorithm than the preferred one,
    /// a work factor below the configured minimum, a shorter salt, or
    /// weaker scrypt block size / parallelism.
    [[nodiscard]] bool needsUpgrade(const CredentialRecord& record) const;

    [[nodiscard]] const HashAlgorithmSpec* find(std::string_view algorithmId) const;

    [[nodiscard]] const std::string& preferredAlgorithm() const noexcept { return preferred_; }

    [[nodiscard]] std::vector<std::string> algorithmIds() const;

    /// Portable text form: `$<id>$<params>$<salt>$<hash>` with base64url
    /// salt and hash; params are `N` or, for scrypt, `logN,r,p`.
    [[nodiscard]] static std::string encode(const CredentialRecord& record);

    /// Parse the text form produced by encode().
    [[nodiscard]] static foundation::SecurityResult<CredentialRecord> decode(
        std::string_view encoded, Principal principal = {});

private:
    HashAlgorithmRegistry(std::map<std::string, HashAlgorithmSpec, std::less<>> specs,
                          std::string preferred);

    std::map<std::string, HashAlgorithmSpec, std::less<>> specs_;
    std::string preferred_;
};

} // namespace warden::security
