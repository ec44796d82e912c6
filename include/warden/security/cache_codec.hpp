#pragma once

/// @file cache_codec.hpp
/// @brief Compact binary encoding of cached security state.

#include <cstdint>
#include <vector>

#include "warden/foundation/security_result.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

/// Codec for values stored through CacheHandler.
///
/// Specialized for CredentialRecord, AuthorizationRecord and Session. The
/// layout is a format byte followed by little-endian fields; strings and
/// byte arrays are length-prefixed with a u32. decode() rejects truncated
/// input, unknown formats and trailing bytes with CacheDecodeFailed.
template <typename T>
struct CacheCodec;

template <>
struct CacheCodec<CredentialRecord> {
    static std::vector<uint8_t> encode(const CredentialRecord& value);
    static foundation::SecurityResult<CredentialRecord> decode(const std::vector<uint8_t>& bytes);
};

template <>
struct CacheCodec<AuthorizationRecord> {
    static std::vector<uint8_t> encode(const AuthorizationRecord& value);
    static foundation::SecurityResult<AuthorizationRecord> decode(
        const std::vector<uint8_t>& bytes);
};

template <>
struct CacheCodec<Session> {
    static std::vector<uint8_t> encode(const Session& value);
    static foundation::SecurityResult<Session> decode(const std::vector<uint8_t>& bytes);
};

} // namespace warden::security
