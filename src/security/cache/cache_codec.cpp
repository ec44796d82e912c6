/// @file cache_codec.cpp
/// @brief Binary layouts for cached credentials, authorization info and
///        sessions.

#include "warden/security/cache_codec.hpp"

#include <map>
#include <string>

namespace warden::security {

using foundation::ErrorCode;
using foundation::SecurityResult;

namespace {

constexpr uint8_t kCredentialFormat = 0x01;
constexpr uint8_t kAuthorizationFormat = 0x02;
constexpr uint8_t kSessionFormat = 0x03;

// ── Writer ──────────────────────────────────────────────────────────────────

class ByteWriter {
public:
    void u8(uint8_t v) { out_.push_back(v); }

    void u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    void i64(int64_t v) {
        auto u = static_cast<uint64_t>(v);
        for (int i = 0; i < 8; ++i) {
            out_.push_back(static_cast<uint8_t>(u >> (8 * i)));
        }
    }

    void bytes(const uint8_t* data, std::size_t size) {
        u32(static_cast<uint32_t>(size));
        out_.insert(out_.end(), data, data + size);
    }

    void bytes(const std::vector<uint8_t>& v) { bytes(v.data(), v.size()); }

    void str(const std::string& s) {
        bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    void strings(const std::vector<std::string>& v) {
        u32(static_cast<uint32_t>(v.size()));
        for (const auto& s : v) {
            str(s);
        }
    }

    void time(TimePoint t) {
        i64(std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count());
    }

    std::vector<uint8_t> take() { return std::move(out_); }

private:
    std::vector<uint8_t> out_;
};

// ── Reader ──────────────────────────────────────────────────────────────────

/// Bounds-checked reader; once a read fails every later read fails too.
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& in) : in_(in) {}

    uint8_t u8() {
        if (!need(1)) {
            return 0;
        }
        return in_[pos_++];
    }

    uint32_t u32() {
        if (!need(4)) {
            return 0;
        }
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(in_[pos_++]) << (8 * i);
        }
        return v;
    }

    int64_t i64() {
        if (!need(8)) {
            return 0;
        }
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(in_[pos_++]) << (8 * i);
        }
        return static_cast<int64_t>(v);
    }

    std::vector<uint8_t> bytes() {
        auto size = u32();
        if (!need(size)) {
            return {};
        }
        std::vector<uint8_t> out(in_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                 in_.begin() + static_cast<std::ptrdiff_t>(pos_ + size));
        pos_ += size;
        return out;
    }

    std::string str() {
        auto raw = bytes();
        return std::string(raw.begin(), raw.end());
    }

    std::vector<std::string> strings() {
        auto count = u32();
        std::vector<std::string> out;
        // Each string costs at least its 4-byte length prefix.
        if (!ok_ || count > (in_.size() - pos_) / 4) {
            ok_ = false;
            return out;
        }
        out.reserve(count);
        for (uint32_t i = 0; i < count && ok_; ++i) {
            out.push_back(str());
        }
        return out;
    }

    TimePoint time() {
        return TimePoint(std::chrono::duration_cast<Clock::duration>(
            std::chrono::milliseconds(i64())));
    }

    [[nodiscard]] bool good() const noexcept { return ok_; }

    /// True when every read succeeded and the input was fully consumed.
    [[nodiscard]] bool complete() const noexcept { return ok_ && pos_ == in_.size(); }

private:
    bool need(std::size_t n) {
        if (!ok_ || in_.size() - pos_ < n) {
            ok_ = false;
            return false;
        }
        return true;
    }

    const std::vector<uint8_t>& in_;
    std::size_t pos_ = 0;
    bool ok_ = true;
};

template <typename T>
SecurityResult<T> decodeFailed(const char* what) {
    return SecurityResult<T>::err(ErrorCode::CacheDecodeFailed,
                                  std::string("malformed cached ") + what);
}

} // namespace

// ── CredentialRecord ────────────────────────────────────────────────────────

std::vector<uint8_t> CacheCodec<CredentialRecord>::encode(const CredentialRecord& value) {
    ByteWriter w;
    w.u8(kCredentialFormat);
    w.str(value.principal);
    w.str(value.algorithmId);
    w.bytes(value.hash);
    w.bytes(value.salt);
    w.u32(value.params.workFactor);
    w.u32(value.params.blockSize);
    w.u32(value.params.parallelism);
    return w.take();
}

SecurityResult<CredentialRecord> CacheCodec<CredentialRecord>::decode(
    const std::vector<uint8_t>& bytes) {
    ByteReader r(bytes);
    if (r.u8() != kCredentialFormat) {
        return decodeFailed<CredentialRecord>("credential");
    }
    CredentialRecord value;
    value.principal = r.str();
    value.algorithmId = r.str();
    value.hash = r.bytes();
    value.salt = r.bytes();
    value.params.workFactor = r.u32();
    value.params.blockSize = r.u32();
    value.params.parallelism = r.u32();
    if (!r.complete()) {
        return decodeFailed<CredentialRecord>("credential");
    }
    return SecurityResult<CredentialRecord>::ok(std::move(value));
}

// ── AuthorizationRecord ─────────────────────────────────────────────────────

std::vector<uint8_t> CacheCodec<AuthorizationRecord>::encode(const AuthorizationRecord& value) {
    ByteWriter w;
    w.u8(kAuthorizationFormat);
    w.str(value.principal);
    w.strings(value.roles);
    w.strings(value.permissions);
    return w.take();
}

SecurityResult<AuthorizationRecord> CacheCodec<AuthorizationRecord>::decode(
    const std::vector<uint8_t>& bytes) {
    ByteReader r(bytes);
    if (r.u8() != kAuthorizationFormat) {
        return decodeFailed<AuthorizationRecord>("authorization info");
    }
    AuthorizationRecord value;
    value.principal = r.str();
    value.roles = r.strings();
    value.permissions = r.strings();
    if (!r.complete()) {
        return decodeFailed<AuthorizationRecord>("authorization info");
    }
    return SecurityResult<AuthorizationRecord>::ok(std::move(value));
}

// ── Session ─────────────────────────────────────────────────────────────────

std::vector<uint8_t> CacheCodec<Session>::encode(const Session& value) {
    ByteWriter w;
    w.u8(kSessionFormat);
    w.str(value.sessionId);
    w.str(value.principal);
    w.time(value.createdAt);
    w.time(value.lastAccessedAt);
    w.time(value.absoluteExpiry);
    w.time(value.idleExpiry);
    w.u32(static_cast<uint32_t>(value.attributes.size()));
    for (const auto& [k, v] : value.attributes) {
        w.str(k);
        w.str(v);
    }
    return w.take();
}

SecurityResult<Session> CacheCodec<Session>::decode(const std::vector<uint8_t>& bytes) {
    ByteReader r(bytes);
    if (r.u8() != kSessionFormat) {
        return decodeFailed<Session>("session");
    }
    Session value;
    value.sessionId = r.str();
    value.principal = r.str();
    value.createdAt = r.time();
    value.lastAccessedAt = r.time();
    value.absoluteExpiry = r.time();
    value.idleExpiry = r.time();
    auto count = r.u32();
    for (uint32_t i = 0; i < count && r.good(); ++i) {
        auto key = r.str();
        value.attributes[key] = r.str();
    }
    if (!r.complete()) {
        return decodeFailed<Session>("session");
    }
    return SecurityResult<Session>::ok(std::move(value));
}

} // namespace warden::security
