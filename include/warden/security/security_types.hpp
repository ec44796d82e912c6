#pragma once

/// @file security_types.hpp
/// @brief Core value types shared by the authentication, authorization and
///        session layers.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden::security {

// -- Time ---------------------------------------------------------------------

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Injectable clock. Components default to Clock::now; tests drive time.
using TimeSource = std::function<TimePoint()>;

inline TimeSource systemTimeSource() {
    return [] { return Clock::now(); };
}

// -- Identity -----------------------------------------------------------------

/// Unique account identifier, owned by the account store.
using Principal = std::string;

/// Username/password credentials submitted to login().
struct UsernamePasswordToken {
    std::string username;
    std::string password;
    bool rememberMe = false;
    std::optional<std::string> totpCode; ///< Second factor, when the account has one.
};

// -- Credentials --------------------------------------------------------------

/// Scheme implementing a configured hash algorithm.
enum class HashScheme : uint8_t {
    Scrypt,              ///< Memory-hard; work factor is log2(N).
    Pbkdf2Sha256,        ///< Salted and stretched; work factor is the round count.
    Pbkdf2Sha256Peppered ///< PBKDF2 over HMAC-SHA256(pepper, plain).
};

/// Parameters a credential was hashed with. blockSize and parallelism are
/// only meaningful for scrypt and are zero otherwise.
struct HashParameters {
    uint32_t workFactor = 0;
    uint32_t blockSize = 0;
    uint32_t parallelism = 0;

    bool operator==(const HashParameters&) const = default;
};

/// Stored credential hash for one principal.
struct CredentialRecord {
    Principal principal;
    std::string algorithmId;
    std::vector<uint8_t> hash;
    std::vector<uint8_t> salt;
    HashParameters params;
};

/// Inclusive work-factor bounds; min <= defaultValue <= max after load.
struct WorkFactorBounds {
    uint32_t min = 0;
    uint32_t defaultValue = 0;
    uint32_t max = 0;
};

/// Configured hash algorithm. Immutable after configuration load.
struct HashAlgorithmSpec {
    std::string id;
    HashScheme scheme = HashScheme::Pbkdf2Sha256;
    WorkFactorBounds bounds;
    std::size_t saltSize = 16;
    uint32_t blockSize = 8;   ///< scrypt r
    uint32_t parallelism = 1; ///< scrypt p
    std::optional<std::string> pepper;
};

// -- Lockout ------------------------------------------------------------------

struct LockoutState {
    Principal principal;
    uint32_t failedCount = 0;
    TimePoint firstFailureTime{};
    bool locked = false;
    uint32_t inFlight = 0; ///< Admitted attempts not yet settled.
};

// -- Second factor ------------------------------------------------------------

/// Per-user TOTP secret, sealed under the application key named by tag.
struct TotpSecret {
    Principal principal;
    std::string tag;
    std::vector<uint8_t> sealedSecret;
    uint32_t digits = 6;
    uint32_t period = 30;
};

/// Reference to an issued challenge, returned to the caller.
struct ChallengeRef {
    Principal principal;
    uint64_t timeStep = 0;
    std::string channel;
};

/// Result of TOTP enrollment: the plain secret is handed out exactly once.
struct TotpEnrollment {
    std::string tag;
    std::string base32Secret;
    std::string provisioningUri;
};

// -- Authorization ------------------------------------------------------------

/// Roles and permission strings granted to a principal by one account store.
struct AuthorizationRecord {
    Principal principal;
    std::vector<std::string> roles;
    std::vector<std::string> permissions;
};

// -- Sessions -----------------------------------------------------------------

struct Session {
    std::string sessionId;
    Principal principal;
    TimePoint createdAt{};
    TimePoint lastAccessedAt{};
    TimePoint absoluteExpiry{};
    TimePoint idleExpiry{};
    std::map<std::string, std::string> attributes;
};

/// Outcome of a successful login.
struct LoginResult {
    Session session;
    std::optional<std::string> rememberMeToken;
};

// -- Cache --------------------------------------------------------------------

enum class TtlClass : uint8_t { Credentials, AuthzInfo, Session, Absolute };

} // namespace warden::security
