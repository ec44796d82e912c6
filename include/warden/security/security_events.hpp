#pragma once

/// @file security_events.hpp
/// @brief Events published on the foundation EventBus by the security layer.

#include <cstdint>
#include <string>

#include "warden/foundation/error_code.hpp"
#include "warden/security/security_types.hpp"

namespace warden::security {

struct AuthenticationSucceeded {
    Principal principal;
};

/// @p cause is the internal reason; it is for auditing only.
struct AuthenticationFailed {
    Principal principal;
    foundation::ErrorCode cause = foundation::ErrorCode::AuthenticationFailed;
};

struct AccountLocked {
    Principal principal;
    uint32_t failedCount = 0;
};

struct SessionStarted {
    std::string sessionId;
    Principal principal;
};

struct SessionStopped {
    std::string sessionId;
    Principal principal;
};

struct SessionExpired {
    std::string sessionId;
    Principal principal;
};

/// Credential, role or permission data for @p principal changed in a store.
struct AccountChanged {
    Principal principal;
};

} // namespace warden::security
