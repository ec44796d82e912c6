#pragma once

/// @file warden.hpp
/// @brief Umbrella header for the warden security library.

#include "warden/version.hpp"

#include "warden/foundation/component_registry.hpp"
#include "warden/foundation/config_manager.hpp"
#include "warden/foundation/error_code.hpp"
#include "warden/foundation/event_bus.hpp"
#include "warden/foundation/security_error.hpp"
#include "warden/foundation/security_logger.hpp"
#include "warden/foundation/security_result.hpp"
#include "warden/foundation/worker_pool.hpp"

#include "warden/security/account_lockout_tracker.hpp"
#include "warden/security/account_store.hpp"
#include "warden/security/authz_verifiers.hpp"
#include "warden/security/cache_backend.hpp"
#include "warden/security/cache_codec.hpp"
#include "warden/security/cache_handler.hpp"
#include "warden/security/hash_algorithm_registry.hpp"
#include "warden/security/mfa_challenge_dispatcher.hpp"
#include "warden/security/permission.hpp"
#include "warden/security/realm.hpp"
#include "warden/security/realm_chain.hpp"
#include "warden/security/remember_me_manager.hpp"
#include "warden/security/security_config.hpp"
#include "warden/security/security_events.hpp"
#include "warden/security/security_manager.hpp"
#include "warden/security/security_types.hpp"
#include "warden/security/session_cookie_signer.hpp"
#include "warden/security/session_manager.hpp"
#include "warden/security/session_store.hpp"
#include "warden/security/totp.hpp"
