#pragma once

/// mpvipc - Main Header
///
/// Version: 0.1.0
///
/// Concurrent client for the mpv JSON IPC protocol.
/// Include this file to use every mpvipc component.

// Version information
#define MPVIPC_VERSION_MAJOR 0
#define MPVIPC_VERSION_MINOR 1
#define MPVIPC_VERSION_PATCH 0

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// Synchronization
#include "sync/cancel_token.hpp"
#include "sync/primitives.hpp"

// Networking
#include "net/uds.hpp"

// IPC client
#include "ipc/ipc.hpp"

#include <tuple>

/// Root namespace for the mpvipc library
namespace mpvipc {

/// Get library version string
inline const char* version() noexcept {
    return "0.1.0";
}

/// Get library version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(MPVIPC_VERSION_MAJOR, MPVIPC_VERSION_MINOR, MPVIPC_VERSION_PATCH);
}

} // namespace mpvipc
