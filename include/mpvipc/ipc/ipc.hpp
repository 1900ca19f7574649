#pragma once

/// @file ipc.hpp
/// @brief Umbrella header for the mpv IPC client
///
/// ## Quick Start
///
/// @code
/// #include <mpvipc/ipc/ipc.hpp>
///
/// mpvipc::ipc::client_config config;
/// config.socket_path = "/tmp/mpvsocket";   // mpv --input-ipc-server=/tmp/mpvsocket
///
/// auto connected = mpvipc::ipc::ipc_client::connect(config);
/// if (!connected) {
///     std::cerr << connected.error_message() << ": " << connected.detail() << "\n";
///     return 1;
/// }
///
/// mpvipc::ipc::client mpv(*connected);
/// mpv.loadfile("movie.mkv");
/// if (auto vol = mpv.volume(); vol.ok()) {
///     std::cout << "Volume: " << *vol << "\n";
/// }
/// @endcode
///
/// ## Features
///
/// - **Concurrent calls**: any number of threads share one connection
/// - **Out-of-order replies**: matched by request id
/// - **Two timeouts per call**: send phase and receive phase
/// - **Events**: routed to a pluggable notification_sink
/// - **Single shutdown path**: close() or a parent cancel token
///
/// ## Wire Format
///
/// Newline-delimited JSON objects:
/// - request: {"command": [...], "request_id": N}
/// - reply:   {"error": "success", "data": ..., "request_id": N}
/// - event:   {"event": "name", ...}

#include "ipc_types.hpp"
#include "ipc_protocol.hpp"
#include "correlation_table.hpp"
#include "notification.hpp"
#include "ipc_client.hpp"
#include "client.hpp"
