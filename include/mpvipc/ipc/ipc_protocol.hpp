#pragma once

/// @file ipc_protocol.hpp
/// @brief Wire codec for the mpv JSON IPC protocol
///
/// Every message is one JSON object on one line:
///
///   client -> peer   {"command":["get_property","volume"],"request_id":7}
///   peer -> client   {"error":"success","data":50.0,"request_id":7}
///   peer -> client   {"event":"pause"}
///
/// A message with a non-empty "event" is a notification; its "request_id"
/// carries no meaning. The codec is stateless.

#include "ipc_types.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mpvipc::ipc {

// ============================================================================
// Protocol constants
// ============================================================================

/// Message delimiter
constexpr char line_delimiter = '\n';

/// Error string the peer uses for success
constexpr std::string_view success_error = "success";

/// Default dial and per-phase call timeout
constexpr std::chrono::milliseconds default_timeout{2000};

/// Largest correlation id handed out; ids wrap back to 1 after it
constexpr request_id_t max_request_id = std::numeric_limits<int32_t>::max();

// ============================================================================
// Codec errors
// ============================================================================

/// Base class of codec failures
class protocol_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Command arguments not representable on the wire
class encoding_error : public protocol_error {
public:
    using protocol_error::protocol_error;
};

/// Inbound line is not a valid message
class decoding_error : public protocol_error {
public:
    using protocol_error::protocol_error;
};

// ============================================================================
// Request ID generator
// ============================================================================

/// Thread-safe correlation id generator.
/// Yields 1, 2, ... max_request_id, then wraps to 1. Never yields 0.
class request_id_generator {
public:
    request_id_generator() = default;

    /// Start counting after @p start (testing wrap-around)
    explicit request_id_generator(uint64_t start) noexcept : counter_(start) {}

    request_id_t next() noexcept {
        uint64_t n = counter_.fetch_add(1, std::memory_order_relaxed);
        return static_cast<request_id_t>(n % static_cast<uint64_t>(max_request_id)) + 1;
    }

private:
    std::atomic<uint64_t> counter_{0};
};

// ============================================================================
// Encoding
// ============================================================================

namespace detail {

inline void check_argument(const json& arg, size_t index) {
    switch (arg.type()) {
        case json::value_t::string:
        case json::value_t::boolean:
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return;
        case json::value_t::number_float:
            if (!std::isfinite(arg.get<double>())) {
                throw encoding_error("argument " + std::to_string(index) +
                                     " is not a finite number");
            }
            return;
        default:
            throw encoding_error("argument " + std::to_string(index) +
                                 " has unsupported type " + arg.type_name());
    }
}

} // namespace detail

/// Serialize a command as one delimited line.
/// @throws encoding_error for empty commands, non-scalar or non-finite
///         arguments and strings that are not valid UTF-8
inline std::string encode_request(request_id_t id, const command& cmd) {
    if (cmd.empty()) {
        throw encoding_error("empty command");
    }
    for (size_t i = 0; i < cmd.size(); ++i) {
        detail::check_argument(cmd[i], i);
    }

    json msg = json::object();
    msg["command"] = cmd;
    msg["request_id"] = id;

    std::string line;
    try {
        line = msg.dump();
    } catch (const json::type_error& e) {
        throw encoding_error(e.what());
    }
    line.push_back(line_delimiter);
    return line;
}

/// Serialize a reply as one delimited line (peer side)
inline std::string encode_reply(const reply& r) {
    json msg = r.extra.is_object() ? r.extra : json::object();
    if (r.is_event()) {
        msg["event"] = r.event;
        if (!r.data.is_null()) {
            msg["data"] = r.data;
        }
    } else {
        msg["error"] = r.error.empty() ? std::string(success_error) : r.error;
        msg["data"] = r.data;
        msg["request_id"] = r.request_id;
    }
    try {
        return msg.dump() + line_delimiter;
    } catch (const json::type_error& e) {
        throw encoding_error(e.what());
    }
}

// ============================================================================
// Decoding
// ============================================================================

namespace detail {

inline std::string_view trim_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

inline json parse_object(std::string_view line) {
    line = trim_line(line);
    json msg = json::parse(line.begin(), line.end(), nullptr, false);
    if (msg.is_discarded()) {
        throw decoding_error("malformed JSON");
    }
    if (!msg.is_object()) {
        throw decoding_error(std::string("expected object, got ") + msg.type_name());
    }
    return msg;
}

inline std::string take_string(json& msg, const char* key) {
    auto it = msg.find(key);
    if (it == msg.end()) {
        return {};
    }
    std::string value;
    if (it->is_string()) {
        value = it->get<std::string>();
    } else if (!it->is_null()) {
        throw decoding_error(std::string("\"") + key + "\" is not a string");
    }
    msg.erase(it);
    return value;
}

inline request_id_t take_request_id(json& msg) {
    auto it = msg.find("request_id");
    if (it == msg.end()) {
        return 0;
    }
    request_id_t id = 0;
    if (it->is_number_integer()) {
        id = it->get<request_id_t>();
    } else if (!it->is_null()) {
        throw decoding_error("\"request_id\" is not an integer");
    }
    msg.erase(it);
    return id;
}

} // namespace detail

/// Parse one inbound line into a reply.
/// A wire error of "success" becomes an empty error string.
/// @throws decoding_error on malformed input
inline reply decode_reply(std::string_view line) {
    json msg = detail::parse_object(line);

    reply r;
    r.error = detail::take_string(msg, "error");
    if (r.error == success_error) {
        r.error.clear();
    }
    r.event = detail::take_string(msg, "event");
    r.request_id = detail::take_request_id(msg);

    auto data = msg.find("data");
    if (data != msg.end()) {
        r.data = std::move(*data);
        msg.erase(data);
    }
    if (!msg.empty()) {
        r.extra = std::move(msg);
    }
    return r;
}

/// Decoded outbound message (peer side)
struct request_message {
    command cmd;
    request_id_t request_id = 0;
};

/// Parse one outbound line (used by peers and tests)
/// @throws decoding_error when "command" is missing or not an array
inline request_message decode_request(std::string_view line) {
    json msg = detail::parse_object(line);

    auto cmd = msg.find("command");
    if (cmd == msg.end() || !cmd->is_array()) {
        throw decoding_error("\"command\" is missing or not an array");
    }

    request_message req;
    req.cmd = cmd->get<command>();
    req.request_id = detail::take_request_id(msg);
    return req;
}

} // namespace mpvipc::ipc
