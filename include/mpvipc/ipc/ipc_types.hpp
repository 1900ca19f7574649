#pragma once

/// @file ipc_types.hpp
/// @brief Value types shared by the IPC codec, client and command API
///
/// - command: ordered list of scalar JSON arguments
/// - reply: one decoded inbound message (reply or event)
/// - ipc_error / ipc_result<T>: error codes returned by every call

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mpvipc::ipc {

using json = nlohmann::json;

/// Correlation id carried in "request_id"
using request_id_t = int64_t;

/// One protocol operation: e.g. {"get_property", "volume"}
using command = std::vector<json>;

/// Build a command from scalar arguments
/// @code
/// auto cmd = make_command("set_property", "volume", 50);
/// @endcode
template<typename... Args>
command make_command(Args&&... args) {
    command cmd;
    cmd.reserve(sizeof...(Args));
    (cmd.emplace_back(std::forward<Args>(args)), ...);
    return cmd;
}

/// Decoded inbound message
struct reply {
    std::string error;          ///< Empty on success ("success" on the wire)
    json data;                  ///< Payload; null when absent
    std::string event;          ///< Non-empty for notifications
    request_id_t request_id = 0; ///< Only meaningful when event is empty
    json extra;                 ///< Other members, e.g. "name"/"id" of property-change

    /// True for unsolicited notifications
    bool is_event() const noexcept { return !event.empty(); }

    /// True when the peer reported success
    bool ok() const noexcept { return error.empty(); }
};

// ============================================================================
// IPC result type
// ============================================================================

/// Error codes for IPC operations
enum class ipc_error : uint32_t {
    success = 0,
    connection_failed = 1,    ///< Dial failed or timed out
    send_timeout = 2,         ///< Writer did not accept the request in time
    recv_timeout = 3,         ///< Request written, no reply in time
    channel_closed = 4,       ///< Reply slot closed without a value
    cancelled = 5,            ///< Client closed or peer hung up
    write_failed = 6,         ///< Writing the request to the socket failed
    encoding_failed = 7,      ///< Command not representable as JSON
    duplicate_request_id = 8, ///< Correlation id already pending
    command_failed = 9,       ///< Peer answered with an error string
    invalid_type = 10,        ///< Reply data has an unexpected type
};

/// Convert error code to string
inline const char* ipc_error_str(ipc_error err) {
    switch (err) {
        case ipc_error::success: return "success";
        case ipc_error::connection_failed: return "connection failed";
        case ipc_error::send_timeout: return "timeout while sending command";
        case ipc_error::recv_timeout: return "timeout while receiving response";
        case ipc_error::channel_closed: return "response channel closed";
        case ipc_error::cancelled: return "cancelled";
        case ipc_error::write_failed: return "write failed";
        case ipc_error::encoding_failed: return "encoding failed";
        case ipc_error::duplicate_request_id: return "duplicate request id";
        case ipc_error::command_failed: return "command failed";
        case ipc_error::invalid_type: return "invalid type";
        default: return "unknown error";
    }
}

/// Result of an IPC call: a value or an error code with optional detail
template<typename T>
class ipc_result {
public:
    ipc_result() = default;

    /// Construct success result
    explicit ipc_result(T value)
        : value_(std::move(value))
        , error_(ipc_error::success) {}

    /// Construct error result
    explicit ipc_result(ipc_error err, std::string detail = {})
        : error_(err), detail_(std::move(detail)) {}

    /// Check if successful
    bool ok() const noexcept { return error_ == ipc_error::success; }
    explicit operator bool() const noexcept { return ok(); }

    /// Get error code
    ipc_error error() const noexcept { return error_; }

    /// Get error message
    const char* error_message() const noexcept { return ipc_error_str(error_); }

    /// Extra context, e.g. the peer's error string for command_failed
    const std::string& detail() const noexcept { return detail_; }

    /// Get value (throws if error)
    T& value() & {
        if (!ok()) throw std::runtime_error(describe());
        return value_;
    }
    const T& value() const& {
        if (!ok()) throw std::runtime_error(describe());
        return value_;
    }
    T&& value() && {
        if (!ok()) throw std::runtime_error(describe());
        return std::move(value_);
    }

    /// Get value or default
    template<typename U>
    T value_or(U&& default_value) const& {
        return ok() ? value_ : static_cast<T>(std::forward<U>(default_value));
    }
    template<typename U>
    T value_or(U&& default_value) && {
        return ok() ? std::move(value_) : static_cast<T>(std::forward<U>(default_value));
    }

    /// Access value (undefined if error)
    T* operator->() { return &value_; }
    const T* operator->() const { return &value_; }
    T& operator*() & { return value_; }
    const T& operator*() const& { return value_; }
    T&& operator*() && { return std::move(value_); }

private:
    std::string describe() const {
        return detail_.empty() ? std::string(error_message())
                               : std::string(error_message()) + ": " + detail_;
    }

    T value_{};
    ipc_error error_ = ipc_error::success;
    std::string detail_;
};

/// Specialization for void
template<>
class ipc_result<void> {
public:
    ipc_result() = default;
    explicit ipc_result(ipc_error err, std::string detail = {})
        : error_(err), detail_(std::move(detail)) {}

    static ipc_result success() { return ipc_result(); }

    bool ok() const noexcept { return error_ == ipc_error::success; }
    explicit operator bool() const noexcept { return ok(); }

    ipc_error error() const noexcept { return error_; }
    const char* error_message() const noexcept { return ipc_error_str(error_); }
    const std::string& detail() const noexcept { return detail_; }

private:
    ipc_error error_ = ipc_error::success;
    std::string detail_;
};

} // namespace mpvipc::ipc
