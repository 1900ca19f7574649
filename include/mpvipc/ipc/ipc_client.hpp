#pragma once

/// @file ipc_client.hpp
/// @brief Multiplexing IPC client with out-of-order reply support
///
/// Any number of threads may call execute() concurrently. Each call is
/// handed to a single writer thread, which assigns the request to the
/// correlation table and writes it to the socket in acceptance order. A
/// single reader thread decodes inbound lines and routes replies to their
/// callers by request id; events go to a notification_sink.
///
/// execute() is synchronous, so the loops run on plain threads with
/// condition-variable waits instead of coroutines and an event loop.
///
/// Usage:
/// @code
/// ipc::client_config config;
/// config.socket_path = "/tmp/mpvsocket";
/// auto connected = ipc::ipc_client::connect(config);
/// if (!connected) {
///     return;
/// }
/// auto client = *connected;
/// auto result = client->exec("get_property", "volume");
/// if (result.ok() && result->ok()) {
///     double volume = result->data.get<double>();
/// }
/// @endcode

#include "ipc_protocol.hpp"
#include "correlation_table.hpp"
#include "notification.hpp"

#include <mpvipc/net/uds.hpp>
#include <mpvipc/sync/cancel_token.hpp>
#include <mpvipc/sync/primitives.hpp>
#include <mpvipc/log/macros.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mpvipc::ipc {

/// Client configuration, fixed at construction
struct client_config {
    std::string socket_path;                           ///< Filesystem path, or "@name" for abstract
    std::chrono::milliseconds dial_timeout{default_timeout}; ///< Connect timeout
    std::chrono::milliseconds send_timeout{default_timeout}; ///< Send phase timeout
    std::chrono::milliseconds recv_timeout{default_timeout}; ///< Receive phase timeout
    net::uds_options socket;                           ///< Socket options
    sync::cancel_token parent_token;                   ///< Cancelling it shuts the client down

    /// Request id source, called concurrently by callers.
    /// Empty = per-client counter wrapping inside [1, INT32_MAX].
    std::function<request_id_t()> request_ids;
};

/// Client lifecycle state
enum class client_state {
    connected,     ///< Loops running
    disconnected,  ///< Cancelled or peer hung up; close() not yet called
    closed         ///< close() completed
};

/// Interface consumed by the command API
class ll_client {
public:
    virtual ~ll_client() = default;

    /// Execute one command and wait for its reply.
    /// A reply carrying a peer error is still a successful result.
    virtual ipc_result<reply> execute(const command& cmd) = 0;

    /// Shut the client down
    virtual ipc_error close() = 0;
};

namespace detail {

/// State shared by an ipc_client and its reader and writer threads.
/// Each thread holds a reference, so a loop may outlive its client handle.
class client_core {
public:
    client_core(net::uds_stream s, const client_config& cfg, notification_sink_ptr sk)
        : config(cfg)
        , stream(std::move(s))
        , sink(sk ? std::move(sk) : std::make_shared<null_notification_sink>())
        , cancel(cfg.parent_token) {}

    ~client_core() {
        shutdown_registration.unregister();
        release_pending();
    }

    client_core(const client_core&) = delete;
    client_core& operator=(const client_core&) = delete;

    request_id_t next_id() {
        return config.request_ids ? config.request_ids() : id_generator.next();
    }

    bool on_loop_thread() const noexcept {
        auto self = std::this_thread::get_id();
        return self == reader_id.load(std::memory_order_acquire) ||
               self == writer_id.load(std::memory_order_acquire);
    }

    /// Close the reply slot of every request still in the table
    void release_pending() {
        auto orphans = table.drain();
        for (auto& request : orphans) {
            request->result.close();
        }
        if (!orphans.empty()) {
            MPVIPC_LOG_DEBUG("Released {} pending requests", orphans.size());
        }
    }

    /// Takes requests from the intake one at a time: encode, register, write
    void writer_loop() {
        writer_id.store(std::this_thread::get_id(), std::memory_order_release);
        MPVIPC_LOG_DEBUG("IPC writer loop started");
        auto token = cancel.get_token();

        while (auto next = intake.recv(token)) {
            pending_ptr request = std::move(*next);

            std::string line;
            try {
                line = encode_request(request->id, request->cmd);
            } catch (const encoding_error& e) {
                MPVIPC_LOG_WARNING("Discarding request {}: {}", request->id, e.what());
                request->fail(ipc_error::encoding_failed, e.what());
                continue;
            }

            if (!table.insert(request)) {
                MPVIPC_LOG_ERROR("Request id {} is already pending", request->id);
                request->fail(ipc_error::duplicate_request_id);
                continue;
            }

            if (!stream.write_all(line)) {
                int err = errno;
                if (!token.is_cancelled()) {
                    MPVIPC_LOG_ERROR("Failed to write request {}: {}", request->id, std::strerror(err));
                }
                // The reader may have completed it already
                if (auto orphan = table.take(request->id)) {
                    orphan->fail(ipc_error::write_failed, std::strerror(err));
                }
            }
        }

        MPVIPC_LOG_DEBUG("IPC writer loop ended");
    }

    /// Reads lines until the socket fails or is shut down
    void reader_loop() {
        reader_id.store(std::this_thread::get_id(), std::memory_order_release);
        MPVIPC_LOG_DEBUG("IPC reader loop started");
        auto token = cancel.get_token();

        while (!token.is_cancelled()) {
            auto line = stream.read_line();
            if (!line) {
                int err = errno;
                if (!token.is_cancelled()) {
                    if (err == 0) {
                        MPVIPC_LOG_INFO("IPC peer closed the connection");
                    } else {
                        MPVIPC_LOG_ERROR("IPC read failed: {}", std::strerror(err));
                    }
                    cancel.cancel();
                }
                break;
            }
            if (line->empty()) {
                continue;
            }

            reply r;
            try {
                r = decode_reply(*line);
            } catch (const decoding_error& e) {
                malformed_lines.fetch_add(1, std::memory_order_relaxed);
                MPVIPC_LOG_WARNING("Discarding malformed line: {}", e.what());
                continue;
            }
            dispatch(std::move(r));
        }

        MPVIPC_LOG_DEBUG("IPC reader loop ended");
    }

    /// Route one decoded message to its caller or to the sink
    void dispatch(reply r) {
        if (r.is_event()) {
            events_received.fetch_add(1, std::memory_order_relaxed);
            try {
                sink->on_event(r);
            } catch (const std::exception& e) {
                MPVIPC_LOG_ERROR("Notification sink failed on '{}': {}", r.event, e.what());
            }
            return;
        }

        auto request = table.take(r.request_id);
        if (!request) {
            unmatched_replies.fetch_add(1, std::memory_order_relaxed);
            MPVIPC_LOG_DEBUG("Discarding reply for unknown request {}", r.request_id);
            return;
        }
        request->complete(std::move(r));
    }

    const client_config config;
    net::uds_stream stream;
    notification_sink_ptr sink;

    sync::cancel_source cancel;
    sync::rendezvous<pending_ptr> intake;
    correlation_table table;
    request_id_generator id_generator;

    std::atomic<std::thread::id> reader_id{};
    std::atomic<std::thread::id> writer_id{};

    std::atomic<uint64_t> malformed_lines{0};
    std::atomic<uint64_t> unmatched_replies{0};
    std::atomic<uint64_t> events_received{0};

    // Destroyed first: its callback shuts down the stream
    sync::cancel_registration shutdown_registration;
};

} // namespace detail

/// Low-level IPC client over a Unix domain socket
class ipc_client final : public ll_client {
public:
    using ptr = std::shared_ptr<ipc_client>;

    /// Connect to config.socket_path within config.dial_timeout and start
    /// the reader and writer threads.
    /// @param sink receiver of events (nullptr = discard)
    static ipc_result<ptr> connect(const client_config& config,
                                   notification_sink_ptr sink = nullptr) {
        if (config.parent_token.is_cancelled()) {
            return ipc_result<ptr>(ipc_error::cancelled);
        }

        auto addr = net::unix_address::parse(config.socket_path);
        auto stream = net::uds_connect(addr, config.dial_timeout, config.socket);
        if (!stream) {
            int err = errno;
            MPVIPC_LOG_ERROR("Failed to connect to {}: {}", addr.to_string(), std::strerror(err));
            return ipc_result<ptr>(ipc_error::connection_failed, std::strerror(err));
        }

        MPVIPC_LOG_INFO("Connected to {}", addr.to_string());
        return ipc_result<ptr>(create(std::move(*stream), config, std::move(sink)));
    }

    /// Create a client from an already connected stream
    static ptr create(net::uds_stream stream, const client_config& config = {},
                      notification_sink_ptr sink = nullptr) {
        ptr client(new ipc_client(std::move(stream), config, std::move(sink)));
        client->start();
        return client;
    }

    /// Destructor. When the last reference goes away on a loop thread (a
    /// sink holding the client), the other loop is joined and the current
    /// one finishes on its own reference to the shared state.
    ~ipc_client() override {
        if (core_->on_loop_thread()) {
            release_from_loop();
        } else {
            close();
        }
    }

    // Non-copyable
    ipc_client(const ipc_client&) = delete;
    ipc_client& operator=(const ipc_client&) = delete;

    /// Execute a command with the configured timeouts
    ipc_result<reply> execute(const command& cmd) override {
        return execute(cmd, core_->config.send_timeout, core_->config.recv_timeout);
    }

    /// Execute a command with explicit per-phase timeouts.
    ///
    /// Errors:
    /// - send_timeout: the writer did not accept the request in time
    /// - recv_timeout: the request was accepted, no reply arrived in time
    /// - cancelled: the client was closed or the peer hung up
    /// - channel_closed: the reply slot was closed during teardown
    /// - encoding_failed / write_failed / duplicate_request_id: reported by
    ///   the writer for this request
    template<typename Rep1, typename Period1, typename Rep2, typename Period2>
    ipc_result<reply> execute(const command& cmd,
                              std::chrono::duration<Rep1, Period1> send_timeout,
                              std::chrono::duration<Rep2, Period2> recv_timeout) {
        auto token = core_->cancel.get_token();
        if (token.is_cancelled()) {
            return ipc_result<reply>(ipc_error::cancelled);
        }

        auto request = std::make_shared<pending_request>(core_->next_id(), cmd);

        // Send phase
        switch (core_->intake.send_for(request, send_timeout, token)) {
            case sync::wait_status::ready:
                break;
            case sync::wait_status::timeout:
                MPVIPC_LOG_DEBUG("Request {} not accepted in time", request->id);
                return ipc_result<reply>(ipc_error::send_timeout);
            default:
                return ipc_result<reply>(ipc_error::cancelled);
        }

        // Receive phase
        switch (request->result.wait_for(recv_timeout, token)) {
            case sync::wait_status::ready:
                return std::move(*request->result.take());
            case sync::wait_status::closed:
                return ipc_result<reply>(ipc_error::channel_closed);
            case sync::wait_status::timeout:
                MPVIPC_LOG_DEBUG("Request {} timed out waiting for reply", request->id);
                return ipc_result<reply>(ipc_error::recv_timeout);
            default:
                return ipc_result<reply>(ipc_error::cancelled);
        }
    }

    /// Build and execute a command from arguments
    template<typename... Args>
    ipc_result<reply> exec(Args&&... args) {
        return execute(make_command(std::forward<Args>(args)...));
    }

    /// Close the client.
    ///
    /// Cancels every in-flight call, shuts the socket down, joins both
    /// threads, closes every pending reply slot and releases the socket.
    /// Idempotent. Called from the notification sink it only requests
    /// cancellation; the teardown completes in a later close() or in the
    /// destructor.
    ipc_error close() override {
        if (core_->on_loop_thread()) {
            core_->cancel.cancel();
            return ipc_error::success;
        }

        std::lock_guard<std::mutex> lock(close_mutex_);
        if (closed_.load(std::memory_order_acquire)) {
            return ipc_error::success;
        }

        core_->cancel.cancel();
        core_->intake.close();
        if (writer_.joinable()) {
            writer_.join();
        }
        if (reader_.joinable()) {
            reader_.join();
        }
        core_->shutdown_registration.unregister();
        core_->release_pending();

        ipc_error result = ipc_error::success;
        if (!core_->stream.close()) {
            MPVIPC_LOG_WARNING("Closing socket failed: {}", std::strerror(errno));
            result = ipc_error::connection_failed;
        }

        closed_.store(true, std::memory_order_release);
        MPVIPC_LOG_DEBUG("IPC client closed");
        return result;
    }

    /// Check if the client can still execute commands
    bool is_connected() const noexcept {
        return state() == client_state::connected;
    }

    /// Current lifecycle state
    client_state state() const noexcept {
        if (closed_.load(std::memory_order_acquire)) {
            return client_state::closed;
        }
        return core_->cancel.is_cancelled() ? client_state::disconnected : client_state::connected;
    }

    /// Token cancelled when the client shuts down
    sync::cancel_token token() const noexcept { return core_->cancel.get_token(); }

    /// Client configuration
    const client_config& config() const noexcept { return core_->config; }

    /// Requests registered and still waiting for a reply
    size_t pending_count() const { return core_->table.size(); }

    /// Inbound lines discarded because they could not be decoded
    uint64_t malformed_lines() const noexcept {
        return core_->malformed_lines.load(std::memory_order_relaxed);
    }

    /// Replies discarded because no request was waiting for them
    uint64_t unmatched_replies() const noexcept {
        return core_->unmatched_replies.load(std::memory_order_relaxed);
    }

    /// Events passed to the notification sink
    uint64_t events_received() const noexcept {
        return core_->events_received.load(std::memory_order_relaxed);
    }

private:
    ipc_client(net::uds_stream stream, const client_config& config, notification_sink_ptr sink)
        : core_(std::make_shared<detail::client_core>(std::move(stream), config, std::move(sink))) {}

    void start() {
        // Any cancellation, including the parent's, unblocks the reader
        auto* core = core_.get();
        core_->shutdown_registration = core_->cancel.get_token().on_cancel([core]() {
            core->stream.shutdown();
        });
        writer_ = std::thread([core = core_] { core->writer_loop(); });
        reader_ = std::thread([core = core_] { core->reader_loop(); });
    }

    /// Stop the other loop and detach the calling one; it sees the
    /// cancellation, leaves its loop and drops its reference to the core.
    void release_from_loop() {
        core_->cancel.cancel();
        core_->intake.close();

        bool on_reader = std::this_thread::get_id() ==
                         core_->reader_id.load(std::memory_order_acquire);
        std::thread& current = on_reader ? reader_ : writer_;
        std::thread& other = on_reader ? writer_ : reader_;
        if (other.joinable()) {
            other.join();
        }
        if (current.joinable()) {
            current.detach();
        }
        MPVIPC_LOG_DEBUG("IPC client released on its {} thread", on_reader ? "reader" : "writer");
    }

    std::shared_ptr<detail::client_core> core_;

    std::thread writer_;
    std::thread reader_;
    std::mutex close_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace mpvipc::ipc
