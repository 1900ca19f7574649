#pragma once

// Scripted in-process mpv peer for client tests.

#include <mpvipc/ipc/ipc_protocol.hpp>
#include <mpvipc/net/uds.hpp>

#include <sys/socket.h>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace mpvipc::test {

/// Connected stream pair: first for the client, second for the peer
inline std::pair<net::uds_stream, net::uds_stream> make_stream_pair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        throw std::system_error(errno, std::generic_category(), "socketpair");
    }
    return {net::uds_stream(fds[0]), net::uds_stream(fds[1])};
}

/// Reads requests from its end of the socket on a background thread and
/// hands each one to a handler, which may answer through reply()/send_line().
class fake_peer {
public:
    using handler = std::function<void(fake_peer&, const ipc::request_message&)>;

    explicit fake_peer(net::uds_stream stream, handler on_request = {})
        : stream_(std::move(stream)), on_request_(std::move(on_request)) {
        thread_ = std::thread([this] { run(); });
    }

    ~fake_peer() {
        stop();
    }

    fake_peer(const fake_peer&) = delete;
    fake_peer& operator=(const fake_peer&) = delete;

    /// Write one raw line (delimiter appended when missing)
    bool send_line(std::string_view line) {
        std::string data(line);
        if (data.empty() || data.back() != '\n') {
            data.push_back('\n');
        }
        std::lock_guard<std::mutex> lock(write_mutex_);
        return stream_.write_all(data);
    }

    /// Answer request @p id
    bool reply(ipc::request_id_t id, ipc::json data, std::string error = "success") {
        ipc::reply r;
        r.request_id = id;
        r.data = std::move(data);
        r.error = std::move(error);
        return send_line(ipc::encode_reply(r));
    }

    /// Emit an unsolicited event
    bool send_event(std::string name, ipc::json data = nullptr) {
        ipc::reply r;
        r.event = std::move(name);
        r.data = std::move(data);
        return send_line(ipc::encode_reply(r));
    }

    /// Requests received so far, in wire order
    std::vector<ipc::request_message> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    /// Wait until at least @p count requests arrived
    bool wait_for_requests(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return requests_.size() >= count; });
    }

    /// Lines that were not valid requests
    size_t bad_lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bad_lines_;
    }

    /// Close the connection from the peer side
    void hang_up() {
        stream_.shutdown();
    }

    /// Hang up and join the reader thread
    void stop() {
        stream_.shutdown();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void run() {
        while (auto line = stream_.read_line()) {
            ipc::request_message req;
            try {
                req = ipc::decode_request(*line);
            } catch (const ipc::decoding_error&) {
                std::lock_guard<std::mutex> lock(mutex_);
                ++bad_lines_;
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(req);
            }
            cv_.notify_all();
            if (on_request_) {
                on_request_(*this, req);
            }
        }
    }

    net::uds_stream stream_;
    handler on_request_;
    std::thread thread_;
    std::mutex write_mutex_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ipc::request_message> requests_;
    size_t bad_lines_ = 0;
};

/// Handler answering every request with its own command as data
inline void echo_command(fake_peer& peer, const ipc::request_message& req) {
    peer.reply(req.request_id, ipc::json(req.cmd));
}

} // namespace mpvipc::test
