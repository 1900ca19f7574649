/// @file mpv_mock_server.cpp
/// @brief Minimal mpv-like JSON IPC peer
///
/// Serves a small in-memory property table over a Unix socket, speaking the
/// same newline-delimited JSON as mpv. Handy for trying mpv_ctl or the
/// client library without a real player.
///
/// Supported commands: get_property, set_property, cycle, observe_property,
/// unobserve_property, loadfile, stop, seek, client_name, quit.
///
/// Usage: ./mpv_mock_server [socket_path]
/// Default path: /tmp/mpvipc_mock.sock
/// Use "@name" for abstract sockets (Linux-specific)

#include <mpvipc/mpvipc.hpp>

#include <pthread.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mpvipc;
using ipc::json;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

/// One accepted client
struct connection {
    int id = 0;
    net::uds_stream stream;
    std::mutex write_mutex;
    std::map<std::string, json> observers;  ///< property -> observer id, guarded by player mutex

    connection(int conn_id, net::uds_stream s) : id(conn_id), stream(std::move(s)) {}

    bool send(const ipc::reply& msg) {
        std::lock_guard<std::mutex> lock(write_mutex);
        return stream.write_all(ipc::encode_reply(msg));
    }
};

using connection_ptr = std::shared_ptr<connection>;

/// Property table plus the connections observing it
class mock_player {
public:
    mock_player() {
        properties_ = {
            {"pause", false}, {"volume", 100.0}, {"mute", false}, {"speed", 1.0},
            {"fullscreen", false}, {"idle", true}, {"time-pos", nullptr},
            {"percent-pos", nullptr}, {"duration", nullptr}, {"playback-time", nullptr},
            {"filename", nullptr}, {"path", nullptr}, {"track-list", json::array()},
        };
    }

    void attach(const connection_ptr& conn) {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.push_back(conn);
    }

    void detach(const connection_ptr& conn) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = connections_.begin(); it != connections_.end(); ++it) {
            if (*it == conn) {
                connections_.erase(it);
                break;
            }
        }
    }

    /// Unblock every connection reader
    void disconnect_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& conn : connections_) {
            conn->stream.shutdown();
        }
    }

    /// Read and answer requests until the client goes away
    void serve(const connection_ptr& conn) {
        while (auto line = conn->stream.read_line()) {
            if (line->empty()) {
                continue;
            }
            ipc::request_message req;
            try {
                req = ipc::decode_request(*line);
            } catch (const ipc::decoding_error& e) {
                MPVIPC_LOG_WARNING("[Client {}] Bad request: {}", conn->id, e.what());
                continue;
            }
            if (req.cmd.empty() || !req.cmd[0].is_string()) {
                send_reply(*conn, req.request_id, nullptr, "invalid parameter");
                continue;
            }
            try {
                handle(conn, req);
            } catch (const json::exception& e) {
                MPVIPC_LOG_WARNING("[Client {}] Bad arguments: {}", conn->id, e.what());
                send_reply(*conn, req.request_id, nullptr, "invalid parameter");
            }
        }
        MPVIPC_LOG_INFO("[Client {}] Disconnected", conn->id);
    }

private:
    void handle(const connection_ptr& conn, const ipc::request_message& req) {
        const auto name = req.cmd[0].get<std::string>();
        const auto& args = req.cmd;
        MPVIPC_LOG_DEBUG("[Client {}] {} (request {})", conn->id, json(args).dump(), req.request_id);

        if (name == "client_name") {
            send_reply(*conn, req.request_id, "mock");
        } else if (name == "get_property" && args.size() >= 2) {
            std::string error;
            json value = get(args[1].get<std::string>(), error);
            send_reply(*conn, req.request_id, value, error);
        } else if (name == "set_property" && args.size() >= 3) {
            auto property = args[1].get<std::string>();
            if (!exists(property)) {
                send_reply(*conn, req.request_id, nullptr, "property not found");
                return;
            }
            send_reply(*conn, req.request_id, nullptr);
            set(property, args[2]);
        } else if (name == "cycle" && args.size() >= 2) {
            auto property = args[1].get<std::string>();
            std::string error;
            json value = get(property, error);
            if (!value.is_boolean()) {
                send_reply(*conn, req.request_id, nullptr, "invalid parameter");
                return;
            }
            send_reply(*conn, req.request_id, nullptr);
            set(property, !value.get<bool>());
        } else if (name == "observe_property" && args.size() >= 3) {
            auto property = args[2].get<std::string>();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                conn->observers[property] = args[1];
            }
            send_reply(*conn, req.request_id, nullptr);
            std::string error;
            emit_change(*conn, args[1], property, get(property, error));
        } else if (name == "unobserve_property" && args.size() >= 2) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto it = conn->observers.begin(); it != conn->observers.end();) {
                    it = it->second == args[1] ? conn->observers.erase(it) : std::next(it);
                }
            }
            send_reply(*conn, req.request_id, nullptr);
        } else if (name == "loadfile" && args.size() >= 2) {
            auto path = args[1].get<std::string>();
            send_reply(*conn, req.request_id, nullptr);
            broadcast("start-file");
            set("path", path);
            set("filename", path.substr(path.find_last_of('/') + 1));
            set("duration", 120.0);
            set("time-pos", 0.0);
            set("percent-pos", 0.0);
            set("idle", false);
            broadcast("file-loaded");
        } else if (name == "stop") {
            send_reply(*conn, req.request_id, nullptr);
            set("path", nullptr);
            set("filename", nullptr);
            set("time-pos", nullptr);
            set("idle", true);
            broadcast("end-file");
            broadcast("idle");
        } else if (name == "seek" && args.size() >= 2) {
            seek(*conn, req);
        } else if (name == "quit") {
            send_reply(*conn, req.request_id, nullptr);
            MPVIPC_LOG_INFO("[Client {}] Requested quit", conn->id);
            g_running = false;
            ::kill(::getpid(), SIGTERM);
        } else {
            send_reply(*conn, req.request_id, nullptr, "invalid parameter");
        }
    }

    void seek(connection& conn, const ipc::request_message& req) {
        std::string error;
        json position = get("time-pos", error);
        json duration = get("duration", error);
        if (!position.is_number() || !duration.is_number()) {
            send_reply(conn, req.request_id, nullptr, "property unavailable");
            return;
        }

        // mpv accepts the amount as a number or as a numeric string
        double amount = 0.0;
        const auto& arg = req.cmd[1];
        if (arg.is_number()) {
            amount = arg.get<double>();
        } else if (arg.is_string()) {
            try {
                amount = std::stod(arg.get<std::string>());
            } catch (const std::exception&) {
                send_reply(conn, req.request_id, nullptr, "invalid parameter");
                return;
            }
        }

        bool absolute = req.cmd.size() >= 3 && req.cmd[2] == "absolute";
        double target = absolute ? amount : position.get<double>() + amount;
        double length = duration.get<double>();
        target = std::max(0.0, std::min(target, length));

        send_reply(conn, req.request_id, nullptr);
        set("time-pos", target);
        set("percent-pos", length > 0 ? target * 100.0 / length : 0.0);
        broadcast("seek");
    }

    bool exists(const std::string& property) {
        std::lock_guard<std::mutex> lock(mutex_);
        return properties_.contains(property);
    }

    json get(const std::string& property, std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = properties_.find(property);
        if (it == properties_.end()) {
            error = "property not found";
            return nullptr;
        }
        if (it->is_null()) {
            error = "property unavailable";
        }
        return *it;
    }

    /// Store a value and notify every observer of that property
    void set(const std::string& property, json value) {
        std::vector<std::pair<connection_ptr, json>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            properties_[property] = value;
            for (auto& conn : connections_) {
                auto it = conn->observers.find(property);
                if (it != conn->observers.end()) {
                    targets.emplace_back(conn, it->second);
                }
            }
        }
        for (auto& [conn, observer_id] : targets) {
            emit_change(*conn, observer_id, property, value);
        }
    }

    void broadcast(const std::string& event) {
        std::vector<connection_ptr> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            targets = connections_;
        }
        ipc::reply msg;
        msg.event = event;
        for (auto& conn : targets) {
            conn->send(msg);
        }
    }

    static void emit_change(connection& conn, const json& observer_id,
                            const std::string& property, const json& value) {
        ipc::reply msg;
        msg.event = "property-change";
        msg.data = value;
        msg.extra = {{"id", observer_id}, {"name", property}};
        conn.send(msg);
    }

    static void send_reply(connection& conn, ipc::request_id_t id, json data,
                           const std::string& error = {}) {
        ipc::reply msg;
        msg.request_id = id;
        msg.data = std::move(data);
        msg.error = error;
        if (!conn.send(msg)) {
            MPVIPC_LOG_WARNING("[Client {}] Reply {} not delivered", conn.id, id);
        }
    }

    std::mutex mutex_;
    json properties_;
    std::vector<connection_ptr> connections_;
};

/// Connection thread and its completion flag
struct worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

/// Join and drop workers whose client has gone
void reap_finished(std::vector<worker>& workers) {
    auto finished = std::partition(workers.begin(), workers.end(),
                                   [](const worker& w) { return !w.done->load(); });
    for (auto it = finished; it != workers.end(); ++it) {
        it->thread.join();
    }
    workers.erase(finished, workers.end());
}

int main(int argc, char* argv[]) {
    std::string socket_path = "/tmp/mpvipc_mock.sock";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [socket_path]" << std::endl;
            std::cout << "Default socket: /tmp/mpvipc_mock.sock" << std::endl;
            std::cout << "Use @name for abstract sockets (e.g., @mpv_mock)" << std::endl;
            return 0;
        }
        socket_path = arg;
    }

    // Block termination signals in every thread; a dedicated thread waits for them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::thread signal_thread([&signals] {
        int sig = 0;
        sigwait(&signals, &sig);
        MPVIPC_LOG_INFO("Received signal {} - initiating shutdown", sig);
        g_running = false;
    });

    auto addr = net::unix_address::parse(socket_path);
    auto listener = net::uds_listener::bind(addr);
    if (!listener) {
        MPVIPC_LOG_ERROR("Failed to bind to {}: {}", addr.to_string(), strerror(errno));
        ::kill(::getpid(), SIGTERM);
        signal_thread.join();
        return 1;
    }

    MPVIPC_LOG_INFO("Mock mpv listening on {}", addr.to_string());
    MPVIPC_LOG_INFO("Press Ctrl+C to stop");

    mock_player player;
    std::vector<worker> workers;
    int next_id = 0;

    while (g_running) {
        reap_finished(workers);

        auto stream = listener->accept(std::chrono::milliseconds(200));
        if (!stream) {
            if (errno != ETIMEDOUT && errno != EINTR) {
                MPVIPC_LOG_ERROR("Accept failed: {}", strerror(errno));
                break;
            }
            continue;
        }

        auto conn = std::make_shared<connection>(++next_id, std::move(*stream));
        MPVIPC_LOG_INFO("[Client {}] Connected", conn->id);
        player.attach(conn);
        auto done = std::make_shared<std::atomic<bool>>(false);
        workers.push_back({std::thread([&player, conn, done] {
            player.serve(conn);
            player.detach(conn);
            done->store(true);
        }), done});
    }

    player.disconnect_all();
    for (auto& w : workers) {
        w.thread.join();
    }

    if (g_running.exchange(false)) {
        // Left the loop on an accept error; release the signal thread
        ::kill(::getpid(), SIGTERM);
    }
    signal_thread.join();

    MPVIPC_LOG_INFO("Mock mpv stopped");
    return 0;
}
