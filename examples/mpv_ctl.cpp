/// @file mpv_ctl.cpp
/// @brief Command-line controller for a running mpv instance
///
/// Connects to mpv's JSON IPC socket (mpv --input-ipc-server=<path>), runs
/// one command and prints the reply data. With -w it keeps the connection
/// open and prints every event until interrupted.
///
/// Usage: ./mpv_ctl [options] <socket_path> [command [args...]]
/// Examples:
///   ./mpv_ctl /tmp/mpvsocket get_property volume
///   ./mpv_ctl /tmp/mpvsocket set_property pause true
///   ./mpv_ctl -w /tmp/mpvsocket observe_property 1 time-pos
/// Use "@name" for abstract sockets (Linux-specific)

#include <mpvipc/mpvipc.hpp>

#include <fmt/core.h>

#include <pthread.h>
#include <unistd.h>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace mpvipc;

/// Interpret a command-line word as the JSON scalar it looks like
ipc::json parse_argument(const std::string& word) {
    if (word == "true") {
        return true;
    }
    if (word == "false") {
        return false;
    }
    auto value = ipc::json::parse(word, nullptr, false);
    if (!value.is_discarded() && value.is_number()) {
        return value;
    }
    return word;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <socket_path> [command [args...]]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -w, --watch        Print events until interrupted" << std::endl;
    std::cout << "  -t <ms>            Per-phase call timeout (default: 2000)" << std::endl;
    std::cout << "  -v, --verbose      Log connection details" << std::endl;
    std::cout << "  -h, --help         Show this help" << std::endl;
    std::cout << "Use @name for abstract sockets (e.g., @mpv)" << std::endl;
}

int main(int argc, char* argv[]) {
    bool watch = false;
    bool verbose = false;
    int timeout_ms = static_cast<int>(ipc::default_timeout.count());

    // Collect positional arguments
    std::vector<std::string> positional;

    // Parse command line; everything after the socket path belongs to the command
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (positional.empty() && (arg == "-w" || arg == "--watch")) {
            watch = true;
        } else if (positional.empty() && (arg == "-v" || arg == "--verbose")) {
            verbose = true;
        } else if (positional.empty() && arg == "-t" && i + 1 < argc) {
            timeout_ms = std::atoi(argv[++i]);
        } else if (positional.empty() && (arg == "-h" || arg == "--help")) {
            print_usage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || timeout_ms <= 0) {
        print_usage(argv[0]);
        return 2;
    }

    log::logger::instance().set_level(verbose ? log::level::info : log::level::warning);

    // Block the termination signals before any thread starts; main waits for them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    ipc::client_config config;
    config.socket_path = positional[0];
    config.dial_timeout = std::chrono::milliseconds(timeout_ms);
    config.send_timeout = std::chrono::milliseconds(timeout_ms);
    config.recv_timeout = std::chrono::milliseconds(timeout_ms);

    ipc::notification_sink_ptr sink;
    if (watch) {
        sink = ipc::make_notification_sink([](const ipc::reply& ev) {
            ipc::json line = ev.extra.is_object() ? ev.extra : ipc::json::object();
            line["event"] = ev.event;
            if (!ev.data.is_null()) {
                line["data"] = ev.data;
            }
            fmt::print("{}\n", line.dump());
            std::fflush(stdout);
        });
    }

    auto connected = ipc::ipc_client::connect(config, sink);
    if (!connected) {
        fmt::print(stderr, "Cannot connect to {}: {}\n", config.socket_path,
                   connected.detail().empty() ? connected.error_message() : connected.detail());
        return 1;
    }
    auto client = *connected;

    int status = 0;
    if (positional.size() > 1) {
        ipc::command cmd;
        cmd.emplace_back(positional[1]);
        for (size_t i = 2; i < positional.size(); ++i) {
            cmd.push_back(parse_argument(positional[i]));
        }

        auto result = client->execute(cmd);
        if (!result) {
            fmt::print(stderr, "{}\n", result.detail().empty()
                ? std::string(result.error_message())
                : fmt::format("{}: {}", result.error_message(), result.detail()));
            status = 1;
        } else if (!result->ok()) {
            fmt::print(stderr, "mpv: {}\n", result->error);
            status = 1;
        } else if (!result->data.is_null()) {
            fmt::print("{}\n", result->data.is_string()
                ? result->data.get<std::string>()
                : result->data.dump());
        }
    }

    if (watch && status == 0) {
        // Wake the signal wait when mpv goes away
        auto registration = client->token().on_cancel([] {
            ::kill(::getpid(), SIGTERM);
        });

        int sig = 0;
        sigwait(&signals, &sig);
        if (client->is_connected()) {
            MPVIPC_LOG_INFO("Received signal {}, disconnecting", sig);
        }
    }

    if (client->close() != ipc::ipc_error::success) {
        status = 1;
    }
    return status;
}
