#include <catch2/catch_test_macros.hpp>
#include <mpvipc/ipc/ipc_client.hpp>
#include <mpvipc/ipc/client.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "../test_main.cpp"  // For scaled timeouts
#include "../fake_peer.hpp"

using namespace mpvipc;
using namespace mpvipc::ipc;
using namespace mpvipc::test;
using namespace std::chrono_literals;

namespace {

/// Peer answering from several worker threads with random delays, so
/// replies leave in a different order than requests arrived.
class shuffling_peer {
public:
    shuffling_peer(net::uds_stream stream, int workers)
        : peer_(std::move(stream), [this](fake_peer&, const request_message& req) {
              enqueue(req);
          }) {
        for (int i = 0; i < workers; ++i) {
            threads_.emplace_back([this, i] { run(static_cast<unsigned>(i)); });
        }
    }

    ~shuffling_peer() {
        peer_.stop();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& t : threads_) {
            t.join();
        }
    }

    fake_peer& peer() { return peer_; }

private:
    void enqueue(const request_message& req) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(req);
        }
        cv_.notify_one();
    }

    void run(unsigned seed) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> delay(0, 300);
        for (;;) {
            request_message req;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (stopping_) {
                    return;
                }
                req = std::move(queue_.front());
                queue_.pop_front();
            }
            std::this_thread::sleep_for(std::chrono::microseconds(delay(rng)));
            peer_.reply(req.request_id, json(req.cmd));
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<request_message> queue_;
    bool stopping_ = false;
    fake_peer peer_;
    std::vector<std::thread> threads_;
};

} // namespace

TEST_CASE("Concurrent calls never receive another caller's reply", "[integration][concurrent]") {
    auto streams = make_stream_pair();
    shuffling_peer shuffler(std::move(streams.second), 4);

    client_config config;
    config.send_timeout = scaled_ms(5000);
    config.recv_timeout = scaled_ms(5000);
    auto client = ipc_client::create(std::move(streams.first), config);

    const int num_threads = 16;
    const int calls_per_thread = 50;
    std::atomic<int> matched{0};
    std::atomic<int> mismatched{0};
    std::atomic<int> failed{0};

    std::vector<std::thread> callers;
    for (int t = 0; t < num_threads; ++t) {
        callers.emplace_back([&, t] {
            for (int i = 0; i < calls_per_thread; ++i) {
                auto cmd = make_command("get_property", "caller-" + std::to_string(t), i);
                auto result = client->execute(cmd);
                if (!result) {
                    failed++;
                } else if (result->data == json(cmd)) {
                    matched++;
                } else {
                    mismatched++;
                }
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }

    REQUIRE(mismatched == 0);
    REQUIRE(failed == 0);
    REQUIRE(matched == num_threads * calls_per_thread);
    REQUIRE(client->pending_count() == 0);
    REQUIRE(client->unmatched_replies() == 0);
    REQUIRE(shuffler.peer().request_count() == static_cast<size_t>(num_threads * calls_per_thread));

    REQUIRE(client->close() == ipc_error::success);
}

TEST_CASE("Wire order follows acceptance order", "[integration][concurrent]") {
    auto streams = make_stream_pair();
    fake_peer peer(std::move(streams.second), echo_command);
    auto client = ipc_client::create(std::move(streams.first));

    // One caller issuing sequential calls: ids must reach the peer ascending
    for (int i = 0; i < 100; ++i) {
        REQUIRE(client->exec("set_property", "volume", i).ok());
    }

    auto requests = peer.requests();
    REQUIRE(requests.size() == 100);
    for (size_t i = 1; i < requests.size(); ++i) {
        REQUIRE(requests[i].request_id > requests[i - 1].request_id);
        REQUIRE(requests[i].cmd[2] == static_cast<int>(i));
    }
}

TEST_CASE("Close under load releases every caller", "[integration][lifecycle]") {
    // Peer answers only every other request so some callers are always waiting
    std::atomic<int> seen{0};
    auto streams = make_stream_pair();
    fake_peer peer(std::move(streams.second), [&seen](fake_peer& p, const request_message& req) {
        if (seen.fetch_add(1) % 2 == 0) {
            p.reply(req.request_id, true);
        }
    });

    client_config config;
    config.send_timeout = scaled_ms(10000);
    config.recv_timeout = scaled_ms(10000);
    auto client = ipc_client::create(std::move(streams.first), config);

    std::atomic<int> succeeded{0};
    std::atomic<int> released{0};
    std::atomic<int> unexpected{0};

    std::vector<std::thread> callers;
    for (int t = 0; t < 8; ++t) {
        callers.emplace_back([&] {
            for (;;) {
                auto result = client->exec("get_property", "idle");
                if (result.ok()) {
                    succeeded++;
                    continue;
                }
                if (result.error() == ipc_error::cancelled ||
                    result.error() == ipc_error::channel_closed) {
                    released++;
                    return;
                }
                unexpected++;
                return;
            }
        });
    }

    REQUIRE(wait_until([&] { return peer.request_count() >= 16; }));

    auto start = std::chrono::steady_clock::now();
    REQUIRE(client->close() == ipc_error::success);
    for (auto& t : callers) {
        t.join();
    }
    auto took = std::chrono::steady_clock::now() - start;

    REQUIRE(took < scaled_ms(5000));
    REQUIRE(unexpected == 0);
    REQUIRE(released == 8);
    REQUIRE(succeeded > 0);
    REQUIRE(client->pending_count() == 0);
}

TEST_CASE("Parent token shuts down several clients", "[integration][lifecycle]") {
    mpvipc::sync::cancel_source parent;

    auto pair_a = make_stream_pair();
    auto pair_b = make_stream_pair();
    fake_peer peer_a(std::move(pair_a.second), echo_command);
    fake_peer peer_b(std::move(pair_b.second), echo_command);

    client_config config;
    config.parent_token = parent.get_token();
    auto a = ipc_client::create(std::move(pair_a.first), config);
    auto b = ipc_client::create(std::move(pair_b.first), config);

    REQUIRE(a->exec("stop").ok());
    REQUIRE(b->exec("stop").ok());

    parent.cancel();

    REQUIRE(a->exec("stop").error() == ipc_error::cancelled);
    REQUIRE(b->exec("stop").error() == ipc_error::cancelled);
    REQUIRE(a->close() == ipc_error::success);
    REQUIRE(b->close() == ipc_error::success);
}

TEST_CASE("Command API over a live connection", "[integration][client]") {
    auto streams = make_stream_pair();
    fake_peer peer(std::move(streams.second), [](fake_peer& p, const request_message& req) {
        if (req.cmd[0] == "get_property" && req.cmd[1] == "volume") {
            p.reply(req.request_id, 70.0);
        } else if (req.cmd[0] == "get_property") {
            p.reply(req.request_id, nullptr, "property unavailable");
        } else {
            p.reply(req.request_id, nullptr);
        }
    });

    client c(ipc_client::create(std::move(streams.first)));

    auto volume = c.volume();
    REQUIRE(volume.ok());
    REQUIRE(*volume == 70.0);

    REQUIRE(c.set_volume_gain(5).ok());
    auto requests = peer.requests();
    REQUIRE(requests.back().cmd == make_command("set_property", "volume", 75.0));

    auto duration = c.duration();
    REQUIRE(duration.error() == ipc_error::command_failed);
    REQUIRE(duration.detail() == "property unavailable");

    REQUIRE(c.close() == ipc_error::success);
}
