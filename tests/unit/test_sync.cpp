#include <catch2/catch_test_macros.hpp>
#include <mpvipc/sync/primitives.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "../test_main.cpp"

using namespace mpvipc::sync;
using namespace mpvipc::test;
using namespace std::chrono_literals;

TEST_CASE("wait_status names", "[sync]") {
    REQUIRE(std::string(wait_status_str(wait_status::ready)) == "ready");
    REQUIRE(std::string(wait_status_str(wait_status::timeout)) == "timeout");
    REQUIRE(std::string(wait_status_str(wait_status::cancelled)) == "cancelled");
    REQUIRE(std::string(wait_status_str(wait_status::closed)) == "closed");
}

TEST_CASE("oneshot basic operations", "[sync][oneshot]") {
    oneshot<int> slot;
    REQUIRE_FALSE(slot.is_completed());

    SECTION("set then wait") {
        REQUIRE(slot.set(42));
        REQUIRE(slot.is_completed());
        REQUIRE(slot.wait_for(0ms) == wait_status::ready);
        auto value = slot.take();
        REQUIRE(value.has_value());
        REQUIRE(*value == 42);
        REQUIRE_FALSE(slot.take().has_value());
    }

    SECTION("only first completion counts") {
        REQUIRE(slot.set(1));
        REQUIRE_FALSE(slot.set(2));
        REQUIRE_FALSE(slot.close());
        REQUIRE(*slot.take() == 1);
    }

    SECTION("close without value") {
        REQUIRE(slot.close());
        REQUIRE_FALSE(slot.set(3));
        REQUIRE(slot.wait_for(0ms) == wait_status::closed);
    }

    SECTION("timeout") {
        auto start = std::chrono::steady_clock::now();
        REQUIRE(slot.wait_for(30ms) == wait_status::timeout);
        REQUIRE(std::chrono::steady_clock::now() - start >= 30ms);
    }
}

TEST_CASE("oneshot cross-thread delivery", "[sync][oneshot]") {
    oneshot<std::string> slot;

    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        slot.set("done");
    });

    REQUIRE(slot.wait_for(scaled_ms(2000)) == wait_status::ready);
    REQUIRE(*slot.take() == "done");
    producer.join();
}

TEST_CASE("oneshot cancellation", "[sync][oneshot]") {
    oneshot<int> slot;
    cancel_source source;

    SECTION("already cancelled") {
        source.cancel();
        REQUIRE(slot.wait_for(scaled_ms(1000), source.get_token()) == wait_status::cancelled);
    }

    SECTION("cancelled while waiting") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(20ms);
            source.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        REQUIRE(slot.wait_for(scaled_ms(5000), source.get_token()) == wait_status::cancelled);
        REQUIRE(std::chrono::steady_clock::now() - start < scaled_ms(5000));
        canceller.join();
    }

    SECTION("value wins over cancellation") {
        slot.set(7);
        source.cancel();
        REQUIRE(slot.wait_for(0ms, source.get_token()) == wait_status::ready);
    }
}

TEST_CASE("rendezvous hand-off", "[sync][rendezvous]") {
    rendezvous<int> chan;

    SECTION("send completes only after recv") {
        std::atomic<bool> sent{false};
        wait_status status = wait_status::timeout;
        std::thread sender([&] {
            status = chan.send_for(5, scaled_ms(2000));
            sent = true;
        });

        std::this_thread::sleep_for(30ms);
        REQUIRE_FALSE(sent);

        auto value = chan.recv();
        REQUIRE(value.has_value());
        REQUIRE(*value == 5);
        sender.join();
        REQUIRE(sent);
        REQUIRE(status == wait_status::ready);
    }

    SECTION("send without receiver times out") {
        auto start = std::chrono::steady_clock::now();
        REQUIRE(chan.send_for(1, 30ms) == wait_status::timeout);
        REQUIRE(std::chrono::steady_clock::now() - start >= 30ms);
    }

    SECTION("withdrawn offer is never received") {
        REQUIRE(chan.send_for(1, 10ms) == wait_status::timeout);

        std::thread sender([&] {
            chan.send_for(2, scaled_ms(2000));
        });
        auto value = chan.recv();
        REQUIRE(value.has_value());
        REQUIRE(*value == 2);
        sender.join();
    }

    SECTION("close wakes sender and receiver") {
        wait_status status = wait_status::ready;
        std::thread sender([&] {
            status = chan.send_for(1, scaled_ms(5000));
        });
        std::this_thread::sleep_for(20ms);
        chan.close();
        sender.join();

        REQUIRE(status == wait_status::closed);
        REQUIRE(chan.is_closed());
        REQUIRE_FALSE(chan.recv().has_value());
        REQUIRE(chan.send_for(1, 10ms) == wait_status::closed);
    }
}

TEST_CASE("rendezvous cancellation", "[sync][rendezvous]") {
    rendezvous<int> chan;
    cancel_source source;

    SECTION("sender cancelled") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(20ms);
            source.cancel();
        });
        REQUIRE(chan.send_for(1, scaled_ms(5000), source.get_token()) == wait_status::cancelled);
        canceller.join();
    }

    SECTION("receiver cancelled") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(20ms);
            source.cancel();
        });
        REQUIRE_FALSE(chan.recv(source.get_token()).has_value());
        canceller.join();
    }
}

TEST_CASE("rendezvous with many senders", "[sync][rendezvous]") {
    rendezvous<int> chan;
    constexpr int num_senders = 8;
    constexpr int per_sender = 50;

    std::atomic<int> accepted{0};
    std::vector<std::thread> senders;
    for (int s = 0; s < num_senders; ++s) {
        senders.emplace_back([&, s] {
            for (int i = 0; i < per_sender; ++i) {
                if (chan.send_for(s * per_sender + i, scaled_ms(5000)) == wait_status::ready) {
                    accepted++;
                }
            }
        });
    }

    std::vector<bool> seen(num_senders * per_sender, false);
    for (int i = 0; i < num_senders * per_sender; ++i) {
        auto value = chan.recv();
        REQUIRE(value.has_value());
        REQUIRE_FALSE(seen[*value]);
        seen[*value] = true;
    }

    for (auto& t : senders) {
        t.join();
    }
    REQUIRE(accepted == num_senders * per_sender);
}
