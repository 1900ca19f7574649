#include <catch2/catch_test_macros.hpp>
#include <mpvipc/ipc/correlation_table.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace mpvipc;
using namespace mpvipc::ipc;
using namespace std::chrono_literals;

namespace {

pending_ptr make_pending(request_id_t id) {
    return std::make_shared<pending_request>(id, make_command("get_property", "pause"));
}

} // namespace

TEST_CASE("correlation_table insert and take", "[correlation]") {
    correlation_table table;
    REQUIRE(table.size() == 0);

    auto first = make_pending(1);
    REQUIRE(table.insert(first));
    REQUIRE(table.contains(1));
    REQUIRE(table.size() == 1);

    SECTION("take removes the entry") {
        auto taken = table.take(1);
        REQUIRE(taken == first);
        REQUIRE_FALSE(table.contains(1));
        REQUIRE(table.take(1) == nullptr);
    }

    SECTION("unknown id") {
        REQUIRE(table.take(2) == nullptr);
        REQUIRE(table.size() == 1);
    }

    SECTION("duplicate id is rejected") {
        auto second = make_pending(1);
        REQUIRE_FALSE(table.insert(second));
        REQUIRE(table.take(1) == first);
    }
}

TEST_CASE("correlation_table drain", "[correlation]") {
    correlation_table table;
    for (request_id_t id = 1; id <= 5; ++id) {
        REQUIRE(table.insert(make_pending(id)));
    }

    auto all = table.drain();
    REQUIRE(all.size() == 5);
    REQUIRE(table.size() == 0);
    REQUIRE(table.drain().empty());
}

TEST_CASE("pending_request completes once", "[correlation]") {
    auto request = make_pending(3);

    reply r;
    r.request_id = 3;
    r.data = true;
    REQUIRE(request->complete(r));
    REQUIRE_FALSE(request->fail(ipc_error::write_failed));

    REQUIRE(request->result.wait_for(0ms) == mpvipc::sync::wait_status::ready);
    auto result = request->result.take();
    REQUIRE(result.has_value());
    REQUIRE(result->ok());
    REQUIRE((*result)->data == true);
}

TEST_CASE("pending_request failure carries detail", "[correlation]") {
    auto request = make_pending(4);
    REQUIRE(request->fail(ipc_error::write_failed, "Broken pipe"));

    auto result = request->result.take();
    REQUIRE(result.has_value());
    REQUIRE(result->error() == ipc_error::write_failed);
    REQUIRE(result->detail() == "Broken pipe");
}

TEST_CASE("correlation_table concurrent take delivers once", "[correlation]") {
    correlation_table table;
    constexpr request_id_t count = 500;
    for (request_id_t id = 1; id <= count; ++id) {
        REQUIRE(table.insert(make_pending(id)));
    }

    std::atomic<int> taken{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (request_id_t id = 1; id <= count; ++id) {
                if (table.take(id)) {
                    taken++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(taken == count);
    REQUIRE(table.size() == 0);
}
