// Test main - Catch2 provides main via Catch2::Catch2WithMain
// This file holds shared test helpers and is included by the test sources

// Helper to detect sanitizers and scale timeouts accordingly
#ifndef MPVIPC_TEST_HELPERS_HPP
#define MPVIPC_TEST_HELPERS_HPP

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <unistd.h>

namespace mpvipc::test {

// Detect if running under ThreadSanitizer
constexpr bool is_tsan_enabled() {
#if defined(__SANITIZE_THREAD__)
    return true;
#elif defined(__has_feature)
    #if __has_feature(thread_sanitizer)
        return true;
    #else
        return false;
    #endif
#else
    return false;
#endif
}

// Detect if running under AddressSanitizer
constexpr bool is_asan_enabled() {
#if defined(__SANITIZE_ADDRESS__)
    return true;
#elif defined(__has_feature)
    #if __has_feature(address_sanitizer)
        return true;
    #else
        return false;
    #endif
#else
    return false;
#endif
}

// Scale factor for timeouts under sanitizers
constexpr int timeout_scale_factor() {
    if (is_tsan_enabled()) return 10;  // TSAN is ~5-15x slower
    if (is_asan_enabled()) return 3;   // ASAN is ~2-3x slower
    return 1;
}

// Helper to scale milliseconds timeout
inline std::chrono::milliseconds scaled_ms(int base_ms) {
    return std::chrono::milliseconds(base_ms * timeout_scale_factor());
}

// Unique filesystem socket path for this process
inline std::string temp_socket_path(const char* tag) {
    static std::atomic<int> counter{0};
    return "/tmp/mpvipc_" + std::string(tag) + "_" + std::to_string(::getpid()) +
           "_" + std::to_string(counter.fetch_add(1)) + ".sock";
}

// Poll @p pred until it holds or @p timeout elapses
template<typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = scaled_ms(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

} // namespace mpvipc::test

#endif // MPVIPC_TEST_HELPERS_HPP
