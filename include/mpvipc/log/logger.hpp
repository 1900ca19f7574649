#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <array>
#include <atomic>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <thread>

namespace mpvipc::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Convert log level to ANSI color code
constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";  // Cyan
        case level::info:    return "\033[32m";  // Green
        case level::warning: return "\033[33m";  // Yellow
        case level::error:   return "\033[31m";  // Red
        default:             return "\033[0m";   // Reset
    }
}

/// Process-wide logger shared by the reader/writer threads and callers.
///
/// Every message is tagged with the emitting thread so that interleaved
/// output of the I/O loops stays readable. Emitted messages are counted per
/// level; the counters survive level changes and can be reset.
class logger {
public:
    /// Get singleton instance
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    /// Get current minimum log level
    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Enable or disable ANSI colors (enabled by default)
    void set_color(bool enable) noexcept {
        color_.store(enable, std::memory_order_relaxed);
    }

    /// Check whether a message at this level would be emitted
    bool should_log(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed);
    }

    /// Number of messages emitted at the given level since the last reset
    uint64_t count(level lvl) const noexcept {
        return counters_[static_cast<size_t>(lvl)].load(std::memory_order_relaxed);
    }

    /// Reset all per-level counters
    void reset_counts() noexcept {
        for (auto& c : counters_) {
            c.store(0, std::memory_order_relaxed);
        }
    }

    /// Log a message with formatting
    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!should_log(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffff;
        bool color = color_.load(std::memory_order_relaxed);

        counters_[static_cast<size_t>(lvl)].fetch_add(1, std::memory_order_relaxed);

        // Thread-safe output
        std::lock_guard<std::mutex> lock(mutex_);

        // Format: [TIMESTAMP] [LEVEL] [tid] [file:line] message
        fmt::print(stderr,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{:04x}] [{}:{}] {}{}\n",
            color ? level_to_color(lvl) : "",
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            tid,
            file,
            line,
            msg,
            color ? "\033[0m" : ""
        );
    }

private:
    logger() noexcept : min_level_(level::info) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    std::atomic<level> min_level_;
    std::atomic<bool> color_{true};
    std::array<std::atomic<uint64_t>, 4> counters_{};
    std::mutex mutex_;  // Protect concurrent writes to stderr
};

} // namespace mpvipc::log
