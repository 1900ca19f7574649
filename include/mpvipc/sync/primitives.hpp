#pragma once

#include "cancel_token.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace mpvipc::sync {

using clock = std::chrono::steady_clock;

/// Outcome of a blocking wait
enum class wait_status {
    ready,      ///< Value delivered / accepted
    timeout,    ///< Deadline elapsed first
    cancelled,  ///< Cancellation requested first
    closed      ///< Primitive closed without a value
};

inline const char* wait_status_str(wait_status s) noexcept {
    switch (s) {
        case wait_status::ready:     return "ready";
        case wait_status::timeout:   return "timeout";
        case wait_status::cancelled: return "cancelled";
        case wait_status::closed:    return "closed";
        default:                     return "unknown";
    }
}

/// Single-use, single-slot delivery cell.
///
/// Exactly one of set() or close() takes effect; later calls return false.
/// Producers never block, so a late set() into an abandoned oneshot is
/// harmless. A single consumer waits with a deadline and a cancel token.
template<typename T>
class oneshot {
public:
    oneshot() = default;

    // Non-copyable, non-movable
    oneshot(const oneshot&) = delete;
    oneshot& operator=(const oneshot&) = delete;

    /// Store a value and wake the consumer. Returns false if already completed.
    bool set(T value) {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (completed_) {
                return false;
            }
            value_ = std::move(value);
            completed_ = true;
        }
        cv_.notify_all();
        return true;
    }

    /// Complete without a value. Returns false if already completed.
    bool close() {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (completed_) {
                return false;
            }
            completed_ = true;
        }
        cv_.notify_all();
        return true;
    }

    /// Check if set() or close() has taken effect
    bool is_completed() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return completed_;
    }

    /// Wait until completion, deadline or cancellation.
    /// @return ready when a value is available, closed when completed empty
    wait_status wait_until(clock::time_point deadline, const cancel_token& token = {}) {
        auto registration = token.on_cancel([this]() {
            std::lock_guard<std::mutex> guard(mutex_);
            cv_.notify_all();
        });

        std::unique_lock<std::mutex> lock(mutex_);
        bool woken = cv_.wait_until(lock, deadline, [&] {
            return completed_ || token.is_cancelled();
        });
        if (completed_) {
            return value_ ? wait_status::ready : wait_status::closed;
        }
        return woken ? wait_status::cancelled : wait_status::timeout;
    }

    /// Wait for at most @p timeout
    template<typename Rep, typename Period>
    wait_status wait_for(std::chrono::duration<Rep, Period> timeout, const cancel_token& token = {}) {
        return wait_until(clock::now() + timeout, token);
    }

    /// Move the stored value out (empty if none or already taken)
    std::optional<T> take() {
        std::lock_guard<std::mutex> guard(mutex_);
        return std::exchange(value_, std::nullopt);
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> value_;
    bool completed_ = false;
};

/// Unbuffered hand-off channel.
///
/// send() returns ready only once a receiver has taken the value, so a slow
/// receiver throttles every sender. At most one offer is outstanding at a
/// time; other senders queue behind it on the same deadline. A sender that
/// times out or is cancelled withdraws its offer, so a value is either
/// received or returned to nobody, never both.
template<typename T>
class rendezvous {
public:
    rendezvous() = default;

    // Non-copyable, non-movable
    rendezvous(const rendezvous&) = delete;
    rendezvous& operator=(const rendezvous&) = delete;

    /// Offer a value and wait until it is received
    wait_status send(T value, clock::time_point deadline, const cancel_token& token = {}) {
        auto registration = token.on_cancel([this]() {
            std::lock_guard<std::mutex> guard(mutex_);
            cv_.notify_all();
        });

        std::unique_lock<std::mutex> lock(mutex_);

        // Wait for the slot to become free
        bool free = cv_.wait_until(lock, deadline, [&] {
            return !slot_ || closed_ || token.is_cancelled();
        });
        if (closed_) {
            return wait_status::closed;
        }
        if (token.is_cancelled()) {
            return wait_status::cancelled;
        }
        if (!free) {
            return wait_status::timeout;
        }

        slot_ = std::move(value);
        uint64_t ticket = ++offered_;
        cv_.notify_all();

        // Wait for a receiver to take it
        cv_.wait_until(lock, deadline, [&] {
            return taken_ >= ticket || closed_ || token.is_cancelled();
        });
        if (taken_ >= ticket) {
            return wait_status::ready;
        }

        // Withdraw the offer
        slot_.reset();
        cv_.notify_all();
        if (closed_) {
            return wait_status::closed;
        }
        return token.is_cancelled() ? wait_status::cancelled : wait_status::timeout;
    }

    /// Offer a value, waiting at most @p timeout
    template<typename Rep, typename Period>
    wait_status send_for(T value, std::chrono::duration<Rep, Period> timeout,
                         const cancel_token& token = {}) {
        return send(std::move(value), clock::now() + timeout, token);
    }

    /// Receive the next offered value.
    /// @return std::nullopt once closed or cancelled
    std::optional<T> recv(const cancel_token& token = {}) {
        auto registration = token.on_cancel([this]() {
            std::lock_guard<std::mutex> guard(mutex_);
            cv_.notify_all();
        });

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] {
            return slot_.has_value() || closed_ || token.is_cancelled();
        });
        if (closed_ || token.is_cancelled()) {
            return std::nullopt;
        }

        std::optional<T> result = std::exchange(slot_, std::nullopt);
        taken_ = offered_;
        lock.unlock();
        cv_.notify_all();
        return result;
    }

    /// Close the channel, waking every sender and receiver
    void close() {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Check if channel is closed
    bool is_closed() const noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> slot_;
    uint64_t offered_ = 0;
    uint64_t taken_ = 0;
    bool closed_ = false;
};

} // namespace mpvipc::sync
