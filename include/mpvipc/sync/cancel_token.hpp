#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace mpvipc::sync {

namespace detail {

/// Shared cancellation state (implementation detail)
///
/// Callbacks run on the thread that calls trigger(), outside the lock.
/// remove_callback() blocks while the callback being removed is running on
/// another thread, so a registration can never outlive the object its
/// callback refers to.
struct cancel_state {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable callback_done;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_id = 1;
    uint64_t running_id = 0;
    std::thread::id trigger_thread;

    uint64_t add_callback(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!cancelled.load(std::memory_order_relaxed)) {
                uint64_t id = next_id++;
                callbacks.emplace_back(id, std::move(cb));
                return id;
            }
        }
        // Already cancelled, invoke immediately
        cb();
        return 0;
    }

    void remove_callback(uint64_t id) {
        std::unique_lock<std::mutex> lock(mutex);
        auto it = std::find_if(callbacks.begin(), callbacks.end(),
            [id](const auto& p) { return p.first == id; });
        if (it != callbacks.end()) {
            callbacks.erase(it);
            return;
        }
        if (running_id == id && trigger_thread != std::this_thread::get_id()) {
            callback_done.wait(lock, [this, id] { return running_id != id; });
        }
    }

    void trigger() {
        std::unique_lock<std::mutex> lock(mutex);
        if (cancelled.exchange(true, std::memory_order_release)) {
            return; // Already cancelled
        }
        trigger_thread = std::this_thread::get_id();
        while (!callbacks.empty()) {
            auto [id, cb] = std::move(callbacks.front());
            callbacks.erase(callbacks.begin());
            running_id = id;
            lock.unlock();
            cb();
            lock.lock();
            running_id = 0;
            callback_done.notify_all();
        }
    }
};

} // namespace detail

class cancel_source;

/// Registration handle for cancel callbacks
class cancel_registration {
public:
    cancel_registration() = default;
    cancel_registration(cancel_registration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {
        other.id_ = 0;
    }
    cancel_registration& operator=(cancel_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }
    ~cancel_registration() { unregister(); }

    // Non-copyable
    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;

    /// Unregister the callback; waits for it if it is currently running
    void unregister() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
            id_ = 0;
        }
        state_.reset();
    }

private:
    friend class cancel_token;

    cancel_registration(std::shared_ptr<detail::cancel_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::cancel_state> state_;
    uint64_t id_ = 0;
};

/// A copyable handle observing a cancel_source.
///
/// Every blocking operation in mpvipc takes a token and returns early once
/// it is cancelled. A default-constructed token is never cancelled.
///
/// Example:
/// ```cpp
/// sync::cancel_source source;
/// auto token = source.get_token();
/// std::thread worker([token] {
///     while (!token.is_cancelled()) {
///         // do work
///     }
/// });
/// source.cancel();
/// worker.join();
/// ```
class cancel_token {
public:
    using registration = cancel_registration;

    /// Default constructor creates an empty (never-cancelled) token
    cancel_token() = default;

    /// Check if cancellation has been requested
    bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    /// True if NOT cancelled
    explicit operator bool() const noexcept {
        return !is_cancelled();
    }

    /// Check whether this token can ever be cancelled
    bool can_be_cancelled() const noexcept {
        return state_ != nullptr;
    }

    /// Register a callback to be invoked when cancellation is requested.
    /// The callback is invoked immediately (on this thread) if already cancelled.
    /// @param callback Function to call on cancellation
    /// @return Registration handle (callback unregisters when handle is destroyed)
    template<typename F>
    [[nodiscard]] registration on_cancel(F&& callback) const {
        if (!state_) {
            return registration{};
        }
        return registration{state_, state_->add_callback(std::forward<F>(callback))};
    }

private:
    friend class cancel_source;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

/// Owner of a cancellation state.
///
/// A source may be linked to a parent token: cancelling the parent cancels
/// the source, while cancelling the source leaves the parent untouched.
class cancel_source {
public:
    /// Create a new cancel source
    cancel_source()
        : state_(std::make_shared<detail::cancel_state>()) {}

    /// Create a source that is also cancelled when @p parent is cancelled
    explicit cancel_source(const cancel_token& parent)
        : state_(std::make_shared<detail::cancel_state>()) {
        std::weak_ptr<detail::cancel_state> weak = state_;
        parent_registration_ = parent.on_cancel([weak]() {
            if (auto state = weak.lock()) {
                state->trigger();
            }
        });
    }

    ~cancel_source() {
        parent_registration_.unregister();
    }

    cancel_source(const cancel_source&) = delete;
    cancel_source& operator=(const cancel_source&) = delete;

    /// Get a token associated with this source
    cancel_token get_token() const noexcept {
        return cancel_token{state_};
    }

    /// Request cancellation
    /// All registered callbacks are invoked on the calling thread and all
    /// tokens report is_cancelled() == true
    void cancel() {
        state_->trigger();
    }

    /// Check if cancellation has been requested
    bool is_cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::cancel_state> state_;
    cancel_registration parent_registration_;
};

} // namespace mpvipc::sync
