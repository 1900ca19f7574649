#pragma once

/// @file notification.hpp
/// @brief Hook receiving unsolicited events from the reader loop

#include "ipc_types.hpp"

#include <functional>
#include <memory>
#include <utility>

namespace mpvipc::ipc {

/// Receiver of notifications ("event" messages).
///
/// on_event() runs on the reader thread; it must not block for long, and
/// it must not call back into the client synchronously (a call would wait
/// for a reply that only the reader thread can deliver).
class notification_sink {
public:
    virtual ~notification_sink() = default;

    /// @param ev decoded message; ev.event holds the name, ev.data the payload
    virtual void on_event(const reply& ev) = 0;
};

using notification_sink_ptr = std::shared_ptr<notification_sink>;

/// Discards every event
class null_notification_sink final : public notification_sink {
public:
    void on_event(const reply&) override {}
};

/// Forwards events to a function
class callback_notification_sink final : public notification_sink {
public:
    using handler = std::function<void(const reply&)>;

    explicit callback_notification_sink(handler fn) : fn_(std::move(fn)) {}

    void on_event(const reply& ev) override {
        if (fn_) {
            fn_(ev);
        }
    }

private:
    handler fn_;
};

/// Convenience factory
inline notification_sink_ptr make_notification_sink(callback_notification_sink::handler fn) {
    return std::make_shared<callback_notification_sink>(std::move(fn));
}

} // namespace mpvipc::ipc
