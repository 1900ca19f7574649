#pragma once

/// @file correlation_table.hpp
/// @brief Pending request tracking for the IPC client

#include "ipc_types.hpp"

#include <mpvipc/sync/primitives.hpp>

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace mpvipc::ipc {

// ============================================================================
// Pending request tracking
// ============================================================================

/// One in-flight call.
///
/// Shared between the calling thread, the writer loop and the correlation
/// table. The result slot is completed exactly once: with the reply, with
/// the error that prevented the request from being written, or closed empty
/// on teardown.
struct pending_request {
    request_id_t id = 0;
    command cmd;
    sync::oneshot<ipc_result<reply>> result;

    pending_request(request_id_t request_id, command c)
        : id(request_id), cmd(std::move(c)) {}

    /// Deliver a reply. Returns false if already completed.
    bool complete(reply r) {
        return result.set(ipc_result<reply>(std::move(r)));
    }

    /// Fail with an error. Returns false if already completed.
    bool fail(ipc_error err, std::string detail = {}) {
        return result.set(ipc_result<reply>(err, std::move(detail)));
    }
};

using pending_ptr = std::shared_ptr<pending_request>;

/// Map from correlation id to pending request.
///
/// An id is present at most once. Entries leave the table only through
/// take() or drain(), so whoever removes an entry owns its completion.
class correlation_table {
public:
    correlation_table() = default;

    correlation_table(const correlation_table&) = delete;
    correlation_table& operator=(const correlation_table&) = delete;

    /// Register a request under its id.
    /// @return false (table unchanged) if the id is already pending
    bool insert(pending_ptr request) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto id = request->id;
        return pending_.try_emplace(id, std::move(request)).second;
    }

    /// Atomically look up and remove an entry.
    /// @return the request, or nullptr for unknown, expired or forged ids
    pending_ptr take(request_id_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return nullptr;
        }
        pending_ptr request = std::move(it->second);
        pending_.erase(it);
        return request;
    }

    /// Remove and return every entry (shutdown path)
    std::vector<pending_ptr> drain() {
        std::vector<pending_ptr> all;
        std::lock_guard<std::mutex> lock(mutex_);
        all.reserve(pending_.size());
        for (auto& [id, request] : pending_) {
            all.push_back(std::move(request));
        }
        pending_.clear();
        return all;
    }

    bool contains(request_id_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.count(id) != 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<request_id_t, pending_ptr> pending_;
};

} // namespace mpvipc::ipc
