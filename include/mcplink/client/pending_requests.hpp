#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Pending Requests (correlation table)
// ═══════════════════════════════════════════════════════════════════════════
// Maps outstanding request ids to single-use response slots. One table per
// connection; request callers and the reader loop touch it concurrently, so
// every operation takes the mutex. Completion removes the entry under the lock
// and fires the slot outside it, which makes "complete" and "timeout" racing
// for the same id resolve the caller exactly once.

#include "mcplink/client/client_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/experimental/channel.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace mcplink {

class PendingRequests {
public:
    /// Capacity-1 channel; exactly one value is ever sent into it.
    using ResponseSlot = asio::experimental::channel<void(asio::error_code, ClientResult<Json>)>;

    explicit PendingRequests(asio::any_io_executor executor);

    PendingRequests(const PendingRequests&) = delete;
    PendingRequests& operator=(const PendingRequests&) = delete;

    /// Next id: starts at 1, strictly increasing, never reused.
    [[nodiscard]] std::uint64_t allocate() noexcept;

    /// Create the slot for `id`. Returns nullptr once the table is closed
    /// (after fail_all) or if `id` is already registered.
    [[nodiscard]] std::shared_ptr<ResponseSlot> register_request(std::uint64_t id);

    /// Deliver a result. Unknown ids (late, duplicate, timed out) are dropped
    /// and false is returned.
    bool complete(std::uint64_t id, ClientResult<Json> result);

    /// Forget an entry without completing it (write failure).
    bool remove(std::uint64_t id);

    /// Fail and remove every entry, then refuse new registrations.
    /// Idempotent; returns the number of entries failed by this call.
    std::size_t fail_all(const ClientError& error);

    /// True while `id` is still waiting for its result.
    [[nodiscard]] bool contains(std::uint64_t id) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool is_closed() const;

private:
    asio::any_io_executor executor_;
    std::atomic<std::uint64_t> next_id_{1};

    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<ResponseSlot>> entries_;
    bool closed_{false};
};

}  // namespace mcplink
