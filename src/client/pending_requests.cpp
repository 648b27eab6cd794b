#include "mcplink/client/pending_requests.hpp"

#include <vector>

namespace mcplink {

PendingRequests::PendingRequests(asio::any_io_executor executor)
    : executor_(std::move(executor))
{}

std::uint64_t PendingRequests::allocate() noexcept {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
}

std::shared_ptr<PendingRequests::ResponseSlot> PendingRequests::register_request(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || entries_.contains(id)) {
        return nullptr;
    }
    auto slot = std::make_shared<ResponseSlot>(executor_, 1);
    entries_.emplace(id, slot);
    return slot;
}

bool PendingRequests::complete(std::uint64_t id, ClientResult<Json> result) {
    std::shared_ptr<ResponseSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        slot = std::move(it->second);
        entries_.erase(it);
    }
    slot->try_send(asio::error_code{}, std::move(result));
    return true;
}

bool PendingRequests::remove(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(id) > 0;
}

std::size_t PendingRequests::fail_all(const ClientError& error) {
    std::vector<std::shared_ptr<ResponseSlot>> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        failed.reserve(entries_.size());
        for (auto& [id, slot] : entries_) {
            failed.push_back(std::move(slot));
        }
        entries_.clear();
    }
    for (auto& slot : failed) {
        slot->try_send(asio::error_code{}, ClientResult<Json>(tl::unexpect, error));
    }
    return failed.size();
}

bool PendingRequests::contains(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(id);
}

std::size_t PendingRequests::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool PendingRequests::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace mcplink
