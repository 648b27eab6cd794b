#pragma once

#include <atomic>
#include <optional>
#include <utility>

namespace mcplink {

/// A value that is set at most once and read-only afterwards.
///
/// The first set() wins; later calls are rejected. Readers either see
/// nothing or the fully constructed value, never a partial write.
template <typename T>
class WriteOnce {
public:
    WriteOnce() = default;
    WriteOnce(const WriteOnce&) = delete;
    WriteOnce& operator=(const WriteOnce&) = delete;

    bool set(T value) {
        bool expected = false;
        if (!claimed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return false;
        }
        value_.emplace(std::move(value));
        published_.store(true, std::memory_order_release);
        return true;
    }

    [[nodiscard]] const T* get() const noexcept {
        if (!published_.load(std::memory_order_acquire)) {
            return nullptr;
        }
        return &*value_;
    }

    [[nodiscard]] bool is_set() const noexcept {
        return published_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::optional<T> copy() const {
        if (const T* v = get()) {
            return *v;
        }
        return std::nullopt;
    }

private:
    std::atomic<bool> claimed_{false};
    std::atomic<bool> published_{false};
    std::optional<T> value_;
};

}  // namespace mcplink
