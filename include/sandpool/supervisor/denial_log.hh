#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace sandpool::supervisor {

// Syscalls denied to one worker. Written by the supervisor thread, read by the pool.
class DenialLog {
    static constexpr size_t RECENT_CAPACITY = 64;

    std::atomic<uint64_t> count_{0};
    mutable std::mutex mtx_;
    std::deque<int> recent_;

public:
    void record(int syscall_nr) {
        std::lock_guard lock{mtx_};
        if (recent_.size() == RECENT_CAPACITY) {
            recent_.pop_front();
        }
        recent_.push_back(syscall_nr);
        count_.fetch_add(1, std::memory_order_release);
    }

    [[nodiscard]] uint64_t count() const noexcept { return count_.load(std::memory_order_acquire); }

    // The last min(@p num, capacity) denied syscalls, oldest first
    [[nodiscard]] std::vector<int> recent(size_t num) const {
        std::lock_guard lock{mtx_};
        num = std::min(num, recent_.size());
        return {recent_.end() - static_cast<ptrdiff_t>(num), recent_.end()};
    }
};

} // namespace sandpool::supervisor
