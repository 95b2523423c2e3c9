/**
 * @file concurrency_limiter.cpp
 * @brief Implementation of the FIFO concurrency limiter
 */

#include "kcenon/object_transfer/core/concurrency_limiter.h"

#include <algorithm>

namespace kcenon::object_transfer {

concurrency_limiter::concurrency_limiter(std::size_t permits)
    : max_permits_(std::max<std::size_t>(permits, 1))
    , available_(max_permits_) {}

auto concurrency_limiter::acquire() -> void {
    std::unique_lock lock(mutex_);

    if (available_ > 0 && queue_.empty()) {
        --available_;
        return;
    }

    waiter self;
    queue_.push_back(&self);
    self.cv.wait(lock, [&self] { return self.granted; });
    // The releaser already dequeued us and kept available_ unchanged
}

auto concurrency_limiter::acquire(const cancellation_token& token) -> bool {
    if (token.is_stop_requested()) {
        return false;
    }

    waiter self;
    auto handle = token.add_stop_callback([this, &self] {
        std::lock_guard lock(mutex_);
        self.cv.notify_one();
    });

    bool granted = false;
    {
        std::unique_lock lock(mutex_);
        if (available_ > 0 && queue_.empty()) {
            --available_;
            granted = true;
        } else {
            queue_.push_back(&self);
            self.cv.wait(lock, [&] { return self.granted || token.is_stop_requested(); });
            granted = self.granted;
            if (!granted) {
                queue_.erase(std::find(queue_.begin(), queue_.end(), &self));
            }
        }
    }

    // Must run without mutex_ held; a running callback locks it
    token.remove_stop_callback(handle);
    return granted;
}

auto concurrency_limiter::try_acquire() -> bool {
    std::lock_guard lock(mutex_);
    if (available_ > 0 && queue_.empty()) {
        --available_;
        return true;
    }
    return false;
}

auto concurrency_limiter::release() -> void {
    std::lock_guard lock(mutex_);

    if (!queue_.empty()) {
        auto* next = queue_.front();
        queue_.pop_front();
        next->granted = true;
        next->cv.notify_one();
        return;
    }

    if (available_ < max_permits_) {
        ++available_;
    }
}

auto concurrency_limiter::max_permits() const noexcept -> std::size_t {
    return max_permits_;
}

auto concurrency_limiter::available_permits() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return available_;
}

auto concurrency_limiter::active_holders() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return max_permits_ - available_;
}

auto concurrency_limiter::waiting_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

}  // namespace kcenon::object_transfer
