/**
 * @file cancellation_token.cpp
 * @brief Implementation of cancellation_token
 */

#include "kcenon/object_transfer/core/cancellation_token.h"

#include <utility>

namespace kcenon::object_transfer {

auto cancellation_token::request_pause() -> void {
    {
        std::lock_guard lock(mutex_);
        if (reason_ == stop_reason::cancel) {
            return;
        }
        reason_ = stop_reason::pause;
    }
    cv_.notify_all();
    notify_stop();
}

auto cancellation_token::request_cancel() -> void {
    {
        std::lock_guard lock(mutex_);
        reason_ = stop_reason::cancel;
    }
    cv_.notify_all();
    notify_stop();
}

auto cancellation_token::reset() -> void {
    std::lock_guard lock(mutex_);
    reason_ = stop_reason::none;
}

auto cancellation_token::is_stop_requested() const -> bool {
    std::lock_guard lock(mutex_);
    return reason_ != stop_reason::none;
}

auto cancellation_token::reason() const -> stop_reason {
    std::lock_guard lock(mutex_);
    return reason_;
}

auto cancellation_token::wait_for(std::chrono::milliseconds duration) const -> bool {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, duration,
                        [this] { return reason_ != stop_reason::none; });
}

auto cancellation_token::to_error() const -> error {
    switch (reason()) {
        case stop_reason::cancel:
            return error{error_code::transfer_cancelled};
        case stop_reason::pause:
            return error{error_code::transfer_paused};
        default:
            return error{error_code::internal_error, "no stop requested"};
    }
}

auto cancellation_token::add_stop_callback(std::function<void()> callback) const
    -> uint64_t {
    std::lock_guard lock(callback_mutex_);
    auto handle = next_callback_++;
    callbacks_.emplace(handle, std::move(callback));
    return handle;
}

auto cancellation_token::remove_stop_callback(uint64_t handle) const -> void {
    std::lock_guard lock(callback_mutex_);
    callbacks_.erase(handle);
}

auto cancellation_token::notify_stop() -> void {
    // Held while calling so remove_stop_callback() waits for a running callback
    std::lock_guard lock(callback_mutex_);
    for (const auto& [handle, callback] : callbacks_) {
        callback();
    }
}

}  // namespace kcenon::object_transfer
