/**
 * @file cancellation_token.h
 * @brief Cooperative pause/cancel signal for one transfer
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_CANCELLATION_TOKEN_H
#define KCENON_OBJECT_TRANSFER_CORE_CANCELLATION_TOKEN_H

#include <kcenon/object_transfer/core/types.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string_view>

namespace kcenon::object_transfer {

/**
 * @brief Why a transfer was asked to stop
 */
enum class stop_reason {
    none,
    pause,
    cancel
};

[[nodiscard]] constexpr auto to_string(stop_reason reason) noexcept
    -> std::string_view {
    switch (reason) {
        case stop_reason::none: return "none";
        case stop_reason::pause: return "pause";
        case stop_reason::cancel: return "cancel";
        default: return "unknown";
    }
}

/**
 * @brief Per-task stop signal checked at suspension points
 *
 * Engines check the token before dispatching each part or reading each
 * chunk and use wait_for() for backoff sleeps so that a pause or cancel
 * cuts the sleep short. A cancel request overrides an earlier pause
 * request, never the other way round.
 *
 * @code
 * cancellation_token token;
 * // worker thread
 * while (!token.is_stop_requested()) { transfer_next_chunk(); }
 * // control thread
 * token.request_pause();
 * @endcode
 */
class cancellation_token {
public:
    cancellation_token() = default;

    // Non-copyable, non-movable (waiters hold references)
    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    auto request_pause() -> void;
    auto request_cancel() -> void;

    /**
     * @brief Clear the signal before a resumed run
     */
    auto reset() -> void;

    [[nodiscard]] auto is_stop_requested() const -> bool;
    [[nodiscard]] auto reason() const -> stop_reason;

    /**
     * @brief Sleep for @p duration unless a stop is requested first
     * @return true if woken by a stop request
     */
    auto wait_for(std::chrono::milliseconds duration) const -> bool;

    /**
     * @brief Error matching the current stop reason
     *
     * transfer_cancelled or transfer_paused; internal_error when no stop
     * was requested.
     */
    [[nodiscard]] auto to_error() const -> error;

    /**
     * @brief Call @p callback on every later pause or cancel request
     *
     * The callback runs on the requesting thread and must not call back
     * into this token's callback registration.
     *
     * @return Handle for remove_stop_callback()
     */
    [[nodiscard]] auto add_stop_callback(std::function<void()> callback) const
        -> uint64_t;

    /**
     * @brief Unregister a callback; blocks while it is running
     */
    auto remove_stop_callback(uint64_t handle) const -> void;

private:
    auto notify_stop() -> void;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    stop_reason reason_ = stop_reason::none;

    mutable std::mutex callback_mutex_;
    mutable std::map<uint64_t, std::function<void()>> callbacks_;
    mutable uint64_t next_callback_ = 1;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_CANCELLATION_TOKEN_H
