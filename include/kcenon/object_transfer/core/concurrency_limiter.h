/**
 * @file concurrency_limiter.h
 * @brief FIFO counting semaphore bounding simultaneous network operations
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_CONCURRENCY_LIMITER_H
#define KCENON_OBJECT_TRANSFER_CORE_CONCURRENCY_LIMITER_H

#include <kcenon/object_transfer/core/cancellation_token.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace kcenon::object_transfer {

/**
 * @brief Counting admission gate with FIFO hand-off
 *
 * acquire() takes a free permit immediately when no one is queued;
 * otherwise the caller joins the back of the queue. release() hands the
 * permit straight to the longest-waiting caller instead of returning it to
 * the pool, so a late arrival can never overtake a queued waiter.
 *
 * The limiter may be shared by several engines to bound global concurrency.
 *
 * @code
 * concurrency_limiter limiter(3);
 *
 * auto etag = limiter.run([&] { return upload_one_part(part); });
 *
 * // or hold a permit across an asynchronous hand-off
 * limiter.acquire();
 * pool->submit([&] { upload_one_part(part); limiter.release(); });
 * @endcode
 */
class concurrency_limiter {
public:
    /**
     * @param permits Maximum simultaneous holders (at least 1)
     */
    explicit concurrency_limiter(std::size_t permits);

    ~concurrency_limiter() = default;

    // Non-copyable, non-movable (waiters reference internal state)
    concurrency_limiter(const concurrency_limiter&) = delete;
    auto operator=(const concurrency_limiter&) -> concurrency_limiter& = delete;
    concurrency_limiter(concurrency_limiter&&) = delete;
    auto operator=(concurrency_limiter&&) -> concurrency_limiter& = delete;

    /**
     * @brief Block until a permit is granted
     */
    auto acquire() -> void;

    /**
     * @brief Block until a permit is granted or @p token requests a stop
     *
     * A stopped waiter leaves the queue without taking a permit. When the
     * grant and the stop race, the grant wins and the caller holds a permit.
     *
     * @return true if a permit is held
     */
    [[nodiscard]] auto acquire(const cancellation_token& token) -> bool;

    /**
     * @brief Take a permit only if one is free and nobody is queued
     */
    [[nodiscard]] auto try_acquire() -> bool;

    /**
     * @brief Return a permit, handing it to the oldest waiter if any
     */
    auto release() -> void;

    /**
     * @brief Run @p task while holding a permit
     * @return Whatever @p task returns
     */
    template <typename Task>
    auto run(Task&& task) -> decltype(std::forward<Task>(task)()) {
        acquire();
        struct releaser {
            concurrency_limiter& limiter;
            ~releaser() { limiter.release(); }
        } guard{*this};
        return std::forward<Task>(task)();
    }

    [[nodiscard]] auto max_permits() const noexcept -> std::size_t;
    [[nodiscard]] auto available_permits() const -> std::size_t;
    [[nodiscard]] auto active_holders() const -> std::size_t;
    [[nodiscard]] auto waiting_count() const -> std::size_t;

private:
    struct waiter {
        std::condition_variable cv;
        bool granted = false;
    };

    const std::size_t max_permits_;
    mutable std::mutex mutex_;
    std::size_t available_;
    std::deque<waiter*> queue_;
};

/**
 * @brief RAII permit holder
 */
class scoped_permit {
public:
    explicit scoped_permit(concurrency_limiter& limiter) : limiter_(&limiter) {
        limiter_->acquire();
    }

    /**
     * @brief Wait for a permit unless @p token stops first; check held()
     */
    scoped_permit(concurrency_limiter& limiter, const cancellation_token& token)
        : limiter_(limiter.acquire(token) ? &limiter : nullptr) {}

    ~scoped_permit() { release(); }

    /**
     * @brief Give the permit back early; later calls do nothing
     */
    auto release() -> void {
        if (auto* limiter = std::exchange(limiter_, nullptr)) {
            limiter->release();
        }
    }

    [[nodiscard]] auto held() const noexcept -> bool { return limiter_ != nullptr; }

    scoped_permit(const scoped_permit&) = delete;
    auto operator=(const scoped_permit&) -> scoped_permit& = delete;

    scoped_permit(scoped_permit&& other) noexcept
        : limiter_(std::exchange(other.limiter_, nullptr)) {}
    auto operator=(scoped_permit&&) -> scoped_permit& = delete;

private:
    concurrency_limiter* limiter_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_CONCURRENCY_LIMITER_H
