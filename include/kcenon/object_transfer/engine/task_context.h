/**
 * @file task_context.h
 * @brief Per-task engine state shared by the upload and download engines
 */

#ifndef KCENON_OBJECT_TRANSFER_ENGINE_TASK_CONTEXT_H
#define KCENON_OBJECT_TRANSFER_ENGINE_TASK_CONTEXT_H

#include <kcenon/object_transfer/core/cancellation_token.h>
#include <kcenon/object_transfer/core/logging.h>
#include <kcenon/object_transfer/core/transfer_task.h>
#include <kcenon/object_transfer/core/types.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>

namespace kcenon::object_transfer {

/**
 * @brief Base transfer context for common state
 *
 * The task is mutated only by the engine that owns the context, under
 * @ref mutex. Callers outside the engine see copies taken by snapshot().
 */
struct task_context {
    explicit task_context(transfer_task initial) : task(std::move(initial)) {}
    virtual ~task_context() = default;

    task_context(const task_context&) = delete;
    auto operator=(const task_context&) -> task_context& = delete;

    transfer_task task;
    cancellation_token token;

    // Synchronization
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool running = false;          ///< A runner is queued or executing
    std::future<void> worker;      ///< Future of the latest runner

    /// Serializes callbacks of this task
    std::mutex event_mutex;

    [[nodiscard]] auto snapshot() const -> transfer_task;

    /**
     * @brief Move the task to @p to if the state machine allows it
     *
     * Caller must hold @ref mutex. Stamps completed_at on terminal states
     * and run_started_at when the task becomes active.
     */
    [[nodiscard]] auto transition_locked(transfer_status to) -> result<void>;

    /**
     * @brief Block until no runner is queued or executing
     */
    auto wait_idle() -> transfer_task;

    /**
     * @return true if the task went idle within @p timeout
     */
    auto wait_idle_for(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Structured logging fields for this task (caller holds @ref mutex)
     */
    [[nodiscard]] auto log_context_locked() const -> transfer_log_context;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_ENGINE_TASK_CONTEXT_H
