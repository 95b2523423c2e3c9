/**
 * @file task_context.cpp
 * @brief Implementation of task_context
 */

#include "kcenon/object_transfer/engine/task_context.h"

namespace kcenon::object_transfer {

auto task_context::snapshot() const -> transfer_task {
    std::lock_guard lock(mutex);
    return task;
}

auto task_context::transition_locked(transfer_status to) -> result<void> {
    if (!is_valid_transition(task.status, to)) {
        return unexpected{error{error_code::invalid_state_transition,
            "Cannot move transfer " + task.id.to_string() + " from " +
            std::string(to_string(task.status)) + " to " +
            std::string(to_string(to))}};
    }

    OT_LOG_DEBUG(log_category::manager,
                 task.id.to_string() + ": " + std::string(to_string(task.status)) +
                     " -> " + std::string(to_string(to)));

    task.status = to;
    if (to == transfer_status::active) {
        task.run_started_at = std::chrono::steady_clock::now();
        task.run_start_bytes = task.transferred_bytes;
    }
    if (is_terminal_status(to)) {
        task.completed_at = std::chrono::system_clock::now();
    }
    cv.notify_all();
    return {};
}

auto task_context::wait_idle() -> transfer_task {
    std::unique_lock lock(mutex);
    cv.wait(lock, [this] { return !running; });
    return task;
}

auto task_context::wait_idle_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(mutex);
    return cv.wait_for(lock, timeout, [this] { return !running; });
}

auto task_context::log_context_locked() const -> transfer_log_context {
    transfer_log_context ctx;
    ctx.transfer_id = task.id.to_string();
    ctx.object_key = task.object_key;
    ctx.local_path = task.local_path.string();
    ctx.total_bytes = task.total_bytes;
    ctx.bytes_transferred = task.transferred_bytes;
    if (task.upload_id) {
        ctx.upload_id = *task.upload_id;
    }
    if (task.run_started_at) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - *task.run_started_at);
        ctx.duration_ms = static_cast<uint64_t>(elapsed.count());
        auto rate = task.progress().bytes_per_second;
        if (rate > 0.0) {
            ctx.rate_mbps = rate / (1024.0 * 1024.0);
        }
    }
    if (task.last_error) {
        ctx.error_message = task.last_error->message;
    }
    return ctx;
}

}  // namespace kcenon::object_transfer
