/**
 * @file transfer_engine.cpp
 * @brief Implementation of the shared engine control surface
 */

#include "kcenon/object_transfer/engine/transfer_engine.h"

#include <exception>
#include <system_error>

namespace kcenon::object_transfer {

// ============================================================================
// engine_resources
// ============================================================================

auto engine_resources::complete(engine_resources resources,
                                const transfer_config& config) -> engine_resources {
    if (!resources.limiter) {
        resources.limiter =
            std::make_shared<concurrency_limiter>(config.max_concurrent_transfers);
    }
    if (!resources.runner_pool) {
        resources.runner_pool = adapters::task_pool_factory::create(
            config.worker_threads, "object_transfer_runners");
    }
    if (!resources.part_pool) {
        resources.part_pool = adapters::task_pool_factory::create(
            config.max_concurrent_transfers, "object_transfer_parts");
    }
    if (!resources.free_space) {
        resources.free_space = [](const std::filesystem::path& dir) -> result<uint64_t> {
            std::error_code ec;
            auto info = std::filesystem::space(dir, ec);
            if (ec) {
                return unexpected{error{error_code::file_read_error, ec.message()}};
            }
            return static_cast<uint64_t>(info.available);
        };
    }
    return resources;
}

// ============================================================================
// transfer_engine lifecycle
// ============================================================================

transfer_engine::transfer_engine(engine_resources resources,
                                 transfer_config config,
                                 transfer_callbacks callbacks,
                                 std::string_view category)
    : resources_(engine_resources::complete(std::move(resources), config)),
      callbacks_(std::move(callbacks)),
      category_(category),
      config_(std::move(config)) {}

transfer_engine::~transfer_engine() = default;

auto transfer_engine::shutdown() -> void {
    auto contexts = registry_.contexts();

    for (const auto& ctx : contexts) {
        std::lock_guard lock(ctx->mutex);
        if (ctx->running) {
            ctx->token.request_pause();
        }
    }

    for (const auto& ctx : contexts) {
        ctx->wait_idle();
        std::future<void> worker;
        {
            std::lock_guard lock(ctx->mutex);
            worker = std::move(ctx->worker);
        }
        if (worker.valid()) {
            worker.wait();
        }
    }
}

// ============================================================================
// Scheduling
// ============================================================================

auto transfer_engine::submit(std::shared_ptr<task_context> ctx) -> result<transfer_id> {
    auto id = ctx->snapshot().id;

    auto added = registry_.add(ctx);
    if (!added) {
        return unexpected{added.error()};
    }

    {
        std::lock_guard lock(ctx->mutex);
        auto log = ctx->log_context_locked();
        OT_LOG_INFO_CTX(category_, "transfer queued", log);
        schedule_locked(*ctx);
    }
    return id;
}

auto transfer_engine::schedule_locked(task_context& ctx) -> void {
    ctx.running = true;
    auto* raw = &ctx;
    ctx.worker = resources_.runner_pool->submit_to_stage(
        [this, raw] { execute(*raw); }, adapters::transfer_task_stage);
}

auto transfer_engine::execute(task_context& ctx) -> void {
    try {
        run(ctx);
    } catch (const std::exception& e) {
        finish_failed(ctx, error{error_code::internal_error,
                                 std::string("unexpected exception: ") + e.what()});
    }

    // Notify under the lock: the context may be removed as soon as it is idle
    std::lock_guard lock(ctx.mutex);
    ctx.running = false;
    ctx.cv.notify_all();
}

auto transfer_engine::request_for(const task_context& ctx) const -> request_context {
    request_context request;
    request.timeout = config().request_timeout;
    request.token = &ctx.token;
    return request;
}

auto transfer_engine::find_context(const transfer_id& id) const
    -> std::shared_ptr<task_context> {
    return registry_.find(id);
}

// ============================================================================
// Events
// ============================================================================

template <typename Callback, typename... Args>
auto transfer_engine::emit(task_context& ctx,
                           const Callback& callback,
                           const Args&... args) -> void {
    if (!callback) {
        return;
    }
    try {
        callback(args...);
    } catch (const std::exception& e) {
        OT_LOG_WARN(category_, ctx.snapshot().id.to_string() +
                                   ": event callback threw: " + e.what());
    }
}

auto transfer_engine::report_progress(task_context& ctx) -> void {
    // Snapshot under the event lock so observers never see progress go back
    std::lock_guard events(ctx.event_mutex);

    transfer_id id;
    uint64_t transferred = 0;
    uint64_t total = 0;
    {
        std::lock_guard lock(ctx.mutex);
        id = ctx.task.id;
        transferred = ctx.task.transferred_bytes;
        total = ctx.task.total_bytes;
    }
    emit(ctx, callbacks_.on_progress, id, transferred, total);
}

auto transfer_engine::finish_completed(task_context& ctx, const std::string& location)
    -> void {
    std::lock_guard events(ctx.event_mutex);

    transfer_id id;
    transfer_log_context log;
    {
        std::lock_guard lock(ctx.mutex);
        auto moved = ctx.transition_locked(transfer_status::completed);
        if (!moved) {
            OT_LOG_ERROR(category_, moved.error().message);
            return;
        }
        id = ctx.task.id;
        log = ctx.log_context_locked();
    }

    OT_LOG_INFO_CTX(category_, "transfer completed", log);
    emit(ctx, callbacks_.on_completion, id, location);
}

auto transfer_engine::finish_failed(task_context& ctx, const error& err) -> void {
    auto classified = error_classifier::classify(err);

    std::lock_guard events(ctx.event_mutex);

    transfer_id id;
    transfer_log_context log;
    {
        std::lock_guard lock(ctx.mutex);
        auto moved = ctx.transition_locked(transfer_status::failed);
        if (!moved) {
            OT_LOG_ERROR(category_, moved.error().message + " (" + err.message + ")");
            return;
        }
        ctx.task.last_error = classified;
        id = ctx.task.id;
        log = ctx.log_context_locked();
    }

    OT_LOG_ERROR_CTX(category_,
                     "transfer failed [" + std::string(to_string(classified.category)) +
                         "]: " + classified.message,
                     log);
    emit(ctx, callbacks_.on_error, id, classified, classified.retryable);
}

auto transfer_engine::finish_stopped(task_context& ctx) -> void {
    auto reason = ctx.token.reason();
    if (reason == stop_reason::none) {
        finish_failed(ctx, error{error_code::internal_error,
                                 "run stopped without a pause or cancel request"});
        return;
    }

    auto target = reason == stop_reason::cancel ? transfer_status::cancelled
                                                : transfer_status::paused;

    std::lock_guard events(ctx.event_mutex);
    std::lock_guard lock(ctx.mutex);
    if (ctx.task.status == target) {
        // Paused again before a resumed run got going
        return;
    }
    auto moved = ctx.transition_locked(target);
    if (!moved) {
        OT_LOG_ERROR(category_, moved.error().message);
        return;
    }
    auto log = ctx.log_context_locked();
    OT_LOG_INFO_CTX(category_, "transfer " + std::string(to_string(target)), log);
}

// ============================================================================
// Control verbs
// ============================================================================

auto transfer_engine::pause(const transfer_id& id) -> result<void> {
    auto ctx = registry_.find(id);
    if (!ctx) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }

    std::lock_guard lock(ctx->mutex);
    if (!is_valid_transition(ctx->task.status, transfer_status::paused)) {
        return unexpected{error{error_code::invalid_state_transition,
            "Cannot pause transfer in current state: " +
            std::string(to_string(ctx->task.status))}};
    }

    if (ctx->running) {
        ctx->token.request_pause();
        OT_LOG_DEBUG(category_, id.to_string() + ": pause requested");
        return {};
    }
    return ctx->transition_locked(transfer_status::paused);
}

auto transfer_engine::resume(const transfer_id& id) -> result<void> {
    auto ctx = registry_.find(id);
    if (!ctx) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }

    std::lock_guard lock(ctx->mutex);
    if (ctx->task.status != transfer_status::paused) {
        return unexpected{error{error_code::invalid_state_transition,
            "Cannot resume transfer in current state: " +
            std::string(to_string(ctx->task.status))}};
    }
    if (ctx->running) {
        return unexpected{error{error_code::transfer_active,
                                "Transfer is still stopping: " + id.to_string()}};
    }

    ctx->token.reset();
    auto log = ctx->log_context_locked();
    OT_LOG_INFO_CTX(category_, "transfer resumed", log);
    schedule_locked(*ctx);
    return {};
}

auto transfer_engine::cancel(const transfer_id& id) -> result<void> {
    auto ctx = registry_.find(id);
    if (!ctx) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }

    {
        std::lock_guard lock(ctx->mutex);
        if (!is_valid_transition(ctx->task.status, transfer_status::cancelled)) {
            return unexpected{error{error_code::invalid_state_transition,
                "Cannot cancel transfer in current state: " +
                std::string(to_string(ctx->task.status))}};
        }
        if (ctx->running) {
            ctx->token.request_cancel();
            OT_LOG_DEBUG(category_, id.to_string() + ": cancel requested");
            return {};
        }
        // Keeps resume() and remove() away while resources are released
        ctx->running = true;
    }

    ctx->token.request_cancel();
    cancel_idle(*ctx);

    {
        std::lock_guard events(ctx->event_mutex);
        std::lock_guard lock(ctx->mutex);
        auto moved = ctx->transition_locked(transfer_status::cancelled);
        ctx->running = false;
        ctx->cv.notify_all();
        if (!moved) {
            return moved;
        }
        auto log = ctx->log_context_locked();
        OT_LOG_INFO_CTX(category_, "transfer cancelled", log);
    }
    return {};
}

auto transfer_engine::retry(const transfer_id& id) -> result<transfer_id> {
    auto ctx = registry_.find(id);
    if (!ctx) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }

    transfer_task next;
    {
        std::lock_guard lock(ctx->mutex);
        const auto& failed = ctx->task;
        if (failed.status != transfer_status::failed) {
            return unexpected{error{error_code::invalid_state_transition,
                "Only failed transfers can be retried, current state: " +
                std::string(to_string(failed.status))}};
        }
        if (ctx->running) {
            return unexpected{error{error_code::transfer_active,
                                    "Transfer is still stopping: " + id.to_string()}};
        }
        if (!failed.can_retry()) {
            return unexpected{error{error_code::retry_budget_exhausted,
                "Retry budget exhausted for " + id.to_string() + " (" +
                std::to_string(failed.retry_count) + "/" +
                std::to_string(failed.max_retries) + ")"}};
        }

        next.id = transfer_id::generate();
        next.object_key = failed.object_key;
        next.local_path = failed.local_path;
        next.direction = failed.direction;
        next.max_retries = failed.max_retries;
        next.retry_count = failed.retry_count + 1;
        if (failed.direction == transfer_direction::download) {
            next.etag = failed.etag;
        }
    }

    OT_LOG_INFO(category_, id.to_string() + " retried as " + next.id.to_string() +
                               " (attempt " + std::to_string(next.retry_count) + ")");
    return submit(make_retry_context(*ctx, std::move(next)));
}

// ============================================================================
// Queries
// ============================================================================

auto transfer_engine::get_task(const transfer_id& id) const -> result<transfer_task> {
    auto ctx = registry_.find(id);
    if (!ctx) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }
    return ctx->snapshot();
}

auto transfer_engine::list_tasks() const -> std::vector<transfer_task> {
    return registry_.snapshot_all();
}

auto transfer_engine::contains(const transfer_id& id) const -> bool {
    return registry_.find(id) != nullptr;
}

auto transfer_engine::remove(const transfer_id& id) -> result<void> {
    return registry_.remove(id);
}

auto transfer_engine::remove_if(
    const std::function<bool(const transfer_task&)>& predicate) -> std::size_t {
    return registry_.remove_if(predicate);
}

auto transfer_engine::wait(const transfer_id& id) -> result<transfer_task> {
    auto ctx = registry_.find(id);
    if (!ctx) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }
    return ctx->wait_idle();
}

auto transfer_engine::wait_for(const transfer_id& id,
                               std::chrono::milliseconds timeout) -> result<bool> {
    auto ctx = registry_.find(id);
    if (!ctx) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }
    return ctx->wait_idle_for(timeout);
}

auto transfer_engine::config() const -> transfer_config {
    std::lock_guard lock(config_mutex_);
    return config_;
}

auto transfer_engine::set_retry_policy(const retry_policy& policy) -> result<void> {
    auto valid = policy.validate();
    if (!valid) {
        return valid;
    }

    std::lock_guard lock(config_mutex_);
    config_.retry = policy;
    OT_LOG_INFO(category_, "retry policy updated: max_attempts=" +
                               std::to_string(policy.max_attempts));
    return {};
}

}  // namespace kcenon::object_transfer
