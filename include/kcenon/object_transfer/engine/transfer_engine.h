/**
 * @file transfer_engine.h
 * @brief Control surface and runner scheduling shared by both engines
 */

#ifndef KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_ENGINE_H
#define KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_ENGINE_H

#include <kcenon/object_transfer/adapters/task_pool_adapter.h>
#include <kcenon/object_transfer/core/concurrency_limiter.h>
#include <kcenon/object_transfer/core/logging.h>
#include <kcenon/object_transfer/core/retry_policy.h>
#include <kcenon/object_transfer/engine/task_registry.h>
#include <kcenon/object_transfer/engine/transfer_config.h>
#include <kcenon/object_transfer/engine/transfer_events.h>
#include <kcenon/object_transfer/storage/object_store.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Collaborators an engine is constructed with
 *
 * Runners and part uploads use different pools so that a runner waiting
 * for its parts can never occupy the worker those parts need.
 */
struct engine_resources {
    std::shared_ptr<object_store> store;
    std::shared_ptr<concurrency_limiter> limiter;
    std::shared_ptr<adapters::task_pool_interface> runner_pool;
    std::shared_ptr<adapters::task_pool_interface> part_pool;

    /**
     * @brief Bytes available to unprivileged writers in a directory
     *
     * Defaults to std::filesystem::space(). An error lets the download
     * proceed with a warning.
     */
    std::function<result<uint64_t>(const std::filesystem::path&)> free_space;

    /**
     * @brief Fill missing pools/limiter/free_space from @p config
     */
    [[nodiscard]] static auto complete(engine_resources resources,
                                       const transfer_config& config)
        -> engine_resources;
};

/**
 * @brief Base class of upload_engine and download_engine
 *
 * Owns the task registry and implements the user-facing control verbs.
 * Each run of a task executes run() on the runner pool; pause and cancel
 * are delivered through the task's cancellation token and honoured by
 * run() at its suspension points.
 *
 * Derived destructors must call shutdown() before their own members go
 * away.
 */
class transfer_engine {
public:
    virtual ~transfer_engine();

    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;

    /**
     * @brief Request a pause; the task becomes paused once its runner stops
     */
    [[nodiscard]] auto pause(const transfer_id& id) -> result<void>;

    /**
     * @brief Start a new run of a paused task
     */
    [[nodiscard]] auto resume(const transfer_id& id) -> result<void>;

    /**
     * @brief Cancel a pending, active or paused task
     */
    [[nodiscard]] auto cancel(const transfer_id& id) -> result<void>;

    /**
     * @brief Start a fresh task for a failed one, within its retry budget
     *
     * The failed task stays as it is; the new task has a new id and
     * retry_count + 1.
     */
    [[nodiscard]] auto retry(const transfer_id& id) -> result<transfer_id>;

    [[nodiscard]] auto get_task(const transfer_id& id) const -> result<transfer_task>;
    [[nodiscard]] auto list_tasks() const -> std::vector<transfer_task>;
    [[nodiscard]] auto contains(const transfer_id& id) const -> bool;

    [[nodiscard]] auto remove(const transfer_id& id) -> result<void>;
    auto remove_if(const std::function<bool(const transfer_task&)>& predicate)
        -> std::size_t;

    /**
     * @brief Block until the task's current run has ended
     */
    [[nodiscard]] auto wait(const transfer_id& id) -> result<transfer_task>;

    /**
     * @return true if the run ended within @p timeout
     */
    [[nodiscard]] auto wait_for(const transfer_id& id,
                                std::chrono::milliseconds timeout) -> result<bool>;

    [[nodiscard]] auto config() const -> transfer_config;

    /**
     * @brief Replace the retry policy used by runs started from now on
     */
    [[nodiscard]] auto set_retry_policy(const retry_policy& policy) -> result<void>;

    /**
     * @brief Pause everything still running and wait for all runners
     */
    auto shutdown() -> void;

protected:
    transfer_engine(engine_resources resources,
                    transfer_config config,
                    transfer_callbacks callbacks,
                    std::string_view category);

    /**
     * @brief Body of one run; executes on the runner pool
     */
    virtual auto run(task_context& ctx) -> void = 0;

    /**
     * @brief Release resources of a task cancelled while no runner owns it
     */
    virtual auto cancel_idle(task_context& ctx) -> void = 0;

    /**
     * @brief New context for a retry of @p failed, carrying @p task
     */
    [[nodiscard]] virtual auto make_retry_context(task_context& failed,
                                                  transfer_task task)
        -> std::shared_ptr<task_context> = 0;

    /**
     * @brief Register @p ctx and queue its first run
     */
    [[nodiscard]] auto submit(std::shared_ptr<task_context> ctx) -> result<transfer_id>;

    [[nodiscard]] auto request_for(const task_context& ctx) const -> request_context;

    [[nodiscard]] auto find_context(const transfer_id& id) const
        -> std::shared_ptr<task_context>;

    // Outcome helpers; each makes the state change and emits the event

    auto report_progress(task_context& ctx) -> void;
    auto finish_completed(task_context& ctx, const std::string& location) -> void;
    auto finish_failed(task_context& ctx, const error& err) -> void;

    /**
     * @brief Settle a run stopped by its token into paused or cancelled
     */
    auto finish_stopped(task_context& ctx) -> void;

    [[nodiscard]] static auto is_stop_error(const error& err) noexcept -> bool {
        return err.code == error_code::transfer_paused ||
               err.code == error_code::transfer_cancelled;
    }

    engine_resources resources_;
    transfer_callbacks callbacks_;
    const std::string_view category_;

private:
    auto schedule_locked(task_context& ctx) -> void;
    auto execute(task_context& ctx) -> void;

    template <typename Callback, typename... Args>
    auto emit(task_context& ctx, const Callback& callback, const Args&... args) -> void;

    task_registry registry_;
    mutable std::mutex config_mutex_;
    transfer_config config_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_ENGINE_H
