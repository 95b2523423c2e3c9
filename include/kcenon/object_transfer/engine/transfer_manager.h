/**
 * @file transfer_manager.h
 * @brief Front door for uploads and downloads against one object store
 */

#ifndef KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_MANAGER_H
#define KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_MANAGER_H

#include <kcenon/object_transfer/adapters/task_pool_adapter.h>
#include <kcenon/object_transfer/engine/download_engine.h>
#include <kcenon/object_transfer/engine/transfer_config.h>
#include <kcenon/object_transfer/engine/transfer_events.h>
#include <kcenon/object_transfer/engine/upload_engine.h>
#include <kcenon/object_transfer/storage/object_store.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Transfer manager
 *
 * Owns an upload engine and a download engine that share one
 * concurrency_limiter, so max_concurrent_transfers bounds the network
 * operations of all tasks together. Control calls are routed to the
 * engine that owns the id.
 *
 * @code
 * auto manager = transfer_manager::builder()
 *     .with_store(store)
 *     .with_part_size(8 * 1024 * 1024)
 *     .on_progress([](const transfer_id& id, uint64_t done, uint64_t total) {
 *         std::cout << id.to_string() << ": " << done << "/" << total << "\n";
 *     })
 *     .build();
 *
 * auto id = manager->start_upload(
 *     transfer_task::make_upload("logs/app.log", "/var/log/app.log"));
 * auto finished = manager->wait(id.value());
 * @endcode
 */
class transfer_manager {
public:
    /**
     * @brief Builder for transfer_manager
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the object store (required)
         */
        auto with_store(std::shared_ptr<object_store> store) -> builder&;

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(const transfer_config& config) -> builder&;

        /**
         * @brief Set the number of simultaneous network operations (default: 3)
         */
        auto with_max_concurrent_transfers(std::size_t count) -> builder&;

        /**
         * @brief Set the multipart part size (default: 10 MiB)
         */
        auto with_part_size(uint64_t bytes) -> builder&;

        /**
         * @brief Set the size above which uploads use multipart (default: 100 MiB)
         */
        auto with_multipart_threshold(uint64_t bytes) -> builder&;

        /**
         * @brief Set the timeout carried by every store call (default: 30s)
         */
        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;

        auto with_retry_policy(const retry_policy& policy) -> builder&;

        /**
         * @brief Run transfer runners on @p pool
         *
         * Part uploads always get a pool of their own.
         */
        auto with_thread_pool(std::shared_ptr<adapters::task_pool_interface> pool)
            -> builder&;

        auto on_progress(progress_callback callback) -> builder&;
        auto on_completion(completion_callback callback) -> builder&;
        auto on_error(error_callback callback) -> builder&;

        /**
         * @brief Build the manager
         * @return Result containing the manager or an error
         */
        [[nodiscard]] auto build() -> result<transfer_manager>;

    private:
        std::shared_ptr<object_store> store_;
        transfer_config config_;
        std::shared_ptr<adapters::task_pool_interface> pool_;
        transfer_callbacks callbacks_;
    };

    // Non-copyable, movable
    transfer_manager(const transfer_manager&) = delete;
    auto operator=(const transfer_manager&) -> transfer_manager& = delete;
    transfer_manager(transfer_manager&&) noexcept;
    auto operator=(transfer_manager&&) noexcept -> transfer_manager&;
    ~transfer_manager();

    // ========================================================================
    // Starting transfers
    // ========================================================================

    [[nodiscard]] auto start_upload(transfer_task task, const upload_options& options = {})
        -> result<transfer_id>;

    [[nodiscard]] auto start_download(transfer_task task,
                                      const download_options& options = {})
        -> result<transfer_id>;

    /**
     * @brief Continue a multipart upload started by an earlier process
     */
    [[nodiscard]] auto resume_upload(transfer_task task,
                                     std::string upload_id,
                                     const upload_options& options = {})
        -> result<transfer_id>;

    // ========================================================================
    // Control
    // ========================================================================

    [[nodiscard]] auto pause(const transfer_id& id) -> result<void>;
    [[nodiscard]] auto resume(const transfer_id& id) -> result<void>;
    [[nodiscard]] auto cancel(const transfer_id& id) -> result<void>;

    /**
     * @brief Start a new task for a failed one
     * @return Id of the new task
     */
    [[nodiscard]] auto retry(const transfer_id& id) -> result<transfer_id>;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] auto get_task(const transfer_id& id) const -> result<transfer_task>;
    [[nodiscard]] auto list_tasks() const -> std::vector<transfer_task>;

    /**
     * @brief Part plan of a multipart upload
     */
    [[nodiscard]] auto get_parts(const transfer_id& id) const
        -> result<std::vector<part_descriptor>>;

    [[nodiscard]] auto wait(const transfer_id& id) -> result<transfer_task>;
    [[nodiscard]] auto wait_for(const transfer_id& id, std::chrono::milliseconds timeout)
        -> result<bool>;

    // ========================================================================
    // Housekeeping
    // ========================================================================

    /**
     * @brief Forget a terminal task
     */
    [[nodiscard]] auto remove(const transfer_id& id) -> result<void>;

    /// @return Number of tasks removed
    auto clear_completed() -> std::size_t;
    auto clear_failed() -> std::size_t;

    /**
     * @brief Remove every completed, failed and cancelled task
     */
    auto clear_finished() -> std::size_t;

    // ========================================================================
    // Configuration
    // ========================================================================

    [[nodiscard]] auto config() const -> transfer_config;

    /**
     * @brief Swap the retry policy; sequences already retrying keep theirs
     */
    [[nodiscard]] auto set_retry_policy(const retry_policy& policy) -> result<void>;

private:
    transfer_manager(std::shared_ptr<object_store> store,
                     transfer_config config,
                     std::shared_ptr<adapters::task_pool_interface> pool,
                     transfer_callbacks callbacks);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_MANAGER_H
