// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_pool_adapter.h
 * @brief Worker pool adapter for the transfer engines
 *
 * Transfer runners and part uploads execute on a task_pool_interface.
 * When thread_system is available the pool is a kcenon::thread::thread_pool,
 * otherwise every submission runs on its own std::async thread.
 *
 * Features:
 * - Stage-based task tracking ("transfer_task", "upload_part")
 * - Delayed submission for scheduled work
 * - Seamless integration with thread_system when available
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::object_transfer::adapters {

/**
 * @brief Stage names used by the engines
 */
inline constexpr const char* transfer_task_stage = "transfer_task";
inline constexpr const char* upload_part_stage = "upload_part";

/**
 * @brief Interface for worker pool operations
 *
 * Submitted work must not throw; an escaping exception is stored in the
 * returned future and rethrown by whoever calls get() on it.
 */
class task_pool_interface {
public:
    virtual ~task_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task that starts after @p delay
     */
    virtual std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) = 0;

    /**
     * @brief Submit a task and count it against @p stage_name until it ends
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted and not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Tasks of @p stage_name submitted and not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_pool_adapter : public task_pool_interface {
public:
    /**
     * @param pool Running thread_system pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_pool_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "object_transfer_pool",
        size_t worker_count = 0);

    ~thread_system_pool_adapter() override;

    // Non-copyable
    thread_system_pool_adapter(const thread_system_pool_adapter&) = delete;
    thread_system_pool_adapter& operator=(const thread_system_pool_adapter&) = delete;

    // Movable
    thread_system_pool_adapter(thread_system_pool_adapter&&) noexcept;
    thread_system_pool_adapter& operator=(thread_system_pool_adapter&&) noexcept;

    /**
     * @brief Create and start a pool with @p worker_count workers
     * @param worker_count 0 = hardware concurrency
     */
    [[nodiscard]] static std::shared_ptr<thread_system_pool_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "object_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;
    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback implementation using std::async
 *
 * Every submission gets its own thread, so worker_count() only reports
 * the hardware concurrency and the pool never queues work.
 */
class async_task_pool : public task_pool_interface {
public:
    async_task_pool();
    ~async_task_pool() override;

    async_task_pool(const async_task_pool&) = delete;
    async_task_pool& operator=(const async_task_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_delayed(
        std::function<void()> task,
        std::chrono::milliseconds delay) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available pool
 *
 * 1. thread_system_pool_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_task_pool (fallback)
 */
class task_pool_factory {
public:
    /**
     * @param worker_count 0 = auto-detect
     */
    [[nodiscard]] static std::shared_ptr<task_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "object_transfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::object_transfer::adapters
