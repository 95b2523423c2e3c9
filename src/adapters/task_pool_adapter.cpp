// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/object_transfer/adapters/task_pool_adapter.h"

#include "kcenon/object_transfer/core/logging.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::object_transfer::adapters {

// ============================================================================
// Stage tracking helper (shared implementation)
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto default_worker_count() -> size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_pool_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_pool_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> in_flight{0};
    stage_tracker tracker;

    // Runs @p task and forwards its outcome to @p promise
    static void run(const std::function<void()>& task,
                    const std::shared_ptr<std::promise<void>>& promise) {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }

    std::future<void> enqueue(std::function<void()> body, const std::string& job_name) {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();

        in_flight.fetch_add(1, std::memory_order_relaxed);
        auto* counter = &in_flight;
        auto wrapped = [body = std::move(body), promise, counter]() {
            run(body, promise);
            counter->fetch_sub(1, std::memory_order_relaxed);
        };

        auto job = std::make_unique<function_job>(std::move(wrapped), job_name);
        auto enqueued = pool->enqueue(std::move(job));
        if (!enqueued.is_ok()) {
            in_flight.fetch_sub(1, std::memory_order_relaxed);
            OT_LOG_ERROR(log_category::manager, "thread pool rejected job " + job_name);
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("thread pool rejected job " + job_name)));
        }
        return future;
    }
};

thread_system_pool_adapter::thread_system_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_pool_adapter::~thread_system_pool_adapter() {
    if (pimpl_ && pimpl_->pool) {
        pimpl_->pool->stop(false);
    }
}

thread_system_pool_adapter::thread_system_pool_adapter(
    thread_system_pool_adapter&&) noexcept = default;

thread_system_pool_adapter& thread_system_pool_adapter::operator=(
    thread_system_pool_adapter&&) noexcept = default;

std::shared_ptr<thread_system_pool_adapter>
thread_system_pool_adapter::create_default(size_t worker_count,
                                           const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        auto added = pool->enqueue(std::move(worker));
        if (!added.is_ok()) {
            OT_LOG_WARN(log_category::manager,
                        "failed to add worker " + std::to_string(i) + " to " + pool_name);
        }
    }

    pool->start();

    OT_LOG_DEBUG(log_category::manager,
                 "started thread_system pool " + pool_name + " with " +
                     std::to_string(worker_count) + " workers");

    return std::make_shared<thread_system_pool_adapter>(std::move(pool), pool_name,
                                                        worker_count);
}

std::future<void> thread_system_pool_adapter::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), "object_transfer_task");
}

std::future<void> thread_system_pool_adapter::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto delayed = [task = std::move(task), delay]() {
        std::this_thread::sleep_for(delay);
        task();
    };
    return pimpl_->enqueue(std::move(delayed), "delayed_object_transfer_task");
}

std::future<void> thread_system_pool_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    // Adapter outlives its tasks: owners wait on every future before release
    auto* tracker = &pimpl_->tracker;
    auto staged = [task = std::move(task), tracker, stage = stage_name]() {
        struct stage_guard {
            stage_tracker* tracker;
            const std::string& stage;
            ~stage_guard() { tracker->decrement(stage); }
        } guard{tracker, stage};
        task();
    };
    return pimpl_->enqueue(std::move(staged), stage_name);
}

size_t thread_system_pool_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_pool_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_pool_adapter::pending_tasks() const {
    return pimpl_->in_flight.load(std::memory_order_relaxed);
}

size_t thread_system_pool_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_pool_adapter::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_pool_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_task_pool implementation
// ============================================================================

struct async_task_pool::impl {
    std::atomic<size_t> active_tasks{0};
    stage_tracker tracker;
};

async_task_pool::async_task_pool() : pimpl_(std::make_unique<impl>()) {}

async_task_pool::~async_task_pool() = default;

std::future<void> async_task_pool::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    auto* pimpl = pimpl_.get();
    return std::async(std::launch::async, [pimpl, task = std::move(task)]() {
        struct active_guard {
            impl* pimpl;
            ~active_guard() { pimpl->active_tasks.fetch_sub(1, std::memory_order_relaxed); }
        } guard{pimpl};
        task();
    });
}

std::future<void> async_task_pool::submit_delayed(
    std::function<void()> task, std::chrono::milliseconds delay) {
    auto delayed = [task = std::move(task), delay]() {
        std::this_thread::sleep_for(delay);
        task();
    };
    return submit(std::move(delayed));
}

std::future<void> async_task_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto* pimpl = pimpl_.get();
    return submit([pimpl, task = std::move(task), stage = stage_name]() {
        struct stage_guard {
            impl* pimpl;
            const std::string& stage;
            ~stage_guard() { pimpl->tracker.decrement(stage); }
        } guard{pimpl, stage};
        task();
    });
}

size_t async_task_pool::worker_count() const {
    return default_worker_count();
}

bool async_task_pool::is_running() const { return true; }

size_t async_task_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t async_task_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// task_pool_factory implementation
// ============================================================================

std::shared_ptr<task_pool_interface> task_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_pool_adapter::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_task_pool>();
#endif
}

}  // namespace kcenon::object_transfer::adapters
