/**
 * @file transfer_manager.cpp
 * @brief Implementation of transfer_manager
 */

#include "kcenon/object_transfer/engine/transfer_manager.h"

#include "kcenon/object_transfer/core/logging.h"

namespace kcenon::object_transfer {

struct transfer_manager::impl {
    transfer_config config;
    std::unique_ptr<upload_engine> uploads;
    std::unique_ptr<download_engine> downloads;

    impl(std::shared_ptr<object_store> store,
         transfer_config cfg,
         std::shared_ptr<adapters::task_pool_interface> pool,
         transfer_callbacks callbacks)
        : config(std::move(cfg)) {
        engine_resources resources;
        resources.store = std::move(store);
        resources.runner_pool = std::move(pool);
        resources = engine_resources::complete(std::move(resources), config);

        uploads = std::make_unique<upload_engine>(resources, config, callbacks);
        downloads = std::make_unique<download_engine>(resources, config, callbacks);
    }

    /**
     * @brief Engine that owns @p id, or nullptr
     */
    auto owner(const transfer_id& id) const -> transfer_engine* {
        if (uploads->contains(id)) {
            return uploads.get();
        }
        if (downloads->contains(id)) {
            return downloads.get();
        }
        return nullptr;
    }

    static auto not_found(const transfer_id& id) -> error {
        return error{error_code::transfer_not_found,
                     "Transfer not found: " + id.to_string()};
    }

    auto clear(const std::function<bool(const transfer_task&)>& predicate)
        -> std::size_t {
        return uploads->remove_if(predicate) + downloads->remove_if(predicate);
    }
};

// ============================================================================
// Builder
// ============================================================================

transfer_manager::builder::builder() = default;

auto transfer_manager::builder::with_store(std::shared_ptr<object_store> store)
    -> builder& {
    store_ = std::move(store);
    return *this;
}

auto transfer_manager::builder::with_config(const transfer_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto transfer_manager::builder::with_max_concurrent_transfers(std::size_t count)
    -> builder& {
    config_.max_concurrent_transfers = count;
    return *this;
}

auto transfer_manager::builder::with_part_size(uint64_t bytes) -> builder& {
    config_.part_size_bytes = bytes;
    return *this;
}

auto transfer_manager::builder::with_multipart_threshold(uint64_t bytes) -> builder& {
    config_.multipart_threshold_bytes = bytes;
    return *this;
}

auto transfer_manager::builder::with_request_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto transfer_manager::builder::with_retry_policy(const retry_policy& policy)
    -> builder& {
    config_.retry = policy;
    return *this;
}

auto transfer_manager::builder::with_thread_pool(
    std::shared_ptr<adapters::task_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto transfer_manager::builder::on_progress(progress_callback callback) -> builder& {
    callbacks_.on_progress = std::move(callback);
    return *this;
}

auto transfer_manager::builder::on_completion(completion_callback callback)
    -> builder& {
    callbacks_.on_completion = std::move(callback);
    return *this;
}

auto transfer_manager::builder::on_error(error_callback callback) -> builder& {
    callbacks_.on_error = std::move(callback);
    return *this;
}

auto transfer_manager::builder::build() -> result<transfer_manager> {
    if (!store_) {
        return unexpected{error{error_code::invalid_configuration,
                                "An object store is required"}};
    }

    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    return transfer_manager{std::move(store_), std::move(config_), std::move(pool_),
                            std::move(callbacks_)};
}

// ============================================================================
// transfer_manager
// ============================================================================

transfer_manager::transfer_manager(std::shared_ptr<object_store> store,
                                   transfer_config config,
                                   std::shared_ptr<adapters::task_pool_interface> pool,
                                   transfer_callbacks callbacks) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    impl_ = std::make_unique<impl>(std::move(store), std::move(config), std::move(pool),
                                   std::move(callbacks));

    OT_LOG_INFO(log_category::manager,
                "transfer manager ready: max_concurrent_transfers=" +
                    std::to_string(impl_->config.max_concurrent_transfers) +
                    ", part_size=" + std::to_string(impl_->config.part_size_bytes) +
                    ", multipart_threshold=" +
                    std::to_string(impl_->config.multipart_threshold_bytes));
}

transfer_manager::transfer_manager(transfer_manager&&) noexcept = default;
auto transfer_manager::operator=(transfer_manager&&) noexcept
    -> transfer_manager& = default;
transfer_manager::~transfer_manager() = default;

auto transfer_manager::start_upload(transfer_task task, const upload_options& options)
    -> result<transfer_id> {
    task.max_retries = impl_->config.max_task_retries;
    return impl_->uploads->start(std::move(task), options);
}

auto transfer_manager::start_download(transfer_task task,
                                      const download_options& options)
    -> result<transfer_id> {
    task.max_retries = impl_->config.max_task_retries;
    return impl_->downloads->start(std::move(task), options);
}

auto transfer_manager::resume_upload(transfer_task task,
                                     std::string upload_id,
                                     const upload_options& options)
    -> result<transfer_id> {
    task.max_retries = impl_->config.max_task_retries;
    return impl_->uploads->resume_upload(std::move(task), std::move(upload_id), options);
}

auto transfer_manager::pause(const transfer_id& id) -> result<void> {
    auto* engine = impl_->owner(id);
    if (!engine) {
        return unexpected{impl::not_found(id)};
    }
    return engine->pause(id);
}

auto transfer_manager::resume(const transfer_id& id) -> result<void> {
    auto* engine = impl_->owner(id);
    if (!engine) {
        return unexpected{impl::not_found(id)};
    }
    return engine->resume(id);
}

auto transfer_manager::cancel(const transfer_id& id) -> result<void> {
    auto* engine = impl_->owner(id);
    if (!engine) {
        return unexpected{impl::not_found(id)};
    }
    return engine->cancel(id);
}

auto transfer_manager::retry(const transfer_id& id) -> result<transfer_id> {
    auto* engine = impl_->owner(id);
    if (!engine) {
        return unexpected{impl::not_found(id)};
    }
    return engine->retry(id);
}

auto transfer_manager::get_task(const transfer_id& id) const -> result<transfer_task> {
    auto* engine = impl_->owner(id);
    if (!engine) {
        return unexpected{impl::not_found(id)};
    }
    return engine->get_task(id);
}

auto transfer_manager::list_tasks() const -> std::vector<transfer_task> {
    auto tasks = impl_->uploads->list_tasks();
    auto downloads = impl_->downloads->list_tasks();
    tasks.insert(tasks.end(), downloads.begin(), downloads.end());
    return tasks;
}

auto transfer_manager::get_parts(const transfer_id& id) const
    -> result<std::vector<part_descriptor>> {
    return impl_->uploads->get_parts(id);
}

auto transfer_manager::wait(const transfer_id& id) -> result<transfer_task> {
    auto* engine = impl_->owner(id);
    if (!engine) {
        return unexpected{impl::not_found(id)};
    }
    return engine->wait(id);
}

auto transfer_manager::wait_for(const transfer_id& id, std::chrono::milliseconds timeout)
    -> result<bool> {
    auto* engine = impl_->owner(id);
    if (!engine) {
        return unexpected{impl::not_found(id)};
    }
    return engine->wait_for(id, timeout);
}

auto transfer_manager::remove(const transfer_id& id) -> result<void> {
    auto* engine = impl_->owner(id);
    if (!engine) {
        return unexpected{impl::not_found(id)};
    }
    return engine->remove(id);
}

auto transfer_manager::clear_completed() -> std::size_t {
    return impl_->clear([](const transfer_task& task) {
        return task.status == transfer_status::completed;
    });
}

auto transfer_manager::clear_failed() -> std::size_t {
    return impl_->clear([](const transfer_task& task) {
        return task.status == transfer_status::failed;
    });
}

auto transfer_manager::clear_finished() -> std::size_t {
    auto removed = impl_->clear([](const transfer_task&) { return true; });
    OT_LOG_DEBUG(log_category::manager,
                 "cleared " + std::to_string(removed) + " finished transfers");
    return removed;
}

auto transfer_manager::config() const -> transfer_config {
    auto current = impl_->config;
    current.retry = impl_->uploads->config().retry;
    return current;
}

auto transfer_manager::set_retry_policy(const retry_policy& policy) -> result<void> {
    auto updated = impl_->uploads->set_retry_policy(policy);
    if (!updated) {
        return updated;
    }
    return impl_->downloads->set_retry_policy(policy);
}

}  // namespace kcenon::object_transfer
