/**
 * @file upload_engine.cpp
 * @brief Implementation of upload_engine
 */

#include "kcenon/object_transfer/engine/upload_engine.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <future>
#include <optional>
#include <system_error>

namespace kcenon::object_transfer {

struct upload_engine::upload_context : task_context {
    upload_context(transfer_task initial, upload_options opts)
        : task_context(std::move(initial)), options(opts) {}

    upload_options options;
    std::vector<part_descriptor> parts;  ///< Guarded by mutex
};

namespace {

/**
 * @brief Read [offset, offset + size) of @p path
 */
auto read_range(const std::filesystem::path& path, uint64_t offset, uint64_t size)
    -> result<std::vector<std::byte>> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error_classifier::from_filesystem(
            std::error_code(errno, std::generic_category()),
            error_code::file_read_error, "open " + path.string())};
    }

    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    std::vector<std::byte> buffer(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(buffer.data()),
              static_cast<std::streamsize>(buffer.size()));

    auto bytes_read = static_cast<uint64_t>(file.gcount());
    if (bytes_read != size) {
        return unexpected{error{error_code::file_read_error,
            "Short read from " + path.string() + " at offset " +
            std::to_string(offset) + ": " + std::to_string(bytes_read) + " of " +
            std::to_string(size) + " bytes"}};
    }
    return buffer;
}

/**
 * @brief First failure reported by the part jobs of one run
 */
struct dispatch_state {
    std::mutex mutex;
    std::optional<error> failure;
    std::atomic<bool> failed{false};

    void record(const error& err) {
        std::lock_guard lock(mutex);
        if (!failure) {
            failure = err;
        }
        failed.store(true);
    }
};

}  // namespace

// ============================================================================
// Construction
// ============================================================================

upload_engine::upload_engine(engine_resources resources,
                             transfer_config config,
                             transfer_callbacks callbacks)
    : transfer_engine(std::move(resources), std::move(config), std::move(callbacks),
                      log_category::upload) {}

upload_engine::~upload_engine() {
    shutdown();
}

// ============================================================================
// Public API
// ============================================================================

auto upload_engine::validate_source(transfer_task& task) const -> result<void> {
    if (task.direction != transfer_direction::upload) {
        return unexpected{error{error_code::invalid_argument,
                                "upload_engine accepts upload tasks only"}};
    }
    if (task.object_key.empty()) {
        return unexpected{error{error_code::invalid_argument,
                                "object key must not be empty"}};
    }
    if (task.status != transfer_status::pending) {
        return unexpected{error{error_code::invalid_state_transition,
            "New transfers must be pending, got " +
            std::string(to_string(task.status))}};
    }

    std::error_code ec;
    auto status = std::filesystem::status(task.local_path, ec);
    if (!std::filesystem::exists(status)) {
        return unexpected{error{error_code::file_not_found,
                                "Source file not found: " + task.local_path.string()}};
    }
    if (!std::filesystem::is_regular_file(status)) {
        return unexpected{error{error_code::invalid_path,
                                "Source is not a regular file: " +
                                    task.local_path.string()}};
    }

    auto size = std::filesystem::file_size(task.local_path, ec);
    if (ec) {
        return unexpected{error_classifier::from_filesystem(
            ec, error_code::file_read_error, "stat " + task.local_path.string())};
    }

    if (task.id.is_null()) {
        task.id = transfer_id::generate();
    }
    task.total_bytes = size;
    task.transferred_bytes = 0;
    return {};
}

auto upload_engine::start(transfer_task task, const upload_options& options)
    -> result<transfer_id> {
    auto valid = validate_source(task);
    if (!valid) {
        return unexpected{valid.error()};
    }
    return submit(std::make_shared<upload_context>(std::move(task), options));
}

auto upload_engine::resume_upload(transfer_task task,
                                  std::string upload_id,
                                  const upload_options& options) -> result<transfer_id> {
    if (upload_id.empty()) {
        return unexpected{error{error_code::invalid_argument,
                                "upload id must not be empty"}};
    }

    auto valid = validate_source(task);
    if (!valid) {
        return unexpected{valid.error()};
    }

    task.upload_id = std::move(upload_id);
    return submit(std::make_shared<upload_context>(std::move(task), options));
}

auto upload_engine::get_parts(const transfer_id& id) const
    -> result<std::vector<part_descriptor>> {
    auto ctx = find_context(id);
    if (!ctx) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }

    auto& up = static_cast<upload_context&>(*ctx);
    std::lock_guard lock(up.mutex);
    return up.parts;
}

// ============================================================================
// transfer_engine hooks
// ============================================================================

auto upload_engine::make_retry_context(task_context& failed, transfer_task task)
    -> std::shared_ptr<task_context> {
    auto& up = static_cast<upload_context&>(failed);
    return std::make_shared<upload_context>(std::move(task), up.options);
}

auto upload_engine::cancel_idle(task_context& ctx) -> void {
    auto& up = static_cast<upload_context&>(ctx);
    auto upload_id = up.snapshot().upload_id;
    if (!upload_id) {
        return;
    }

    abort_upload(up, *upload_id);
    std::lock_guard lock(up.mutex);
    up.task.upload_id.reset();
}

auto upload_engine::abort_upload(upload_context& ctx, const std::string& upload_id)
    -> void {
    auto key = ctx.snapshot().object_key;

    // Not tied to the task token: abort usually runs because of a cancel
    auto request = request_for(ctx);
    request.token = nullptr;

    auto aborted = with_retry(config().retry, [&] {
        return resources_.store->abort_multipart_upload(key, upload_id, request);
    }, "abort_multipart_upload " + key);

    if (!aborted) {
        OT_LOG_WARN(category_, "failed to abort multipart upload " + upload_id +
                                   " for " + key + ": " + aborted.error().message);
        return;
    }
    OT_LOG_INFO(category_, "aborted multipart upload " + upload_id + " for " + key);
}

// ============================================================================
// Runner
// ============================================================================

auto upload_engine::run(task_context& ctx) -> void {
    auto& up = static_cast<upload_context&>(ctx);
    auto settings = config();

    if (up.token.is_stop_requested()) {
        if (up.token.reason() == stop_reason::cancel) {
            cancel_idle(up);
        }
        finish_stopped(up);
        return;
    }

    std::filesystem::path path;
    {
        std::lock_guard lock(up.mutex);
        path = up.task.local_path;
        auto moved = up.transition_locked(transfer_status::active);
        if (!moved) {
            OT_LOG_ERROR(category_, moved.error().message);
            return;
        }
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        finish_failed(up, error_classifier::from_filesystem(
                              ec, error_code::file_read_error, "stat " + path.string()));
        return;
    }

    bool multipart = false;
    std::optional<std::string> stale_upload;
    {
        std::lock_guard lock(up.mutex);
        auto& task = up.task;
        if (task.upload_id && (size != task.total_bytes || size == 0)) {
            // Source changed under an unfinished multipart upload; start over
            stale_upload = task.upload_id;
            task.upload_id.reset();
            task.part_size = 0;
            task.transferred_bytes = 0;
        }
        task.total_bytes = size;
        multipart = size > 0 &&
                    (up.options.force_multipart || task.upload_id.has_value() ||
                     part_planner::should_use_multipart(
                         size, settings.multipart_threshold_bytes));
    }

    if (stale_upload) {
        OT_LOG_WARN(category_, "source size changed, discarding upload " + *stale_upload);
        abort_upload(up, *stale_upload);
    }

    if (multipart) {
        run_multipart(up, settings.retry);
    } else {
        run_single_put(up, settings.retry);
    }
}

auto upload_engine::run_single_put(upload_context& ctx, const retry_policy& policy)
    -> void {
    auto task = ctx.snapshot();

    auto data = read_range(task.local_path, 0, task.total_bytes);
    if (!data) {
        finish_failed(ctx, data.error());
        return;
    }

    auto request = request_for(ctx);
    scoped_permit permit(*resources_.limiter, ctx.token);
    if (!permit.held()) {
        finish_stopped(ctx);
        return;
    }

    auto etag = with_retry(policy, [&] {
        return resources_.store->put_object(task.object_key, data.value(), request);
    }, "put_object " + task.object_key, &ctx.token);

    permit.release();

    if (!etag) {
        if (is_stop_error(etag.error())) {
            finish_stopped(ctx);
        } else {
            finish_failed(ctx, etag.error());
        }
        return;
    }

    {
        std::lock_guard lock(ctx.mutex);
        ctx.task.transferred_bytes = ctx.task.total_bytes;
        ctx.task.etag = etag.value();
    }
    report_progress(ctx);
    finish_completed(ctx, task.object_key);
}

auto upload_engine::run_multipart(upload_context& ctx, const retry_policy& policy)
    -> void {
    auto task = ctx.snapshot();
    const auto& key = task.object_key;
    auto request = request_for(ctx);

    // Initiate or adopt the multipart upload
    bool resuming = task.upload_id.has_value();
    std::string upload_id;
    if (resuming) {
        upload_id = *task.upload_id;
    } else {
        auto created = with_retry(policy, [&] {
            return resources_.store->create_multipart_upload(key, request);
        }, "create_multipart_upload " + key, &ctx.token);

        if (!created) {
            if (is_stop_error(created.error())) {
                finish_stopped(ctx);
            } else {
                finish_failed(ctx, created.error());
            }
            return;
        }

        upload_id = created.value();
        std::lock_guard lock(ctx.mutex);
        ctx.task.upload_id = upload_id;
        OT_LOG_INFO(category_, "initiated multipart upload " + upload_id + " for " + key);
    }

    // Plan parts; the part size is fixed for the lifetime of the upload
    auto part_size = task.part_size != 0
                         ? task.part_size
                         : part_planner::fit_part_size(task.total_bytes,
                                                       config().part_size_bytes);
    auto planned = part_planner::plan(task.total_bytes, part_size);
    if (!planned) {
        abort_upload(ctx, upload_id);
        {
            std::lock_guard lock(ctx.mutex);
            ctx.task.upload_id.reset();
        }
        finish_failed(ctx, planned.error());
        return;
    }
    auto parts = std::move(planned.value());

    // The store is the source of truth for what has already been uploaded
    if (resuming) {
        auto listed = with_retry(policy, [&] {
            return resources_.store->list_parts(key, upload_id, request);
        }, "list_parts " + key, &ctx.token);

        if (!listed) {
            if (is_stop_error(listed.error())) {
                finish_stopped(ctx);
                return;
            }
            if (listed.error().code == error_code::upload_not_found) {
                std::lock_guard lock(ctx.mutex);
                ctx.task.upload_id.reset();
            }
            finish_failed(ctx, listed.error());
            return;
        }

        for (const auto& stored : listed.value()) {
            if (stored.part_number == 0 || stored.part_number > parts.size()) {
                continue;
            }
            auto& part = parts[stored.part_number - 1];
            if (stored.etag.empty() || stored.size != part.size) {
                OT_LOG_WARN(category_, "part " + std::to_string(stored.part_number) +
                                           " of " + upload_id +
                                           " does not match the plan, re-uploading");
                continue;
            }
            part.etag = stored.etag;
            part.status = part_status::done;
        }
    }

    uint64_t acknowledged = 0;
    std::size_t done_parts = 0;
    for (const auto& part : parts) {
        if (part.is_done()) {
            acknowledged += part.size;
            ++done_parts;
        }
    }

    {
        std::lock_guard lock(ctx.mutex);
        ctx.task.part_size = part_size;
        ctx.task.transferred_bytes = acknowledged;
        ctx.parts = parts;

        auto log = ctx.log_context_locked();
        log.total_parts = static_cast<uint32_t>(parts.size());
        OT_LOG_INFO_CTX(category_,
                        "uploading " + std::to_string(parts.size() - done_parts) +
                            " of " + std::to_string(parts.size()) + " parts",
                        log);
    }
    if (acknowledged > 0) {
        report_progress(ctx);
    }

    // Dispatch missing parts; permits are taken here so pool workers never wait
    dispatch_state state;
    std::vector<std::future<void>> inflight;

    for (std::size_t index = 0; index < parts.size(); ++index) {
        if (parts[index].is_done()) {
            continue;
        }
        if (ctx.token.is_stop_requested() || state.failed.load()) {
            break;
        }

        auto permit = std::make_shared<scoped_permit>(*resources_.limiter, ctx.token);
        if (!permit->held() || ctx.token.is_stop_requested() || state.failed.load()) {
            break;
        }

        {
            std::lock_guard lock(ctx.mutex);
            ctx.parts[index].status = part_status::uploading;
        }

        auto part = parts[index];
        auto path = task.local_path;
        inflight.push_back(resources_.part_pool->submit_to_stage(
            [this, &ctx, &state, &policy, request, key, upload_id, path, part, index,
             permit] {
                auto mark = [&](part_status status) {
                    std::lock_guard lock(ctx.mutex);
                    ctx.parts[index].status = status;
                };

                try {
                    auto data = read_range(path, part.offset, part.size);
                    if (!data) {
                        permit->release();
                        mark(part_status::failed);
                        state.record(data.error());
                        return;
                    }

                    auto etag = with_retry(policy, [&] {
                        return resources_.store->upload_part(key, upload_id,
                                                             part.part_number,
                                                             data.value(), request);
                    }, "upload_part#" + std::to_string(part.part_number), &ctx.token);

                    permit->release();

                    if (!etag) {
                        if (is_stop_error(etag.error())) {
                            mark(part_status::pending);
                        } else {
                            mark(part_status::failed);
                            state.record(etag.error());
                        }
                        return;
                    }

                    {
                        std::lock_guard lock(ctx.mutex);
                        ctx.parts[index].status = part_status::done;
                        ctx.parts[index].etag = etag.value();
                        ctx.task.transferred_bytes += part.size;

                        auto log = ctx.log_context_locked();
                        log.part_number = part.part_number;
                        OT_LOG_DEBUG_CTX(category_, "part uploaded", log);
                    }
                    report_progress(ctx);
                } catch (const std::exception& e) {
                    permit->release();
                    mark(part_status::failed);
                    state.record(error{error_code::internal_error,
                                       "part " + std::to_string(part.part_number) +
                                           ": " + e.what()});
                }
            },
            adapters::upload_part_stage));
    }

    for (auto& job : inflight) {
        job.wait();
    }
    for (auto& job : inflight) {
        job.get();
    }

    // A part that gave up fails the whole upload
    if (state.failure) {
        abort_upload(ctx, upload_id);
        {
            std::lock_guard lock(ctx.mutex);
            ctx.task.upload_id.reset();
        }
        finish_failed(ctx, *state.failure);
        return;
    }

    if (ctx.token.reason() == stop_reason::cancel) {
        cancel_idle(ctx);
        finish_stopped(ctx);
        return;
    }

    std::vector<completed_part> completed;
    std::optional<uint32_t> missing;
    {
        std::lock_guard lock(ctx.mutex);
        completed.reserve(ctx.parts.size());
        for (const auto& part : ctx.parts) {
            if (!part.is_done()) {
                missing = part.part_number;
                break;
            }
            completed.push_back(completed_part{part.part_number, part.etag});
        }
    }

    if (missing) {
        if (ctx.token.is_stop_requested()) {
            finish_stopped(ctx);
            return;
        }
        abort_upload(ctx, upload_id);
        {
            std::lock_guard lock(ctx.mutex);
            ctx.task.upload_id.reset();
        }
        finish_failed(ctx, error{error_code::missing_part_etag,
                                 "Part " + std::to_string(*missing) +
                                     " has no etag from the store"});
        return;
    }

    auto final_etag = with_retry(policy, [&] {
        return resources_.store->complete_multipart_upload(key, upload_id, completed,
                                                           request);
    }, "complete_multipart_upload " + key, &ctx.token);

    if (!final_etag) {
        if (is_stop_error(final_etag.error())) {
            if (ctx.token.reason() == stop_reason::cancel) {
                cancel_idle(ctx);
            }
            finish_stopped(ctx);
            return;
        }
        abort_upload(ctx, upload_id);
        {
            std::lock_guard lock(ctx.mutex);
            ctx.task.upload_id.reset();
        }
        finish_failed(ctx, final_etag.error());
        return;
    }

    {
        std::lock_guard lock(ctx.mutex);
        ctx.task.etag = final_etag.value();
        ctx.task.upload_id.reset();
        ctx.task.transferred_bytes = ctx.task.total_bytes;
    }
    OT_LOG_INFO(category_, "completed multipart upload " + upload_id + " for " + key +
                               " (" + std::to_string(completed.size()) + " parts)");
    finish_completed(ctx, key);
}

}  // namespace kcenon::object_transfer
