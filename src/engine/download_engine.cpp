/**
 * @file download_engine.cpp
 * @brief Implementation of download_engine
 */

#include "kcenon/object_transfer/engine/download_engine.h"

#include "kcenon/object_transfer/core/checksum.h"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>

namespace kcenon::object_transfer {

struct download_engine::download_context : task_context {
    download_context(transfer_task initial, download_options opts)
        : task_context(std::move(initial)), options(opts) {}

    download_options options;

    // Guarded by mutex
    bool owns_partial = false;  ///< The destination was written by this task
    std::optional<std::string> expected_sha256;
    std::optional<std::string> expected_md5;
};

namespace {

auto errno_error(error_code fallback, const std::string& context) -> error {
    return error_classifier::from_filesystem(
        std::error_code(errno, std::generic_category()), fallback, context);
}

auto existing_size(const std::filesystem::path& path) -> std::optional<uint64_t> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

auto remove_file(const std::filesystem::path& path) -> result<void> {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return unexpected{error_classifier::from_filesystem(
            ec, error_code::file_write_error, "remove " + path.string())};
    }
    return {};
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

download_engine::download_engine(engine_resources resources,
                                 transfer_config config,
                                 transfer_callbacks callbacks)
    : transfer_engine(std::move(resources), std::move(config), std::move(callbacks),
                      log_category::download) {}

download_engine::~download_engine() {
    shutdown();
}

// ============================================================================
// Public API
// ============================================================================

auto download_engine::validate_destination(transfer_task& task) const -> result<void> {
    if (task.direction != transfer_direction::download) {
        return unexpected{error{error_code::invalid_argument,
                                "download_engine accepts download tasks only"}};
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

    const auto& path = task.local_path;
    if (path.empty() || !path.has_filename()) {
        return unexpected{error{error_code::invalid_path,
                                "Destination must name a file: " + path.string()}};
    }

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return unexpected{error{error_code::invalid_path,
                                "Destination is a directory: " + path.string()}};
    }

    auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
        return unexpected{error{error_code::invalid_path,
                                "Destination directory does not exist: " +
                                    parent.string()}};
    }

    if (task.id.is_null()) {
        task.id = transfer_id::generate();
    }
    task.total_bytes = 0;
    task.transferred_bytes = 0;
    return {};
}

auto download_engine::start(transfer_task task, const download_options& options)
    -> result<transfer_id> {
    auto valid = validate_destination(task);
    if (!valid) {
        return unexpected{valid.error()};
    }
    return submit(std::make_shared<download_context>(std::move(task), options));
}

auto download_engine::unique_path(const std::filesystem::path& desired)
    -> result<std::filesystem::path> {
    auto parent = desired.parent_path();
    auto stem = desired.stem().string();
    auto extension = desired.extension().string();

    for (int i = 1; i <= 1000; ++i) {
        auto candidate = parent / (stem + " (" + std::to_string(i) + ")" + extension);
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec) && !ec) {
            return candidate;
        }
    }
    return unexpected{error{error_code::file_already_exists,
                            "No free file name for " + desired.string()}};
}

// ============================================================================
// transfer_engine hooks
// ============================================================================

auto download_engine::make_retry_context(task_context& failed, transfer_task task)
    -> std::shared_ptr<task_context> {
    auto& dl = static_cast<download_context&>(failed);
    auto next = std::make_shared<download_context>(std::move(task), dl.options);

    std::lock_guard lock(dl.mutex);
    next->owns_partial = dl.owns_partial;
    return next;
}

auto download_engine::cancel_idle(task_context& ctx) -> void {
    auto& dl = static_cast<download_context&>(ctx);
    discard_unstarted(dl, dl.snapshot().transferred_bytes);
}

auto download_engine::discard_unstarted(download_context& ctx, uint64_t prior_bytes)
    -> void {
    std::filesystem::path path;
    {
        std::lock_guard lock(ctx.mutex);
        if (!ctx.owns_partial || prior_bytes != 0) {
            return;
        }
        path = ctx.task.local_path;
        ctx.owns_partial = false;
    }

    auto removed = remove_file(path);
    if (!removed) {
        OT_LOG_WARN(category_, removed.error().message);
        return;
    }
    OT_LOG_DEBUG(category_, "removed partial file " + path.string());
}

auto download_engine::stop_run(download_context& ctx) -> void {
    if (ctx.token.reason() == stop_reason::cancel) {
        discard_unstarted(ctx, ctx.snapshot().run_start_bytes);
    }
    finish_stopped(ctx);
}

// ============================================================================
// Runner
// ============================================================================

auto download_engine::run(task_context& ctx) -> void {
    auto& dl = static_cast<download_context&>(ctx);
    auto settings = config();

    if (dl.token.is_stop_requested()) {
        if (dl.token.reason() == stop_reason::cancel) {
            cancel_idle(dl);
        }
        finish_stopped(dl);
        return;
    }

    // A paused task cannot fail from paused, so it becomes active first.
    // New tasks run the pre-flight while still pending.
    {
        std::lock_guard lock(dl.mutex);
        if (dl.task.status == transfer_status::paused) {
            auto moved = dl.transition_locked(transfer_status::active);
            if (!moved) {
                OT_LOG_ERROR(category_, moved.error().message);
                return;
            }
        }
    }

    auto ready = preflight(dl, settings.retry);
    if (!ready) {
        if (is_stop_error(ready.error())) {
            stop_run(dl);
        } else {
            finish_failed(dl, ready.error());
        }
        return;
    }

    bool complete_on_disk = false;
    {
        std::lock_guard lock(dl.mutex);
        if (dl.task.status == transfer_status::pending) {
            auto moved = dl.transition_locked(transfer_status::active);
            if (!moved) {
                OT_LOG_ERROR(category_, moved.error().message);
                return;
            }
        }
        dl.task.run_started_at = std::chrono::steady_clock::now();
        dl.task.run_start_bytes = dl.task.transferred_bytes;
        complete_on_disk = dl.task.transferred_bytes == dl.task.total_bytes;
    }

    if (complete_on_disk) {
        OT_LOG_INFO(category_, dl.snapshot().local_path.string() +
                                   " already holds the whole object");
    } else {
        report_progress(dl);
        auto streamed = stream_object(dl, settings.retry, settings.download_buffer_size);
        if (!streamed) {
            if (is_stop_error(streamed.error())) {
                stop_run(dl);
            } else {
                finish_failed(dl, streamed.error());
            }
            return;
        }
    }

    auto verified = verify_content(dl);
    if (!verified) {
        finish_failed(dl, verified.error());
        return;
    }

    report_progress(dl);
    finish_completed(dl, dl.snapshot().local_path.string());
}

auto download_engine::preflight(download_context& ctx, const retry_policy& policy)
    -> result<void> {
    auto task = ctx.snapshot();
    auto request = request_for(ctx);

    auto meta = with_retry(policy, [&] {
        return resources_.store->head_object(task.object_key, request);
    }, "head_object " + task.object_key, &ctx.token);
    if (!meta) {
        return unexpected{meta.error()};
    }
    const auto& object = meta.value();

    bool owns_partial = false;
    {
        std::lock_guard lock(ctx.mutex);
        owns_partial = ctx.owns_partial;
    }

    auto path = task.local_path;
    uint64_t offset = 0;
    bool adopted = false;

    if (auto existing = existing_size(path)) {
        bool etag_changed = task.etag && *task.etag != object.etag;

        if (ctx.options.resumable && !etag_changed && *existing <= object.size) {
            offset = *existing;
            adopted = true;
            OT_LOG_INFO(category_, "resuming " + path.string() + " at offset " +
                                       std::to_string(offset));
        } else if (ctx.options.resumable || owns_partial || ctx.options.overwrite) {
            if (etag_changed) {
                OT_LOG_WARN(category_, "object " + task.object_key +
                                           " changed since the partial download, restarting");
            } else if (*existing > object.size) {
                OT_LOG_WARN(category_, path.string() +
                                           " is larger than the object, restarting");
            }
            auto removed = remove_file(path);
            if (!removed) {
                return removed;
            }
        } else if (ctx.options.unique_name_on_conflict) {
            auto renamed = unique_path(path);
            if (!renamed) {
                return unexpected{renamed.error()};
            }
            path = renamed.value();
            OT_LOG_INFO(category_, task.local_path.string() +
                                       " exists, downloading to " + path.string());
        } else {
            return unexpected{error{error_code::file_already_exists,
                                    "Destination already exists: " + path.string()}};
        }
    }

    // Best effort: an unavailable figure does not block the download
    auto needed = object.size - offset;
    auto parent = path.parent_path().empty() ? std::filesystem::path(".")
                                             : path.parent_path();
    auto available = resources_.free_space(parent);
    if (!available) {
        OT_LOG_WARN(category_, "cannot determine free space in " + parent.string() +
                                   ": " + available.error().message + ", proceeding");
    } else if (available.value() < needed) {
        return unexpected{error{error_code::disk_full,
            "Not enough disk space in " + parent.string() + ": need " +
            std::to_string(needed) + " bytes, " + std::to_string(available.value()) +
            " available"}};
    }

    std::lock_guard lock(ctx.mutex);
    ctx.task.local_path = path;
    ctx.task.total_bytes = object.size;
    ctx.task.transferred_bytes = offset;
    ctx.task.etag = object.etag;
    ctx.expected_sha256 = object.content_sha256;
    ctx.expected_md5 = object.content_md5;
    if (adopted) {
        ctx.owns_partial = true;
    }

    auto log = ctx.log_context_locked();
    OT_LOG_DEBUG_CTX(category_, "pre-flight passed", log);
    return {};
}

auto download_engine::stream_object(download_context& ctx,
                                    const retry_policy& policy,
                                    std::size_t buffer_size) -> result<void> {
    auto task = ctx.snapshot();
    const auto& key = task.object_key;
    const auto total = task.total_bytes;
    auto offset = task.transferred_bytes;
    auto request = request_for(ctx);

    scoped_permit permit(*resources_.limiter, ctx.token);
    if (!permit.held()) {
        return unexpected{ctx.token.to_error()};
    }

    std::ofstream out(task.local_path, std::ios::binary | std::ios::app);
    if (!out) {
        return unexpected{errno_error(error_code::file_write_error,
                                      "open " + task.local_path.string())};
    }
    {
        std::lock_guard lock(ctx.mutex);
        ctx.owns_partial = true;
    }

    // Consecutive failures without progress share one retry budget; progress
    // resets it, so the run as a whole is also capped at max_attempts
    // retries per buffer-sized chunk still to fetch
    std::size_t attempt = 1;
    std::size_t retries = 0;
    const auto chunks_left = std::max<uint64_t>((total - offset + buffer_size - 1) / buffer_size, 1);
    const auto retry_limit = static_cast<uint64_t>(policy.max_attempts) * chunks_left;

    auto back_off = [&](const error& err) -> std::optional<error> {
        if (is_stop_error(err)) {
            return err;
        }
        auto label = "get_object_range " + key + "@" + std::to_string(offset);
        auto classified = error_classifier::classify(err);
        if (!policy.should_retry(classified, attempt)) {
            detail::log_retry_exhausted(label, attempt, classified);
            return err;
        }
        if (retries >= retry_limit) {
            detail::log_retry_exhausted(label, attempt, classified);
            auto gave_up = err;
            gave_up.message += " (stream reopened " + std::to_string(retries) +
                               " times in this run)";
            return gave_up;
        }
        ++retries;
        auto delay = policy.compute_delay(attempt);
        detail::log_retry_scheduled(label, attempt, delay, classified);
        if (ctx.token.wait_for(delay)) {
            return ctx.token.to_error();
        }
        ++attempt;
        return std::nullopt;
    };

    std::vector<std::byte> buffer(buffer_size);
    std::unique_ptr<object_read_stream> stream;

    while (offset < total) {
        if (ctx.token.is_stop_requested()) {
            return unexpected{ctx.token.to_error()};
        }

        if (!stream) {
            auto opened = resources_.store->get_object_range(key, offset, request);
            if (!opened) {
                if (auto fatal = back_off(opened.error())) {
                    return unexpected{*fatal};
                }
                continue;
            }
            stream = std::move(opened.value());
        }

        auto received = stream->read(buffer);
        if (!received || received.value() == 0) {
            auto err = received ? error{error_code::connection_lost,
                                        "Stream ended at offset " +
                                            std::to_string(offset) + " of " +
                                            std::to_string(total)}
                                : received.error();
            stream.reset();
            if (auto fatal = back_off(err)) {
                return unexpected{*fatal};
            }
            continue;
        }

        auto n = received.value();
        if (offset + n > total) {
            return unexpected{error{error_code::size_mismatch,
                "Store sent more than the " + std::to_string(total) +
                " bytes it reported for " + key}};
        }

        out.write(reinterpret_cast<const char*>(buffer.data()),
                  static_cast<std::streamsize>(n));
        out.flush();
        if (!out) {
            return unexpected{errno_error(error_code::file_write_error,
                                          "write " + task.local_path.string())};
        }

        offset += n;
        attempt = 1;
        {
            std::lock_guard lock(ctx.mutex);
            ctx.task.transferred_bytes = offset;
        }
        report_progress(ctx);
    }

    out.close();
    if (!out) {
        return unexpected{errno_error(error_code::file_write_error,
                                      "close " + task.local_path.string())};
    }
    return {};
}

auto download_engine::verify_content(download_context& ctx) -> result<void> {
    std::filesystem::path path;
    uint64_t total = 0;
    std::optional<std::string> sha256;
    std::optional<std::string> md5;
    {
        std::lock_guard lock(ctx.mutex);
        path = ctx.task.local_path;
        total = ctx.task.total_bytes;
        if (ctx.options.verify_checksum) {
            sha256 = ctx.expected_sha256;
            md5 = ctx.expected_md5;
        }
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        // An empty object never opened the file when nothing was there
        if (total != 0) {
            return unexpected{error_classifier::from_filesystem(
                ec, error_code::file_read_error, "stat " + path.string())};
        }
        std::ofstream touch(path, std::ios::binary);
        if (!touch) {
            return unexpected{errno_error(error_code::file_write_error,
                                          "create " + path.string())};
        }
        size = 0;
    }
    if (size != total) {
        return unexpected{error{error_code::size_mismatch,
            path.string() + " has " + std::to_string(size) + " bytes, expected " +
            std::to_string(total)}};
    }

    std::optional<checksum_algorithm> algorithm;
    std::string expected;
    if (sha256) {
        algorithm = checksum_algorithm::sha256;
        expected = *sha256;
    } else if (md5) {
        algorithm = checksum_algorithm::md5;
        expected = *md5;
    }
    if (!algorithm) {
        return {};
    }

    auto matches = checksum::verify_file(path, *algorithm, expected);
    if (!matches) {
        return unexpected{matches.error()};
    }
    if (!matches.value()) {
        // The bytes on disk are wrong; a retry must not resume from them
        auto removed = remove_file(path);
        if (!removed) {
            OT_LOG_WARN(category_, removed.error().message);
        }
        {
            std::lock_guard lock(ctx.mutex);
            ctx.owns_partial = false;
        }
        return unexpected{error{error_code::checksum_mismatch,
            std::string(to_string(*algorithm)) + " of " + path.string() +
            " does not match the object"}};
    }

    OT_LOG_DEBUG(category_, std::string(to_string(*algorithm)) + " verified for " +
                                path.string());
    return {};
}

}  // namespace kcenon::object_transfer
