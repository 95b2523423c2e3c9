/**
 * @file transfer_task.h
 * @brief Shared data model of one object transfer
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_TRANSFER_TASK_H
#define KCENON_OBJECT_TRANSFER_CORE_TRANSFER_TASK_H

#include <kcenon/object_transfer/core/error_classifier.h>
#include <kcenon/object_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::object_transfer {

/**
 * @brief Transfer direction
 */
enum class transfer_direction {
    upload,
    download
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) noexcept
    -> std::string_view {
    switch (direction) {
        case transfer_direction::upload: return "upload";
        case transfer_direction::download: return "download";
        default: return "unknown";
    }
}

/**
 * @brief Lifecycle state of a transfer
 *
 * @code
 * pending --> active --> completed
 *    |          |  ^---> failed
 *    |          |  `---> cancelled
 *    |          v
 *    `-----> paused --> active (resume)
 * @endcode
 */
enum class transfer_status {
    pending,     ///< Created, not yet running (download pre-flight happens here)
    active,      ///< Bytes are moving
    paused,      ///< Stopped by the user, resumable
    completed,   ///< Terminal: all bytes acknowledged
    failed,      ///< Terminal: gave up with a classified error
    cancelled    ///< Terminal: stopped by the user
};

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept
    -> std::string_view {
    switch (status) {
        case transfer_status::pending: return "pending";
        case transfer_status::active: return "active";
        case transfer_status::paused: return "paused";
        case transfer_status::completed: return "completed";
        case transfer_status::failed: return "failed";
        case transfer_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_status(transfer_status status) noexcept
    -> bool {
    return status == transfer_status::completed ||
           status == transfer_status::failed ||
           status == transfer_status::cancelled;
}

/**
 * @brief Check whether @p from may move to @p to
 *
 * Terminal states are immutable.
 */
[[nodiscard]] constexpr auto is_valid_transition(transfer_status from,
                                                 transfer_status to) noexcept
    -> bool {
    switch (from) {
        case transfer_status::pending:
            return to == transfer_status::active ||
                   to == transfer_status::paused ||
                   to == transfer_status::failed ||
                   to == transfer_status::cancelled;
        case transfer_status::active:
            return to == transfer_status::completed ||
                   to == transfer_status::failed ||
                   to == transfer_status::paused ||
                   to == transfer_status::cancelled;
        case transfer_status::paused:
            return to == transfer_status::active ||
                   to == transfer_status::cancelled;
        default:
            return false;
    }
}

/**
 * @brief Point-in-time progress figures
 */
struct transfer_progress {
    uint64_t transferred_bytes = 0;
    uint64_t total_bytes = 0;
    double percentage = 0.0;
    double bytes_per_second = 0.0;  ///< Average over the current run
    std::optional<std::chrono::milliseconds> estimated_remaining;
};

/**
 * @brief One object transfer
 *
 * Created by the caller, owned by an engine while registered, and handed
 * back to callers only as snapshots.
 */
struct transfer_task {
    transfer_id id;
    std::string object_key;
    std::filesystem::path local_path;
    transfer_direction direction = transfer_direction::upload;
    transfer_status status = transfer_status::pending;

    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;  ///< Non-decreasing while active

    std::size_t retry_count = 0;     ///< Task-level retries already used
    std::size_t max_retries = 3;

    std::optional<std::string> upload_id;  ///< Multipart upload in flight
    uint64_t part_size = 0;                ///< Fixed at the first multipart run
    std::optional<std::string> etag;       ///< Object etag (final for uploads,
                                           ///< observed at pre-flight for downloads)
    std::optional<classified_error> last_error;

    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::optional<std::chrono::steady_clock::time_point> run_started_at;
    uint64_t run_start_bytes = 0;

    [[nodiscard]] static auto make_upload(std::string key,
                                          std::filesystem::path source) -> transfer_task;
    [[nodiscard]] static auto make_download(std::string key,
                                            std::filesystem::path destination)
        -> transfer_task;

    [[nodiscard]] auto progress_percentage() const noexcept -> double;
    [[nodiscard]] auto progress() const -> transfer_progress;

    [[nodiscard]] auto can_retry() const noexcept -> bool {
        return status == transfer_status::failed && retry_count < max_retries;
    }
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_TRANSFER_TASK_H
