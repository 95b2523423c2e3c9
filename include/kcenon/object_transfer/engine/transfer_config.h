/**
 * @file transfer_config.h
 * @brief Engine configuration
 */

#ifndef KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_CONFIG_H
#define KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_CONFIG_H

#include <kcenon/object_transfer/core/part_planner.h>
#include <kcenon/object_transfer/core/retry_policy.h>
#include <kcenon/object_transfer/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace kcenon::object_transfer {

/**
 * @brief Tunables shared by the upload and download engines
 *
 * All values are fixed at engine construction except @ref retry, which
 * transfer_manager::set_retry_policy() may replace between operations.
 */
struct transfer_config {
    /// Simultaneous network operations (part uploads and download streams)
    std::size_t max_concurrent_transfers = 3;

    uint64_t part_size_bytes = part_planner::default_part_size;
    uint64_t multipart_threshold_bytes = part_planner::default_multipart_threshold;

    /// Timeout carried by every store call
    std::chrono::milliseconds request_timeout{30000};

    retry_policy retry;

    /// Size of each streamed read during a download
    std::size_t download_buffer_size = 1024 * 1024;

    /// Default task-level retry budget given to new tasks
    std::size_t max_task_retries = 3;

    /// Workers for transfer runners (0 = hardware concurrency)
    std::size_t worker_threads = 0;

    [[nodiscard]] auto validate() const -> result<void>;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_CONFIG_H
