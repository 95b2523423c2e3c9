/**
 * @file transfer_task.cpp
 * @brief Implementation of transfer_task helpers
 */

#include "kcenon/object_transfer/core/transfer_task.h"

namespace kcenon::object_transfer {

auto transfer_task::make_upload(std::string key, std::filesystem::path source)
    -> transfer_task {
    transfer_task task;
    task.id = transfer_id::generate();
    task.object_key = std::move(key);
    task.local_path = std::move(source);
    task.direction = transfer_direction::upload;
    return task;
}

auto transfer_task::make_download(std::string key, std::filesystem::path destination)
    -> transfer_task {
    transfer_task task;
    task.id = transfer_id::generate();
    task.object_key = std::move(key);
    task.local_path = std::move(destination);
    task.direction = transfer_direction::download;
    return task;
}

auto transfer_task::progress_percentage() const noexcept -> double {
    if (total_bytes == 0) {
        return status == transfer_status::completed ? 100.0 : 0.0;
    }
    return static_cast<double>(transferred_bytes) /
           static_cast<double>(total_bytes) * 100.0;
}

auto transfer_task::progress() const -> transfer_progress {
    transfer_progress p;
    p.transferred_bytes = transferred_bytes;
    p.total_bytes = total_bytes;
    p.percentage = progress_percentage();

    if (!run_started_at || status != transfer_status::active) {
        return p;
    }

    auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - *run_started_at);
    auto moved = transferred_bytes > run_start_bytes
                     ? transferred_bytes - run_start_bytes
                     : 0;
    if (elapsed.count() <= 0.0 || moved == 0) {
        return p;
    }

    p.bytes_per_second = static_cast<double>(moved) / elapsed.count();
    if (total_bytes > transferred_bytes) {
        auto remaining_s =
            static_cast<double>(total_bytes - transferred_bytes) / p.bytes_per_second;
        p.estimated_remaining =
            std::chrono::milliseconds(static_cast<int64_t>(remaining_s * 1000.0));
    } else {
        p.estimated_remaining = std::chrono::milliseconds(0);
    }
    return p;
}

}  // namespace kcenon::object_transfer
