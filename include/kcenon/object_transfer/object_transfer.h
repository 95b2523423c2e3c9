/**
 * @file object_transfer.h
 * @brief Main header for object_trans_system library
 * @version 0.1.0
 *
 * This is the primary include file for the object_trans_system library.
 * Include this header to access all object transfer functionality.
 *
 * @code
 * #include <kcenon/object_transfer/object_transfer.h>
 *
 * using namespace kcenon::object_transfer;
 *
 * auto manager = transfer_manager::builder()
 *     .with_store(std::make_shared<memory_object_store>())
 *     .build();
 *
 * auto id = manager->start_download(
 *     transfer_task::make_download("photos/cat.jpg", "/tmp/cat.jpg"));
 * @endcode
 */

#ifndef KCENON_OBJECT_TRANSFER_OBJECT_TRANSFER_H
#define KCENON_OBJECT_TRANSFER_OBJECT_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/object_transfer/core/types.h"
#include "kcenon/object_transfer/core/error_classifier.h"
#include "kcenon/object_transfer/core/retry_policy.h"
#include "kcenon/object_transfer/core/concurrency_limiter.h"
#include "kcenon/object_transfer/core/part_planner.h"
#include "kcenon/object_transfer/core/checksum.h"
#include "kcenon/object_transfer/core/transfer_task.h"

// Storage
#include "kcenon/object_transfer/storage/object_store.h"
#include "kcenon/object_transfer/storage/memory_object_store.h"

// Engines
#include "kcenon/object_transfer/engine/transfer_config.h"
#include "kcenon/object_transfer/engine/upload_engine.h"
#include "kcenon/object_transfer/engine/download_engine.h"
#include "kcenon/object_transfer/engine/transfer_manager.h"

// Adapters
#include "kcenon/object_transfer/adapters/task_pool_adapter.h"

namespace kcenon::object_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_OBJECT_TRANSFER_H
