/**
 * @file transfer_events.h
 * @brief Notifications emitted by the engines
 *
 * Callbacks of one task are never invoked concurrently and arrive in the
 * order the engine produced them. Callbacks of different tasks may run at
 * the same time on different threads.
 */

#ifndef KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_EVENTS_H
#define KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_EVENTS_H

#include <kcenon/object_transfer/core/error_classifier.h>
#include <kcenon/object_transfer/core/types.h>

#include <cstdint>
#include <functional>
#include <string>

namespace kcenon::object_transfer {

/**
 * @brief (id, transferred bytes, total bytes)
 */
using progress_callback =
    std::function<void(const transfer_id&, uint64_t, uint64_t)>;

/**
 * @brief (id, object key for uploads or final local path for downloads)
 */
using completion_callback =
    std::function<void(const transfer_id&, const std::string&)>;

/**
 * @brief (id, classified error, retryable)
 */
using error_callback =
    std::function<void(const transfer_id&, const classified_error&, bool)>;

struct transfer_callbacks {
    progress_callback on_progress;
    completion_callback on_completion;
    error_callback on_error;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_EVENTS_H
