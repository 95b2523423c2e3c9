/**
 * @file task_registry.h
 * @brief Tracking set of the tasks an engine owns
 */

#ifndef KCENON_OBJECT_TRANSFER_ENGINE_TASK_REGISTRY_H
#define KCENON_OBJECT_TRANSFER_ENGINE_TASK_REGISTRY_H

#include <kcenon/object_transfer/engine/task_context.h>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Thread-safe id -> context map
 *
 * Entries leave the registry only through remove()/remove_if(), and only
 * once their task is terminal and no runner references them.
 */
class task_registry {
public:
    task_registry() = default;

    task_registry(const task_registry&) = delete;
    auto operator=(const task_registry&) -> task_registry& = delete;

    [[nodiscard]] auto add(std::shared_ptr<task_context> ctx) -> result<void>;

    [[nodiscard]] auto find(const transfer_id& id) const
        -> std::shared_ptr<task_context>;

    /**
     * @return transfer_not_found, or transfer_active when the task is not
     *         terminal or a runner still uses it
     */
    [[nodiscard]] auto remove(const transfer_id& id) -> result<void>;

    /**
     * @brief Remove every idle terminal task matching @p predicate
     * @return Number of tasks removed
     */
    auto remove_if(const std::function<bool(const transfer_task&)>& predicate)
        -> std::size_t;

    /**
     * @brief Snapshots ordered by id (creation order)
     */
    [[nodiscard]] auto snapshot_all() const -> std::vector<transfer_task>;

    [[nodiscard]] auto contexts() const -> std::vector<std::shared_ptr<task_context>>;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::map<transfer_id, std::shared_ptr<task_context>> tasks_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_ENGINE_TASK_REGISTRY_H
