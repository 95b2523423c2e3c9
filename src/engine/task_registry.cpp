/**
 * @file task_registry.cpp
 * @brief Implementation of task_registry
 */

#include "kcenon/object_transfer/engine/task_registry.h"

namespace kcenon::object_transfer {

auto task_registry::add(std::shared_ptr<task_context> ctx) -> result<void> {
    if (!ctx) {
        return unexpected{error{error_code::invalid_argument, "null task context"}};
    }

    auto id = ctx->snapshot().id;
    if (id.is_null()) {
        return unexpected{error{error_code::invalid_argument, "task has no id"}};
    }

    std::lock_guard lock(mutex_);
    auto [it, inserted] = tasks_.emplace(id, std::move(ctx));
    if (!inserted) {
        return unexpected{error{error_code::invalid_argument,
                                "Transfer already registered: " + id.to_string()}};
    }
    return {};
}

auto task_registry::find(const transfer_id& id) const
    -> std::shared_ptr<task_context> {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    return it != tasks_.end() ? it->second : nullptr;
}

auto task_registry::remove(const transfer_id& id) -> result<void> {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }

    {
        std::lock_guard ctx_lock(it->second->mutex);
        if (!is_terminal_status(it->second->task.status) || it->second->running) {
            return unexpected{error{error_code::transfer_active,
                "Cannot remove transfer in current state: " +
                std::string(to_string(it->second->task.status))}};
        }
    }

    tasks_.erase(it);
    return {};
}

auto task_registry::remove_if(
    const std::function<bool(const transfer_task&)>& predicate) -> std::size_t {
    std::lock_guard lock(mutex_);
    std::size_t removed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        bool erase = false;
        {
            std::lock_guard ctx_lock(it->second->mutex);
            const auto& task = it->second->task;
            erase = !it->second->running && is_terminal_status(task.status) &&
                    predicate(task);
        }
        if (erase) {
            it = tasks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

auto task_registry::snapshot_all() const -> std::vector<transfer_task> {
    std::lock_guard lock(mutex_);
    std::vector<transfer_task> out;
    out.reserve(tasks_.size());
    for (const auto& [id, ctx] : tasks_) {
        out.push_back(ctx->snapshot());
    }
    return out;
}

auto task_registry::contexts() const -> std::vector<std::shared_ptr<task_context>> {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<task_context>> out;
    out.reserve(tasks_.size());
    for (const auto& [id, ctx] : tasks_) {
        out.push_back(ctx);
    }
    return out;
}

auto task_registry::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

}  // namespace kcenon::object_transfer
