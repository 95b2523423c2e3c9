/**
 * @file transfer_id.cpp
 * @brief Implementation of transfer_id generation
 */

#include "kcenon/object_transfer/core/types.h"

#include <atomic>

namespace kcenon::object_transfer {

namespace {

std::atomic<uint64_t> next_transfer_id{1};

}  // namespace

auto transfer_id::generate() -> transfer_id {
    return transfer_id(next_transfer_id.fetch_add(1, std::memory_order_relaxed));
}

auto transfer_id::to_string() const -> std::string {
    return "ot-" + std::to_string(value);
}

}  // namespace kcenon::object_transfer
