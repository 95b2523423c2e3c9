/**
 * @file part_planner.cpp
 * @brief Implementation of part_planner
 */

#include "kcenon/object_transfer/core/part_planner.h"

namespace kcenon::object_transfer {

auto part_planner::part_count(uint64_t total_size, uint64_t part_size) noexcept
    -> uint64_t {
    if (total_size == 0 || part_size == 0) {
        return 0;
    }

    auto count = total_size / part_size + 1;
    // A zero-byte remainder would make the last part empty
    if (total_size % part_size == 0) {
        --count;
    }
    return count;
}

auto part_planner::fit_part_size(uint64_t total_size, uint64_t requested) noexcept
    -> uint64_t {
    if (requested == 0) {
        requested = default_part_size;
    }
    if (part_count(total_size, requested) <= max_part_count) {
        return requested;
    }
    return (total_size + max_part_count - 1) / max_part_count;
}

auto part_planner::plan(uint64_t total_size, uint64_t part_size)
    -> result<std::vector<part_descriptor>> {
    if (part_size == 0) {
        return unexpected{error{error_code::invalid_argument,
                                "part size must be greater than zero"}};
    }

    auto count = part_count(total_size, part_size);
    if (count > max_part_count) {
        return unexpected{error{error_code::invalid_argument,
                                "object needs " + std::to_string(count) +
                                    " parts, limit is " +
                                    std::to_string(max_part_count)}};
    }

    std::vector<part_descriptor> parts;
    parts.reserve(static_cast<std::size_t>(count));

    uint64_t offset = 0;
    for (uint64_t i = 0; i < count; ++i) {
        part_descriptor part;
        part.part_number = static_cast<uint32_t>(i + 1);
        part.offset = offset;
        part.size = (i + 1 == count) ? total_size - offset : part_size;
        offset += part.size;
        parts.push_back(std::move(part));
    }

    return parts;
}

}  // namespace kcenon::object_transfer
