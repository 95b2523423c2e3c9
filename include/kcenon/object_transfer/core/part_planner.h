/**
 * @file part_planner.h
 * @brief Multipart chunk planning
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_PART_PLANNER_H
#define KCENON_OBJECT_TRANSFER_CORE_PART_PLANNER_H

#include <kcenon/object_transfer/core/types.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Upload state of a single part
 */
enum class part_status {
    pending,
    uploading,
    done,
    failed
};

[[nodiscard]] constexpr auto to_string(part_status status) noexcept
    -> std::string_view {
    switch (status) {
        case part_status::pending: return "pending";
        case part_status::uploading: return "uploading";
        case part_status::done: return "done";
        case part_status::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief One contiguous byte range of a multipart upload
 */
struct part_descriptor {
    uint32_t part_number = 0;  ///< 1-based, contiguous
    uint64_t offset = 0;       ///< Byte offset in the source object
    uint64_t size = 0;         ///< Never zero
    part_status status = part_status::pending;
    std::string etag;          ///< Set by the store once the part is accepted

    [[nodiscard]] auto is_done() const noexcept -> bool {
        return status == part_status::done && !etag.empty();
    }
};

/**
 * @brief Computes part boundaries for multipart uploads
 *
 * @code
 * auto parts = part_planner::plan(25 * MiB, 10 * MiB);
 * // parts->size() == 3, sizes 10, 10 and 5 MiB
 * @endcode
 */
class part_planner {
public:
    static constexpr uint64_t default_part_size = 10ULL * 1024 * 1024;
    static constexpr uint64_t default_multipart_threshold = 100ULL * 1024 * 1024;
    static constexpr uint32_t max_part_count = 10000;

    /**
     * @brief Split @p total_size bytes into parts of @p part_size
     *
     * Every part has part_size bytes except the last, which holds the
     * remainder. A zero remainder never produces a trailing empty part.
     * An empty object yields an empty plan.
     *
     * @return Parts in ascending part_number order, or invalid_argument
     *         when part_size is zero or the plan exceeds max_part_count
     */
    [[nodiscard]] static auto plan(uint64_t total_size, uint64_t part_size)
        -> result<std::vector<part_descriptor>>;

    /**
     * @brief Number of parts plan() would produce
     */
    [[nodiscard]] static auto part_count(uint64_t total_size,
                                         uint64_t part_size) noexcept -> uint64_t;

    /**
     * @brief Smallest part size >= @p requested that keeps the part count
     *        within max_part_count
     */
    [[nodiscard]] static auto fit_part_size(uint64_t total_size,
                                            uint64_t requested) noexcept -> uint64_t;

    /**
     * @brief true iff @p size is strictly greater than @p threshold
     */
    [[nodiscard]] static constexpr auto should_use_multipart(
        uint64_t size, uint64_t threshold) noexcept -> bool {
        return size > threshold;
    }
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_PART_PLANNER_H
