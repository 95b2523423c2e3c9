/**
 * @file error_classifier.h
 * @brief Classification of store, network and filesystem failures
 *
 * Turns a raw error reported by the object store or the local filesystem
 * into a classified_error with a category, severity and retryability.
 * Retryability is a pure function of the error code (and HTTP status for
 * unclassified responses); callers cannot override it per instance.
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_ERROR_CLASSIFIER_H
#define KCENON_OBJECT_TRANSFER_CORE_ERROR_CLASSIFIER_H

#include <kcenon/object_transfer/core/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Error taxonomy
 */
enum class error_category {
    network,
    storage_service,
    filesystem,
    validation,
    unknown
};

[[nodiscard]] constexpr auto to_string(error_category category) noexcept
    -> std::string_view {
    switch (category) {
        case error_category::network: return "network";
        case error_category::storage_service: return "storage-service";
        case error_category::filesystem: return "filesystem";
        case error_category::validation: return "validation";
        case error_category::unknown: return "unknown";
        default: return "unknown";
    }
}

/**
 * @brief Error severity
 */
enum class error_severity {
    low,
    medium,
    high,
    critical
};

[[nodiscard]] constexpr auto to_string(error_severity severity) noexcept
    -> std::string_view {
    switch (severity) {
        case error_severity::low: return "low";
        case error_severity::medium: return "medium";
        case error_severity::high: return "high";
        case error_severity::critical: return "critical";
        default: return "unknown";
    }
}

/**
 * @brief A raw error after classification
 */
struct classified_error {
    error_category category = error_category::unknown;
    error_severity severity = error_severity::medium;
    bool retryable = false;
    error_code code = error_code::internal_error;
    std::optional<int> status_code;
    std::string message;
    std::chrono::system_clock::time_point timestamp;

    /**
     * @brief Short user-facing title, e.g. "Connection Timeout"
     */
    [[nodiscard]] auto title() const -> std::string;

    /**
     * @brief Actionable suggestions for the user, most relevant first
     */
    [[nodiscard]] auto suggestions() const -> std::vector<std::string>;

    /**
     * @brief Convert back to a plain error (keeps code, message and status)
     */
    [[nodiscard]] auto to_error() const -> error;
};

/**
 * @brief Stateless error classifier
 *
 * @code
 * auto classified = error_classifier::classify(
 *     error{error_code::access_denied, "403 Forbidden"});
 * // classified.category == error_category::storage_service
 * // classified.severity == error_severity::high
 * // classified.retryable == false
 * @endcode
 */
class error_classifier {
public:
    [[nodiscard]] static auto classify(const error& raw) -> classified_error;

    /**
     * @brief Map an HTTP status returned by the store to an error code
     *
     * 403 and 404 map to access_denied and object_not_found; everything
     * else stays http_error and is classified by its status.
     */
    [[nodiscard]] static auto from_http_status(int status, std::string message)
        -> error;

    /**
     * @brief Map a std::error_code from a filesystem operation
     *
     * ENOSPC, EACCES/EPERM and ENOENT get their dedicated codes, anything
     * else becomes @p fallback.
     */
    [[nodiscard]] static auto from_filesystem(const std::error_code& ec,
                                              error_code fallback,
                                              const std::string& context) -> error;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_ERROR_CLASSIFIER_H
