/**
 * @file error_codes.h
 * @brief Error codes for object_trans_system (-800 to -899 range)
 *
 * Error code ranges:
 * - -800 to -809: Network Errors
 * - -810 to -819: Storage Service Errors
 * - -820 to -829: Filesystem Errors
 * - -830 to -839: Validation Errors
 * - -840 to -849: Transfer Control Errors
 * - -850 to -859: Internal Errors
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_ERROR_CODES_H
#define KCENON_OBJECT_TRANSFER_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace kcenon::object_transfer {

/**
 * @brief Error codes reported by the store, the local filesystem and the engines
 */
enum class error_code : int32_t {
    success = 0,

    // Network Errors (-800 to -809)
    request_timeout = -800,
    connection_refused = -801,
    dns_failure = -802,
    connection_lost = -803,
    network_unreachable = -804,

    // Storage Service Errors (-810 to -819)
    access_denied = -810,
    invalid_credentials = -811,
    bucket_not_found = -812,
    object_not_found = -813,
    quota_exceeded = -814,
    upload_not_found = -815,
    http_error = -816,

    // Filesystem Errors (-820 to -829)
    disk_full = -820,
    permission_denied = -821,
    file_not_found = -822,
    file_read_error = -823,
    file_write_error = -824,
    file_already_exists = -825,

    // Validation Errors (-830 to -839)
    invalid_argument = -830,
    invalid_path = -831,
    invalid_configuration = -832,
    size_mismatch = -833,
    checksum_mismatch = -834,
    missing_part_etag = -835,

    // Transfer Control Errors (-840 to -849)
    invalid_state_transition = -840,
    transfer_not_found = -841,
    transfer_cancelled = -842,
    transfer_paused = -843,
    retry_budget_exhausted = -844,
    transfer_active = -845,

    // Internal Errors (-850 to -859)
    internal_error = -850,
    not_initialized = -851,
};

/**
 * @brief Convert error code to a short description
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case error_code::success: return "success";

        case error_code::request_timeout: return "request timeout";
        case error_code::connection_refused: return "connection refused";
        case error_code::dns_failure: return "dns resolution failed";
        case error_code::connection_lost: return "connection lost";
        case error_code::network_unreachable: return "network unreachable";

        case error_code::access_denied: return "access denied";
        case error_code::invalid_credentials: return "invalid credentials";
        case error_code::bucket_not_found: return "bucket not found";
        case error_code::object_not_found: return "object not found";
        case error_code::quota_exceeded: return "quota exceeded";
        case error_code::upload_not_found: return "multipart upload not found";
        case error_code::http_error: return "http error";

        case error_code::disk_full: return "disk full";
        case error_code::permission_denied: return "permission denied";
        case error_code::file_not_found: return "file not found";
        case error_code::file_read_error: return "file read error";
        case error_code::file_write_error: return "file write error";
        case error_code::file_already_exists: return "file already exists";

        case error_code::invalid_argument: return "invalid argument";
        case error_code::invalid_path: return "invalid path";
        case error_code::invalid_configuration: return "invalid configuration";
        case error_code::size_mismatch: return "size mismatch";
        case error_code::checksum_mismatch: return "checksum mismatch";
        case error_code::missing_part_etag: return "missing part etag";

        case error_code::invalid_state_transition: return "invalid state transition";
        case error_code::transfer_not_found: return "transfer not found";
        case error_code::transfer_cancelled: return "transfer cancelled";
        case error_code::transfer_paused: return "transfer paused";
        case error_code::retry_budget_exhausted: return "retry budget exhausted";
        case error_code::transfer_active: return "transfer is active";

        case error_code::internal_error: return "internal error";
        case error_code::not_initialized: return "not initialized";

        default: return "unknown error";
    }
}

[[nodiscard]] constexpr auto to_int(error_code code) noexcept -> int32_t {
    return static_cast<int32_t>(code);
}

/**
 * @brief Check if error code is in network error range
 */
[[nodiscard]] constexpr auto is_network_error(error_code code) noexcept -> bool {
    return to_int(code) <= -800 && to_int(code) >= -809;
}

/**
 * @brief Check if error code is in storage service error range
 */
[[nodiscard]] constexpr auto is_storage_error(error_code code) noexcept -> bool {
    return to_int(code) <= -810 && to_int(code) >= -819;
}

/**
 * @brief Check if error code is in filesystem error range
 */
[[nodiscard]] constexpr auto is_filesystem_error(error_code code) noexcept
    -> bool {
    return to_int(code) <= -820 && to_int(code) >= -829;
}

/**
 * @brief Check if error code is in validation error range
 */
[[nodiscard]] constexpr auto is_validation_error(error_code code) noexcept
    -> bool {
    return to_int(code) <= -830 && to_int(code) >= -839;
}

/**
 * @brief Check if error code is in transfer control error range
 */
[[nodiscard]] constexpr auto is_control_error(error_code code) noexcept -> bool {
    return to_int(code) <= -840 && to_int(code) >= -849;
}

/**
 * @brief Check if error code is in internal error range
 */
[[nodiscard]] constexpr auto is_internal_error(error_code code) noexcept
    -> bool {
    return to_int(code) <= -850 && to_int(code) >= -859;
}

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_ERROR_CODES_H
