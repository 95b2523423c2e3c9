/**
 * @file error_classifier.cpp
 * @brief Implementation of error classification
 */

#include "kcenon/object_transfer/core/error_classifier.h"

namespace kcenon::object_transfer {

namespace {

struct classification {
    error_category category;
    error_severity severity;
    bool retryable;
};

auto severity_from_status(const std::optional<int>& status) -> error_severity {
    if (status && *status >= 500) {
        return error_severity::high;
    }
    return error_severity::medium;
}

auto classify_code(error_code code, const std::optional<int>& status)
    -> classification {
    switch (code) {
        // Network
        case error_code::request_timeout:
            return {error_category::network, error_severity::medium, true};
        case error_code::connection_refused:
        case error_code::dns_failure:
            return {error_category::network, error_severity::high, true};
        case error_code::connection_lost:
        case error_code::network_unreachable:
            return {error_category::network, error_severity::medium, true};

        // Storage service; credential problems never self-resolve
        case error_code::access_denied:
            return {error_category::storage_service, error_severity::high, false};
        case error_code::invalid_credentials:
            return {error_category::storage_service, error_severity::critical, false};
        case error_code::bucket_not_found:
        case error_code::object_not_found:
        case error_code::quota_exceeded:
        case error_code::upload_not_found:
            return {error_category::storage_service, error_severity::high, false};

        // Local filesystem
        case error_code::disk_full:
            return {error_category::filesystem, error_severity::critical, false};
        case error_code::permission_denied:
            return {error_category::filesystem, error_severity::high, false};
        case error_code::file_not_found:
        case error_code::file_read_error:
        case error_code::file_write_error:
        case error_code::file_already_exists:
            return {error_category::filesystem, error_severity::medium, false};

        // Validation
        case error_code::size_mismatch:
        case error_code::checksum_mismatch:
        case error_code::missing_part_etag:
            return {error_category::validation, error_severity::high, false};
        case error_code::invalid_argument:
        case error_code::invalid_path:
        case error_code::invalid_configuration:
            return {error_category::validation, error_severity::medium, false};

        case error_code::http_error:
        default:
            break;
    }

    if (is_control_error(code)) {
        return {error_category::validation, error_severity::low, false};
    }
    if (is_internal_error(code)) {
        return {error_category::unknown, error_severity::high, false};
    }
    return {error_category::unknown, severity_from_status(status), false};
}

}  // namespace

auto error_classifier::classify(const error& raw) -> classified_error {
    auto code = raw.code;

    // Unclassified HTTP responses are narrowed by status first
    if (code == error_code::http_error && raw.status_code) {
        if (*raw.status_code == 403) {
            code = error_code::access_denied;
        } else if (*raw.status_code == 404) {
            code = error_code::object_not_found;
        }
    }

    auto c = classify_code(code, raw.status_code);

    classified_error out;
    out.category = c.category;
    out.severity = c.severity;
    out.retryable = c.retryable;
    out.code = code;
    out.status_code = raw.status_code;
    out.message = raw.message.empty() ? std::string(to_string(code)) : raw.message;
    out.timestamp = std::chrono::system_clock::now();
    return out;
}

auto error_classifier::from_http_status(int status, std::string message) -> error {
    switch (status) {
        case 403:
            return error{error_code::access_denied, std::move(message), status};
        case 404:
            return error{error_code::object_not_found, std::move(message), status};
        default:
            return error{error_code::http_error, std::move(message), status};
    }
}

auto error_classifier::from_filesystem(const std::error_code& ec,
                                       error_code fallback,
                                       const std::string& context) -> error {
    auto message = context + ": " + ec.message();
    if (ec == std::errc::no_space_on_device) {
        return error{error_code::disk_full, message};
    }
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted) {
        return error{error_code::permission_denied, message};
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return error{error_code::file_not_found, message};
    }
    return error{fallback, message};
}

// ============================================================================
// User-facing text
// ============================================================================

auto classified_error::title() const -> std::string {
    switch (code) {
        case error_code::request_timeout: return "Connection Timeout";
        case error_code::connection_refused: return "Connection Refused";
        case error_code::dns_failure: return "Server Not Found";
        case error_code::connection_lost:
        case error_code::network_unreachable: return "No Internet Connection";
        case error_code::access_denied: return "Access Denied";
        case error_code::invalid_credentials: return "Invalid Credentials";
        case error_code::bucket_not_found: return "Bucket Not Found";
        case error_code::object_not_found: return "File Not Found";
        case error_code::quota_exceeded: return "Storage Quota Exceeded";
        case error_code::upload_not_found: return "Upload Expired";
        case error_code::disk_full: return "Disk Full";
        case error_code::permission_denied: return "Permission Denied";
        case error_code::file_not_found: return "Local File Not Found";
        case error_code::checksum_mismatch: return "Integrity Check Failed";
        default: break;
    }

    switch (category) {
        case error_category::network: return "Network Error";
        case error_category::storage_service: return "Storage Service Error";
        case error_category::filesystem: return "File System Error";
        case error_category::validation: return "Validation Error";
        default: return "Unexpected Error";
    }
}

auto classified_error::suggestions() const -> std::vector<std::string> {
    std::vector<std::string> out;

    switch (code) {
        case error_code::request_timeout:
            out = {"Check your internet connection",
                   "Try again in a few moments",
                   "Contact your network administrator if the problem persists"};
            break;
        case error_code::connection_refused:
        case error_code::dns_failure:
        case error_code::connection_lost:
        case error_code::network_unreachable:
            out = {"Check your internet connection",
                   "Verify your network settings",
                   "Verify the endpoint address is correct"};
            break;
        case error_code::access_denied:
            out = {"Verify your AWS credentials",
                   "Check your S3 bucket permissions",
                   "Ensure your IAM user has the required permissions"};
            break;
        case error_code::invalid_credentials:
            out = {"Update your AWS access key and secret key",
                   "Check if your credentials have expired",
                   "Verify the credentials are for the correct AWS account"};
            break;
        case error_code::bucket_not_found:
            out = {"Verify the bucket name is correct",
                   "Check if the bucket exists in the specified region",
                   "Ensure you have access to the bucket"};
            break;
        case error_code::object_not_found:
            out = {"Verify the object key is correct",
                   "Refresh the listing, the object may have been deleted"};
            break;
        case error_code::disk_full:
            out = {"Free up disk space",
                   "Delete unnecessary files",
                   "Move files to external storage"};
            break;
        case error_code::permission_denied:
            out = {"Check file and folder permissions",
                   "Ensure the file is not in use by another application"};
            break;
        case error_code::checksum_mismatch:
        case error_code::size_mismatch:
            out = {"Download the file again",
                   "Check whether the object was modified during the transfer"};
            break;
        default:
            if (retryable) {
                out = {"Try the operation again", "Wait a moment and retry"};
            }
            break;
    }

    out.emplace_back("Check the application logs for more details");
    return out;
}

auto classified_error::to_error() const -> error {
    error e{code, message};
    e.status_code = status_code;
    return e;
}

}  // namespace kcenon::object_transfer
