/**
 * @file retry_policy.cpp
 * @brief Implementation of retry_policy
 */

#include "kcenon/object_transfer/core/retry_policy.h"

#include "kcenon/object_transfer/core/logging.h"

#include <algorithm>
#include <random>

namespace kcenon::object_transfer {

auto retry_policy::compute_delay(std::size_t attempt) const
    -> std::chrono::milliseconds {
    auto delay = static_cast<double>(base_delay.count());

    for (std::size_t i = 1; i < attempt; ++i) {
        delay *= backoff_factor;
        if (delay >= static_cast<double>(max_delay.count())) {
            break;
        }
    }

    delay = std::min(delay, static_cast<double>(max_delay.count()));

    if (use_jitter) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay = std::min(delay * dis(gen), static_cast<double>(max_delay.count()));
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto retry_policy::should_retry(const classified_error& err,
                                std::size_t attempt) const -> bool {
    if (!err.retryable || attempt >= max_attempts) {
        return false;
    }
    return retryable_categories.count(err.category) > 0;
}

auto retry_policy::validate() const -> result<void> {
    if (max_attempts == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "retry max_attempts must be at least 1"}};
    }
    if (backoff_factor < 1.0) {
        return unexpected{error{error_code::invalid_configuration,
                                "retry backoff_factor must be >= 1.0"}};
    }
    if (base_delay.count() < 0 || base_delay > max_delay) {
        return unexpected{error{error_code::invalid_configuration,
                                "retry base_delay must be within [0, max_delay]"}};
    }
    return {};
}

auto retry_policy::no_retry() -> retry_policy {
    retry_policy policy;
    policy.max_attempts = 1;
    return policy;
}

namespace detail {

void log_retry_scheduled(std::string_view label,
                         std::size_t attempt,
                         std::chrono::milliseconds delay,
                         const classified_error& err) {
    transfer_log_context ctx;
    ctx.attempt = static_cast<uint32_t>(attempt);
    ctx.duration_ms = static_cast<uint64_t>(delay.count());
    ctx.error_message = err.message;
    OT_LOG_WARN_CTX(log_category::retry,
                    std::string(label) + " failed (" +
                        std::string(to_string(err.category)) + "), retrying",
                    ctx);
}

void log_retry_exhausted(std::string_view label,
                         std::size_t attempt,
                         const classified_error& err) {
    transfer_log_context ctx;
    ctx.attempt = static_cast<uint32_t>(attempt);
    ctx.error_message = err.message;
    auto reason = err.retryable ? "retry budget exhausted" : "not retryable";
    OT_LOG_ERROR_CTX(log_category::retry,
                     std::string(label) + " gave up: " + reason, ctx);
}

}  // namespace detail

}  // namespace kcenon::object_transfer
