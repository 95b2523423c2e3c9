/**
 * @file retry_policy.h
 * @brief Exponential backoff retry policy and the with_retry helper
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_RETRY_POLICY_H
#define KCENON_OBJECT_TRANSFER_CORE_RETRY_POLICY_H

#include <kcenon/object_transfer/core/cancellation_token.h>
#include <kcenon/object_transfer/core/error_classifier.h>
#include <kcenon/object_transfer/core/types.h>

#include <chrono>
#include <cstddef>
#include <set>
#include <string_view>
#include <thread>
#include <type_traits>

namespace kcenon::object_transfer {

/**
 * @brief Retry policy configuration
 *
 * Attempts are 1-indexed and max_attempts counts the first attempt, so the
 * default policy performs at most two retries. A policy value is copied at
 * the start of a retry sequence and never changes underneath it.
 */
struct retry_policy {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_factor = 2.0;
    std::set<error_category> retryable_categories{error_category::network};
    bool use_jitter = false;

    /**
     * @brief Delay before the retry that follows attempt @p attempt
     *
     * min(max_delay, base_delay * backoff_factor^(attempt - 1)); with
     * use_jitter the result is scaled by a random factor in [0.5, 1.5)
     * and capped at max_delay again.
     */
    [[nodiscard]] auto compute_delay(std::size_t attempt) const
        -> std::chrono::milliseconds;

    /**
     * @brief Whether another attempt is allowed after @p attempt failed
     */
    [[nodiscard]] auto should_retry(const classified_error& err,
                                    std::size_t attempt) const -> bool;

    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Policy that performs exactly one attempt
     */
    [[nodiscard]] static auto no_retry() -> retry_policy;
};

namespace detail {

void log_retry_scheduled(std::string_view label,
                         std::size_t attempt,
                         std::chrono::milliseconds delay,
                         const classified_error& err);

void log_retry_exhausted(std::string_view label,
                         std::size_t attempt,
                         const classified_error& err);

}  // namespace detail

/**
 * @brief Run @p operation until it succeeds or the policy gives up
 *
 * @p operation returns a result<T>. A failure is classified; retryable
 * failures are retried after compute_delay(attempt) while attempts remain,
 * everything else is returned unchanged. When @p token is given the
 * backoff sleep wakes early on pause/cancel and the stop error is returned.
 *
 * @code
 * auto etag = with_retry(policy, [&] {
 *     return store->upload_part(key, upload_id, 3, bytes, ctx);
 * }, "upload_part#3", &token);
 * @endcode
 */
template <typename Operation>
auto with_retry(const retry_policy& policy,
                Operation&& operation,
                std::string_view label,
                const cancellation_token* token = nullptr)
    -> std::invoke_result_t<Operation&> {
    std::size_t attempt = 1;
    while (true) {
        if (token && token->is_stop_requested()) {
            return unexpected{token->to_error()};
        }

        auto res = operation();
        if (res) {
            return res;
        }

        auto classified = error_classifier::classify(res.error());
        if (!policy.should_retry(classified, attempt)) {
            detail::log_retry_exhausted(label, attempt, classified);
            return res;
        }

        auto delay = policy.compute_delay(attempt);
        detail::log_retry_scheduled(label, attempt, delay, classified);

        if (token) {
            if (token->wait_for(delay)) {
                return unexpected{token->to_error()};
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
        ++attempt;
    }
}

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_RETRY_POLICY_H
