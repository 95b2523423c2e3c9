/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for retry_policy and with_retry
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/core/retry_policy.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace kcenon::object_transfer::test {

using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Keep the default attempt count but do not sleep for seconds
        fast_.base_delay = 1ms;
        fast_.max_delay = 5ms;
    }

    retry_policy fast_;
};

TEST_F(RetryPolicyTest, Defaults) {
    retry_policy policy;
    EXPECT_EQ(policy.max_attempts, 3u);
    EXPECT_EQ(policy.base_delay, 1000ms);
    EXPECT_EQ(policy.max_delay, 30000ms);
    EXPECT_DOUBLE_EQ(policy.backoff_factor, 2.0);
    EXPECT_FALSE(policy.use_jitter);
    EXPECT_EQ(policy.retryable_categories.count(error_category::network), 1u);
    EXPECT_TRUE(policy.validate().has_value());
}

TEST_F(RetryPolicyTest, ComputeDelay_ExponentialAndCapped) {
    retry_policy policy;
    EXPECT_EQ(policy.compute_delay(1), 1000ms);
    EXPECT_EQ(policy.compute_delay(2), 2000ms);
    EXPECT_EQ(policy.compute_delay(3), 4000ms);
    EXPECT_EQ(policy.compute_delay(6), 30000ms);
    EXPECT_EQ(policy.compute_delay(50), 30000ms);
}

TEST_F(RetryPolicyTest, ComputeDelay_JitterStaysInRange) {
    retry_policy policy;
    policy.use_jitter = true;
    for (int i = 0; i < 100; ++i) {
        auto delay = policy.compute_delay(2);
        EXPECT_GE(delay, 1000ms);
        EXPECT_LT(delay, 3000ms);
    }
}

TEST_F(RetryPolicyTest, ComputeDelay_JitterNeverExceedsMaxDelay) {
    retry_policy policy;
    policy.use_jitter = true;
    for (int i = 0; i < 200; ++i) {
        EXPECT_LE(policy.compute_delay(10), policy.max_delay);
    }
}

TEST_F(RetryPolicyTest, ShouldRetry_RespectsCategoryAndBudget) {
    retry_policy policy;
    auto timeout = error_classifier::classify(error{error_code::request_timeout});
    auto denied = error_classifier::classify(error{error_code::access_denied});

    EXPECT_TRUE(policy.should_retry(timeout, 1));
    EXPECT_TRUE(policy.should_retry(timeout, 2));
    EXPECT_FALSE(policy.should_retry(timeout, 3));
    EXPECT_FALSE(policy.should_retry(denied, 1));
}

TEST_F(RetryPolicyTest, ShouldRetry_CategoryNotInSet) {
    retry_policy policy;
    policy.retryable_categories.clear();
    auto timeout = error_classifier::classify(error{error_code::request_timeout});
    EXPECT_FALSE(policy.should_retry(timeout, 1));
}

TEST_F(RetryPolicyTest, Validate_RejectsBadValues) {
    retry_policy zero_attempts;
    zero_attempts.max_attempts = 0;
    EXPECT_FALSE(zero_attempts.validate().has_value());

    retry_policy shrinking;
    shrinking.backoff_factor = 0.5;
    EXPECT_FALSE(shrinking.validate().has_value());

    retry_policy inverted;
    inverted.base_delay = 10s;
    inverted.max_delay = 1s;
    auto res = inverted.validate();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::invalid_configuration);
}

TEST_F(RetryPolicyTest, NoRetry_SingleAttempt) {
    EXPECT_EQ(retry_policy::no_retry().max_attempts, 1u);
}

TEST_F(RetryPolicyTest, WithRetry_FailsTwiceThenSucceeds) {
    int calls = 0;
    auto res = with_retry(fast_, [&]() -> result<int> {
        ++calls;
        if (calls < 3) {
            return unexpected{error{error_code::request_timeout, "timed out"}};
        }
        return 42;
    }, "flaky");

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 42);
    EXPECT_EQ(calls, 3);
}

TEST_F(RetryPolicyTest, WithRetry_NonRetryableCalledOnce) {
    int calls = 0;
    auto res = with_retry(fast_, [&]() -> result<int> {
        ++calls;
        return unexpected{error{error_code::access_denied, "403 Forbidden"}};
    }, "denied");

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::access_denied);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, WithRetry_ExhaustedReturnsLastError) {
    int calls = 0;
    auto res = with_retry(fast_, [&]() -> result<void> {
        ++calls;
        return unexpected{error{error_code::connection_lost,
                                "attempt " + std::to_string(calls)}};
    }, "always-down");

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().message, "attempt 3");
    EXPECT_EQ(calls, 3);
}

TEST_F(RetryPolicyTest, WithRetry_StopsWhenTokenAlreadySet) {
    cancellation_token token;
    token.request_cancel();

    int calls = 0;
    auto res = with_retry(fast_, [&]() -> result<int> {
        ++calls;
        return 1;
    }, "never", &token);

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(calls, 0);
}

TEST_F(RetryPolicyTest, WithRetry_PauseInterruptsBackoff) {
    retry_policy slow;
    slow.base_delay = 10s;
    slow.max_delay = 10s;

    cancellation_token token;
    std::atomic<int> calls{0};

    std::thread pauser([&] {
        std::this_thread::sleep_for(50ms);
        token.request_pause();
    });

    auto started = std::chrono::steady_clock::now();
    auto res = with_retry(slow, [&]() -> result<int> {
        ++calls;
        return unexpected{error{error_code::request_timeout}};
    }, "slow", &token);
    auto elapsed = std::chrono::steady_clock::now() - started;
    pauser.join();

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::transfer_paused);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_LT(elapsed, 5s);
}

}  // namespace kcenon::object_transfer::test
