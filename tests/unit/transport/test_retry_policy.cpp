/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for backoff calculation and retry_executor
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/transport/retry_policy.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::chunked_upload::test {

using namespace std::chrono_literals;

// ============================================================================
// retry_policy
// ============================================================================

class RetryPolicyTest : public ::testing::Test {};

TEST_F(RetryPolicyTest, Defaults) {
    retry_policy policy;

    EXPECT_EQ(policy.max_attempts, 10u);
    EXPECT_EQ(policy.initial_delay, 500ms);
    EXPECT_EQ(policy.max_delay, 60000ms);
    EXPECT_DOUBLE_EQ(policy.backoff_multiplier, 1.5);
    EXPECT_TRUE(policy.use_jitter);
    EXPECT_EQ(policy.max_elapsed_time, std::chrono::minutes(15));
    EXPECT_TRUE(policy.validate().has_value());
}

TEST_F(RetryPolicyTest, ValidateRejectsInconsistentDelays) {
    retry_policy policy;
    policy.initial_delay = 1000ms;
    policy.max_delay = 10ms;

    auto valid = policy.validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, error_code::invalid_retry_policy);
}

TEST_F(RetryPolicyTest, ValidateRejectsShrinkingMultiplier) {
    retry_policy policy;
    policy.backoff_multiplier = 0.5;

    EXPECT_FALSE(policy.validate().has_value());
}

TEST_F(RetryPolicyTest, DelayGrowsExponentiallyWithoutJitter) {
    retry_policy policy;
    policy.initial_delay = 100ms;
    policy.max_delay = 1000ms;
    policy.backoff_multiplier = 2.0;
    policy.use_jitter = false;

    EXPECT_EQ(calculate_retry_delay(policy, 1), 100ms);
    EXPECT_EQ(calculate_retry_delay(policy, 2), 200ms);
    EXPECT_EQ(calculate_retry_delay(policy, 3), 400ms);
    EXPECT_EQ(calculate_retry_delay(policy, 4), 800ms);
    EXPECT_EQ(calculate_retry_delay(policy, 5), 1000ms);
    EXPECT_EQ(calculate_retry_delay(policy, 20), 1000ms);
}

TEST_F(RetryPolicyTest, JitterStaysWithinBounds) {
    retry_policy policy;
    policy.initial_delay = 1000ms;
    policy.max_delay = 1000ms;

    for (int i = 0; i < 100; ++i) {
        auto delay = calculate_retry_delay(policy, 1);
        EXPECT_GE(delay, 500ms);
        EXPECT_LE(delay, 1500ms);
    }
}

TEST_F(RetryPolicyTest, ImmediatePolicyHasNoDelay) {
    auto policy = retry_policy::immediate(3);

    EXPECT_EQ(policy.max_attempts, 3u);
    EXPECT_EQ(calculate_retry_delay(policy, 1), 0ms);
    EXPECT_EQ(calculate_retry_delay(policy, 3), 0ms);
}

// ============================================================================
// retry_executor
// ============================================================================

class RetryExecutorTest : public ::testing::Test {
protected:
    auto recording_executor(retry_policy policy,
                            std::shared_ptr<cancellation_token> token = nullptr)
        -> retry_executor {
        retry_executor executor(std::move(policy), std::move(token));
        executor.with_sleep_function([this](std::chrono::milliseconds delay) {
            sleeps_.push_back(delay);
            return true;
        });
        return executor;
    }

    static auto transient(const std::string& message) -> classified<int> {
        return classified<int>::fail(response_class::transient,
                                     error{error_code::transient_remote_error, message});
    }

    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(RetryExecutorTest, SucceedsFirstTime) {
    auto executor = recording_executor(retry_policy::immediate(5));
    int calls = 0;

    auto result = executor.execute<int>("op", [&]() {
        ++calls;
        return classified<int>::ok(42);
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryExecutorTest, TwoTransientFailuresThenSuccess) {
    retry_policy policy;
    policy.use_jitter = false;
    auto executor = recording_executor(policy);
    int calls = 0;

    auto result = executor.execute<int>("create upload session", [&]() {
        ++calls;
        if (calls <= 2) {
            return transient("HTTP 500");
        }
        return classified<int>::ok(7);
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], 500ms);
    EXPECT_EQ(sleeps_[1], 750ms);
}

TEST_F(RetryExecutorTest, FatalAuthIsNeverRetried) {
    auto executor = recording_executor(retry_policy::immediate(10));
    int calls = 0;

    auto result = executor.execute<int>("probe chunk", [&]() {
        ++calls;
        return classified<int>::fail(response_class::fatal_auth,
                                     error{error_code::authentication_failed, "HTTP 401"});
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::authentication_failed);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RetryExecutorTest, ExhaustsAttempts) {
    auto executor = recording_executor(retry_policy::immediate(4));
    int calls = 0;

    auto result = executor.execute<int>("upload chunk", [&]() {
        ++calls;
        return transient("HTTP 503");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::retries_exhausted);
    EXPECT_NE(result.error().message.find("HTTP 503"), std::string::npos);
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(sleeps_.size(), 3u);
}

TEST_F(RetryExecutorTest, ElapsedTimeBoundStopsRetrying) {
    auto policy = retry_policy::immediate(0);
    policy.max_elapsed_time = 1ms;
    auto executor = recording_executor(policy);
    int calls = 0;

    auto result = executor.execute<int>("op", [&]() {
        ++calls;
        std::this_thread::sleep_for(2ms);
        return transient("slow");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::retries_exhausted);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryExecutorTest, VoidOperation) {
    auto executor = recording_executor(retry_policy::immediate(3));
    int calls = 0;

    auto result = executor.execute<void>("finalize upload", [&]() {
        ++calls;
        if (calls == 1) {
            return classified<void>::fail(response_class::transient,
                                          error{error_code::transient_remote_error, "HTTP 502"});
        }
        return classified<void>::ok({});
    });

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(calls, 2);
}

TEST_F(RetryExecutorTest, CancelledTokenStopsBeforeFirstAttempt) {
    auto token = std::make_shared<cancellation_token>();
    token->cancel();
    auto executor = recording_executor(retry_policy::immediate(3), token);
    int calls = 0;

    auto result = executor.execute<int>("op", [&]() {
        ++calls;
        return classified<int>::ok(1);
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::operation_cancelled);
    EXPECT_EQ(calls, 0);
}

TEST_F(RetryExecutorTest, CancellationWakesBackoffSleep) {
    auto token = std::make_shared<cancellation_token>();
    retry_policy policy;
    policy.initial_delay = std::chrono::milliseconds(60000);
    policy.use_jitter = false;
    retry_executor executor(policy, token);

    std::thread canceller([token]() {
        std::this_thread::sleep_for(50ms);
        token->cancel();
    });

    auto started = std::chrono::steady_clock::now();
    auto result = executor.execute<int>("op", [&]() { return transient("HTTP 500"); });
    auto waited = std::chrono::steady_clock::now() - started;
    canceller.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::operation_cancelled);
    EXPECT_LT(waited, std::chrono::seconds(10));
}

TEST_F(RetryExecutorTest, InterruptedSleepFunctionCancels) {
    retry_executor executor(retry_policy::immediate(5));
    executor.with_sleep_function([](std::chrono::milliseconds) { return false; });
    int calls = 0;

    auto result = executor.execute<int>("op", [&]() {
        ++calls;
        return transient("HTTP 500");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::operation_cancelled);
    EXPECT_EQ(calls, 1);
}

}  // namespace kcenon::chunked_upload::test
