/**
 * @file retry_policy.h
 * @brief Exponential backoff retry driven by response classification
 */

#ifndef KCENON_CHUNKED_UPLOAD_TRANSPORT_RETRY_POLICY_H
#define KCENON_CHUNKED_UPLOAD_TRANSPORT_RETRY_POLICY_H

#include "kcenon/chunked_upload/core/cancellation_token.h"
#include "kcenon/chunked_upload/core/logging.h"
#include "kcenon/chunked_upload/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace kcenon::chunked_upload {

/**
 * @brief How a single request attempt turned out
 */
enum class response_class {
    success,     ///< Expected status and decodable body
    fatal_auth,  ///< Authorization rejected; never retried
    transient,   ///< Anything else; eligible for retry
};

[[nodiscard]] constexpr auto to_string(response_class cls) -> const char* {
    switch (cls) {
        case response_class::success: return "success";
        case response_class::fatal_auth: return "fatal_auth";
        case response_class::transient: return "transient";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of one attempt: its classification plus value or error
 */
template <typename T>
struct classified {
    response_class classification = response_class::transient;
    result<T> outcome;

    [[nodiscard]] static auto ok(result<T> value) -> classified {
        return classified{response_class::success, std::move(value)};
    }

    [[nodiscard]] static auto fail(response_class cls, error err) -> classified {
        return classified{cls, result<T>(unexpected{std::move(err)})};
    }
};

/**
 * @brief Exponential backoff configuration
 *
 * Defaults: 500 ms first delay growing by 1.5x up to 60 s, jittered by a
 * factor in [0.5, 1.5], at most 10 attempts and 15 minutes per operation.
 * A zero max_attempts or max_elapsed_time removes that bound.
 */
struct retry_policy {
    std::size_t max_attempts = 10;
    std::chrono::milliseconds initial_delay{500};
    std::chrono::milliseconds max_delay{60000};
    double backoff_multiplier = 1.5;
    bool use_jitter = true;
    std::chrono::milliseconds max_elapsed_time{15 * 60 * 1000};

    [[nodiscard]] auto validate() const -> result<void> {
        if (initial_delay.count() < 0 || max_delay.count() < 0 || max_elapsed_time.count() < 0) {
            return unexpected{error{error_code::invalid_retry_policy,
                "retry delays must not be negative"}};
        }
        if (max_delay < initial_delay) {
            return unexpected{error{error_code::invalid_retry_policy,
                "max_delay must not be smaller than initial_delay"}};
        }
        if (backoff_multiplier < 1.0) {
            return unexpected{error{error_code::invalid_retry_policy,
                "backoff_multiplier must be at least 1.0"}};
        }
        return {};
    }

    /**
     * @brief Policy without waits, for tests and tooling
     */
    [[nodiscard]] static auto immediate(std::size_t attempts) -> retry_policy {
        retry_policy policy;
        policy.max_attempts = attempts;
        policy.initial_delay = std::chrono::milliseconds(0);
        policy.max_delay = std::chrono::milliseconds(0);
        policy.use_jitter = false;
        return policy;
    }
};

/**
 * @brief Calculate delay with exponential backoff and jitter
 * @param policy Retry policy configuration
 * @param attempt Attempt that just failed (1-based)
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy,
                                         std::size_t attempt) -> std::chrono::milliseconds;

/**
 * @brief Runs an attempt function until it succeeds, fails fatally or
 *        exhausts the policy
 *
 * A fatal_auth classification returns authentication_failed without any
 * further attempt. Backoff sleeps end early when the cancellation token
 * fires, in which case operation_cancelled is returned.
 */
class retry_executor {
public:
    /// Sleeps for the delay; returns false if interrupted
    using sleep_function = std::function<bool(std::chrono::milliseconds)>;

    explicit retry_executor(retry_policy policy = {},
                            std::shared_ptr<cancellation_token> token = nullptr)
        : policy_(std::move(policy)), token_(std::move(token)) {}

    /**
     * @brief Replace the sleep used between attempts
     */
    auto with_sleep_function(sleep_function sleeper) -> retry_executor& {
        sleeper_ = std::move(sleeper);
        return *this;
    }

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

    [[nodiscard]] auto token() const -> const std::shared_ptr<cancellation_token>& {
        return token_;
    }

    /**
     * @brief Execute an operation under the retry policy
     * @tparam T Value type produced on success
     * @tparam Attempt Callable returning classified<T>
     * @param operation Name used in logs and error messages
     * @param attempt The request attempt
     */
    template <typename T, typename Attempt>
    [[nodiscard]] auto execute(std::string_view operation, Attempt&& attempt) const
        -> result<T> {
        auto started = std::chrono::steady_clock::now();
        std::size_t attempt_no = 0;

        while (true) {
            if (token_ && token_->is_cancelled()) {
                return unexpected{error{error_code::operation_cancelled,
                    std::string(operation) + " cancelled"}};
            }

            ++attempt_no;
            classified<T> step = attempt();

            if (step.classification == response_class::success && step.outcome.has_value()) {
                return std::move(step.outcome);
            }

            const auto& failure = step.outcome.error();

            if (step.classification == response_class::fatal_auth) {
                return unexpected{error{error_code::authentication_failed, failure.message}};
            }

            if (failure.code == error_code::operation_cancelled) {
                return unexpected{failure};
            }

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            bool attempts_spent = policy_.max_attempts != 0 &&
                                  attempt_no >= policy_.max_attempts;
            bool time_spent = policy_.max_elapsed_time.count() != 0 &&
                              elapsed >= policy_.max_elapsed_time;

            if (attempts_spent || time_spent) {
                CU_LOG_ERROR(log_category::retry,
                             std::string(operation) + " gave up after " +
                                 std::to_string(attempt_no) + " attempts: " + failure.message);
                return unexpected{error{error_code::retries_exhausted,
                    std::string(operation) + " failed after " + std::to_string(attempt_no) +
                        " attempts: " + failure.message}};
            }

            auto delay = calculate_retry_delay(policy_, attempt_no);
            CU_LOG_WARN(log_category::retry,
                        std::string(operation) + " attempt " + std::to_string(attempt_no) +
                            " failed (" + failure.message + "), retrying in " +
                            std::to_string(delay.count()) + " ms");

            if (!sleep(delay)) {
                return unexpected{error{error_code::operation_cancelled,
                    std::string(operation) + " cancelled during backoff"}};
            }
        }
    }

private:
    [[nodiscard]] auto sleep(std::chrono::milliseconds delay) const -> bool {
        if (sleeper_) {
            return sleeper_(delay);
        }
        if (token_) {
            return token_->sleep_for(delay);
        }
        std::this_thread::sleep_for(delay);
        return true;
    }

    retry_policy policy_;
    std::shared_ptr<cancellation_token> token_;
    sleep_function sleeper_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_TRANSPORT_RETRY_POLICY_H
