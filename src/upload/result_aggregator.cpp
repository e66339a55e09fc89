/**
 * @file result_aggregator.cpp
 * @brief Result aggregation implementation
 */

#include "kcenon/chunked_upload/upload/result_aggregator.h"

#include "kcenon/chunked_upload/core/logging.h"

#include <algorithm>

namespace kcenon::chunked_upload {

void result_aggregator::submit(chunk_result outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!outcome.succeeded()) {
            if (!failure_) {
                failure_ = outcome.failure;
            }
        } else {
            results_.push_back(std::move(outcome));
        }
    }
    cv_.notify_all();
}

void result_aggregator::fail(error err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_) {
            failure_ = std::move(err);
        }
    }
    cv_.notify_all();
}

void result_aggregator::seal(uint64_t expected_count) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        expected_ = expected_count;
    }
    cv_.notify_all();
}

auto result_aggregator::collect() -> result<ordered_identifier_list> {
    std::vector<chunk_result> results;
    uint64_t expected = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return failure_.has_value() || is_complete(); });

        if (failure_) {
            CU_LOG_ERROR(log_category::aggregator, "Chunk processing failed: " +
                                                       failure_->message);
            return unexpected{*failure_};
        }

        results = results_;
        expected = *expected_;
    }

    return order(std::move(results), expected);
}

auto result_aggregator::has_failed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_.has_value();
}

auto result_aggregator::first_failure() const -> std::optional<error> {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

auto result_aggregator::received_count() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

auto result_aggregator::order(std::vector<chunk_result> results, uint64_t expected_count)
    -> result<ordered_identifier_list> {
    for (const auto& r : results) {
        if (!r.succeeded()) {
            return unexpected{*r.failure};
        }
    }

    if (results.size() != expected_count) {
        return unexpected{error{error_code::protocol_invariant_violation,
            "expected " + std::to_string(expected_count) + " chunk results, got " +
            std::to_string(results.size())}};
    }

    std::sort(results.begin(), results.end(),
              [](const chunk_result& a, const chunk_result& b) { return a.index < b.index; });

    ordered_identifier_list manifest;
    manifest.reserve(results.size());
    for (uint64_t i = 0; i < results.size(); ++i) {
        if (results[i].index != i) {
            return unexpected{error{error_code::protocol_invariant_violation,
                "chunk indices are not contiguous: expected " + std::to_string(i) +
                ", found " + std::to_string(results[i].index)}};
        }
        manifest.push_back(results[i].identifier);
    }

    CU_LOG_DEBUG(log_category::aggregator,
                 "Ordered " + std::to_string(manifest.size()) + " chunk identifiers");
    return manifest;
}

auto result_aggregator::is_complete() const -> bool {
    return expected_.has_value() && results_.size() >= *expected_;
}

}  // namespace kcenon::chunked_upload
