/**
 * @file result_aggregator.h
 * @brief Collects per-chunk outcomes into an ordered manifest
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_RESULT_AGGREGATOR_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_RESULT_AGGREGATOR_H

#include "kcenon/chunked_upload/core/chunk_types.h"
#include "kcenon/chunked_upload/core/types.h"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Thread-safe sink for chunk results
 *
 * Workers submit() in any order. collect() blocks until either the first
 * failure arrives (returned immediately, without waiting for the rest) or
 * the dispatcher has sealed the expected count and every result is in; the
 * successes are then sorted by index and checked for a dense 0..n-1 range.
 */
class result_aggregator {
public:
    result_aggregator() = default;

    result_aggregator(const result_aggregator&) = delete;
    auto operator=(const result_aggregator&) -> result_aggregator& = delete;

    /**
     * @brief Record one chunk outcome; a failed outcome trips the aggregator
     */
    void submit(chunk_result outcome);

    /**
     * @brief Record a failure not tied to a submitted chunk (e.g. a read error)
     */
    void fail(error err);

    /**
     * @brief Declare how many chunks were enumerated
     */
    void seal(uint64_t expected_count);

    /**
     * @brief Wait for the outcome of the whole dispatch
     * @return Identifiers in ascending index order, or the first failure
     */
    [[nodiscard]] auto collect() -> result<ordered_identifier_list>;

    [[nodiscard]] auto has_failed() const -> bool;

    [[nodiscard]] auto first_failure() const -> std::optional<error>;

    [[nodiscard]] auto received_count() const -> uint64_t;

    /**
     * @brief Sort results by index and verify indices are exactly 0..expected-1
     * @return Ordered identifiers or protocol_invariant_violation
     */
    [[nodiscard]] static auto order(std::vector<chunk_result> results, uint64_t expected_count)
        -> result<ordered_identifier_list>;

private:
    [[nodiscard]] auto is_complete() const -> bool;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<chunk_result> results_;
    std::optional<error> failure_;
    std::optional<uint64_t> expected_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_RESULT_AGGREGATOR_H
