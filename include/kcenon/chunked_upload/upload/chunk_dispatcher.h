/**
 * @file chunk_dispatcher.h
 * @brief Bounded-concurrency fan-out of chunk work
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_CHUNK_DISPATCHER_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_CHUNK_DISPATCHER_H

#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"
#include "kcenon/chunked_upload/core/cancellation_token.h"
#include "kcenon/chunked_upload/core/chunk_reader.h"
#include "kcenon/chunked_upload/core/chunk_types.h"
#include "kcenon/chunked_upload/core/types.h"
#include "kcenon/chunked_upload/upload/upload_session.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Dispatcher settings
 */
struct dispatch_config {
    /// Maximum chunks read but not yet finished
    std::size_t max_in_flight = 8;

    /// Worker pool stage the chunk tasks are counted under
    std::string stage_name = adapters::upload_worker_pool::default_stage;
};

/**
 * @brief Snapshot reported after each successfully processed chunk
 */
struct upload_progress {
    uint64_t completed_chunks = 0;
    uint64_t planned_chunks = 0;
    uint64_t bytes_processed = 0;
    uint64_t file_size = 0;
    uint64_t last_index = 0;
    bool deduplicated = false;

    [[nodiscard]] auto percentage() const noexcept -> double {
        if (file_size == 0) {
            return 100.0;
        }
        return static_cast<double>(bytes_processed) / static_cast<double>(file_size) * 100.0;
    }
};

/**
 * @brief Counters for one dispatch run
 */
struct dispatch_stats {
    uint64_t chunks_enumerated = 0;
    uint64_t chunks_uploaded = 0;
    uint64_t chunks_deduplicated = 0;
    uint64_t bytes_processed = 0;
    uint64_t bytes_uploaded = 0;
    std::size_t peak_in_flight = 0;
};

/**
 * @brief Ordered manifest plus the counters that produced it
 */
struct dispatch_outcome {
    ordered_identifier_list manifest;
    dispatch_stats stats;
};

/**
 * @brief Reads chunks sequentially and processes them on a worker pool
 *
 * The calling thread is the only reader of the file. A slot is taken from
 * the admission gate before each read, so at most max_in_flight chunk
 * buffers exist at once and the reader blocks while the pool is saturated.
 * Each chunk is handed to the chunk_handler on a worker; the outcome goes
 * to a result_aggregator.
 *
 * The first failure cancels the shared token: the gate stops admitting,
 * backoff sleeps in other workers wake up, and dispatch() returns that
 * failure. dispatch() always waits for the tasks it started before
 * returning.
 */
class chunk_dispatcher {
public:
    /// Processes one chunk on a worker thread
    using chunk_handler = std::function<chunk_result(chunk)>;

    /// Invoked after each successful chunk; calls are serialized
    using progress_callback = std::function<void(const upload_progress&)>;

    /**
     * @param config Concurrency settings
     * @param pool Worker pool; when null one is created with max_in_flight workers
     * @param token Run-wide cancellation signal; when null a private one is used
     */
    chunk_dispatcher(dispatch_config config,
                     std::shared_ptr<adapters::upload_worker_pool> pool,
                     std::shared_ptr<cancellation_token> token);

    auto on_progress(progress_callback callback) -> chunk_dispatcher&;

    /**
     * @brief Process every chunk the reader yields
     * @param reader Reader positioned at the first chunk
     * @param handler Per-chunk work
     * @return Ordered manifest covering every enumerated chunk, or the
     *         first failure
     */
    [[nodiscard]] auto dispatch(chunk_reader& reader, const chunk_handler& handler)
        -> result<dispatch_outcome>;

    [[nodiscard]] auto config() const -> const dispatch_config&;

    /**
     * @brief Standard handler: identify, probe, upload only if absent
     * @param session Open session; must outlive every dispatch using the handler
     * @param file_name Base name sent with each uploaded part
     */
    [[nodiscard]] static auto make_session_handler(const upload_session& session,
                                                   std::string file_name) -> chunk_handler;

private:
    dispatch_config config_;
    std::shared_ptr<adapters::upload_worker_pool> pool_;
    std::shared_ptr<cancellation_token> token_;
    progress_callback progress_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_CHUNK_DISPATCHER_H
