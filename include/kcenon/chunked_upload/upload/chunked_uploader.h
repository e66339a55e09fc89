/**
 * @file chunked_uploader.h
 * @brief Whole-file chunked upload entry point
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_CHUNKED_UPLOADER_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_CHUNKED_UPLOADER_H

#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"
#include "kcenon/chunked_upload/core/chunk_types.h"
#include "kcenon/chunked_upload/core/types.h"
#include "kcenon/chunked_upload/transport/http_types.h"
#include "kcenon/chunked_upload/transport/retry_policy.h"
#include "kcenon/chunked_upload/transport/transport_client.h"
#include "kcenon/chunked_upload/upload/chunk_dispatcher.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Settings collected by chunked_uploader::builder
 */
struct uploader_config {
    static constexpr const char* default_base_url = "https://transfer.atlassian.com";
    static constexpr std::size_t default_max_in_flight = 8;

    std::string base_url = default_base_url;
    std::string resource_key;
    upload_credentials credentials;
    std::size_t max_in_flight = default_max_in_flight;
    std::chrono::milliseconds timeout{30000};
    retry_policy retry;
    std::optional<uint64_t> chunk_size_override;
    std::optional<std::string> mime_type;
    std::shared_ptr<http_client_interface> http_client;
    std::shared_ptr<adapters::upload_worker_pool> worker_pool;
    chunk_dispatcher::progress_callback on_progress;
    retry_executor::sleep_function retry_sleep;

    /**
     * @brief Check the settings before any network activity
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Outcome of a completed upload
 */
struct upload_summary {
    std::string session_id;
    std::string file_name;
    std::string mime_type;
    uint64_t file_size = 0;
    uint64_t chunk_size = 0;
    uint64_t chunk_count = 0;
    uint64_t chunks_uploaded = 0;
    uint64_t chunks_deduplicated = 0;
    uint64_t bytes_uploaded = 0;
    ordered_identifier_list manifest;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Uploads one file per call to a resource through a chunked session
 *
 * The file is planned, read sequentially, and its chunks are identified,
 * probed and uploaded with bounded parallelism. Chunks the service already
 * holds are not sent again, so re-running an interrupted upload only sends
 * what is missing. The run either commits the full ordered manifest or
 * returns a single error.
 *
 * @code
 * auto uploader = chunked_uploader::builder()
 *     .with_resource_key("PROJ-123")
 *     .with_credentials("user@example.com", api_token)
 *     .build();
 *
 * if (uploader.has_value()) {
 *     auto summary = uploader.value().upload("/data/archive.tar");
 * }
 * @endcode
 */
class chunked_uploader {
public:
    /**
     * @brief Builder for chunked_uploader
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the service base URL
         * @param url Base URL (default: https://transfer.atlassian.com)
         * @return Reference to builder for chaining
         */
        auto with_base_url(std::string url) -> builder&;

        /**
         * @brief Set the resource the file is attached to
         * @param key Resource key, e.g. an issue key
         * @return Reference to builder for chaining
         */
        auto with_resource_key(std::string key) -> builder&;

        /**
         * @brief Set basic-auth credentials
         * @return Reference to builder for chaining
         */
        auto with_credentials(std::string username, std::string token) -> builder&;

        /**
         * @brief Set the concurrency cap
         * @param count Chunks in flight at once (default: 8)
         * @return Reference to builder for chaining
         */
        auto with_max_in_flight(std::size_t count) -> builder&;

        /**
         * @brief Set the per-request timeout
         * @param timeout Timeout for each attempt (default: 30 s)
         * @return Reference to builder for chaining
         */
        auto with_timeout(std::chrono::milliseconds timeout) -> builder&;

        auto with_retry_policy(retry_policy policy) -> builder&;

        /**
         * @brief Use a fixed chunk size instead of the tiered one
         * @param bytes Chunk size in bytes (1 .. 210 MB)
         * @return Reference to builder for chaining
         */
        auto with_chunk_size(uint64_t bytes) -> builder&;

        /**
         * @brief Override the MIME type detected from the file extension
         * @return Reference to builder for chaining
         */
        auto with_mime_type(std::string mime_type) -> builder&;

        /**
         * @brief Use a caller-supplied HTTP client
         * @return Reference to builder for chaining
         */
        auto with_http_client(std::shared_ptr<http_client_interface> client) -> builder&;

        /**
         * @brief Run chunk tasks on a caller-supplied pool
         * @return Reference to builder for chaining
         */
        auto with_worker_pool(std::shared_ptr<adapters::upload_worker_pool> pool) -> builder&;

        auto with_progress_callback(chunk_dispatcher::progress_callback callback) -> builder&;

        /**
         * @brief Replace the sleep between retry attempts
         * @return Reference to builder for chaining
         */
        auto with_retry_sleep_function(retry_executor::sleep_function sleeper) -> builder&;

        /**
         * @brief Build the uploader instance
         * @return Result containing the uploader or a configuration error
         */
        [[nodiscard]] auto build() -> result<chunked_uploader>;

    private:
        uploader_config config_;
    };

    // Non-copyable, movable
    chunked_uploader(const chunked_uploader&) = delete;
    auto operator=(const chunked_uploader&) -> chunked_uploader& = delete;
    chunked_uploader(chunked_uploader&&) noexcept;
    auto operator=(chunked_uploader&&) noexcept -> chunked_uploader&;
    ~chunked_uploader();

    /**
     * @brief Upload a file and commit it to the resource
     * @param file_path Local file
     * @return Summary, or the single error that ended the run
     */
    [[nodiscard]] auto upload(const std::filesystem::path& file_path) -> result<upload_summary>;

    /**
     * @brief Abort the upload in progress, if any
     *
     * Safe to call from any thread. The running upload() returns
     * operation_cancelled once its in-flight requests have returned.
     */
    void cancel();

    [[nodiscard]] auto config() const -> const uploader_config&;

private:
    explicit chunked_uploader(uploader_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_CHUNKED_UPLOADER_H
