/**
 * @file chunked_uploader.cpp
 * @brief Whole-file chunked upload implementation
 */

#include "kcenon/chunked_upload/upload/chunked_uploader.h"

#include "kcenon/chunked_upload/config/feature_flags.h"
#include "kcenon/chunked_upload/core/chunk_planner.h"
#include "kcenon/chunked_upload/core/chunk_reader.h"
#include "kcenon/chunked_upload/core/logging.h"
#include "kcenon/chunked_upload/transport/http_utils.h"
#include "kcenon/chunked_upload/upload/upload_session.h"

#include <mutex>
#include <system_error>

namespace kcenon::chunked_upload {

namespace {

auto stat_file(const std::filesystem::path& file_path) -> result<uint64_t> {
    std::error_code ec;
    auto status = std::filesystem::status(file_path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return unexpected{error{error_code::file_not_found,
            "file not found: " + file_path.string()}};
    }
    if (!std::filesystem::is_regular_file(status)) {
        return unexpected{error{error_code::file_access_denied,
            "not a regular file: " + file_path.string()}};
    }

    auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return unexpected{error{error_code::file_access_denied,
            "cannot read file size: " + file_path.string() + ": " + ec.message()}};
    }
    return static_cast<uint64_t>(size);
}

}  // namespace

// ============================================================================
// uploader_config
// ============================================================================

auto uploader_config::validate() const -> result<void> {
    if (!credentials.is_complete()) {
        return unexpected{error{error_code::missing_credentials,
            "missing user or token"}};
    }
    if (base_url.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "base URL must not be empty"}};
    }
    if (resource_key.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "resource key must not be empty"}};
    }
    if (max_in_flight == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "max in-flight chunks must be at least 1"}};
    }
    if (timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "request timeout must be positive"}};
    }
    if (auto policy = retry.validate(); !policy) {
        return policy;
    }
    if (chunk_size_override &&
        (*chunk_size_override == 0 || *chunk_size_override > chunk_planner::max_chunk_size)) {
        return unexpected{error{error_code::invalid_chunk_size,
            "chunk size must be between 1 byte and " +
            std::to_string(chunk_planner::max_chunk_mb) + " MB"}};
    }
    if (!http_client && !KCENON_WITH_NETWORK_SYSTEM) {
        return unexpected{error{error_code::network_unavailable,
            "no HTTP transport available; build with network_system or inject a client"}};
    }
    return {};
}

// ============================================================================
// chunked_uploader::impl
// ============================================================================

struct chunked_uploader::impl {
    uploader_config config;
    std::shared_ptr<transport_client> transport;
    std::shared_ptr<adapters::upload_worker_pool> pool;

    std::mutex run_mutex;
    std::shared_ptr<cancellation_token> active_token;

    explicit impl(uploader_config cfg) : config(std::move(cfg)) {
        transport_config tc;
        tc.base_url = config.base_url;
        tc.credentials = config.credentials;
        tc.timeout = config.timeout;
        transport = std::make_shared<transport_client>(std::move(tc), config.http_client);

        pool = config.worker_pool
                   ? config.worker_pool
                   : adapters::worker_pool_factory::create(config.max_in_flight,
                                                           "chunk_upload_pool");
    }

    auto begin_run() -> std::shared_ptr<cancellation_token> {
        std::lock_guard<std::mutex> lock(run_mutex);
        active_token = std::make_shared<cancellation_token>();
        return active_token;
    }

    void end_run() {
        std::lock_guard<std::mutex> lock(run_mutex);
        active_token.reset();
    }

    auto run(const std::filesystem::path& file_path,
             const std::shared_ptr<cancellation_token>& token) -> result<upload_summary> {
        auto started = std::chrono::steady_clock::now();

        auto file_name = file_path.filename().string();
        auto mime_type = config.mime_type.value_or(http_utils::detect_content_type(file_name));

        upload_log_context ctx;
        ctx.resource_key = config.resource_key;
        ctx.filename = file_path.string();

        auto size = stat_file(file_path);
        if (!size) {
            ctx.error_message = size.error().message;
            CU_LOG_ERROR_CTX(log_category::uploader, "Cannot stat source file", ctx);
            return unexpected{size.error()};
        }
        ctx.file_size = size.value();

        auto plan = chunk_planner::plan(size.value(), config.chunk_size_override);
        if (!plan) {
            return unexpected{plan.error()};
        }
        ctx.total_chunks = plan.value().data_chunk_count();

        auto reader = chunk_reader::open(file_path, plan.value());
        if (!reader) {
            ctx.error_message = reader.error().message;
            CU_LOG_ERROR_CTX(log_category::uploader, "Cannot open source file", ctx);
            return unexpected{reader.error()};
        }

        CU_LOG_INFO_CTX(log_category::uploader,
                        "Starting chunked upload, chunk size " +
                            std::to_string(plan.value().chunk_size) + " bytes",
                        ctx);

        retry_executor retry(config.retry, token);
        if (config.retry_sleep) {
            retry.with_sleep_function(config.retry_sleep);
        }

        upload_session session(transport, config.resource_key, std::move(retry));
        auto session_id = session.create();
        if (!session_id) {
            ctx.error_message = session_id.error().message;
            CU_LOG_ERROR_CTX(log_category::uploader, "Upload failed", ctx);
            return unexpected{session_id.error()};
        }
        ctx.session_id = session_id.value();

        dispatch_config dc;
        dc.max_in_flight = config.max_in_flight;
        chunk_dispatcher dispatcher(std::move(dc), pool, token);
        if (config.on_progress) {
            dispatcher.on_progress(config.on_progress);
        }

        auto dispatched = dispatcher.dispatch(
            reader.value(), chunk_dispatcher::make_session_handler(session, file_name));
        if (!dispatched) {
            ctx.error_message = dispatched.error().message;
            CU_LOG_ERROR_CTX(log_category::uploader, "Upload failed", ctx);
            return unexpected{dispatched.error()};
        }

        auto& outcome = dispatched.value();
        auto committed = session.finalize(outcome.manifest, file_name, mime_type);
        if (!committed) {
            ctx.error_message = committed.error().message;
            CU_LOG_ERROR_CTX(log_category::uploader, "Upload failed", ctx);
            return unexpected{committed.error()};
        }

        upload_summary summary;
        summary.session_id = session.session_id();
        summary.file_name = file_name;
        summary.mime_type = mime_type;
        summary.file_size = size.value();
        summary.chunk_size = plan.value().chunk_size;
        summary.chunk_count = outcome.manifest.size();
        summary.chunks_uploaded = outcome.stats.chunks_uploaded;
        summary.chunks_deduplicated = outcome.stats.chunks_deduplicated;
        summary.bytes_uploaded = outcome.stats.bytes_uploaded;
        summary.manifest = std::move(outcome.manifest);
        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        ctx.duration_ms = static_cast<uint64_t>(summary.elapsed.count());
        CU_LOG_INFO_CTX(log_category::uploader, "Upload committed", ctx);
        return summary;
    }
};

// ============================================================================
// chunked_uploader::builder
// ============================================================================

chunked_uploader::builder::builder() = default;

auto chunked_uploader::builder::with_base_url(std::string url) -> builder& {
    config_.base_url = std::move(url);
    return *this;
}

auto chunked_uploader::builder::with_resource_key(std::string key) -> builder& {
    config_.resource_key = std::move(key);
    return *this;
}

auto chunked_uploader::builder::with_credentials(std::string username, std::string token)
    -> builder& {
    config_.credentials.username = std::move(username);
    config_.credentials.token = std::move(token);
    return *this;
}

auto chunked_uploader::builder::with_max_in_flight(std::size_t count) -> builder& {
    config_.max_in_flight = count;
    return *this;
}

auto chunked_uploader::builder::with_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.timeout = timeout;
    return *this;
}

auto chunked_uploader::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = std::move(policy);
    return *this;
}

auto chunked_uploader::builder::with_chunk_size(uint64_t bytes) -> builder& {
    config_.chunk_size_override = bytes;
    return *this;
}

auto chunked_uploader::builder::with_mime_type(std::string mime_type) -> builder& {
    config_.mime_type = std::move(mime_type);
    return *this;
}

auto chunked_uploader::builder::with_http_client(std::shared_ptr<http_client_interface> client)
    -> builder& {
    config_.http_client = std::move(client);
    return *this;
}

auto chunked_uploader::builder::with_worker_pool(
    std::shared_ptr<adapters::upload_worker_pool> pool) -> builder& {
    config_.worker_pool = std::move(pool);
    return *this;
}

auto chunked_uploader::builder::with_progress_callback(
    chunk_dispatcher::progress_callback callback) -> builder& {
    config_.on_progress = std::move(callback);
    return *this;
}

auto chunked_uploader::builder::with_retry_sleep_function(
    retry_executor::sleep_function sleeper) -> builder& {
    config_.retry_sleep = std::move(sleeper);
    return *this;
}

auto chunked_uploader::builder::build() -> result<chunked_uploader> {
    if (auto valid = config_.validate(); !valid) {
        CU_LOG_ERROR(log_category::uploader, "Invalid uploader configuration: " +
                                                 valid.error().message);
        return unexpected{valid.error()};
    }

    get_logger().register_secret(config_.credentials.token);

    return chunked_uploader(std::move(config_));
}

// ============================================================================
// chunked_uploader
// ============================================================================

chunked_uploader::chunked_uploader(uploader_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {}

chunked_uploader::chunked_uploader(chunked_uploader&&) noexcept = default;
auto chunked_uploader::operator=(chunked_uploader&&) noexcept -> chunked_uploader& = default;
chunked_uploader::~chunked_uploader() = default;

auto chunked_uploader::upload(const std::filesystem::path& file_path)
    -> result<upload_summary> {
    auto token = impl_->begin_run();
    auto summary = impl_->run(file_path, token);
    impl_->end_run();
    return summary;
}

void chunked_uploader::cancel() {
    std::shared_ptr<cancellation_token> token;
    {
        std::lock_guard<std::mutex> lock(impl_->run_mutex);
        token = impl_->active_token;
    }
    if (token) {
        CU_LOG_INFO(log_category::uploader, "Cancelling upload");
        token->cancel();
    }
}

auto chunked_uploader::config() const -> const uploader_config& {
    return impl_->config;
}

}  // namespace kcenon::chunked_upload
