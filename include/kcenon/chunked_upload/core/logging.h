// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/chunked_upload/config/feature_flags.h"

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::chunked_upload {

/**
 * @brief Log categories for the chunked upload pipeline
 */
struct log_category {
    static constexpr std::string_view uploader = "chunked_upload.uploader";
    static constexpr std::string_view session = "chunked_upload.session";
    static constexpr std::string_view transport = "chunked_upload.transport";
    static constexpr std::string_view dispatcher = "chunked_upload.dispatcher";
    static constexpr std::string_view aggregator = "chunked_upload.aggregator";
    static constexpr std::string_view retry = "chunked_upload.retry";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

[[nodiscard]] inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 *
 * Basic-auth credentials are always masked. Registered secrets (the API
 * token, typically) are replaced wherever they occur in a message.
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_credentials = true;
    std::string mask_char = "*";
    std::size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks credentials and file paths in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = {})
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;

        if (config_.mask_credentials) {
            result = mask_basic_auth(result);
            for (const auto& secret : secrets_) {
                result = replace_all(result, secret, std::string(8, config_.mask_char[0]));
            }
        }

        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }

        return result;
    }

    /**
     * @brief Keep the last path component, mask the directories
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        return std::string(last_sep, config_.mask_char[0]) + "/" + path.substr(last_sep + 1);
    }

    /**
     * @brief Register a literal secret to be removed from every message
     */
    void add_secret(std::string secret) {
        if (secret.size() < config_.visible_chars) {
            return;
        }
        if (std::find(secrets_.begin(), secrets_.end(), secret) == secrets_.end()) {
            secrets_.push_back(std::move(secret));
        }
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] static auto replace_all(std::string input,
                                          const std::string& needle,
                                          const std::string& replacement) -> std::string {
        if (needle.empty()) {
            return input;
        }
        std::size_t pos = 0;
        while ((pos = input.find(needle, pos)) != std::string::npos) {
            input.replace(pos, needle.size(), replacement);
            pos += replacement.size();
        }
        return input;
    }

    [[nodiscard]] auto mask_basic_auth(const std::string& input) const -> std::string {
        static const std::regex basic_pattern(R"((Basic\s+)[A-Za-z0-9+/=]+)");
        return std::regex_replace(input, basic_pattern,
                                  "$1" + std::string(8, config_.mask_char[0]));
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        std::size_t last_pos = 0;
        for (; it != end; ++it) {
            auto pos = static_cast<std::size_t>(it->position());
            result += input.substr(last_pos, pos - last_pos);
            result += mask_path(it->str());
            last_pos = pos + static_cast<std::size_t>(it->length());
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
    std::vector<std::string> secrets_;
};

/**
 * @brief Structured log context for upload operations
 */
struct upload_log_context {
    std::string session_id;
    std::string resource_key;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<uint64_t> part_number;
    std::optional<std::string> operation;
    std::optional<uint32_t> attempt;
    std::optional<int> status_code;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_number = [&](const char* name, auto value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!session_id.empty()) add_field("session_id", session_id);
        if (!resource_key.empty()) add_field("resource_key", resource_key);
        if (!filename.empty()) {
            add_field("filename", masker ? masker->mask_path(filename) : filename);
        }
        if (file_size) add_number("size", *file_size);
        if (chunk_index) add_number("chunk_index", *chunk_index);
        if (total_chunks) add_number("total_chunks", *total_chunks);
        if (part_number) add_number("part_number", *part_number);
        if (operation) add_field("operation", *operation);
        if (attempt) add_number("attempt", *attempt);
        if (status_code) add_number("status_code", *status_code);
        if (duration_ms) add_number("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            std::string file = masker ? masker->mask_path(*source_file) : *source_file;
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::session)
 *     .with_message("Upload session created")
 *     .with_session_id("upl-123")
 *     .with_filename("archive.zip")
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_session_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->session_id = std::string(id);
        return *this;
    }

    auto with_filename(std::string_view filename) -> log_entry_builder& {
        ensure_context();
        entry_.context->filename = std::string(filename);
        return *this;
    }

    auto with_chunk_index(uint64_t index) -> log_entry_builder& {
        ensure_context();
        entry_.context->chunk_index = index;
        return *this;
    }

    auto with_operation(std::string_view operation) -> log_entry_builder& {
        ensure_context();
        entry_.context->operation = std::string(operation);
        return *this;
    }

    auto with_error_message(std::string_view message) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(message);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const upload_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = upload_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Human readable line format
    json    ///< One JSON object per line
};

/**
 * @brief Process-wide logger for the upload pipeline
 *
 * Forwards to logger_system when it is compiled in, otherwise writes to
 * stderr. Callbacks observe every accepted message regardless of backend.
 */
class chunked_upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    chunked_upload_logger() = default;
    ~chunked_upload_logger() = default;

    chunked_upload_logger(const chunked_upload_logger&) = delete;
    chunked_upload_logger& operator=(const chunked_upload_logger&) = delete;

    /**
     * @brief Initialize the backend. Subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    /**
     * @brief Register a secret (for example the API token) to scrub from output
     */
    void register_secret(std::string secret) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.add_secret(std::move(secret));
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked_message = current_masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked_message, context);
            }
        }

        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            auto entry = builder.build();
            std::string json_str = entry.to_json_with_masking(&current_masker);

            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                if (json_callback_) {
                    json_callback_(entry, json_str);
                }
            }
            write(level, json_str, file, line, function);
            return;
        }

        std::ostringstream oss;
        oss << "[" << category << "] " << masked_message;
        if (context) {
            oss << " " << context->to_json_with_masking(&current_masker);
        }
        write(level, oss.str(), file, line, function);
    }

    void flush() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level,
               const std::string& line_text,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << get_timestamp() << " [" << log_level_to_string(level) << "] "
                  << line_text << "\n";
    }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline chunked_upload_logger& get_logger() {
    static chunked_upload_logger instance;
    return instance;
}

#define CU_LOG(level, category, message) \
    kcenon::chunked_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_CTX(level, category, message, context) \
    kcenon::chunked_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_TRACE(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::trace, category, message)

#define CU_LOG_DEBUG(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::debug, category, message)

#define CU_LOG_INFO(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::info, category, message)

#define CU_LOG_WARN(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::warn, category, message)

#define CU_LOG_ERROR(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::error, category, message)

#define CU_LOG_DEBUG_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::debug, category, message, ctx)

#define CU_LOG_INFO_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::info, category, message, ctx)

#define CU_LOG_WARN_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::warn, category, message, ctx)

#define CU_LOG_ERROR_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::error, category, message, ctx)

} // namespace kcenon::chunked_upload
