/**
 * @file types.h
 * @brief Core error and result types for chunked_upload
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_TYPES_H
#define KCENON_CHUNKED_UPLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::chunked_upload {

/**
 * @brief Error codes for chunked upload operations
 */
enum class error_code {
    success = 0,

    // Configuration errors (-100 to -119)
    invalid_configuration = -100,
    missing_credentials = -101,
    invalid_chunk_size = -102,
    invalid_retry_policy = -103,

    // File errors (-120 to -139)
    file_not_found = -120,
    file_access_denied = -121,
    file_read_error = -122,

    // Remote errors (-140 to -159)
    authentication_failed = -140,
    transient_remote_error = -141,
    retries_exhausted = -142,
    malformed_response = -143,
    network_unavailable = -144,

    // Protocol errors (-160 to -179)
    protocol_invariant_violation = -160,
    invalid_content_identifier = -161,

    // Internal errors (-200 to -219)
    operation_cancelled = -200,
    internal_error = -201,
};

/**
 * @brief Failure taxonomy an error code belongs to
 */
enum class error_category {
    none,
    configuration,
    io,
    authentication,
    transient_remote,
    protocol_invariant,
    cancelled,
    internal,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::missing_credentials:
            return "missing credentials";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_retry_policy:
            return "invalid retry policy";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::transient_remote_error:
            return "transient remote error";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::malformed_response:
            return "malformed response";
        case error_code::network_unavailable:
            return "network unavailable";
        case error_code::protocol_invariant_violation:
            return "protocol invariant violation";
        case error_code::invalid_content_identifier:
            return "invalid content identifier";
        case error_code::operation_cancelled:
            return "operation cancelled";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Map an error code onto its failure category
 */
[[nodiscard]] constexpr auto category_of(error_code code) -> error_category {
    switch (code) {
        case error_code::success:
            return error_category::none;
        case error_code::invalid_configuration:
        case error_code::missing_credentials:
        case error_code::invalid_chunk_size:
        case error_code::invalid_retry_policy:
        case error_code::network_unavailable:
            return error_category::configuration;
        case error_code::file_not_found:
        case error_code::file_access_denied:
        case error_code::file_read_error:
            return error_category::io;
        case error_code::authentication_failed:
            return error_category::authentication;
        case error_code::transient_remote_error:
        case error_code::retries_exhausted:
        case error_code::malformed_response:
            return error_category::transient_remote;
        case error_code::protocol_invariant_violation:
        case error_code::invalid_content_identifier:
            return error_category::protocol_invariant;
        case error_code::operation_cancelled:
            return error_category::cancelled;
        default:
            return error_category::internal;
    }
}

[[nodiscard]] constexpr auto to_string(error_category category) -> const char* {
    switch (category) {
        case error_category::none:
            return "none";
        case error_category::configuration:
            return "configuration";
        case error_category::io:
            return "io";
        case error_category::authentication:
            return "authentication";
        case error_category::transient_remote:
            return "transient_remote";
        case error_category::protocol_invariant:
            return "protocol_invariant";
        case error_category::cancelled:
            return "cancelled";
        default:
            return "internal";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] auto category() const noexcept -> error_category {
        return category_of(code);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the spirit of
 * std::expected (C++23).
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for operations without a value
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_TYPES_H
