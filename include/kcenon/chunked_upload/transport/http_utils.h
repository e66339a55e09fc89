/**
 * @file http_utils.h
 * @brief Encoding, JSON and multipart helpers for the upload protocol
 */

#ifndef KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_UTILS_H
#define KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_UTILS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::chunked_upload::http_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Base64 encode string
 * @param data String to encode
 * @return Base64 encoded string
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief URL encode a string (RFC 3986 unreserved characters pass through)
 */
auto url_encode(const std::string& value) -> std::string;

/**
 * @brief Build an HTTP basic authorization header value
 * @return "Basic base64(username:token)"
 */
auto basic_auth_header(const std::string& username, const std::string& token) -> std::string;

// ============================================================================
// JSON Utilities
// ============================================================================

/**
 * @brief Escape a string for inclusion in a JSON document
 */
auto escape_json(const std::string& value) -> std::string;

/**
 * @brief Extract JSON scalar value (simple parser for known structure)
 * @param json JSON string to parse
 * @param key Key to extract
 * @return Unquoted string value or raw scalar text, nullopt if absent
 */
auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string>;

/**
 * @brief Extract the object bound to a key, braces included
 * @param json JSON string to parse
 * @param key Key whose value must be an object
 * @return Object text, or nullopt if the key is absent or not an object
 */
auto extract_json_object(const std::string& json,
                         const std::string& key) -> std::optional<std::string>;

/**
 * @brief Check that text looks like a single JSON object
 */
auto is_json_object(const std::string& json) -> bool;

// ============================================================================
// Multipart Utilities
// ============================================================================

/**
 * @brief multipart/form-data body with a single file field
 */
struct multipart_body {
    std::string boundary;
    std::vector<uint8_t> data;

    [[nodiscard]] auto content_type() const -> std::string {
        return "multipart/form-data; boundary=" + boundary;
    }
};

/**
 * @brief Build a multipart/form-data body carrying one file part
 * @param field_name Form field name
 * @param file_name File name reported for the part
 * @param content Part bytes
 * @param boundary Boundary to use; a random one is generated when empty
 */
auto build_multipart_file(const std::string& field_name,
                          const std::string& file_name,
                          std::span<const std::byte> content,
                          std::string boundary = {}) -> multipart_body;

// ============================================================================
// Random Utilities
// ============================================================================

/**
 * @brief Generate random hex string
 * @param byte_count Number of random bytes (result will be 2x this length)
 */
auto generate_random_hex(std::size_t byte_count) -> std::string;

// ============================================================================
// Content Type Detection
// ============================================================================

/**
 * @brief Detect MIME content type from file extension
 * @param file_name File name or path
 * @return MIME type string (defaults to "application/octet-stream")
 */
auto detect_content_type(const std::string& file_name) -> std::string;

}  // namespace kcenon::chunked_upload::http_utils

#endif  // KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_UTILS_H
