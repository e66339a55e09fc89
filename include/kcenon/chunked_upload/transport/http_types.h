/**
 * @file http_types.h
 * @brief HTTP response type and client interface for the upload transport
 */

#ifndef KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_TYPES_H
#define KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_TYPES_H

#include "kcenon/chunked_upload/core/types.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief HTTP response as seen by the transport
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        };

        auto lower_key = lower(key);
        for (const auto& [name, value] : headers) {
            if (lower(name) == lower_key) {
                return value;
            }
        }
        return std::nullopt;
    }
};

/**
 * @brief Minimal HTTP client interface used by the transport
 *
 * Implemented by network_http_client in production and by scripted
 * services in tests. Implementations must be safe to call from several
 * worker threads at once. A returned error means no HTTP response was
 * obtained (connection failure, timeout).
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    /**
     * @brief Execute POST request with string body
     */
    virtual auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    /**
     * @brief Execute POST request with binary body
     */
    virtual auto post(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_TRANSPORT_HTTP_TYPES_H
