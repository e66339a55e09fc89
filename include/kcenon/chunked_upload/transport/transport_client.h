/**
 * @file transport_client.h
 * @brief Authenticated request primitive with response classification
 */

#ifndef KCENON_CHUNKED_UPLOAD_TRANSPORT_TRANSPORT_CLIENT_H
#define KCENON_CHUNKED_UPLOAD_TRANSPORT_TRANSPORT_CLIENT_H

#include "kcenon/chunked_upload/core/types.h"
#include "kcenon/chunked_upload/transport/http_types.h"
#include "kcenon/chunked_upload/transport/http_utils.h"
#include "kcenon/chunked_upload/transport/retry_policy.h"

#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Basic-auth credentials passed explicitly by the caller
 */
struct upload_credentials {
    std::string username;
    std::string token;

    [[nodiscard]] auto is_complete() const noexcept -> bool {
        return !username.empty() && !token.empty();
    }
};

/**
 * @brief Transport settings
 */
struct transport_config {
    std::string base_url;
    upload_credentials credentials;
    std::chrono::milliseconds timeout{30000};

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Result of a single request attempt
 *
 * `failure` is set whenever classification is not success.
 */
struct transport_outcome {
    response_class classification = response_class::transient;
    int status_code = 0;
    http_response response;
    error failure;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return classification == response_class::success;
    }
};

/**
 * @brief Issues authenticated POST requests and classifies their outcome
 *
 * 401 is fatal_auth; a status in the accepted set is success; any other
 * status or a request that produced no response is transient. This class
 * performs one attempt per call; retrying is the caller's concern.
 *
 * @note Thread-safe as long as the underlying http client is.
 */
class transport_client {
public:
    static constexpr int status_unauthorized = 401;

    /**
     * @brief Construct a transport
     * @param config Base URL, credentials and timeout
     * @param http HTTP client; when null a network_http_client with the
     *        configured timeout is created
     */
    transport_client(transport_config config, std::shared_ptr<http_client_interface> http);

    /**
     * @brief POST a JSON document
     * @param path Path and query appended to the base URL
     * @param json_body Request body (may be empty)
     * @param accepted Status codes treated as success
     */
    [[nodiscard]] auto post_json(const std::string& path,
                                 const std::string& json_body,
                                 std::initializer_list<int> accepted) const
        -> transport_outcome;

    /**
     * @brief POST a multipart/form-data body
     */
    [[nodiscard]] auto post_multipart(const std::string& path,
                                      const http_utils::multipart_body& body,
                                      std::initializer_list<int> accepted) const
        -> transport_outcome;

    /**
     * @brief Classify a status code against the accepted set
     */
    [[nodiscard]] static auto classify(int status_code, std::initializer_list<int> accepted)
        -> response_class;

    [[nodiscard]] auto url_for(const std::string& path) const -> std::string;

    [[nodiscard]] auto config() const -> const transport_config&;

private:
    [[nodiscard]] auto base_headers(const std::string& content_type) const
        -> std::map<std::string, std::string>;

    [[nodiscard]] auto finish(const std::string& url,
                              result<http_response> response,
                              std::initializer_list<int> accepted) const
        -> transport_outcome;

    transport_config config_;
    std::shared_ptr<http_client_interface> http_;
    std::string authorization_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_TRANSPORT_TRANSPORT_CLIENT_H
