/**
 * @file network_http_client.h
 * @brief HTTP client adapter over network_system
 *
 * Wraps the network_system HTTP client behind http_client_interface. When
 * the library is built without network_system every request fails with
 * network_unavailable and is_available() reports false.
 */

#ifndef KCENON_CHUNKED_UPLOAD_TRANSPORT_NETWORK_HTTP_CLIENT_H
#define KCENON_CHUNKED_UPLOAD_TRANSPORT_NETWORK_HTTP_CLIENT_H

#include "kcenon/chunked_upload/transport/http_types.h"

#include <chrono>
#include <memory>

namespace kcenon::chunked_upload {

/**
 * @brief Production HTTP client
 *
 * @note Thread-safe for concurrent requests.
 */
class network_http_client : public http_client_interface {
public:
    /**
     * @brief Construct HTTP client with a per-request timeout
     */
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;
    network_http_client(network_http_client&&) noexcept;
    auto operator=(network_http_client&&) noexcept -> network_http_client&;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::vector<uint8_t>& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Check if the network transport is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create the production HTTP client
 */
[[nodiscard]] auto make_network_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<network_http_client>;

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_TRANSPORT_NETWORK_HTTP_CLIENT_H
