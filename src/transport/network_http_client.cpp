/**
 * @file network_http_client.cpp
 * @brief HTTP client adapter over network_system
 */

#include "kcenon/chunked_upload/transport/network_http_client.h"

#include "kcenon/chunked_upload/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::chunked_upload {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    std::chrono::milliseconds timeout;
    bool available = false;

    explicit impl(std::chrono::milliseconds t) : timeout(t) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    template <typename Body>
    auto do_post(const std::string& url,
                 const Body& body,
                 const std::map<std::string, std::string>& headers)
        -> result<http_response> {
        if (!client) {
            return unexpected{error{error_code::internal_error,
                "HTTP client not initialized"}};
        }

        auto response = client->post(url, body, headers);
        if (response.is_err()) {
            return unexpected{error{error_code::transient_remote_error,
                "HTTP POST request failed: " + url}};
        }
        return convert_response(response.value());
    }
#endif

    static auto not_available() -> result<http_response> {
        return unexpected{error{error_code::network_unavailable,
            "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

network_http_client::network_http_client(network_http_client&&) noexcept = default;
auto network_http_client::operator=(network_http_client&&) noexcept
    -> network_http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_http_client::post(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->do_post(url, body, headers);
#else
    (void)url;
    (void)body;
    (void)headers;
    return impl::not_available();
#endif
}

auto network_http_client::post(
    const std::string& url,
    const std::vector<uint8_t>& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->do_post(url, body, headers);
#else
    (void)url;
    (void)body;
    (void)headers;
    return impl::not_available();
#endif
}

auto network_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto network_http_client::timeout() const noexcept -> std::chrono::milliseconds {
    return impl_->timeout;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_network_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<network_http_client> {
    return std::make_shared<network_http_client>(timeout);
}

}  // namespace kcenon::chunked_upload
