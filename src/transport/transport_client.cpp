/**
 * @file transport_client.cpp
 * @brief Authenticated request primitive with response classification
 */

#include "kcenon/chunked_upload/transport/transport_client.h"

#include "kcenon/chunked_upload/core/logging.h"
#include "kcenon/chunked_upload/transport/network_http_client.h"

#include <algorithm>

namespace kcenon::chunked_upload {

auto transport_config::validate() const -> result<void> {
    if (!credentials.is_complete()) {
        return unexpected{error{error_code::missing_credentials,
            "missing user or token"}};
    }
    if (base_url.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "base URL must not be empty"}};
    }
    if (timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "request timeout must be positive"}};
    }
    return {};
}

transport_client::transport_client(transport_config config,
                                   std::shared_ptr<http_client_interface> http)
    : config_(std::move(config)), http_(std::move(http)) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
    if (!http_) {
        http_ = make_network_http_client(config_.timeout);
    }
    authorization_ = http_utils::basic_auth_header(config_.credentials.username,
                                                   config_.credentials.token);
}

auto transport_client::post_json(const std::string& path,
                                 const std::string& json_body,
                                 std::initializer_list<int> accepted) const
    -> transport_outcome {
    auto url = url_for(path);
    auto response = http_->post(url, json_body, base_headers("application/json"));
    return finish(url, std::move(response), accepted);
}

auto transport_client::post_multipart(const std::string& path,
                                      const http_utils::multipart_body& body,
                                      std::initializer_list<int> accepted) const
    -> transport_outcome {
    auto url = url_for(path);
    auto response = http_->post(url, body.data, base_headers(body.content_type()));
    return finish(url, std::move(response), accepted);
}

auto transport_client::classify(int status_code, std::initializer_list<int> accepted)
    -> response_class {
    if (status_code == status_unauthorized) {
        return response_class::fatal_auth;
    }
    if (std::find(accepted.begin(), accepted.end(), status_code) != accepted.end()) {
        return response_class::success;
    }
    return response_class::transient;
}

auto transport_client::url_for(const std::string& path) const -> std::string {
    if (!path.empty() && path.front() != '/') {
        return config_.base_url + "/" + path;
    }
    return config_.base_url + path;
}

auto transport_client::config() const -> const transport_config& {
    return config_;
}

auto transport_client::base_headers(const std::string& content_type) const
    -> std::map<std::string, std::string> {
    return {
        {"Authorization", authorization_},
        {"Content-Type", content_type},
        {"Accept", "application/json"},
    };
}

auto transport_client::finish(const std::string& url,
                              result<http_response> response,
                              std::initializer_list<int> accepted) const
    -> transport_outcome {
    transport_outcome outcome;

    if (!response.has_value()) {
        outcome.classification = response_class::transient;
        outcome.failure = response.error();
        CU_LOG_DEBUG(log_category::transport,
                     "POST " + url + " produced no response: " + response.error().message);
        return outcome;
    }

    outcome.response = std::move(response.value());
    outcome.status_code = outcome.response.status_code;
    outcome.classification = classify(outcome.status_code, accepted);

    switch (outcome.classification) {
        case response_class::success:
            break;
        case response_class::fatal_auth:
            outcome.failure = error{error_code::authentication_failed,
                "authentication failed (HTTP " + std::to_string(outcome.status_code) + ")"};
            break;
        case response_class::transient:
            outcome.failure = error{error_code::transient_remote_error,
                "unexpected HTTP status " + std::to_string(outcome.status_code)};
            break;
    }

    CU_LOG_DEBUG(log_category::transport,
                 "POST " + url + " -> " + std::to_string(outcome.status_code) + " (" +
                     to_string(outcome.classification) + ")");
    return outcome;
}

}  // namespace kcenon::chunked_upload
