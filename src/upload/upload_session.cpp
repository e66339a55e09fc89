/**
 * @file upload_session.cpp
 * @brief Remote upload session implementation
 */

#include "kcenon/chunked_upload/upload/upload_session.h"

#include "kcenon/chunked_upload/core/logging.h"
#include "kcenon/chunked_upload/transport/http_utils.h"

#include <sstream>

namespace kcenon::chunked_upload {

upload_session::upload_session(std::shared_ptr<transport_client> transport,
                               std::string resource_key,
                               retry_executor retry)
    : transport_(std::move(transport)),
      resource_key_(std::move(resource_key)),
      retry_(std::move(retry)) {}

auto upload_session::create() -> result<std::string> {
    if (is_open()) {
        return unexpected{error{error_code::internal_error,
            "upload session already created: " + session_id_}};
    }

    auto path = api_path("/create");
    auto created = retry_.execute<std::string>("create upload session", [&]() {
        auto outcome = transport_->post_json(path, "", {status_created});
        if (!outcome.is_success()) {
            return classified<std::string>::fail(outcome.classification, outcome.failure);
        }

        auto body = outcome.response.get_body_string();
        auto upload_id = http_utils::extract_json_value(body, "uploadId");
        if (!http_utils::is_json_object(body) || !upload_id || upload_id->empty()) {
            return classified<std::string>::fail(
                response_class::transient,
                error{error_code::malformed_response, "create response has no uploadId"});
        }
        return classified<std::string>::ok(*upload_id);
    });

    if (!created) {
        return unexpected{created.error()};
    }

    session_id_ = created.value();

    upload_log_context ctx;
    ctx.session_id = session_id_;
    ctx.resource_key = resource_key_;
    CU_LOG_INFO_CTX(log_category::session, "Upload session created", ctx);

    return session_id_;
}

auto upload_session::probe(const content_identifier& id) const -> result<bool> {
    if (auto open = require_open("probe"); !open) {
        return unexpected{open.error()};
    }

    auto path = api_path("/chunk/probe?uploadId=" + http_utils::url_encode(session_id_));
    auto body = "{\"chunks\":" + chunks_json(std::span<const content_identifier>(&id, 1)) + "}";

    return retry_.execute<bool>("probe chunk", [&]() {
        auto outcome = transport_->post_json(path, body, {status_ok});
        if (!outcome.is_success()) {
            return classified<bool>::fail(outcome.classification, outcome.failure);
        }

        auto exists = parse_probe_response(outcome.response.get_body_string(), id);
        if (!exists) {
            return classified<bool>::fail(response_class::transient, exists.error());
        }
        return classified<bool>::ok(exists.value());
    });
}

auto upload_session::upload(const content_identifier& id,
                            std::span<const std::byte> data,
                            uint64_t part_number,
                            const std::string& file_name) const -> result<void> {
    if (auto open = require_open("upload"); !open) {
        return unexpected{open.error()};
    }

    if (data.size() != id.size) {
        return unexpected{error{error_code::protocol_invariant_violation,
            "chunk length " + std::to_string(data.size()) +
            " does not match identifier size " + id.size_string()}};
    }

    auto path = api_path("/chunk/" + id.to_string() +
                         "?uploadId=" + http_utils::url_encode(session_id_) +
                         "&partNumber=" + std::to_string(part_number));

    return retry_.execute<void>("upload chunk", [&]() {
        auto body = http_utils::build_multipart_file(upload_field_name, file_name, data);
        auto outcome = transport_->post_multipart(path, body, {status_ok, status_created});
        if (!outcome.is_success()) {
            return classified<void>::fail(outcome.classification, outcome.failure);
        }
        return classified<void>::ok({});
    });
}

auto upload_session::finalize(const ordered_identifier_list& manifest,
                              const std::string& file_name,
                              const std::string& mime_type) -> result<void> {
    if (auto open = require_open("finalize"); !open) {
        return unexpected{open.error()};
    }
    if (finalized_) {
        return unexpected{error{error_code::internal_error,
            "upload session already finalized: " + session_id_}};
    }

    auto path = api_path("/file/chunked?uploadId=" + http_utils::url_encode(session_id_));

    std::ostringstream body;
    body << "{\"chunks\":" << chunks_json(manifest)
         << ",\"name\":\"" << http_utils::escape_json(file_name) << "\""
         << ",\"mimeType\":\"" << http_utils::escape_json(mime_type) << "\"}";
    auto payload = body.str();

    auto committed = retry_.execute<void>("finalize upload", [&]() {
        auto outcome = transport_->post_json(path, payload, {status_ok, status_created});
        if (!outcome.is_success()) {
            return classified<void>::fail(outcome.classification, outcome.failure);
        }
        return classified<void>::ok({});
    });

    if (!committed) {
        return committed;
    }

    finalized_ = true;

    upload_log_context ctx;
    ctx.session_id = session_id_;
    ctx.resource_key = resource_key_;
    ctx.filename = file_name;
    ctx.total_chunks = manifest.size();
    CU_LOG_INFO_CTX(log_category::session, "Upload session finalized", ctx);

    return {};
}

auto upload_session::session_id() const -> const std::string& {
    return session_id_;
}

auto upload_session::resource_key() const -> const std::string& {
    return resource_key_;
}

auto upload_session::is_open() const noexcept -> bool {
    return !session_id_.empty();
}

auto upload_session::is_finalized() const noexcept -> bool {
    return finalized_;
}

auto upload_session::chunks_json(std::span<const content_identifier> ids) -> std::string {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto& id : ids) {
        if (!first) oss << ",";
        oss << "{\"hash\":\"" << id.digest << "\",\"size\":\"" << id.size_string() << "\"}";
        first = false;
    }
    oss << "]";
    return oss.str();
}

auto upload_session::parse_probe_response(const std::string& body,
                                          const content_identifier& id) -> result<bool> {
    if (!http_utils::is_json_object(body)) {
        return unexpected{error{error_code::malformed_response,
            "probe response is not a JSON object"}};
    }

    auto data = http_utils::extract_json_object(body, "data");
    if (!data) {
        return false;
    }
    auto results = http_utils::extract_json_object(*data, "results");
    if (!results) {
        return false;
    }
    auto entry = http_utils::extract_json_object(*results, id.probe_key());
    if (!entry) {
        return false;
    }

    auto exists = http_utils::extract_json_value(*entry, "exists");
    return exists.has_value() && *exists == "true";
}

auto upload_session::api_path(const std::string& suffix) const -> std::string {
    return "/api/upload/" + http_utils::url_encode(resource_key_) + suffix;
}

auto upload_session::require_open(const char* operation) const -> result<void> {
    if (!is_open()) {
        return unexpected{error{error_code::internal_error,
            std::string(operation) + " called before the session was created"}};
    }
    return {};
}

}  // namespace kcenon::chunked_upload
