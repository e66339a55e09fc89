/**
 * @file upload_session.h
 * @brief Remote upload session: create, probe, upload, finalize
 */

#ifndef KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_SESSION_H
#define KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_SESSION_H

#include "kcenon/chunked_upload/core/chunk_types.h"
#include "kcenon/chunked_upload/core/content_address.h"
#include "kcenon/chunked_upload/core/types.h"
#include "kcenon/chunked_upload/transport/retry_policy.h"
#include "kcenon/chunked_upload/transport/transport_client.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief One logical transfer against `{base}/api/upload/{resource_key}`
 *
 * Every remote operation runs under the session's retry_executor: transient
 * outcomes are retried with backoff, an unauthorized response aborts at
 * once. After create() succeeds, probe() and upload() may be called from
 * several threads concurrently.
 */
class upload_session {
public:
    static constexpr int status_ok = 200;
    static constexpr int status_created = 201;
    static constexpr const char* upload_field_name = "chunk";

    upload_session(std::shared_ptr<transport_client> transport,
                   std::string resource_key,
                   retry_executor retry);

    /**
     * @brief Open the remote session
     *
     * POST {base}/api/upload/{key}/create, expects 201 and {"uploadId": ...}.
     * @return Session id issued by the server
     */
    [[nodiscard]] auto create() -> result<std::string>;

    /**
     * @brief Ask whether a chunk with this identifier is already stored
     *
     * POST .../chunk/probe?uploadId={id} with {"chunks":[{"hash","size"}]},
     * expects 200 and reads data.results["sha256-<identifier>"].exists.
     * A result entry that is absent means the chunk does not exist.
     */
    [[nodiscard]] auto probe(const content_identifier& id) const -> result<bool>;

    /**
     * @brief Transmit chunk bytes as multipart field "chunk"
     *
     * POST .../chunk/{identifier}?uploadId={id}&partNumber={n}, accepts
     * 200 or 201.
     * @param part_number 1-based part number
     * @param file_name Base name reported as the part's filename
     */
    [[nodiscard]] auto upload(const content_identifier& id,
                              std::span<const std::byte> data,
                              uint64_t part_number,
                              const std::string& file_name) const -> result<void>;

    /**
     * @brief Commit the ordered manifest
     *
     * POST .../file/chunked?uploadId={id} with {"chunks", "name", "mimeType"},
     * accepts 200 or 201.
     */
    [[nodiscard]] auto finalize(const ordered_identifier_list& manifest,
                                const std::string& file_name,
                                const std::string& mime_type) -> result<void>;

    [[nodiscard]] auto session_id() const -> const std::string&;

    [[nodiscard]] auto resource_key() const -> const std::string&;

    [[nodiscard]] auto is_open() const noexcept -> bool;

    [[nodiscard]] auto is_finalized() const noexcept -> bool;

    /**
     * @brief Render identifiers as the wire array [{"hash":..,"size":..},...]
     */
    [[nodiscard]] static auto chunks_json(std::span<const content_identifier> ids)
        -> std::string;

    /**
     * @brief Read the existence flag for one identifier from a probe reply
     * @return exists flag, or malformed_response for a non-object body
     */
    [[nodiscard]] static auto parse_probe_response(const std::string& body,
                                                   const content_identifier& id)
        -> result<bool>;

private:
    [[nodiscard]] auto api_path(const std::string& suffix) const -> std::string;

    [[nodiscard]] auto require_open(const char* operation) const -> result<void>;

    std::shared_ptr<transport_client> transport_;
    std::string resource_key_;
    retry_executor retry_;
    std::string session_id_;
    bool finalized_ = false;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_UPLOAD_UPLOAD_SESSION_H
