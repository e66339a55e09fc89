/**
 * @file chunk_types.h
 * @brief Chunk, per-chunk outcome and manifest types
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHUNK_TYPES_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHUNK_TYPES_H

#include <kcenon/chunked_upload/core/content_address.h>
#include <kcenon/chunked_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief A contiguous byte range of the source file
 */
struct chunk {
    uint64_t index = 0;
    uint64_t offset = 0;
    std::vector<std::byte> data;

    /**
     * @brief 1-based part number used on the wire
     */
    [[nodiscard]] auto part_number() const noexcept -> uint64_t { return index + 1; }

    [[nodiscard]] auto size() const noexcept -> uint64_t { return data.size(); }

    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::byte> {
        return std::span<const std::byte>(data);
    }
};

/**
 * @brief Step of the per-chunk pipeline
 */
enum class chunk_operation {
    read,
    hash,
    probe,
    upload,
};

[[nodiscard]] constexpr auto to_string(chunk_operation op) -> const char* {
    switch (op) {
        case chunk_operation::read: return "read";
        case chunk_operation::hash: return "hash";
        case chunk_operation::probe: return "probe";
        case chunk_operation::upload: return "upload";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of processing one chunk
 */
struct chunk_result {
    uint64_t index = 0;
    content_identifier identifier;
    bool uploaded = false;
    std::optional<error> failure;
    std::optional<chunk_operation> failed_operation;

    [[nodiscard]] auto succeeded() const noexcept -> bool { return !failure.has_value(); }

    [[nodiscard]] static auto success(uint64_t index, content_identifier id, bool uploaded)
        -> chunk_result {
        chunk_result r;
        r.index = index;
        r.identifier = std::move(id);
        r.uploaded = uploaded;
        return r;
    }

    /**
     * @brief Failed outcome; the message is prefixed with chunk index and step
     */
    [[nodiscard]] static auto failed(uint64_t index, chunk_operation op, const error& err)
        -> chunk_result {
        chunk_result r;
        r.index = index;
        r.failed_operation = op;
        r.failure = error{err.code, "chunk " + std::to_string(index) + " " +
                                        to_string(op) + ": " + err.message};
        return r;
    }
};

/**
 * @brief Finalize payload: identifiers in ascending chunk index order
 */
using ordered_identifier_list = std::vector<content_identifier>;

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHUNK_TYPES_H
