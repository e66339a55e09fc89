/**
 * @file content_address.h
 * @brief Content identifiers derived from chunk bytes
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CONTENT_ADDRESS_H
#define KCENON_CHUNKED_UPLOAD_CORE_CONTENT_ADDRESS_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::chunked_upload {

/**
 * @brief Composite key identifying a chunk by its content
 *
 * Rendered as "<lowercase hex sha256>-<decimal byte length>". The digest is
 * hex only, so splitting on the first separator always yields exactly
 * (digest, size).
 */
struct content_identifier {
    static constexpr char separator = '-';
    static constexpr std::size_t digest_hex_length = 64;
    static constexpr std::string_view algorithm = "sha256";

    std::string digest;
    uint64_t size = 0;

    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Decimal rendering of size as sent on the wire
     */
    [[nodiscard]] auto size_string() const -> std::string;

    /**
     * @brief Key under which the service reports probe results
     * @return "sha256-<identifier>"
     */
    [[nodiscard]] auto probe_key() const -> std::string;

    /**
     * @brief Split an identifier string back into digest and size
     * @param text Identifier in "<hex>-<size>" form
     * @return Identifier or invalid_content_identifier
     */
    [[nodiscard]] static auto parse(std::string_view text) -> result<content_identifier>;

    [[nodiscard]] auto operator==(const content_identifier& other) const -> bool = default;
};

/**
 * @brief Computes content identifiers with OpenSSL SHA-256
 */
class content_addresser {
public:
    /**
     * @brief Identify a byte buffer
     * @param data Chunk bytes
     * @return Identifier, or internal_error if the digest could not be computed
     */
    [[nodiscard]] static auto compute(std::span<const std::byte> data)
        -> result<content_identifier>;

    /**
     * @brief Lowercase hex SHA-256 of a byte buffer
     */
    [[nodiscard]] static auto digest_hex(std::span<const std::byte> data) -> result<std::string>;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CONTENT_ADDRESS_H
