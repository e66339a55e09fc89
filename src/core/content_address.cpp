/**
 * @file content_address.cpp
 * @brief Implementation of content identifiers
 */

#include <kcenon/chunked_upload/core/content_address.h>

#include <openssl/evp.h>

#include <array>
#include <charconv>

namespace kcenon::chunked_upload {

namespace {

constexpr const char* HEX_DIGITS = "0123456789abcdef";

auto is_lower_hex(char c) -> bool {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

}  // namespace

// content_identifier implementation

auto content_identifier::to_string() const -> std::string {
    return digest + separator + size_string();
}

auto content_identifier::size_string() const -> std::string {
    return std::to_string(size);
}

auto content_identifier::probe_key() const -> std::string {
    return std::string(algorithm) + separator + to_string();
}

auto content_identifier::parse(std::string_view text) -> result<content_identifier> {
    auto sep = text.find(separator);
    if (sep == std::string_view::npos) {
        return unexpected{error{error_code::invalid_content_identifier,
            "missing separator in identifier: " + std::string(text)}};
    }

    auto digest_part = text.substr(0, sep);
    auto size_part = text.substr(sep + 1);

    if (digest_part.size() != digest_hex_length) {
        return unexpected{error{error_code::invalid_content_identifier,
            "digest must be " + std::to_string(digest_hex_length) +
            " hex characters: " + std::string(text)}};
    }
    for (char c : digest_part) {
        if (!is_lower_hex(c)) {
            return unexpected{error{error_code::invalid_content_identifier,
                "digest is not lowercase hex: " + std::string(text)}};
        }
    }

    if (size_part.empty() || (size_part.size() > 1 && size_part.front() == '0')) {
        return unexpected{error{error_code::invalid_content_identifier,
            "size is not a canonical decimal number: " + std::string(text)}};
    }

    uint64_t size = 0;
    auto [ptr, ec] = std::from_chars(size_part.data(), size_part.data() + size_part.size(), size);
    if (ec != std::errc{} || ptr != size_part.data() + size_part.size()) {
        return unexpected{error{error_code::invalid_content_identifier,
            "size is not a decimal number: " + std::string(text)}};
    }

    content_identifier id;
    id.digest = std::string(digest_part);
    id.size = size;
    return id;
}

// content_addresser implementation

auto content_addresser::digest_hex(std::span<const std::byte> data) -> result<std::string> {
    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hash_len = 0;

    if (EVP_Digest(data.data(), data.size(), hash.data(), &hash_len,
                   EVP_sha256(), nullptr) != 1) {
        return unexpected{error{error_code::internal_error, "SHA-256 digest failed"}};
    }

    std::string hex;
    hex.reserve(static_cast<std::size_t>(hash_len) * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += HEX_DIGITS[hash[i] >> 4];
        hex += HEX_DIGITS[hash[i] & 0x0F];
    }
    return hex;
}

auto content_addresser::compute(std::span<const std::byte> data)
    -> result<content_identifier> {
    auto hex = digest_hex(data);
    if (!hex) {
        return unexpected{hex.error()};
    }

    content_identifier id;
    id.digest = std::move(hex.value());
    id.size = data.size();
    return id;
}

}  // namespace kcenon::chunked_upload
