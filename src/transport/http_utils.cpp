/**
 * @file http_utils.cpp
 * @brief Encoding, JSON and multipart helpers for the upload protocol
 */

#include "kcenon/chunked_upload/transport/http_utils.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <unordered_map>

namespace kcenon::chunked_upload::http_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

namespace {
constexpr const char* BASE64_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr const char* WHITESPACE = " \t\n\r";

auto append(std::vector<uint8_t>& out, const std::string& text) -> void {
    out.insert(out.end(), text.begin(), text.end());
}

auto escape_quoted(const std::string& value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

/**
 * @brief Position just past the ':' following "key", with whitespace skipped
 */
auto find_value_start(const std::string& json, const std::string& key)
    -> std::optional<std::size_t> {
    std::string search = "\"" + key + "\"";
    auto pos = json.find(search);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos = json.find_first_not_of(WHITESPACE, pos + search.length());
    if (pos == std::string::npos || json[pos] != ':') {
        return std::nullopt;
    }

    pos = json.find_first_not_of(WHITESPACE, pos + 1);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}
}  // namespace

auto base64_encode(const std::string& data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16;
        if (i + 1 < data.size()) {
            n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8;
        }
        if (i + 2 < data.size()) {
            n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 2]));
        }

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto url_encode(const std::string& value) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto basic_auth_header(const std::string& username, const std::string& token) -> std::string {
    return "Basic " + base64_encode(username + ":" + token);
}

// ============================================================================
// JSON Utilities
// ============================================================================

auto escape_json(const std::string& value) -> std::string {
    std::string output;
    output.reserve(value.size() + 8);
    for (char c : value) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    output += oss.str();
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string> {
    auto start = find_value_start(json, key);
    if (!start) {
        return std::nullopt;
    }
    auto pos = *start;

    if (json[pos] == '"') {
        auto end_pos = pos + 1;
        while (end_pos < json.size()) {
            if (json[end_pos] == '"' && json[end_pos - 1] != '\\') {
                break;
            }
            ++end_pos;
        }
        if (end_pos >= json.size()) {
            return std::nullopt;
        }
        return json.substr(pos + 1, end_pos - pos - 1);
    }

    auto end_pos = json.find_first_of(",}]\n", pos);
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    auto value = json.substr(pos, end_pos - pos);
    auto last = value.find_last_not_of(WHITESPACE);
    return last == std::string::npos ? std::string{} : value.substr(0, last + 1);
}

auto extract_json_object(const std::string& json,
                         const std::string& key) -> std::optional<std::string> {
    auto start = find_value_start(json, key);
    if (!start || json[*start] != '{') {
        return std::nullopt;
    }

    int depth = 0;
    bool in_string = false;
    for (auto pos = *start; pos < json.size(); ++pos) {
        char c = json[pos];
        if (in_string) {
            if (c == '\\') {
                ++pos;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return json.substr(*start, pos - *start + 1);
            }
        }
    }

    return std::nullopt;
}

auto is_json_object(const std::string& json) -> bool {
    auto first = json.find_first_not_of(WHITESPACE);
    auto last = json.find_last_not_of(WHITESPACE);
    return first != std::string::npos && json[first] == '{' && json[last] == '}';
}

// ============================================================================
// Multipart Utilities
// ============================================================================

auto build_multipart_file(const std::string& field_name,
                          const std::string& file_name,
                          std::span<const std::byte> content,
                          std::string boundary) -> multipart_body {
    multipart_body body;
    body.boundary = boundary.empty() ? generate_random_hex(30) : std::move(boundary);

    body.data.reserve(content.size() + 256);
    append(body.data, "--" + body.boundary + "\r\n");
    append(body.data, "Content-Disposition: form-data; name=\"" + escape_quoted(field_name) +
                          "\"; filename=\"" + escape_quoted(file_name) + "\"\r\n");
    append(body.data, "Content-Type: application/octet-stream\r\n\r\n");

    const auto* bytes = reinterpret_cast<const uint8_t*>(content.data());
    body.data.insert(body.data.end(), bytes, bytes + content.size());

    append(body.data, "\r\n--" + body.boundary + "--\r\n");
    return body;
}

// ============================================================================
// Random Utilities
// ============================================================================

auto generate_random_hex(std::size_t byte_count) -> std::string {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    for (std::size_t i = 0; i < byte_count; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << dis(gen);
    }
    return oss.str();
}

// ============================================================================
// Content Type Detection
// ============================================================================

auto detect_content_type(const std::string& file_name) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".log", "text/plain"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tgz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".webm", "video/webm"},
    };

    auto sep_pos = file_name.find_last_of("/\\");
    auto dot_pos = file_name.rfind('.');
    if (dot_pos == std::string::npos ||
        (sep_pos != std::string::npos && dot_pos < sep_pos)) {
        return "application/octet-stream";
    }

    std::string ext = file_name.substr(dot_pos);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = mime_types.find(ext);
    if (it != mime_types.end()) {
        return it->second;
    }

    return "application/octet-stream";
}

}  // namespace kcenon::chunked_upload::http_utils
