/**
 * @file chunked_upload_cli.cpp
 * @brief Command line front end for chunked_uploader
 *
 * This example demonstrates:
 * - Building an uploader from flags and environment variables
 * - Rendering progress from the progress callback
 * - Switching the library logger to JSON output
 * - Reporting the single error that ends a failed upload
 */

#include <kcenon/chunked_upload/chunked_upload.h>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using namespace kcenon::chunked_upload;

namespace {

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto env_or_empty(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string{};
}

void print_usage(const char* program) {
    std::cout << "Chunked Upload - content-addressed file upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <ISSUE-KEY> <FILEPATH>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -u, --user <user>         Account name (default: $CHUNKED_UPLOAD_USER)" << std::endl;
    std::cout << "  -t, --token <token>       API token (default: $CHUNKED_UPLOAD_TOKEN)" << std::endl;
    std::cout << "  --url <url>               Service base URL (default: "
              << uploader_config::default_base_url << ")" << std::endl;
    std::cout << "  -j, --max-in-flight <n>   Chunks in flight at once (default: "
              << uploader_config::default_max_in_flight << ")" << std::endl;
    std::cout << "  --chunk-size-mb <mb>      Fixed chunk size instead of the tiered one" << std::endl;
    std::cout << "  --mime-type <type>        MIME type reported on finalize" << std::endl;
    std::cout << "  -v, --verbose             Debug logging" << std::endl;
    std::cout << "  --json-logs               Emit logs as JSON lines" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " PROJ-123 ./archive.tar" << std::endl;
    std::cout << "  " << program << " -u me@example.com -t $TOKEN -j 4 PROJ-123 big.iso" << std::endl;
}

auto parse_count(const std::string& flag, const char* text) -> std::optional<uint64_t> {
    try {
        std::size_t pos = 0;
        auto value = std::stoull(text, &pos);
        if (pos != std::string(text).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        std::cerr << "Error: " << flag << " expects a positive integer, got '" << text << "'"
                  << std::endl;
        return std::nullopt;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string user = env_or_empty("CHUNKED_UPLOAD_USER");
    std::string token = env_or_empty("CHUNKED_UPLOAD_TOKEN");
    std::string base_url = uploader_config::default_base_url;
    std::size_t max_in_flight = uploader_config::default_max_in_flight;
    std::optional<uint64_t> chunk_size_mb;
    std::optional<std::string> mime_type;
    bool verbose = false;
    bool json_logs = false;
    std::string resource_key;
    std::string file_path;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* flag) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << flag << " requires an argument" << std::endl;
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-u" || arg == "--user") {
            auto value = next_value("--user");
            if (!value) return 1;
            user = value;
        } else if (arg == "-t" || arg == "--token") {
            auto value = next_value("--token");
            if (!value) return 1;
            token = value;
        } else if (arg == "--url") {
            auto value = next_value("--url");
            if (!value) return 1;
            base_url = value;
        } else if (arg == "-j" || arg == "--max-in-flight") {
            auto value = next_value("--max-in-flight");
            if (!value) return 1;
            auto count = parse_count("--max-in-flight", value);
            if (!count) return 1;
            max_in_flight = static_cast<std::size_t>(*count);
        } else if (arg == "--chunk-size-mb") {
            auto value = next_value("--chunk-size-mb");
            if (!value) return 1;
            chunk_size_mb = parse_count("--chunk-size-mb", value);
            if (!chunk_size_mb) return 1;
        } else if (arg == "--mime-type") {
            auto value = next_value("--mime-type");
            if (!value) return 1;
            mime_type = value;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--json-logs") {
            json_logs = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else if (resource_key.empty()) {
            resource_key = arg;
        } else if (file_path.empty()) {
            file_path = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if (resource_key.empty() || file_path.empty()) {
        std::cerr << "Error: Both ISSUE-KEY and FILEPATH are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    get_logger().initialize();
    get_logger().set_level(verbose ? log_level::debug : log_level::info);
    get_logger().enable_json_output(json_logs);

    auto builder = chunked_uploader::builder();
    builder.with_base_url(base_url)
        .with_resource_key(resource_key)
        .with_credentials(user, token)
        .with_max_in_flight(max_in_flight)
        .with_progress_callback([](const upload_progress& progress) {
            std::cout << "\r[" << progress.completed_chunks << "/" << progress.planned_chunks
                      << "] " << std::fixed << std::setprecision(1) << progress.percentage()
                      << "% " << format_bytes(progress.bytes_processed) << "/"
                      << format_bytes(progress.file_size)
                      << (progress.deduplicated ? " (already stored)" : "") << "     "
                      << std::flush;
        });

    if (chunk_size_mb) {
        auto bytes = chunk_planner::chunk_size_from_mb(*chunk_size_mb);
        if (!bytes.has_value()) {
            std::cerr << "Error: --chunk-size-mb: " << bytes.error().message << std::endl;
            get_logger().shutdown();
            return 1;
        }
        builder.with_chunk_size(bytes.value());
    }
    if (mime_type) {
        builder.with_mime_type(*mime_type);
    }

    auto uploader = builder.build();
    if (!uploader.has_value()) {
        std::cerr << "Error: " << uploader.error().message << std::endl;
        if (uploader.error().code == error_code::missing_credentials) {
            std::cerr << "Hint: pass --user/--token or set CHUNKED_UPLOAD_USER and "
                         "CHUNKED_UPLOAD_TOKEN"
                      << std::endl;
        }
        get_logger().shutdown();
        return 1;
    }

    auto file_name = std::filesystem::path(file_path).filename().string();
    auto summary = uploader.value().upload(file_path);
    std::cout << std::endl;

    if (!summary.has_value()) {
        const auto& err = summary.error();
        std::cerr << "Upload failed [" << to_string(err.code) << "]: " << err.message
                  << std::endl;
        if (err.category() == error_category::authentication) {
            std::cerr << "Hint: check the user name and API token" << std::endl;
        }
        get_logger().shutdown();
        return 1;
    }

    const auto& s = summary.value();
    std::cout << "Successfully uploaded " << file_name << " to " << resource_key << std::endl;
    std::cout << "  Size: " << format_bytes(s.file_size) << " in " << s.chunk_count
              << " chunks of " << format_bytes(s.chunk_size) << std::endl;
    std::cout << "  Sent: " << s.chunks_uploaded << " chunks (" << format_bytes(s.bytes_uploaded)
              << "), already stored: " << s.chunks_deduplicated << std::endl;
    std::cout << "  Time: " << s.elapsed.count() << " ms" << std::endl;

    get_logger().shutdown();
    return 0;
}
