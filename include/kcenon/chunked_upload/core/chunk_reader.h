/**
 * @file chunk_reader.h
 * @brief Sequential chunk reader over the source file
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHUNK_READER_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHUNK_READER_H

#include <kcenon/chunked_upload/core/chunk_planner.h>
#include <kcenon/chunked_upload/core/chunk_types.h>
#include <kcenon/chunked_upload/core/types.h>

#include <filesystem>
#include <fstream>

namespace kcenon::chunked_upload {

/**
 * @brief Reads a file strictly front to back in plan-sized pieces
 *
 * The reader is the single owner of the file handle. Each call to next()
 * returns the following chunk with the next index; the last chunk is
 * short when the file size is not a multiple of the chunk size. An empty
 * file yields no chunks.
 */
class chunk_reader {
public:
    /**
     * @brief Open a file for sequential reading
     * @param file_path Source file
     * @param plan Geometry computed for the file
     * @return Reader or file_not_found / file_access_denied
     */
    [[nodiscard]] static auto open(const std::filesystem::path& file_path,
                                   const chunk_plan& plan) -> result<chunk_reader>;

    [[nodiscard]] auto has_next() const -> bool;

    /**
     * @brief Read the next chunk
     * @return Chunk, or file_read_error when the file ends early
     */
    [[nodiscard]] auto next() -> result<chunk>;

    [[nodiscard]] auto current_index() const -> uint64_t;

    [[nodiscard]] auto bytes_read() const -> uint64_t;

    [[nodiscard]] auto plan() const -> const chunk_plan&;

    // Move-only
    chunk_reader(chunk_reader&&) noexcept;
    auto operator=(chunk_reader&&) noexcept -> chunk_reader&;
    ~chunk_reader();

    chunk_reader(const chunk_reader&) = delete;
    auto operator=(const chunk_reader&) -> chunk_reader& = delete;

private:
    chunk_reader(std::ifstream file, std::filesystem::path path, chunk_plan plan);

    std::ifstream file_;
    std::filesystem::path path_;
    chunk_plan plan_;
    uint64_t current_index_;
    uint64_t bytes_read_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHUNK_READER_H
