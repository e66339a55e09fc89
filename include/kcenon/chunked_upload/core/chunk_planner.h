/**
 * @file chunk_planner.h
 * @brief Adaptive chunk size selection and file geometry
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHUNK_PLANNER_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHUNK_PLANNER_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstdint>
#include <optional>

namespace kcenon::chunked_upload {

/**
 * @brief Geometry of a file split into fixed-size chunks
 *
 * planned_chunks is floor(file_size / chunk_size) + 1, an upper bound that
 * is never zero. data_chunk_count() is the number of non-empty byte ranges
 * the reader actually produces.
 */
struct chunk_plan {
    uint64_t file_size = 0;
    uint64_t chunk_size = 0;
    uint64_t planned_chunks = 0;

    [[nodiscard]] auto data_chunk_count() const noexcept -> uint64_t;

    [[nodiscard]] auto chunk_offset(uint64_t index) const noexcept -> uint64_t;

    /**
     * @brief Byte length of the chunk at index (0 past the end of the file)
     */
    [[nodiscard]] auto chunk_length(uint64_t index) const noexcept -> uint64_t;
};

/**
 * @brief Computes chunk size from file size using tiered thresholds
 *
 * groups = ceil(size_mb / 10000); groups < 5 -> 5 MB, < 50 -> 50 MB,
 * < 100 -> 100 MB, otherwise 210 MB.
 */
class chunk_planner {
public:
    static constexpr uint64_t bytes_per_mb = 1024ULL * 1024ULL;
    static constexpr double mb_per_group = 10000.0;

    static constexpr uint64_t small_chunk_mb = 5;
    static constexpr uint64_t medium_chunk_mb = 50;
    static constexpr uint64_t large_chunk_mb = 100;
    static constexpr uint64_t max_chunk_mb = 210;

    static constexpr uint64_t max_chunk_size = max_chunk_mb * bytes_per_mb;

    /**
     * @brief Select the chunk size for a file
     * @param file_size File size in bytes
     * @return Chunk size in bytes
     */
    [[nodiscard]] static auto chunk_size_for(uint64_t file_size) noexcept -> uint64_t;

    /**
     * @brief Planned chunk count, floor(file_size / chunk_size) + 1
     * @note A zero chunk size yields 1.
     */
    [[nodiscard]] static auto chunk_count_for(uint64_t file_size, uint64_t chunk_size) noexcept
        -> uint64_t;

    /**
     * @brief Convert a chunk size given in megabytes to bytes
     * @return Bytes, or invalid_chunk_size when mb is 0 or above max_chunk_mb
     */
    [[nodiscard]] static auto chunk_size_from_mb(uint64_t mb) -> result<uint64_t>;

    /**
     * @brief Plan a file with the tiered chunk size
     */
    [[nodiscard]] static auto plan(uint64_t file_size) noexcept -> chunk_plan;

    /**
     * @brief Plan a file with an explicit chunk size
     * @param file_size File size in bytes
     * @param chunk_size_override Chunk size in bytes (1 .. max_chunk_size)
     * @return Plan or invalid_chunk_size
     */
    [[nodiscard]] static auto plan(uint64_t file_size, uint64_t chunk_size_override)
        -> result<chunk_plan>;

    /**
     * @brief Plan with the override when present, the tiered size otherwise
     */
    [[nodiscard]] static auto plan(uint64_t file_size,
                                   const std::optional<uint64_t>& chunk_size_override)
        -> result<chunk_plan>;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHUNK_PLANNER_H
