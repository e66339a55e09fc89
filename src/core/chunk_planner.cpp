/**
 * @file chunk_planner.cpp
 * @brief Implementation of adaptive chunk planning
 */

#include <kcenon/chunked_upload/core/chunk_planner.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace kcenon::chunked_upload {

// chunk_plan implementation

auto chunk_plan::data_chunk_count() const noexcept -> uint64_t {
    if (chunk_size == 0) {
        return 0;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

auto chunk_plan::chunk_offset(uint64_t index) const noexcept -> uint64_t {
    return std::min(index * chunk_size, file_size);
}

auto chunk_plan::chunk_length(uint64_t index) const noexcept -> uint64_t {
    auto offset = chunk_offset(index);
    return std::min(chunk_size, file_size - offset);
}

// chunk_planner implementation

auto chunk_planner::chunk_size_for(uint64_t file_size) noexcept -> uint64_t {
    double size_mb = static_cast<double>(file_size) / static_cast<double>(bytes_per_mb);
    double groups = std::ceil(size_mb / mb_per_group);

    uint64_t chunk_mb = max_chunk_mb;
    if (groups < 5) {
        chunk_mb = small_chunk_mb;
    } else if (groups < 50) {
        chunk_mb = medium_chunk_mb;
    } else if (groups < 100) {
        chunk_mb = large_chunk_mb;
    }

    return chunk_mb * bytes_per_mb;
}

auto chunk_planner::chunk_count_for(uint64_t file_size, uint64_t chunk_size) noexcept
    -> uint64_t {
    if (chunk_size == 0) {
        return 1;
    }
    return file_size / chunk_size + 1;
}

auto chunk_planner::chunk_size_from_mb(uint64_t mb) -> result<uint64_t> {
    if (mb == 0 || mb > max_chunk_mb) {
        return unexpected{error{error_code::invalid_chunk_size,
            "chunk size must be between 1 and " + std::to_string(max_chunk_mb) +
            " MB, got " + std::to_string(mb)}};
    }
    return mb * bytes_per_mb;
}

auto chunk_planner::plan(uint64_t file_size) noexcept -> chunk_plan {
    chunk_plan p;
    p.file_size = file_size;
    p.chunk_size = chunk_size_for(file_size);
    p.planned_chunks = chunk_count_for(file_size, p.chunk_size);
    return p;
}

auto chunk_planner::plan(uint64_t file_size, uint64_t chunk_size_override)
    -> result<chunk_plan> {
    if (chunk_size_override == 0 || chunk_size_override > max_chunk_size) {
        return unexpected{error{error_code::invalid_chunk_size,
            "chunk size must be between 1 byte and " +
            std::to_string(max_chunk_mb) + " MB, got " +
            std::to_string(chunk_size_override)}};
    }

    chunk_plan p;
    p.file_size = file_size;
    p.chunk_size = chunk_size_override;
    p.planned_chunks = chunk_count_for(file_size, p.chunk_size);
    return p;
}

auto chunk_planner::plan(uint64_t file_size,
                         const std::optional<uint64_t>& chunk_size_override)
    -> result<chunk_plan> {
    if (chunk_size_override) {
        return plan(file_size, *chunk_size_override);
    }
    return plan(file_size);
}

}  // namespace kcenon::chunked_upload
