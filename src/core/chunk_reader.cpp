/**
 * @file chunk_reader.cpp
 * @brief Implementation of the sequential chunk reader
 */

#include <kcenon/chunked_upload/core/chunk_reader.h>

#include <string>

namespace kcenon::chunked_upload {

chunk_reader::chunk_reader(std::ifstream file, std::filesystem::path path, chunk_plan plan)
    : file_(std::move(file)),
      path_(std::move(path)),
      plan_(plan),
      current_index_(0),
      bytes_read_(0) {}

chunk_reader::chunk_reader(chunk_reader&& other) noexcept
    : file_(std::move(other.file_)),
      path_(std::move(other.path_)),
      plan_(other.plan_),
      current_index_(other.current_index_),
      bytes_read_(other.bytes_read_) {
    other.plan_ = chunk_plan{};
    other.current_index_ = 0;
    other.bytes_read_ = 0;
}

auto chunk_reader::operator=(chunk_reader&& other) noexcept -> chunk_reader& {
    if (this != &other) {
        file_ = std::move(other.file_);
        path_ = std::move(other.path_);
        plan_ = other.plan_;
        current_index_ = other.current_index_;
        bytes_read_ = other.bytes_read_;

        other.plan_ = chunk_plan{};
        other.current_index_ = 0;
        other.bytes_read_ = 0;
    }
    return *this;
}

chunk_reader::~chunk_reader() = default;

auto chunk_reader::open(const std::filesystem::path& file_path, const chunk_plan& plan)
    -> result<chunk_reader> {
    if (plan.chunk_size == 0) {
        return unexpected{error{error_code::invalid_chunk_size, "chunk size must not be zero"}};
    }

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return unexpected{
            error{error_code::file_not_found, "file not found: " + file_path.string()}};
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return unexpected{
            error{error_code::file_access_denied, "cannot open file: " + file_path.string()}};
    }

    return chunk_reader(std::move(file), file_path, plan);
}

auto chunk_reader::has_next() const -> bool {
    return bytes_read_ < plan_.file_size;
}

auto chunk_reader::next() -> result<chunk> {
    if (!has_next()) {
        return unexpected{error{error_code::file_read_error, "no more chunks available"}};
    }

    if (!file_.good()) {
        return unexpected{
            error{error_code::file_read_error, "file stream error: " + path_.string()}};
    }

    auto length = plan_.chunk_length(current_index_);

    chunk c;
    c.index = current_index_;
    c.offset = bytes_read_;
    c.data.resize(static_cast<std::size_t>(length));

    file_.read(reinterpret_cast<char*>(c.data.data()), static_cast<std::streamsize>(length));
    auto got = static_cast<uint64_t>(file_.gcount());

    if (got != length) {
        return unexpected{error{error_code::file_read_error,
            "short read at offset " + std::to_string(bytes_read_) + ": expected " +
            std::to_string(length) + " bytes, got " + std::to_string(got)}};
    }

    bytes_read_ += got;
    ++current_index_;

    return c;
}

auto chunk_reader::current_index() const -> uint64_t {
    return current_index_;
}

auto chunk_reader::bytes_read() const -> uint64_t {
    return bytes_read_;
}

auto chunk_reader::plan() const -> const chunk_plan& {
    return plan_;
}

}  // namespace kcenon::chunked_upload
