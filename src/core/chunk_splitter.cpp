/**
 * @file chunk_splitter.cpp
 * @brief Implementation of file splitting into chunks
 */

#include <kcenon/serial_transfer/core/chunk_splitter.h>

#include <limits>

namespace kcenon::serial_transfer {

namespace {

auto stat_regular_file(const std::filesystem::path& file_path) -> result<uint64_t> {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + file_path.string()});
    }

    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return unexpected(
            error{error_code::invalid_file_path, "not a regular file: " + file_path.string()});
    }

    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_access_denied, "cannot get file size: " + file_path.string()});
    }

    return static_cast<uint64_t>(file_size);
}

}  // namespace

// chunk_iterator implementation

chunk_splitter::chunk_iterator::chunk_iterator(
    std::ifstream file,
    chunk_config config,
    uint64_t file_size,
    uint64_t total_chunks)
    : file_(std::move(file)),
      config_(config),
      file_size_(file_size),
      total_chunks_(total_chunks),
      current_index_(0) {
    buffer_.resize(config_.chunk_size);
}

chunk_splitter::chunk_iterator::chunk_iterator(chunk_iterator&& other) noexcept
    : file_(std::move(other.file_)),
      config_(other.config_),
      file_size_(other.file_size_),
      total_chunks_(other.total_chunks_),
      current_index_(other.current_index_),
      buffer_(std::move(other.buffer_)) {
    other.total_chunks_ = 0;
    other.current_index_ = 0;
}

auto chunk_splitter::chunk_iterator::operator=(chunk_iterator&& other) noexcept
    -> chunk_iterator& {
    if (this != &other) {
        file_ = std::move(other.file_);
        config_ = other.config_;
        file_size_ = other.file_size_;
        total_chunks_ = other.total_chunks_;
        current_index_ = other.current_index_;
        buffer_ = std::move(other.buffer_);

        other.total_chunks_ = 0;
        other.current_index_ = 0;
    }
    return *this;
}

chunk_splitter::chunk_iterator::~chunk_iterator() = default;

auto chunk_splitter::chunk_iterator::has_next() const -> bool {
    return current_index_ < total_chunks_;
}

auto chunk_splitter::chunk_iterator::next() -> result<chunk> {
    if (!has_next()) {
        return unexpected(error{error_code::internal_error, "no more chunks available"});
    }

    if (!file_.good()) {
        return unexpected(error{error_code::file_read_error, "file stream error"});
    }

    uint64_t offset = current_index_ * config_.chunk_size;
    auto bytes_to_read =
        static_cast<std::size_t>(config_.chunk_length(file_size_, current_index_));

    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file_.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed"});
    }

    file_.read(reinterpret_cast<char*>(buffer_.data()),
               static_cast<std::streamsize>(bytes_to_read));
    auto bytes_read = static_cast<std::size_t>(file_.gcount());

    // A file truncated underneath us shows up here
    if (bytes_read != bytes_to_read) {
        return unexpected(error{
            error_code::file_read_error,
            "short read at offset " + std::to_string(offset) + ": expected " +
                std::to_string(bytes_to_read) + " bytes, got " + std::to_string(bytes_read)});
    }

    chunk c;
    c.index = current_index_;
    c.offset = offset;
    c.data.assign(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(bytes_read));

    ++current_index_;

    return c;
}

auto chunk_splitter::chunk_iterator::seek(uint64_t index) -> result<void> {
    if (index > total_chunks_) {
        return unexpected(error{
            error_code::invalid_configuration,
            "chunk index " + std::to_string(index) + " out of range (total " +
                std::to_string(total_chunks_) + ")"});
    }

    file_.clear();
    current_index_ = index;
    return {};
}

auto chunk_splitter::chunk_iterator::current_index() const -> uint64_t {
    return current_index_;
}

auto chunk_splitter::chunk_iterator::total_chunks() const -> uint64_t {
    return total_chunks_;
}

auto chunk_splitter::chunk_iterator::file_size() const -> uint64_t {
    return file_size_;
}

// chunk_splitter implementation

chunk_splitter::chunk_splitter() : config_() {}

chunk_splitter::chunk_splitter(const chunk_config& config) : config_(config) {}

auto chunk_splitter::split(const std::filesystem::path& file_path) -> result<chunk_iterator> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto size_result = stat_regular_file(file_path);
    if (!size_result) {
        return unexpected(size_result.error());
    }
    auto file_size = size_result.value();

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_access_denied, "cannot open file: " + file_path.string()});
    }

    return chunk_iterator(
        std::move(file), config_, file_size, config_.calculate_chunk_count(file_size));
}

auto chunk_splitter::calculate_metadata(const std::filesystem::path& file_path)
    -> result<file_metadata> {
    auto size_result = stat_regular_file(file_path);
    if (!size_result) {
        return unexpected(size_result.error());
    }

    auto name = file_path.filename().string();
    if (name.empty() || name.size() > std::numeric_limits<uint8_t>::max()) {
        return unexpected(
            error{error_code::invalid_file_path, "unusable file name: " + file_path.string()});
    }

    file_metadata metadata;
    metadata.filename = std::move(name);
    metadata.file_size = size_result.value();
    metadata.chunk_size = config_.chunk_size;
    metadata.total_chunks = config_.calculate_chunk_count(metadata.file_size);

    return metadata;
}

auto chunk_splitter::config() const -> const chunk_config& {
    return config_;
}

}  // namespace kcenon::serial_transfer
