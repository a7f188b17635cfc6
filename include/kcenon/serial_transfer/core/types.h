/**
 * @file types.h
 * @brief Core type definitions for serial_trans_system
 */

#ifndef KCENON_SERIAL_TRANSFER_CORE_TYPES_H
#define KCENON_SERIAL_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::serial_transfer {

/**
 * @brief Error codes for serial transfer operations
 */
enum class error_code {
    success = 0,

    // Frame errors (-100 to -119)
    frame_incomplete = -100,
    frame_corrupt = -101,
    frame_too_large = -102,
    invalid_frame_type = -103,
    invalid_payload = -104,

    // Transfer errors (-120 to -139)
    ack_timeout = -120,
    retries_exhausted = -121,
    transfer_rejected = -122,
    chunk_sequence_error = -123,
    file_hash_mismatch = -124,
    transfer_cancelled = -125,
    handshake_failed = -126,
    protocol_mismatch = -127,
    no_active_file = -128,
    receive_stalled = -129,

    // Channel errors (-140 to -159)
    channel_open_failed = -140,
    channel_config_failed = -141,
    channel_read_error = -142,
    channel_write_error = -143,
    channel_closed = -144,

    // File system errors (-160 to -179)
    file_not_found = -160,
    file_access_denied = -161,
    invalid_file_path = -162,
    file_read_error = -163,
    file_write_error = -164,

    // Configuration errors (-180 to -199)
    invalid_chunk_size = -180,
    invalid_configuration = -181,
    invalid_baud_rate = -182,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
    already_initialized = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::frame_incomplete:
            return "frame incomplete";
        case error_code::frame_corrupt:
            return "frame corrupt";
        case error_code::frame_too_large:
            return "frame too large";
        case error_code::invalid_frame_type:
            return "invalid frame type";
        case error_code::invalid_payload:
            return "invalid payload";
        case error_code::ack_timeout:
            return "acknowledgement timeout";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::transfer_rejected:
            return "transfer rejected by peer";
        case error_code::chunk_sequence_error:
            return "chunk sequence error";
        case error_code::file_hash_mismatch:
            return "file hash mismatch";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::handshake_failed:
            return "handshake failed";
        case error_code::protocol_mismatch:
            return "protocol mismatch";
        case error_code::no_active_file:
            return "no active file";
        case error_code::receive_stalled:
            return "receive stalled";
        case error_code::channel_open_failed:
            return "channel open failed";
        case error_code::channel_config_failed:
            return "channel configuration failed";
        case error_code::channel_read_error:
            return "channel read error";
        case error_code::channel_write_error:
            return "channel write error";
        case error_code::channel_closed:
            return "channel closed";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_baud_rate:
            return "invalid baud rate";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Direction of a single file task relative to this endpoint
 */
enum class transfer_direction : uint8_t {
    send = 0,
    receive = 1,
};

[[nodiscard]] constexpr auto to_string(transfer_direction dir) -> const char* {
    return dir == transfer_direction::send ? "send" : "receive";
}

/**
 * @brief Which sub-protocols a session runs
 */
enum class session_mode : uint8_t {
    send = 1,
    recv = 2,
    both = 3,
};

[[nodiscard]] constexpr auto to_string(session_mode mode) -> const char* {
    switch (mode) {
        case session_mode::send:
            return "send";
        case session_mode::recv:
            return "recv";
        case session_mode::both:
            return "both";
        default:
            return "unknown";
    }
}

[[nodiscard]] constexpr auto sends_files(session_mode mode) -> bool {
    return mode == session_mode::send || mode == session_mode::both;
}

[[nodiscard]] constexpr auto receives_files(session_mode mode) -> bool {
    return mode == session_mode::recv || mode == session_mode::both;
}

/**
 * @brief One bounded slice of a file
 *
 * offset is always index * chunk_size of the owning file.
 */
struct chunk {
    uint64_t index;
    uint64_t offset;
    std::vector<std::byte> data;

    chunk() : index(0), offset(0) {}
};

/**
 * @brief File metadata announced by FILE_META
 *
 * total_chunks is ceil(file_size / chunk_size); a zero-byte file has none.
 */
struct file_metadata {
    std::string filename;
    uint64_t file_size;
    uint64_t total_chunks;
    uint32_t chunk_size;

    file_metadata() : file_size(0), total_chunks(0), chunk_size(0) {}

    [[nodiscard]] auto operator==(const file_metadata& other) const -> bool = default;
};

/**
 * @brief Assembly progress information
 */
struct assembly_progress {
    uint64_t total_chunks;
    uint64_t received_chunks;
    uint64_t bytes_written;

    [[nodiscard]] auto completion_percentage() const -> double {
        if (total_chunks == 0) return 100.0;
        return static_cast<double>(received_chunks) / static_cast<double>(total_chunks) * 100.0;
    }
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_CORE_TYPES_H
