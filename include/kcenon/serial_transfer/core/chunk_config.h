/**
 * @file chunk_config.h
 * @brief Configuration for chunk operations
 */

#ifndef KCENON_SERIAL_TRANSFER_CORE_CHUNK_CONFIG_H
#define KCENON_SERIAL_TRANSFER_CORE_CHUNK_CONFIG_H

#include <kcenon/serial_transfer/core/types.h>

#include <cstdint>
#include <string>

namespace kcenon::serial_transfer {

/**
 * @brief Configuration for chunk operations
 *
 * The chunk size is announced in HELLO and FILE_META and stays constant for
 * the whole session.
 */
struct chunk_config {
    /// Default chunk size (4KB)
    static constexpr uint32_t default_chunk_size = 4 * 1024;

    /// Minimum allowed chunk size (1B)
    static constexpr uint32_t min_chunk_size = 1;

    /// Maximum allowed chunk size (64KB)
    static constexpr uint32_t max_chunk_size = 64 * 1024;

    /// Chunk size to use for splitting
    uint32_t chunk_size = default_chunk_size;

    chunk_config() = default;

    /**
     * @brief Constructor with custom chunk size
     * @param size Chunk size in bytes
     */
    explicit chunk_config(uint32_t size) : chunk_size(size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size < min_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too small (minimum: " + std::to_string(min_chunk_size) + ")"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        return {};
    }

    /**
     * @brief Calculate number of chunks for a given file size
     * @return ceil(file_size / chunk_size); zero for an empty file
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 0;
        return (file_size + chunk_size - 1) / chunk_size;
    }

    /**
     * @brief Size of the chunk at @p index of a file of @p file_size bytes
     */
    [[nodiscard]] auto chunk_length(uint64_t file_size, uint64_t index) const -> uint64_t {
        uint64_t offset = index * chunk_size;
        if (offset >= file_size) return 0;
        uint64_t remaining = file_size - offset;
        return remaining < chunk_size ? remaining : chunk_size;
    }
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_CORE_CHUNK_CONFIG_H
