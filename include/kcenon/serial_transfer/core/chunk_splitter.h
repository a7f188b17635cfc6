/**
 * @file chunk_splitter.h
 * @brief File splitting into chunks for transfer
 */

#ifndef KCENON_SERIAL_TRANSFER_CORE_CHUNK_SPLITTER_H
#define KCENON_SERIAL_TRANSFER_CORE_CHUNK_SPLITTER_H

#include <kcenon/serial_transfer/core/chunk_config.h>
#include <kcenon/serial_transfer/core/types.h>

#include <filesystem>
#include <fstream>
#include <vector>

namespace kcenon::serial_transfer {

/**
 * @brief Splits files into chunks for streaming transfer
 *
 * Files are read one chunk at a time; nothing beyond the current chunk is
 * held in memory.
 */
class chunk_splitter {
public:
    /**
     * @brief Lazy, finite iterator over the chunks of one file
     *
     * Yields chunks in strictly increasing index order and can be restarted
     * at any index with seek().
     */
    class chunk_iterator {
    public:
        /**
         * @brief Check if more chunks are available
         */
        [[nodiscard]] auto has_next() const -> bool;

        /**
         * @brief Read the next chunk
         * @return Next chunk or error
         */
        [[nodiscard]] auto next() -> result<chunk>;

        /**
         * @brief Restart iteration at @p index
         * @return invalid_configuration if index > total_chunks()
         */
        [[nodiscard]] auto seek(uint64_t index) -> result<void>;

        /**
         * @brief Index of the chunk next() will return
         */
        [[nodiscard]] auto current_index() const -> uint64_t;

        [[nodiscard]] auto total_chunks() const -> uint64_t;

        [[nodiscard]] auto file_size() const -> uint64_t;

        // Move-only
        chunk_iterator(chunk_iterator&&) noexcept;
        auto operator=(chunk_iterator&&) noexcept -> chunk_iterator&;
        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        auto operator=(const chunk_iterator&) -> chunk_iterator& = delete;

    private:
        friend class chunk_splitter;

        chunk_iterator(
            std::ifstream file,
            chunk_config config,
            uint64_t file_size,
            uint64_t total_chunks);

        std::ifstream file_;
        chunk_config config_;
        uint64_t file_size_;
        uint64_t total_chunks_;
        uint64_t current_index_;
        std::vector<std::byte> buffer_;
    };

    /**
     * @brief Construct with default configuration
     */
    chunk_splitter();

    /**
     * @brief Construct with custom configuration
     */
    explicit chunk_splitter(const chunk_config& config);

    /**
     * @brief Create chunk iterator for a file
     * @param file_path Path to the file to split
     * @return Chunk iterator or error
     */
    [[nodiscard]] auto split(const std::filesystem::path& file_path)
        -> result<chunk_iterator>;

    /**
     * @brief Calculate file metadata without reading the file
     *
     * The filename is reduced to the final path component.
     */
    [[nodiscard]] auto calculate_metadata(const std::filesystem::path& file_path)
        -> result<file_metadata>;

    [[nodiscard]] auto config() const -> const chunk_config&;

private:
    chunk_config config_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_CORE_CHUNK_SPLITTER_H
