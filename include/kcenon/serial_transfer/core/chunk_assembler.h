/**
 * @file chunk_assembler.h
 * @brief Chunk assembly into files
 */

#ifndef KCENON_SERIAL_TRANSFER_CORE_CHUNK_ASSEMBLER_H
#define KCENON_SERIAL_TRANSFER_CORE_CHUNK_ASSEMBLER_H

#include <kcenon/serial_transfer/core/checksum.h>
#include <kcenon/serial_transfer/core/types.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

namespace kcenon::serial_transfer {

/**
 * @brief Outcome of writing one chunk
 */
enum class chunk_write_status {
    written,    ///< Bytes were appended to the destination
    duplicate,  ///< Index was already written; nothing changed
};

/**
 * @brief Reassembles one incoming file at a time
 *
 * The destination is created (or truncated) inside the output directory
 * when the file is announced. Chunks must arrive in index order; each
 * accepted chunk is written at index * chunk_size and fed to a running
 * SHA-256 so that finalize() can verify the file without re-reading it.
 * A file that is abandoned or fails verification is removed.
 */
class chunk_assembler {
public:
    /**
     * @brief Construct assembler with output directory
     * @param output_dir Directory for assembled files (created on demand)
     */
    explicit chunk_assembler(std::filesystem::path output_dir);

    /**
     * @brief Open the destination for a newly announced file
     *
     * Any file still in progress is abandoned first. The announced name is
     * reduced to its final path component.
     *
     * @return Destination path or error
     */
    [[nodiscard]] auto begin_file(const file_metadata& meta) -> result<std::filesystem::path>;

    /**
     * @brief Write one chunk of the active file
     * @param index Chunk index (must be the next expected one, or already written)
     * @param data Chunk bytes (length must match the announced layout)
     */
    [[nodiscard]] auto write_chunk(uint64_t index, std::span<const std::byte> data)
        -> result<chunk_write_status>;

    /**
     * @brief Verify and close the active file
     * @param total_chunks Chunk count announced in FILE_END
     * @param file_size Byte count announced in FILE_END
     * @param digest SHA-256 announced in FILE_END
     * @return Path to assembled file, or error (file removed on mismatch)
     */
    [[nodiscard]] auto finalize(
        uint64_t total_chunks,
        uint64_t file_size,
        const sha256_digest& digest) -> result<std::filesystem::path>;

    /**
     * @brief Drop the active file and remove the partial output
     */
    void abandon();

    [[nodiscard]] auto has_active_file() const -> bool;

    [[nodiscard]] auto active_metadata() const -> std::optional<file_metadata>;

    [[nodiscard]] auto get_progress() const -> std::optional<assembly_progress>;

    [[nodiscard]] auto output_directory() const -> const std::filesystem::path&;

    ~chunk_assembler();

    // No copy or move
    chunk_assembler(const chunk_assembler&) = delete;
    auto operator=(const chunk_assembler&) -> chunk_assembler& = delete;

private:
    struct assembly_context {
        file_metadata meta;
        std::filesystem::path path;
        std::unique_ptr<std::ofstream> file;
        sha256_hasher hasher;
        uint64_t next_index = 0;
        uint64_t bytes_written = 0;
    };

    void abandon_locked();

    std::filesystem::path output_dir_;
    std::unique_ptr<assembly_context> active_;
    mutable std::mutex mutex_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_CORE_CHUNK_ASSEMBLER_H
