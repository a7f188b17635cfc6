/**
 * @file checksum.h
 * @brief Checksum utilities for frame and file integrity verification
 */

#ifndef KCENON_SERIAL_TRANSFER_CORE_CHECKSUM_H
#define KCENON_SERIAL_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/serial_transfer/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::serial_transfer {

/// Raw SHA-256 digest
using sha256_digest = std::array<std::byte, 32>;

/**
 * @brief Checksum utilities for CRC and SHA-256 calculations
 *
 * Provides static methods for:
 * - CRC32 (IEEE 802.3) over whole frames
 * - CRC-16/CCITT-FALSE over frame headers
 * - SHA-256 for end-to-end file verification
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 checksum of data
     * @param data Input data span
     * @return CRC32 checksum value
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Continue a CRC32 over another block
     * @param crc Value returned by a previous crc32() or crc32_update() call
     * @param data Next block
     *
     * crc32_update(crc32(a), b) == crc32(a + b).
     */
    [[nodiscard]] static auto crc32_update(uint32_t crc, std::span<const std::byte> data)
        -> uint32_t;

    /**
     * @brief Verify CRC32 checksum of data
     */
    [[nodiscard]] static auto verify_crc32(
        std::span<const std::byte> data, uint32_t expected) -> bool;

    /**
     * @brief Calculate CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF)
     */
    [[nodiscard]] static auto crc16_ccitt(std::span<const std::byte> data) -> uint16_t;

    /**
     * @brief Calculate SHA-256 digest of data
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> sha256_digest;

    /**
     * @brief Calculate SHA-256 digest of a file
     * @param path Path to the file
     * @return digest, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<sha256_digest>;

    /**
     * @brief Lower-case hex representation of a digest
     */
    [[nodiscard]] static auto to_hex(const sha256_digest& digest) -> std::string;
};

/**
 * @brief Streaming SHA-256
 *
 * Lets the receiver hash each chunk as it is written instead of re-reading
 * the finished file.
 *
 * @code
 * sha256_hasher hasher;
 * hasher.update(first);
 * hasher.update(second);
 * auto digest = hasher.finalize();
 * @endcode
 */
class sha256_hasher {
public:
    sha256_hasher();

    void update(std::span<const std::byte> data);

    /**
     * @brief Finish the hash and reset the hasher for reuse
     */
    [[nodiscard]] auto finalize() -> sha256_digest;

    void reset();

    [[nodiscard]] auto bytes_processed() const noexcept -> uint64_t { return total_bytes_; }

private:
    std::array<uint32_t, 8> state_;
    std::array<uint8_t, 64> block_;
    std::size_t block_pos_;
    uint64_t total_bytes_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_CORE_CHECKSUM_H
