/**
 * @file frame_codec.h
 * @brief One-shot frame encoding and decoding
 */

#ifndef KCENON_SERIAL_TRANSFER_PROTOCOL_FRAME_CODEC_H
#define KCENON_SERIAL_TRANSFER_PROTOCOL_FRAME_CODEC_H

#include <kcenon/serial_transfer/core/types.h>
#include <kcenon/serial_transfer/protocol/frame.h>

#include <cstddef>
#include <span>
#include <vector>

namespace kcenon::serial_transfer {

/**
 * @brief A frame decoded from the front of a byte span
 */
struct decoded_frame {
    frame value;
    std::size_t consumed = 0;  ///< Bytes of input the frame occupied
};

/**
 * @brief Encodes frames to their wire form and decodes them back
 *
 * decode() looks only at the front of its input and reports one of:
 * - a frame plus the number of bytes it occupied,
 * - error_code::frame_incomplete when more bytes are needed,
 * - error_code::frame_corrupt when the front cannot be a valid frame
 *   (bad magic, header CRC, oversize length, unknown type, CRC32 mismatch).
 *
 * Every single-byte corruption of an encoded frame is reported as
 * frame_corrupt rather than frame_incomplete, because the length field is
 * covered by its own header CRC.
 */
class frame_codec {
public:
    explicit frame_codec(uint32_t max_payload_size = default_max_payload_size);

    /**
     * @brief Encode a frame
     * @return Wire bytes, or frame_too_large when the payload exceeds the limit
     */
    [[nodiscard]] auto encode(const frame& f) const -> result<std::vector<std::byte>>;

    /**
     * @brief Decode one frame from the front of @p bytes
     */
    [[nodiscard]] auto decode(std::span<const std::byte> bytes) const -> result<decoded_frame>;

    [[nodiscard]] auto max_payload_size() const noexcept -> uint32_t;

private:
    uint32_t max_payload_size_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_PROTOCOL_FRAME_CODEC_H
