/**
 * @file frame_decoder.h
 * @brief Stream deframer with resynchronisation
 */

#ifndef KCENON_SERIAL_TRANSFER_PROTOCOL_FRAME_DECODER_H
#define KCENON_SERIAL_TRANSFER_PROTOCOL_FRAME_DECODER_H

#include <kcenon/serial_transfer/core/types.h>
#include <kcenon/serial_transfer/protocol/frame_codec.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kcenon::serial_transfer {

/**
 * @brief Turns an unframed byte stream back into frames
 *
 * Bytes are fed in whatever pieces the channel delivers. next() then
 * yields, one at a time:
 * - a decoded frame,
 * - error_code::frame_incomplete: nothing more can be decoded yet,
 * - error_code::frame_corrupt: a candidate frame failed validation. One
 *   byte is dropped and the decoder rescans for the next magic, so a
 *   single call never loses more than the corrupt candidate's first byte.
 *
 * Bytes that cannot start a frame (no magic) are discarded silently and
 * only counted as noise.
 *
 * @code
 * frame_decoder decoder;
 * decoder.feed(received);
 * for (;;) {
 *     auto next = decoder.next();
 *     if (next) { dispatch(next.value()); continue; }
 *     if (next.error().code == error_code::frame_corrupt) { send_nak(); continue; }
 *     break;  // incomplete
 * }
 * @endcode
 */
class frame_decoder {
public:
    struct statistics {
        uint64_t frames_decoded = 0;
        uint64_t corrupt_frames = 0;
        uint64_t noise_bytes = 0;
        uint64_t discarded_bytes = 0;  ///< Partial frames dropped by discard_pending()
    };

    explicit frame_decoder(uint32_t max_payload_size = default_max_payload_size);

    /**
     * @brief Append received bytes
     */
    void feed(std::span<const std::byte> bytes);

    /**
     * @brief Extract the next frame from the buffered bytes
     */
    [[nodiscard]] auto next() -> result<frame>;

    /**
     * @brief Drop a partial frame that stopped arriving
     * @return Number of bytes dropped
     */
    auto discard_pending() -> std::size_t;

    [[nodiscard]] auto pending_bytes() const noexcept -> std::size_t;

    [[nodiscard]] auto get_statistics() const noexcept -> const statistics&;

    void reset();

private:
    void skip_to_magic();
    void consume(std::size_t count);

    frame_codec codec_;
    std::vector<std::byte> buffer_;
    std::size_t start_;
    statistics stats_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_PROTOCOL_FRAME_DECODER_H
