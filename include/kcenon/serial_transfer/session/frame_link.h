/**
 * @file frame_link.h
 * @brief Serialized frame output onto a byte channel
 */

#ifndef KCENON_SERIAL_TRANSFER_SESSION_FRAME_LINK_H
#define KCENON_SERIAL_TRANSFER_SESSION_FRAME_LINK_H

#include <kcenon/serial_transfer/core/types.h>
#include <kcenon/serial_transfer/protocol/frame_codec.h>
#include <kcenon/serial_transfer/transport/byte_channel.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>

namespace kcenon::serial_transfer {

/**
 * @brief Writes whole frames to a channel, one at a time
 *
 * The sender worker and the reader thread (which emits ACK/NAK) share one
 * link. Each frame is written under a lock so the bytes of two frames never
 * interleave on the wire.
 */
class frame_link {
public:
    explicit frame_link(byte_channel& channel,
                        uint32_t max_payload_size = default_max_payload_size);

    frame_link(const frame_link&) = delete;
    auto operator=(const frame_link&) -> frame_link& = delete;

    /**
     * @brief Encode and write a frame
     */
    [[nodiscard]] auto send(const frame& f) -> result<void>;

    /**
     * @brief Write an already encoded frame
     */
    [[nodiscard]] auto send_encoded(std::span<const std::byte> bytes) -> result<void>;

    /**
     * @brief Emit ACK for @p type at @p sequence
     */
    [[nodiscard]] auto send_ack(uint16_t sequence, frame_type type) -> result<void>;

    /**
     * @brief Emit NAK with @p reason at @p sequence
     */
    [[nodiscard]] auto send_nak(uint16_t sequence, error_code reason) -> result<void>;

    [[nodiscard]] auto codec() const noexcept -> const frame_codec&;

    [[nodiscard]] auto channel() noexcept -> byte_channel&;

    [[nodiscard]] auto frames_sent() const noexcept -> uint64_t;

private:
    byte_channel& channel_;
    frame_codec codec_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> frames_sent_{0};
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_SESSION_FRAME_LINK_H
