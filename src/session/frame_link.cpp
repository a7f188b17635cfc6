/**
 * @file frame_link.cpp
 * @brief Implementation of the frame link
 */

#include <kcenon/serial_transfer/session/frame_link.h>

#include <kcenon/serial_transfer/core/logging.h>
#include <kcenon/serial_transfer/protocol/payload_codec.h>

namespace kcenon::serial_transfer {

frame_link::frame_link(byte_channel& channel, uint32_t max_payload_size)
    : channel_(channel), codec_(max_payload_size) {}

auto frame_link::send(const frame& f) -> result<void> {
    auto encoded = codec_.encode(f);
    if (!encoded) {
        return unexpected(encoded.error());
    }
    return send_encoded(encoded.value());
}

auto frame_link::send_encoded(std::span<const std::byte> bytes) -> result<void> {
    std::lock_guard lock(write_mutex_);

    auto written = channel_.write(bytes);
    if (!written) {
        ST_LOG_ERROR(log_category::channel, "Frame write failed: " + written.error().message);
        return unexpected(written.error());
    }

    frames_sent_.fetch_add(1, std::memory_order_relaxed);
    return {};
}

auto frame_link::send_ack(uint16_t sequence, frame_type type) -> result<void> {
    return send(frame{frame_type::ack, sequence, payload_codec::encode_ack({type})});
}

auto frame_link::send_nak(uint16_t sequence, error_code reason) -> result<void> {
    ST_LOG_DEBUG(log_category::frame,
                 "NAK seq " + std::to_string(sequence) + ": " + to_string(reason));
    return send(frame{frame_type::nak, sequence, payload_codec::encode_nak({reason})});
}

auto frame_link::codec() const noexcept -> const frame_codec& {
    return codec_;
}

auto frame_link::channel() noexcept -> byte_channel& {
    return channel_;
}

auto frame_link::frames_sent() const noexcept -> uint64_t {
    return frames_sent_.load(std::memory_order_relaxed);
}

}  // namespace kcenon::serial_transfer
