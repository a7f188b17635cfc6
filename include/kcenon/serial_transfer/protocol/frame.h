/**
 * @file frame.h
 * @brief Frame types and wire constants for the serial link protocol
 *
 * Frame layout (all multi-byte fields big-endian):
 *
 * | Offset | Size | Field          | Description                              |
 * |--------|------|----------------|------------------------------------------|
 * | 0      | 2    | magic          | 0x53 0x42 ("SB")                         |
 * | 2      | 1    | type           | frame_type                               |
 * | 3      | 2    | sequence       | Per-direction counter, wraps at 65536    |
 * | 5      | 4    | payload_length | Bytes of payload that follow             |
 * | 9      | 2    | header_crc     | CRC-16/CCITT over bytes 0..8             |
 * | 11     | N    | payload        | Type-specific payload                    |
 * | 11+N   | 4    | frame_crc      | CRC32 over bytes 2..(11+N-1)             |
 */

#ifndef KCENON_SERIAL_TRANSFER_PROTOCOL_FRAME_H
#define KCENON_SERIAL_TRANSFER_PROTOCOL_FRAME_H

#include <kcenon/serial_transfer/core/chunk_config.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::serial_transfer {

/**
 * @brief Frame magic ("SB")
 */
inline constexpr uint16_t frame_magic = 0x5342;

inline constexpr std::size_t frame_header_size = 11;
inline constexpr std::size_t frame_trailer_size = 4;
inline constexpr std::size_t frame_overhead = frame_header_size + frame_trailer_size;

/**
 * @brief Largest payload the codec will accept by default
 *
 * A DATA payload is an 8-byte chunk index followed by at most one chunk.
 */
inline constexpr uint32_t default_max_payload_size = chunk_config::max_chunk_size + 64;

/**
 * @brief Protocol version structure (Major.Minor.Patch.Build)
 */
struct protocol_version {
    uint8_t major;
    uint8_t minor;
    uint8_t patch;
    uint8_t build;

    constexpr protocol_version() noexcept
        : major(0), minor(1), patch(0), build(0) {}

    constexpr protocol_version(uint8_t maj, uint8_t min, uint8_t pat,
                               uint8_t bld = 0) noexcept
        : major(maj), minor(min), patch(pat), build(bld) {}

    [[nodiscard]] auto to_string() const -> std::string {
        return std::to_string(major) + "." + std::to_string(minor) + "." +
               std::to_string(patch) + "." + std::to_string(build);
    }

    /**
     * @brief Peers interoperate when major and minor match
     */
    [[nodiscard]] constexpr auto is_compatible_with(const protocol_version& other) const noexcept
        -> bool {
        return major == other.major && minor == other.minor;
    }

    [[nodiscard]] constexpr auto operator==(const protocol_version& other) const
        -> bool = default;
};

inline constexpr protocol_version current_protocol_version{0, 1, 0, 0};

/**
 * @brief Frame type enumeration
 *
 * - 0x01-0x0F: Session management
 * - 0x10-0x1F: File control
 * - 0x20-0x2F: Data transfer and acknowledgement
 */
enum class frame_type : uint8_t {
    hello = 0x01,
    session_end = 0x03,

    file_meta = 0x10,
    file_end = 0x13,

    data = 0x20,
    ack = 0x21,
    nak = 0x22,
};

[[nodiscard]] constexpr auto to_string(frame_type type) noexcept -> std::string_view {
    switch (type) {
        case frame_type::hello:
            return "HELLO";
        case frame_type::session_end:
            return "SESSION_END";
        case frame_type::file_meta:
            return "FILE_META";
        case frame_type::file_end:
            return "FILE_END";
        case frame_type::data:
            return "DATA";
        case frame_type::ack:
            return "ACK";
        case frame_type::nak:
            return "NAK";
        default:
            return "UNKNOWN";
    }
}

[[nodiscard]] constexpr auto is_valid_frame_type(uint8_t value) noexcept -> bool {
    switch (static_cast<frame_type>(value)) {
        case frame_type::hello:
        case frame_type::session_end:
        case frame_type::file_meta:
        case frame_type::file_end:
        case frame_type::data:
        case frame_type::ack:
        case frame_type::nak:
            return true;
        default:
            return false;
    }
}

/**
 * @brief ACK and NAK answer another frame and never consume a sequence number
 */
[[nodiscard]] constexpr auto is_acknowledgement(frame_type type) noexcept -> bool {
    return type == frame_type::ack || type == frame_type::nak;
}

/**
 * @brief Frames the receiver accepts after a sequence gap
 */
[[nodiscard]] constexpr auto is_sync_point(frame_type type) noexcept -> bool {
    return type == frame_type::hello || type == frame_type::file_meta ||
           type == frame_type::session_end;
}

/**
 * @brief One protocol unit
 *
 * checksum holds the CRC32 read off the wire after decode; encode computes
 * it and ignores the stored value.
 */
struct frame {
    frame_type type = frame_type::hello;
    uint16_t sequence = 0;
    std::vector<std::byte> payload;
    uint32_t checksum = 0;

    frame() = default;
    frame(frame_type t, uint16_t seq, std::vector<std::byte> p = {})
        : type(t), sequence(seq), payload(std::move(p)) {}

    [[nodiscard]] auto encoded_size() const noexcept -> std::size_t {
        return frame_overhead + payload.size();
    }
};

/**
 * @brief Next sequence number, wrapping at 65536
 */
[[nodiscard]] constexpr auto next_sequence(uint16_t seq) noexcept -> uint16_t {
    return static_cast<uint16_t>(seq + 1);
}

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_PROTOCOL_FRAME_H
