/**
 * @file payload_codec.h
 * @brief Typed payloads carried inside frames
 *
 * | Frame       | Payload                                                    |
 * |-------------|------------------------------------------------------------|
 * | HELLO       | version (4 x u8), chunk_size u32, role u8                  |
 * | FILE_META   | file_size u64, total_chunks u64, chunk_size u32,           |
 * |             | name_length u16, name                                      |
 * | DATA        | chunk_index u64, chunk bytes                               |
 * | FILE_END    | total_chunks u64, file_size u64, SHA-256 (32 bytes)        |
 * | ACK         | acknowledged frame type u8                                 |
 * | NAK         | reason i32 (error_code)                                    |
 * | SESSION_END | empty                                                      |
 */

#ifndef KCENON_SERIAL_TRANSFER_PROTOCOL_PAYLOAD_CODEC_H
#define KCENON_SERIAL_TRANSFER_PROTOCOL_PAYLOAD_CODEC_H

#include <kcenon/serial_transfer/core/checksum.h>
#include <kcenon/serial_transfer/core/types.h>
#include <kcenon/serial_transfer/protocol/frame.h>

#include <cstdint>
#include <span>
#include <vector>

namespace kcenon::serial_transfer {

struct hello_payload {
    protocol_version version = current_protocol_version;
    uint32_t chunk_size = chunk_config::default_chunk_size;
    session_mode role = session_mode::send;
};

struct data_payload {
    uint64_t chunk_index = 0;
    std::span<const std::byte> data;  ///< Views the frame payload it was decoded from
};

struct file_end_payload {
    uint64_t total_chunks = 0;
    uint64_t file_size = 0;
    sha256_digest digest{};
};

struct ack_payload {
    frame_type acked_type = frame_type::data;
};

struct nak_payload {
    error_code reason = error_code::frame_corrupt;
};

/**
 * @brief Encoders and decoders for every frame payload
 *
 * Decoders report error_code::invalid_payload for truncated, oversized or
 * inconsistent payloads.
 */
class payload_codec {
public:
    [[nodiscard]] static auto encode_hello(const hello_payload& p) -> std::vector<std::byte>;
    [[nodiscard]] static auto decode_hello(std::span<const std::byte> bytes)
        -> result<hello_payload>;

    [[nodiscard]] static auto encode_file_meta(const file_metadata& meta)
        -> std::vector<std::byte>;
    [[nodiscard]] static auto decode_file_meta(std::span<const std::byte> bytes)
        -> result<file_metadata>;

    [[nodiscard]] static auto encode_data(uint64_t chunk_index, std::span<const std::byte> data)
        -> std::vector<std::byte>;
    [[nodiscard]] static auto decode_data(std::span<const std::byte> bytes)
        -> result<data_payload>;

    [[nodiscard]] static auto encode_file_end(const file_end_payload& p)
        -> std::vector<std::byte>;
    [[nodiscard]] static auto decode_file_end(std::span<const std::byte> bytes)
        -> result<file_end_payload>;

    [[nodiscard]] static auto encode_ack(const ack_payload& p) -> std::vector<std::byte>;
    [[nodiscard]] static auto decode_ack(std::span<const std::byte> bytes)
        -> result<ack_payload>;

    [[nodiscard]] static auto encode_nak(const nak_payload& p) -> std::vector<std::byte>;
    [[nodiscard]] static auto decode_nak(std::span<const std::byte> bytes)
        -> result<nak_payload>;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_PROTOCOL_PAYLOAD_CODEC_H
