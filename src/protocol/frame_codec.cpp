/**
 * @file frame_codec.cpp
 * @brief Implementation of frame encoding and decoding
 */

#include <kcenon/serial_transfer/protocol/frame_codec.h>

#include <kcenon/serial_transfer/core/checksum.h>
#include <kcenon/serial_transfer/protocol/byte_order.h>

#include <string>

namespace kcenon::serial_transfer {

namespace {

constexpr std::size_t header_crc_offset = 9;
constexpr std::size_t crc32_start_offset = 2;

constexpr auto magic_hi = static_cast<std::byte>(frame_magic >> 8);
constexpr auto magic_lo = static_cast<std::byte>(frame_magic & 0xFF);

auto corrupt(std::string message) -> unexpected {
    return unexpected(error{error_code::frame_corrupt, std::move(message)});
}

auto incomplete() -> unexpected {
    return unexpected(error{error_code::frame_incomplete});
}

}  // namespace

frame_codec::frame_codec(uint32_t max_payload_size) : max_payload_size_(max_payload_size) {}

auto frame_codec::encode(const frame& f) const -> result<std::vector<std::byte>> {
    if (f.payload.size() > max_payload_size_) {
        return unexpected(error{
            error_code::frame_too_large,
            "payload of " + std::to_string(f.payload.size()) + " bytes exceeds limit of " +
                std::to_string(max_payload_size_)});
    }

    std::vector<std::byte> out;
    out.reserve(f.encoded_size());

    byte_writer writer(out);
    writer.put_u16(frame_magic);
    writer.put_u8(static_cast<uint8_t>(f.type));
    writer.put_u16(f.sequence);
    writer.put_u32(static_cast<uint32_t>(f.payload.size()));
    writer.put_u16(checksum::crc16_ccitt(std::span<const std::byte>(out.data(), header_crc_offset)));
    writer.put_bytes(f.payload);

    auto covered = std::span<const std::byte>(out).subspan(crc32_start_offset);
    writer.put_u32(checksum::crc32(covered));

    return out;
}

auto frame_codec::decode(std::span<const std::byte> bytes) const -> result<decoded_frame> {
    if (bytes.empty()) {
        return incomplete();
    }
    if (bytes[0] != magic_hi) {
        return corrupt("bad magic");
    }
    if (bytes.size() < 2) {
        return incomplete();
    }
    if (bytes[1] != magic_lo) {
        return corrupt("bad magic");
    }
    if (bytes.size() < frame_header_size) {
        return incomplete();
    }

    byte_reader header(bytes.first(frame_header_size));
    (void)header.get_u16();
    auto type_raw = header.get_u8();
    auto sequence = header.get_u16();
    auto length = header.get_u32();
    auto header_crc = header.get_u16();
    if (!type_raw || !sequence || !length || !header_crc) {
        return corrupt("short header");
    }

    if (checksum::crc16_ccitt(bytes.first(header_crc_offset)) != *header_crc) {
        return corrupt("header checksum mismatch");
    }

    if (!is_valid_frame_type(*type_raw)) {
        return corrupt("unknown frame type " + std::to_string(*type_raw));
    }

    if (*length > max_payload_size_) {
        return corrupt("payload length " + std::to_string(*length) + " exceeds limit");
    }

    std::size_t total = frame_overhead + *length;
    if (bytes.size() < total) {
        return incomplete();
    }

    byte_reader trailer(bytes.subspan(total - frame_trailer_size, frame_trailer_size));
    auto expected_crc = trailer.get_u32();
    auto covered = bytes.subspan(crc32_start_offset, total - frame_trailer_size - crc32_start_offset);
    if (!expected_crc || checksum::crc32(covered) != *expected_crc) {
        return corrupt("frame checksum mismatch");
    }

    decoded_frame out;
    out.value.type = static_cast<frame_type>(*type_raw);
    out.value.sequence = *sequence;
    auto payload = bytes.subspan(frame_header_size, *length);
    out.value.payload.assign(payload.begin(), payload.end());
    out.value.checksum = *expected_crc;
    out.consumed = total;

    return out;
}

auto frame_codec::max_payload_size() const noexcept -> uint32_t {
    return max_payload_size_;
}

}  // namespace kcenon::serial_transfer
