/**
 * @file payload_codec.cpp
 * @brief Implementation of frame payload encoding and decoding
 */

#include <kcenon/serial_transfer/protocol/payload_codec.h>

#include <kcenon/serial_transfer/protocol/byte_order.h>

#include <limits>
#include <string>

namespace kcenon::serial_transfer {

namespace {

constexpr std::size_t max_filename_length = 255;

auto invalid(const char* what) -> unexpected {
    return unexpected(error{error_code::invalid_payload, std::string("malformed ") + what});
}

}  // namespace

// HELLO

auto payload_codec::encode_hello(const hello_payload& p) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    out.reserve(9);
    byte_writer w(out);
    w.put_u8(p.version.major);
    w.put_u8(p.version.minor);
    w.put_u8(p.version.patch);
    w.put_u8(p.version.build);
    w.put_u32(p.chunk_size);
    w.put_u8(static_cast<uint8_t>(p.role));
    return out;
}

auto payload_codec::decode_hello(std::span<const std::byte> bytes) -> result<hello_payload> {
    byte_reader r(bytes);
    auto major = r.get_u8();
    auto minor = r.get_u8();
    auto patch = r.get_u8();
    auto build = r.get_u8();
    auto chunk_size = r.get_u32();
    auto role = r.get_u8();
    if (!major || !minor || !patch || !build || !chunk_size || !role || r.remaining() != 0) {
        return invalid("HELLO");
    }
    if (*role < static_cast<uint8_t>(session_mode::send) ||
        *role > static_cast<uint8_t>(session_mode::both)) {
        return invalid("HELLO role");
    }

    hello_payload p;
    p.version = protocol_version{*major, *minor, *patch, *build};
    p.chunk_size = *chunk_size;
    p.role = static_cast<session_mode>(*role);
    return p;
}

// FILE_META

auto payload_codec::encode_file_meta(const file_metadata& meta) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    out.reserve(22 + meta.filename.size());
    byte_writer w(out);
    w.put_u64(meta.file_size);
    w.put_u64(meta.total_chunks);
    w.put_u32(meta.chunk_size);
    w.put_u16(static_cast<uint16_t>(meta.filename.size()));
    w.put_string(meta.filename);
    return out;
}

auto payload_codec::decode_file_meta(std::span<const std::byte> bytes) -> result<file_metadata> {
    byte_reader r(bytes);
    auto file_size = r.get_u64();
    auto total_chunks = r.get_u64();
    auto chunk_size = r.get_u32();
    auto name_length = r.get_u16();
    if (!file_size || !total_chunks || !chunk_size || !name_length) {
        return invalid("FILE_META");
    }
    if (*name_length == 0 || *name_length > max_filename_length ||
        r.remaining() != *name_length) {
        return invalid("FILE_META name");
    }

    auto name = r.get_bytes(*name_length);
    if (!name) {
        return invalid("FILE_META name");
    }

    file_metadata meta;
    meta.file_size = *file_size;
    meta.total_chunks = *total_chunks;
    meta.chunk_size = *chunk_size;
    meta.filename.assign(reinterpret_cast<const char*>(name->data()), name->size());
    return meta;
}

// DATA

auto payload_codec::encode_data(uint64_t chunk_index, std::span<const std::byte> data)
    -> std::vector<std::byte> {
    std::vector<std::byte> out;
    out.reserve(8 + data.size());
    byte_writer w(out);
    w.put_u64(chunk_index);
    w.put_bytes(data);
    return out;
}

auto payload_codec::decode_data(std::span<const std::byte> bytes) -> result<data_payload> {
    byte_reader r(bytes);
    auto index = r.get_u64();
    if (!index) {
        return invalid("DATA");
    }

    data_payload p;
    p.chunk_index = *index;
    p.data = r.rest();
    return p;
}

// FILE_END

auto payload_codec::encode_file_end(const file_end_payload& p) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    out.reserve(16 + p.digest.size());
    byte_writer w(out);
    w.put_u64(p.total_chunks);
    w.put_u64(p.file_size);
    w.put_bytes(p.digest);
    return out;
}

auto payload_codec::decode_file_end(std::span<const std::byte> bytes)
    -> result<file_end_payload> {
    byte_reader r(bytes);
    auto total_chunks = r.get_u64();
    auto file_size = r.get_u64();
    auto digest = r.get_bytes(sizeof(sha256_digest));
    if (!total_chunks || !file_size || !digest || r.remaining() != 0) {
        return invalid("FILE_END");
    }

    file_end_payload p;
    p.total_chunks = *total_chunks;
    p.file_size = *file_size;
    std::copy(digest->begin(), digest->end(), p.digest.begin());
    return p;
}

// ACK / NAK

auto payload_codec::encode_ack(const ack_payload& p) -> std::vector<std::byte> {
    return {static_cast<std::byte>(p.acked_type)};
}

auto payload_codec::decode_ack(std::span<const std::byte> bytes) -> result<ack_payload> {
    byte_reader r(bytes);
    auto type = r.get_u8();
    if (!type || r.remaining() != 0 || !is_valid_frame_type(*type)) {
        return invalid("ACK");
    }

    ack_payload p;
    p.acked_type = static_cast<frame_type>(*type);
    return p;
}

auto payload_codec::encode_nak(const nak_payload& p) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    out.reserve(4);
    byte_writer w(out);
    w.put_u32(static_cast<uint32_t>(static_cast<int32_t>(p.reason)));
    return out;
}

auto payload_codec::decode_nak(std::span<const std::byte> bytes) -> result<nak_payload> {
    byte_reader r(bytes);
    auto reason = r.get_u32();
    if (!reason || r.remaining() != 0) {
        return invalid("NAK");
    }

    nak_payload p;
    p.reason = static_cast<error_code>(static_cast<int32_t>(*reason));
    return p;
}

}  // namespace kcenon::serial_transfer
