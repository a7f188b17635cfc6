/**
 * @file byte_order.h
 * @brief Big-endian field packing for frames and payloads
 */

#ifndef KCENON_SERIAL_TRANSFER_PROTOCOL_BYTE_ORDER_H
#define KCENON_SERIAL_TRANSFER_PROTOCOL_BYTE_ORDER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::serial_transfer {

/**
 * @brief Appends big-endian fields to a byte vector
 */
class byte_writer {
public:
    explicit byte_writer(std::vector<std::byte>& out) : out_(out) {}

    void put_u8(uint8_t v) { out_.push_back(static_cast<std::byte>(v)); }

    void put_u16(uint16_t v) {
        put_u8(static_cast<uint8_t>(v >> 8));
        put_u8(static_cast<uint8_t>(v));
    }

    void put_u32(uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            put_u8(static_cast<uint8_t>(v >> shift));
        }
    }

    void put_u64(uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            put_u8(static_cast<uint8_t>(v >> shift));
        }
    }

    void put_bytes(std::span<const std::byte> bytes) {
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    void put_string(const std::string& s) {
        put_bytes(std::as_bytes(std::span<const char>(s.data(), s.size())));
    }

private:
    std::vector<std::byte>& out_;
};

/**
 * @brief Reads big-endian fields from a byte span
 *
 * Every getter returns std::nullopt once the input is exhausted, so a
 * truncated payload is detected without reading past the span.
 */
class byte_reader {
public:
    explicit byte_reader(std::span<const std::byte> in) : in_(in), pos_(0) {}

    [[nodiscard]] auto get_u8() -> std::optional<uint8_t> {
        if (remaining() < 1) return std::nullopt;
        return static_cast<uint8_t>(in_[pos_++]);
    }

    [[nodiscard]] auto get_u16() -> std::optional<uint16_t> {
        auto v = get_unsigned(2);
        if (!v) return std::nullopt;
        return static_cast<uint16_t>(*v);
    }

    [[nodiscard]] auto get_u32() -> std::optional<uint32_t> {
        auto v = get_unsigned(4);
        if (!v) return std::nullopt;
        return static_cast<uint32_t>(*v);
    }

    [[nodiscard]] auto get_u64() -> std::optional<uint64_t> {
        return get_unsigned(8);
    }

    [[nodiscard]] auto get_bytes(std::size_t count) -> std::optional<std::span<const std::byte>> {
        if (remaining() < count) return std::nullopt;
        auto out = in_.subspan(pos_, count);
        pos_ += count;
        return out;
    }

    [[nodiscard]] auto rest() -> std::span<const std::byte> {
        auto out = in_.subspan(pos_);
        pos_ = in_.size();
        return out;
    }

    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return in_.size() - pos_; }

private:
    [[nodiscard]] auto get_unsigned(std::size_t width) -> std::optional<uint64_t> {
        if (remaining() < width) return std::nullopt;
        uint64_t v = 0;
        for (std::size_t i = 0; i < width; ++i) {
            v = (v << 8) | static_cast<uint8_t>(in_[pos_++]);
        }
        return v;
    }

    std::span<const std::byte> in_;
    std::size_t pos_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_PROTOCOL_BYTE_ORDER_H
