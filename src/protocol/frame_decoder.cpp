/**
 * @file frame_decoder.cpp
 * @brief Implementation of the stream deframer
 */

#include <kcenon/serial_transfer/protocol/frame_decoder.h>

#include <kcenon/serial_transfer/core/logging.h>

#include <algorithm>

namespace kcenon::serial_transfer {

namespace {

constexpr auto magic_hi = static_cast<std::byte>(frame_magic >> 8);
constexpr auto magic_lo = static_cast<std::byte>(frame_magic & 0xFF);

// Compact the buffer once this many consumed bytes sit at its front
constexpr std::size_t compact_threshold = 16 * 1024;

}  // namespace

frame_decoder::frame_decoder(uint32_t max_payload_size)
    : codec_(max_payload_size), start_(0) {}

void frame_decoder::feed(std::span<const std::byte> bytes) {
    if (start_ > 0 && (start_ >= compact_threshold || start_ == buffer_.size())) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(start_));
        start_ = 0;
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

auto frame_decoder::next() -> result<frame> {
    skip_to_magic();

    auto view = std::span<const std::byte>(buffer_).subspan(start_);
    auto decoded = codec_.decode(view);

    if (decoded) {
        consume(decoded.value().consumed);
        ++stats_.frames_decoded;
        return std::move(decoded.value().value);
    }

    if (decoded.error().code == error_code::frame_corrupt) {
        ST_LOG_DEBUG(log_category::frame, "Dropping corrupt frame: " + decoded.error().message);
        consume(1);
        ++stats_.corrupt_frames;
    }

    return unexpected(decoded.error());
}

auto frame_decoder::discard_pending() -> std::size_t {
    auto dropped = pending_bytes();
    buffer_.clear();
    start_ = 0;
    stats_.discarded_bytes += dropped;
    return dropped;
}

auto frame_decoder::pending_bytes() const noexcept -> std::size_t {
    return buffer_.size() - start_;
}

auto frame_decoder::get_statistics() const noexcept -> const statistics& {
    return stats_;
}

void frame_decoder::reset() {
    buffer_.clear();
    start_ = 0;
    stats_ = statistics{};
}

void frame_decoder::skip_to_magic() {
    auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(start_);
    auto it = begin;

    while (it != buffer_.end()) {
        it = std::find(it, buffer_.end(), magic_hi);
        if (it == buffer_.end()) {
            break;
        }
        // A lone first magic byte at the end may still be completed
        if (it + 1 == buffer_.end() || *(it + 1) == magic_lo) {
            break;
        }
        ++it;
    }

    auto skipped = static_cast<std::size_t>(it - begin);
    if (skipped > 0) {
        stats_.noise_bytes += skipped;
        consume(skipped);
    }
}

void frame_decoder::consume(std::size_t count) {
    start_ += std::min(count, pending_bytes());
}

}  // namespace kcenon::serial_transfer
