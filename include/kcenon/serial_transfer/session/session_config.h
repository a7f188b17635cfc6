/**
 * @file session_config.h
 * @brief Session tuning parameters
 */

#ifndef KCENON_SERIAL_TRANSFER_SESSION_SESSION_CONFIG_H
#define KCENON_SERIAL_TRANSFER_SESSION_SESSION_CONFIG_H

#include <kcenon/serial_transfer/core/chunk_config.h>
#include <kcenon/serial_transfer/core/types.h>
#include <kcenon/serial_transfer/protocol/frame.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace kcenon::serial_transfer {

/**
 * @brief Session configuration
 *
 * Timeouts left unset are derived from the chunk size and baud rate, so a
 * session tuned for 9600 baud waits long enough for a full DATA frame to
 * cross the line and its ACK to come back.
 */
struct session_config {
    session_mode mode = session_mode::send;
    uint32_t chunk_size = chunk_config::default_chunk_size;
    uint32_t baud_rate = 115200;
    uint32_t max_retries = 3;        ///< Retransmissions per frame after the first send
    uint32_t handshake_retries = 8;  ///< Retransmissions of HELLO
    std::optional<std::chrono::milliseconds> ack_timeout;
    std::optional<std::chrono::milliseconds> receive_stall_timeout;
    std::filesystem::path output_directory = ".";
    std::size_t rate_window_size = 8;
    std::chrono::milliseconds poll_interval{20};  ///< Reader wake-up period

    /// Fixed allowance added to the computed round trip
    static constexpr std::chrono::milliseconds ack_timeout_margin{250};

    [[nodiscard]] auto validate() const -> result<void> {
        if (auto valid = chunk_config{chunk_size}.validate(); !valid) {
            return valid;
        }
        if (baud_rate == 0) {
            return unexpected(error{error_code::invalid_baud_rate, "baud rate must be positive"});
        }
        if (ack_timeout && ack_timeout->count() <= 0) {
            return unexpected(
                error{error_code::invalid_configuration, "ack timeout must be positive"});
        }
        if (receive_stall_timeout && receive_stall_timeout->count() <= 0) {
            return unexpected(
                error{error_code::invalid_configuration, "receive stall timeout must be positive"});
        }
        if (rate_window_size == 0) {
            return unexpected(
                error{error_code::invalid_configuration, "rate window must hold at least one sample"});
        }
        if (poll_interval.count() <= 0) {
            return unexpected(
                error{error_code::invalid_configuration, "poll interval must be positive"});
        }
        if (!sends_files(mode) && !receives_files(mode)) {
            return unexpected(error{error_code::invalid_configuration, "unknown session mode"});
        }
        return {};
    }

    /**
     * @brief Line time of one full DATA frame at the configured baud rate
     *
     * 10 bit times per byte (start, 8 data, stop).
     */
    [[nodiscard]] auto frame_line_time() const -> std::chrono::milliseconds {
        uint64_t frame_bytes = uint64_t{chunk_size} + 8 + frame_overhead;
        uint64_t ms = (frame_bytes * 10 * 1000 + baud_rate - 1) / baud_rate;
        return std::chrono::milliseconds{static_cast<int64_t>(ms)};
    }

    [[nodiscard]] auto effective_ack_timeout() const -> std::chrono::milliseconds {
        if (ack_timeout) return *ack_timeout;
        return 2 * frame_line_time() + ack_timeout_margin;
    }

    /**
     * @brief Silence after which a partially received file is abandoned
     *
     * Twice the longest a sender can spend on one frame before giving up.
     */
    [[nodiscard]] auto effective_receive_stall_timeout() const -> std::chrono::milliseconds {
        if (receive_stall_timeout) return *receive_stall_timeout;
        return effective_ack_timeout() * (max_retries + 1) * 2;
    }

    /**
     * @brief Idle time after which buffered bytes of an unfinished frame are dropped
     */
    [[nodiscard]] auto inter_frame_timeout() const -> std::chrono::milliseconds {
        return effective_ack_timeout();
    }
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_SESSION_SESSION_CONFIG_H
