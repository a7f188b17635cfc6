/**
 * @file file_receiver.h
 * @brief Receiving side of the transfer protocol
 */

#ifndef KCENON_SERIAL_TRANSFER_SESSION_FILE_RECEIVER_H
#define KCENON_SERIAL_TRANSFER_SESSION_FILE_RECEIVER_H

#include <kcenon/serial_transfer/core/chunk_assembler.h>
#include <kcenon/serial_transfer/core/progress_accountant.h>
#include <kcenon/serial_transfer/core/types.h>
#include <kcenon/serial_transfer/protocol/frame.h>
#include <kcenon/serial_transfer/session/frame_link.h>
#include <kcenon/serial_transfer/session/session_config.h>
#include <kcenon/serial_transfer/session/session_types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace kcenon::serial_transfer {

/**
 * @brief Applies incoming frames and answers each with ACK or NAK
 *
 * Sequence rules:
 * - a frame repeating the last accepted sequence is a retransmission whose
 *   ACK was lost; it is ACKed again and not applied
 * - HELLO, FILE_META and SESSION_END resynchronize and are accepted at any
 *   other sequence
 * - DATA and FILE_END must carry the sequence after the last accepted one
 *
 * Only the reader thread calls handle(), on_corrupt_frame(), check_stall()
 * and shutdown(). is_receiving() may be polled from anywhere.
 */
class file_receiver {
public:
    file_receiver(frame_link& link, const session_config& config);

    file_receiver(const file_receiver&) = delete;
    auto operator=(const file_receiver&) -> file_receiver& = delete;

    /**
     * @brief Process one non-acknowledgement frame
     * @return Error only when the answer could not be written
     */
    [[nodiscard]] auto handle(const frame& f) -> result<void>;

    /**
     * @brief NAK a frame that failed its integrity check
     */
    [[nodiscard]] auto on_corrupt_frame() -> result<void>;

    /**
     * @brief Abandon the active file if the sender has gone quiet
     */
    void check_stall(std::chrono::steady_clock::time_point now);

    /**
     * @brief Abandon the active file because the session is stopping
     */
    void shutdown();

    void set_progress_callback(progress_callback callback);
    void set_file_complete_callback(file_complete_callback callback);

    [[nodiscard]] auto is_receiving() const -> bool;

    [[nodiscard]] auto last_accepted_sequence() const -> std::optional<uint16_t>;

private:
    auto handle_hello(const frame& f) -> result<void>;
    auto handle_session_end(const frame& f) -> result<void>;
    auto handle_file_meta(const frame& f) -> result<void>;
    auto handle_data(const frame& f) -> result<void>;
    auto handle_file_end(const frame& f) -> result<void>;

    auto reject(const frame& f, error_code reason) -> result<void>;
    auto accept(const frame& f) -> result<void>;
    auto in_sequence(const frame& f) const -> bool;

    void abandon_active(const error& reason);
    void complete_active(bool success, std::optional<error> failure);

    struct active_file {
        file_transfer_result outcome;
        std::chrono::steady_clock::time_point started;
        std::chrono::steady_clock::time_point last_activity;
    };

    frame_link& link_;
    session_config config_;
    chunk_assembler assembler_;
    progress_accountant accountant_;

    progress_callback on_progress_;
    file_complete_callback on_file_complete_;

    bool synced_ = false;
    uint16_t last_sequence_ = 0xFFFF;
    std::optional<uint32_t> session_chunk_size_;  // announced in HELLO
    std::optional<active_file> active_;
    std::atomic<bool> receiving_{false};
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_SESSION_FILE_RECEIVER_H
