/**
 * @file file_sender.h
 * @brief Sending side of the transfer protocol
 */

#ifndef KCENON_SERIAL_TRANSFER_SESSION_FILE_SENDER_H
#define KCENON_SERIAL_TRANSFER_SESSION_FILE_SENDER_H

#include <kcenon/serial_transfer/core/checksum.h>
#include <kcenon/serial_transfer/core/chunk_splitter.h>
#include <kcenon/serial_transfer/core/types.h>
#include <kcenon/serial_transfer/protocol/frame.h>
#include <kcenon/serial_transfer/session/retry_controller.h>
#include <kcenon/serial_transfer/session/session_config.h>
#include <kcenon/serial_transfer/session/session_types.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace kcenon::serial_transfer {

/**
 * @brief Drives HELLO, per-file FILE_META / DATA / FILE_END and SESSION_END
 *
 * Every data-bearing frame takes the next sequence number and is confirmed
 * through the retry controller before the next one is sent. The SHA-256 of
 * a file is computed from the chunks as they go out.
 */
class file_sender {
public:
    file_sender(retry_controller& retry, const session_config& config);

    file_sender(const file_sender&) = delete;
    auto operator=(const file_sender&) -> file_sender& = delete;

    /**
     * @brief Announce this endpoint with HELLO
     * @return handshake_failed when the peer never confirms or refuses,
     *         otherwise a channel or cancellation error
     */
    [[nodiscard]] auto handshake() -> result<void>;

    /**
     * @brief Send one file
     *
     * Never throws and never returns early without a result: a missing or
     * unreadable file, a rejection or exhausted retries all end up in the
     * returned result's failure field.
     */
    [[nodiscard]] auto send_file(const std::filesystem::path& path) -> file_transfer_result;

    /**
     * @brief Tell the peer no more files follow
     */
    [[nodiscard]] auto end_session() -> result<void>;

    void set_progress_callback(progress_callback callback);

    [[nodiscard]] auto is_handshake_complete() const -> bool;

private:
    auto make_frame(frame_type type, std::vector<std::byte> payload) -> frame;

    retry_controller& retry_;
    session_config config_;
    chunk_splitter splitter_;
    sha256_hasher hasher_;
    progress_callback on_progress_;
    uint16_t next_sequence_ = 0;
    std::atomic<bool> handshake_complete_{false};
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_SESSION_FILE_SENDER_H
