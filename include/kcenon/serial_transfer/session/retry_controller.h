/**
 * @file retry_controller.h
 * @brief Stop-and-wait confirmation of outgoing frames
 */

#ifndef KCENON_SERIAL_TRANSFER_SESSION_RETRY_CONTROLLER_H
#define KCENON_SERIAL_TRANSFER_SESSION_RETRY_CONTROLLER_H

#include <kcenon/serial_transfer/core/types.h>
#include <kcenon/serial_transfer/protocol/frame.h>
#include <kcenon/serial_transfer/session/frame_link.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace kcenon::serial_transfer {

/**
 * @brief Sends one frame at a time and waits for the peer to confirm it
 *
 * The sending thread calls send_and_confirm(); the reader thread hands every
 * ACK and NAK it decodes to on_acknowledgement(). A frame is confirmed by an
 * ACK with the same sequence and frame type. A NAK naming the sequence just
 * before the pending one means the peer saw damage and has not accepted the
 * pending frame, so it is retransmitted at once; other NAKs for the pending
 * sequence carry a rejection reason.
 *
 * @code
 * retry_controller retry(link, {std::chrono::milliseconds{900}, 3});
 * auto sent = retry.send_and_confirm(frame{frame_type::data, seq, payload});
 * if (!sent && sent.error().code == error_code::retries_exhausted) {
 *     // peer unreachable
 * }
 * @endcode
 */
class retry_controller {
public:
    struct config {
        std::chrono::milliseconds ack_timeout{1000};
        uint32_t max_retries = 3;
    };

    struct statistics {
        uint64_t frames_confirmed = 0;
        uint64_t retransmissions = 0;
        uint64_t timeouts = 0;
        uint64_t naks_received = 0;
    };

    retry_controller(frame_link& link, config cfg);

    retry_controller(const retry_controller&) = delete;
    auto operator=(const retry_controller&) -> retry_controller& = delete;

    /**
     * @brief Send @p f and block until it is confirmed
     * @return Success, or retries_exhausted / transfer_rejected /
     *         transfer_cancelled / a channel error
     */
    [[nodiscard]] auto send_and_confirm(const frame& f) -> result<void>;

    /**
     * @brief Same, with a retransmission budget other than the configured one
     */
    [[nodiscard]] auto send_and_confirm(const frame& f, uint32_t max_retries) -> result<void>;

    /**
     * @brief Deliver an ACK or NAK read from the channel
     */
    void on_acknowledgement(const frame& f);

    /**
     * @brief Stop retransmitting
     *
     * A frame already on the wire still gets its full wait. No new frame
     * and no further retransmission is written afterwards; those calls
     * report transfer_cancelled.
     */
    void cancel();

    /**
     * @brief Wake any waiter with @p err; later sends fail with it at once
     */
    void fail(const error& err);

    [[nodiscard]] auto is_cancelled() const -> bool;

    [[nodiscard]] auto get_statistics() const -> statistics;

private:
    enum class outcome { pending, confirmed, retransmit, rejected };

    frame_link& link_;
    config config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool awaiting_ = false;
    uint16_t awaiting_sequence_ = 0;
    frame_type awaiting_type_ = frame_type::data;
    outcome outcome_ = outcome::pending;
    error_code reject_reason_ = error_code::success;
    bool cancelled_ = false;
    std::optional<error> link_failure_;
    statistics stats_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_SESSION_RETRY_CONTROLLER_H
