/**
 * @file transfer_session.h
 * @brief Multi-file transfer session over one byte channel
 */

#ifndef KCENON_SERIAL_TRANSFER_SESSION_TRANSFER_SESSION_H
#define KCENON_SERIAL_TRANSFER_SESSION_TRANSFER_SESSION_H

#include <kcenon/serial_transfer/core/types.h>
#include <kcenon/serial_transfer/session/session_config.h>
#include <kcenon/serial_transfer/session/session_types.h>
#include <kcenon/serial_transfer/transport/byte_channel.h>

#include <chrono>
#include <filesystem>
#include <memory>

namespace kcenon::serial_transfer {

/**
 * @brief Transfer session
 *
 * Owns a reader thread that deframes everything arriving on the channel and
 * routes it (ACK/NAK to the sender, everything else to the receiver), and in
 * send-capable modes a worker thread that sends queued files one by one.
 *
 * A SEND session ends by itself once finish() was called and the queue has
 * drained. RECV and BOTH sessions listen until stop() or a channel failure.
 *
 * @code
 * auto session = transfer_session::builder()
 *     .with_mode(session_mode::send)
 *     .with_baud_rate(115200)
 *     .build();
 *
 * if (session.has_value()) {
 *     auto& s = session.value();
 *     s.on_progress([](const progress_report& p) { std::cout << format_progress_line(p); });
 *     (void)s.enqueue("firmware.bin");
 *     s.finish();
 *     (void)s.start(*channel);
 *     auto summary = s.wait();
 * }
 * @endcode
 */
class transfer_session {
public:
    /**
     * @brief Builder for transfer_session
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set what this endpoint does (default: send)
         */
        auto with_mode(session_mode mode) -> builder&;

        /**
         * @brief Set chunk size for outgoing files
         * @param size Chunk size in bytes, 1 to 65536 (default: 4096)
         */
        auto with_chunk_size(uint32_t size) -> builder&;

        /**
         * @brief Set the line rate used to derive timeouts (default: 115200)
         */
        auto with_baud_rate(uint32_t baud_rate) -> builder&;

        /**
         * @brief Set retransmissions per frame (default: 3)
         */
        auto with_max_retries(uint32_t retries) -> builder&;

        /**
         * @brief Set retransmissions of HELLO (default: 8)
         */
        auto with_handshake_retries(uint32_t retries) -> builder&;

        /**
         * @brief Override the derived ACK timeout
         */
        auto with_ack_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Override the derived receive stall timeout
         */
        auto with_receive_stall_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Set where received files are written (default: current directory)
         */
        auto with_output_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Set the number of confirmations in the rate window (default: 8)
         */
        auto with_rate_window(std::size_t samples) -> builder&;

        /**
         * @brief Set how often the reader wakes up with no input (default: 20 ms)
         */
        auto with_poll_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Build the session
         * @return Session, or a config error
         */
        [[nodiscard]] auto build() -> result<transfer_session>;

    private:
        session_config config_;
    };

    // Non-copyable, movable
    transfer_session(const transfer_session&) = delete;
    auto operator=(const transfer_session&) -> transfer_session& = delete;
    transfer_session(transfer_session&&) noexcept;
    auto operator=(transfer_session&&) noexcept -> transfer_session&;

    /**
     * @brief Stops and joins a running session
     */
    ~transfer_session();

    /**
     * @brief Start the reader and sender threads on @p channel
     *
     * The channel must outlive the session.
     */
    [[nodiscard]] auto start(byte_channel& channel) -> result<void>;

    /**
     * @brief Queue a file for sending
     *
     * May be called before or after start(). Files are sent in the order they
     * were queued.
     */
    [[nodiscard]] auto enqueue(const std::filesystem::path& path) -> result<void>;

    /**
     * @brief Declare that no more files will be queued
     */
    void finish();

    /**
     * @brief Request shutdown
     *
     * Takes effect at a frame boundary: a frame on the wire still gets its
     * confirmation wait, nothing is retransmitted afterwards, and a partially
     * received file is removed.
     */
    void stop();

    /**
     * @brief Block until the session closes
     * @return Summary, or the channel / handshake error that closed it
     */
    [[nodiscard]] auto wait() -> result<session_summary>;

    /**
     * @brief Wait up to @p timeout for the session to begin closing
     * @return true when wait() would no longer block on the session
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto state() const -> session_state;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto config() const -> const session_config&;

    void on_progress(progress_callback callback);
    void on_file_complete(file_complete_callback callback);
    void on_state_changed(state_changed_callback callback);

private:
    explicit transfer_session(session_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_SESSION_TRANSFER_SESSION_H
