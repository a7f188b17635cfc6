/**
 * @file byte_channel.h
 * @brief Byte channel abstraction
 *
 * A byte channel is an unframed, unreliable, half-duplex byte pipe. It has
 * no packet boundaries, no error detection and no flow control; the session
 * protocol provides all of that on top.
 */

#ifndef KCENON_SERIAL_TRANSFER_TRANSPORT_BYTE_CHANNEL_H
#define KCENON_SERIAL_TRANSFER_TRANSPORT_BYTE_CHANNEL_H

#include <kcenon/serial_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>

namespace kcenon::serial_transfer {

/**
 * @brief Channel statistics
 */
struct channel_statistics {
    uint64_t bytes_written = 0;
    uint64_t bytes_read = 0;
    uint64_t write_calls = 0;
    uint64_t read_calls = 0;
    uint64_t errors = 0;
};

/**
 * @brief Byte channel base class
 *
 * The session borrows a channel for its lifetime; the host owns it.
 * read() and write() may be called concurrently from one reader and one
 * writer thread.
 *
 * @code
 * auto channel = serial_channel::open(serial_channel_config{"/dev/ttyUSB0", 115200});
 * if (channel) {
 *     auto session = transfer_session::builder().with_mode(session_mode::send).build();
 *     session.value().start(*channel.value());
 * }
 * @endcode
 */
class byte_channel {
public:
    byte_channel() = default;
    virtual ~byte_channel() = default;

    // Non-copyable
    byte_channel(const byte_channel&) = delete;
    auto operator=(const byte_channel&) -> byte_channel& = delete;

    /**
     * @brief Get the channel type identifier (e.g. "serial", "memory")
     */
    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    /**
     * @brief Read whatever bytes are available, waiting up to @p timeout
     * @return Number of bytes stored in @p buffer; 0 when the wait timed out
     *
     * Returns error_code::channel_closed once the channel is closed.
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer,
                                    std::chrono::milliseconds timeout) -> result<std::size_t> = 0;

    /**
     * @brief Write all of @p data
     * @return Number of bytes written (always data.size() on success)
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<std::size_t> = 0;

    /**
     * @brief Close the channel; pending and later reads fail with channel_closed
     */
    virtual void close() = 0;

    [[nodiscard]] virtual auto get_statistics() const -> channel_statistics = 0;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_TRANSPORT_BYTE_CHANNEL_H
