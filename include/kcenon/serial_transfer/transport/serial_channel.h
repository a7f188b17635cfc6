/**
 * @file serial_channel.h
 * @brief Byte channel over a POSIX serial device
 */

#ifndef KCENON_SERIAL_TRANSFER_TRANSPORT_SERIAL_CHANNEL_H
#define KCENON_SERIAL_TRANSFER_TRANSPORT_SERIAL_CHANNEL_H

#include <kcenon/serial_transfer/transport/byte_channel.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace kcenon::serial_transfer {

/**
 * @brief Serial device configuration
 *
 * The line is always configured raw 8N1 without flow control.
 */
struct serial_channel_config {
    std::string device;
    uint32_t baud_rate = 115200;
    std::chrono::milliseconds write_timeout{5000};  ///< Max wait for the driver to drain

    serial_channel_config() = default;
    serial_channel_config(std::string dev, uint32_t baud)
        : device(std::move(dev)), baud_rate(baud) {}

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Byte channel over a termios serial port
 *
 * The descriptor is opened non-blocking and waited on with poll(); input
 * and output queues are flushed at open so stale bytes from a previous run
 * never reach the deframer.
 *
 * @code
 * auto channel = serial_channel::open({"/dev/ttyUSB0", 2000000});
 * if (!channel) {
 *     std::cerr << channel.error().message << "\n";
 * }
 * @endcode
 */
class serial_channel : public byte_channel {
public:
    /**
     * @brief Open and configure a serial device
     * @return Channel, or channel_open_failed / channel_config_failed / invalid_baud_rate
     */
    [[nodiscard]] static auto open(const serial_channel_config& config)
        -> result<std::unique_ptr<serial_channel>>;

    /**
     * @brief Check whether this platform can drive @p baud_rate
     */
    [[nodiscard]] static auto is_supported_baud_rate(uint32_t baud_rate) -> bool;

    ~serial_channel() override;

    [[nodiscard]] auto type() const -> std::string_view override;
    [[nodiscard]] auto is_open() const -> bool override;
    [[nodiscard]] auto read(std::span<std::byte> buffer,
                            std::chrono::milliseconds timeout) -> result<std::size_t> override;
    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<std::size_t> override;
    void close() override;
    [[nodiscard]] auto get_statistics() const -> channel_statistics override;

    [[nodiscard]] auto config() const -> const serial_channel_config&;

private:
    struct impl;

    explicit serial_channel(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_TRANSPORT_SERIAL_CHANNEL_H
