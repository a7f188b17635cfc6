/**
 * @file memory_channel.h
 * @brief In-process byte channel pair with fault injection
 */

#ifndef KCENON_SERIAL_TRANSFER_TRANSPORT_MEMORY_CHANNEL_H
#define KCENON_SERIAL_TRANSFER_TRANSPORT_MEMORY_CHANNEL_H

#include <kcenon/serial_transfer/transport/byte_channel.h>

#include <functional>
#include <memory>
#include <utility>

namespace kcenon::serial_transfer {

/**
 * @brief What happens to one write() on its way to the peer
 */
enum class write_action {
    deliver,  ///< Bytes arrive unchanged
    drop,     ///< Bytes are lost
    corrupt,  ///< One byte in the middle is inverted
};

/**
 * @brief One end of an in-memory link
 *
 * Two endpoints created together behave like a null-modem cable: bytes
 * written on one end become readable on the other. A write filter sees
 * every write() before delivery, which lets tests lose or damage whole
 * frames deterministically. Closing either end takes the link down for
 * both; bytes already delivered can still be read.
 *
 * @code
 * auto [a, b] = memory_channel::create_pair();
 * int count = 0;
 * a->set_write_filter([&](std::span<const std::byte>) {
 *     return ++count % 3 == 0 ? write_action::drop : write_action::deliver;
 * });
 * @endcode
 */
class memory_channel : public byte_channel {
public:
    using write_filter = std::function<write_action(std::span<const std::byte>)>;

    [[nodiscard]] static auto create_pair()
        -> std::pair<std::unique_ptr<memory_channel>, std::unique_ptr<memory_channel>>;

    ~memory_channel() override;

    [[nodiscard]] auto type() const -> std::string_view override;
    [[nodiscard]] auto is_open() const -> bool override;
    [[nodiscard]] auto read(std::span<std::byte> buffer,
                            std::chrono::milliseconds timeout) -> result<std::size_t> override;
    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<std::size_t> override;
    void close() override;
    [[nodiscard]] auto get_statistics() const -> channel_statistics override;

    /**
     * @brief Install a filter applied to every subsequent write()
     */
    void set_write_filter(write_filter filter);

    /**
     * @brief Deliver raw bytes to the peer, bypassing the filter
     */
    void inject(std::span<const std::byte> data);

private:
    struct link;

    memory_channel(std::shared_ptr<link> shared, int side);

    std::shared_ptr<link> link_;
    int side_;
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_TRANSPORT_MEMORY_CHANNEL_H
