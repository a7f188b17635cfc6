/**
 * @file serial_channel.cpp
 * @brief Implementation of the termios serial channel
 */

#include <kcenon/serial_transfer/transport/serial_channel.h>

#include <kcenon/serial_transfer/core/logging.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <optional>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace kcenon::serial_transfer {

namespace {

auto baud_to_speed(uint32_t baud) -> std::optional<speed_t> {
    switch (baud) {
        case 9600:
            return B9600;
        case 19200:
            return B19200;
        case 38400:
            return B38400;
        case 57600:
            return B57600;
        case 115200:
            return B115200;
        case 230400:
            return B230400;
#ifdef B460800
        case 460800:
            return B460800;
#endif
#ifdef B500000
        case 500000:
            return B500000;
#endif
#ifdef B921600
        case 921600:
            return B921600;
#endif
#ifdef B1000000
        case 1000000:
            return B1000000;
#endif
#ifdef B1500000
        case 1500000:
            return B1500000;
#endif
#ifdef B2000000
        case 2000000:
            return B2000000;
#endif
#ifdef B3000000
        case 3000000:
            return B3000000;
#endif
#ifdef B4000000
        case 4000000:
            return B4000000;
#endif
        default:
            return std::nullopt;
    }
}

auto errno_message(const char* what) -> std::string {
    return std::string(what) + ": " + std::strerror(errno);
}

}  // namespace

auto serial_channel_config::validate() const -> result<void> {
    if (device.empty()) {
        return unexpected(error{error_code::invalid_configuration, "serial device not set"});
    }
    if (!serial_channel::is_supported_baud_rate(baud_rate)) {
        return unexpected(error{
            error_code::invalid_baud_rate,
            "unsupported baud rate: " + std::to_string(baud_rate)});
    }
    if (write_timeout.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration, "write timeout must be positive"});
    }
    return {};
}

struct serial_channel::impl {
    serial_channel_config config;
    int fd = -1;
    int wake_pipe[2] = {-1, -1};  // [0] polled by readers, [1] written by close()
    std::atomic<bool> open{false};

    mutable std::mutex stats_mutex;
    channel_statistics stats;

    ~impl() {
        if (fd >= 0) ::close(fd);
        if (wake_pipe[0] >= 0) ::close(wake_pipe[0]);
        if (wake_pipe[1] >= 0) ::close(wake_pipe[1]);
    }

    auto configure_port(speed_t speed) -> result<void> {
        struct termios tio;
        std::memset(&tio, 0, sizeof(tio));

        if (::tcgetattr(fd, &tio) != 0) {
            return unexpected(error{error_code::channel_config_failed, errno_message("tcgetattr")});
        }

        // Raw mode, 8N1, no flow control
        tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR |
                                               IGNCR | ICRNL | IXON | IXOFF | IXANY));
        tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
        tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
        tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
#ifdef CRTSCTS
        tio.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
#endif
        tio.c_cflag |= static_cast<tcflag_t>(CS8 | CLOCAL | CREAD);

        tio.c_cc[VMIN] = 0;
        tio.c_cc[VTIME] = 0;

        ::cfsetispeed(&tio, speed);
        ::cfsetospeed(&tio, speed);

        if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
            return unexpected(error{error_code::channel_config_failed, errno_message("tcsetattr")});
        }

        ::tcflush(fd, TCIOFLUSH);
        return {};
    }

    void count_error() {
        std::lock_guard lock(stats_mutex);
        ++stats.errors;
    }
};

auto serial_channel::open(const serial_channel_config& config)
    -> result<std::unique_ptr<serial_channel>> {
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto state = std::make_unique<impl>();
    state->config = config;

    state->fd = ::open(config.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (state->fd < 0) {
        return unexpected(error{
            error_code::channel_open_failed, errno_message(("open " + config.device).c_str())});
    }

    if (auto configured = state->configure_port(*baud_to_speed(config.baud_rate)); !configured) {
        return unexpected(configured.error());
    }

    if (::pipe(state->wake_pipe) != 0) {
        return unexpected(error{error_code::channel_open_failed, errno_message("pipe")});
    }

    state->open.store(true);

    ST_LOG_INFO(log_category::channel,
                "Opened " + config.device + " at " + std::to_string(config.baud_rate) + " baud");

    return std::unique_ptr<serial_channel>(new serial_channel(std::move(state)));
}

auto serial_channel::is_supported_baud_rate(uint32_t baud_rate) -> bool {
    return baud_to_speed(baud_rate).has_value();
}

serial_channel::serial_channel(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

serial_channel::~serial_channel() {
    close();
}

auto serial_channel::type() const -> std::string_view {
    return "serial";
}

auto serial_channel::is_open() const -> bool {
    return impl_->open.load();
}

auto serial_channel::read(std::span<std::byte> buffer, std::chrono::milliseconds timeout)
    -> result<std::size_t> {
    if (!impl_->open.load()) {
        return unexpected(error{error_code::channel_closed});
    }

    struct pollfd fds[2];
    fds[0] = {impl_->fd, POLLIN, 0};
    fds[1] = {impl_->wake_pipe[0], POLLIN, 0};

    int ready = ::poll(fds, 2, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return std::size_t{0};
        }
        impl_->count_error();
        return unexpected(error{error_code::channel_read_error, errno_message("poll")});
    }

    if (!impl_->open.load() || (fds[1].revents & POLLIN)) {
        return unexpected(error{error_code::channel_closed});
    }

    if (ready == 0) {
        return std::size_t{0};
    }

    if (fds[0].revents & (POLLERR | POLLNVAL)) {
        impl_->count_error();
        return unexpected(error{error_code::channel_read_error, "device reported an error"});
    }
    if ((fds[0].revents & POLLHUP) && !(fds[0].revents & POLLIN)) {
        return unexpected(error{error_code::channel_closed, "device hung up"});
    }

    ssize_t n = ::read(impl_->fd, buffer.data(), buffer.size());
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::size_t{0};
        }
        impl_->count_error();
        return unexpected(error{error_code::channel_read_error, errno_message("read")});
    }

    std::lock_guard lock(impl_->stats_mutex);
    impl_->stats.bytes_read += static_cast<uint64_t>(n);
    ++impl_->stats.read_calls;
    return static_cast<std::size_t>(n);
}

auto serial_channel::write(std::span<const std::byte> data) -> result<std::size_t> {
    if (!impl_->open.load()) {
        return unexpected(error{error_code::channel_closed});
    }

    std::size_t written = 0;
    auto deadline = std::chrono::steady_clock::now() + impl_->config.write_timeout;

    while (written < data.size()) {
        ssize_t n = ::write(impl_->fd, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }

        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            impl_->count_error();
            return unexpected(error{error_code::channel_write_error, errno_message("write")});
        }

        // Driver queue full: wait for room
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            impl_->count_error();
            return unexpected(error{
                error_code::channel_write_error,
                "write stalled after " + std::to_string(written) + " of " +
                    std::to_string(data.size()) + " bytes"});
        }

        struct pollfd pfd = {impl_->fd, POLLOUT, 0};
        if (::poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR) {
            impl_->count_error();
            return unexpected(error{error_code::channel_write_error, errno_message("poll")});
        }

        if (!impl_->open.load()) {
            return unexpected(error{error_code::channel_closed});
        }
    }

    std::lock_guard lock(impl_->stats_mutex);
    impl_->stats.bytes_written += written;
    ++impl_->stats.write_calls;
    return written;
}

void serial_channel::close() {
    bool expected = true;
    if (!impl_->open.compare_exchange_strong(expected, false)) {
        return;
    }

    const char wake = 1;
    if (::write(impl_->wake_pipe[1], &wake, 1) < 0) {
        ST_LOG_DEBUG(log_category::channel, errno_message("wake pipe write"));
    }

    ST_LOG_INFO(log_category::channel, "Closed " + impl_->config.device);
}

auto serial_channel::get_statistics() const -> channel_statistics {
    std::lock_guard lock(impl_->stats_mutex);
    return impl_->stats;
}

auto serial_channel::config() const -> const serial_channel_config& {
    return impl_->config;
}

}  // namespace kcenon::serial_transfer
