/**
 * @file memory_channel.cpp
 * @brief Implementation of the in-memory channel pair
 */

#include <kcenon/serial_transfer/transport/memory_channel.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace kcenon::serial_transfer {

struct memory_channel::link {
    std::mutex mutex;
    std::condition_variable readable;
    std::deque<std::byte> inbox[2];  // inbox[side] is read by endpoint `side`
    write_filter filters[2];
    channel_statistics stats[2];
    bool closed = false;
};

auto memory_channel::create_pair()
    -> std::pair<std::unique_ptr<memory_channel>, std::unique_ptr<memory_channel>> {
    auto shared = std::make_shared<link>();
    return {std::unique_ptr<memory_channel>(new memory_channel(shared, 0)),
            std::unique_ptr<memory_channel>(new memory_channel(shared, 1))};
}

memory_channel::memory_channel(std::shared_ptr<link> shared, int side)
    : link_(std::move(shared)), side_(side) {}

memory_channel::~memory_channel() {
    close();
}

auto memory_channel::type() const -> std::string_view {
    return "memory";
}

auto memory_channel::is_open() const -> bool {
    std::lock_guard lock(link_->mutex);
    return !link_->closed;
}

auto memory_channel::read(std::span<std::byte> buffer, std::chrono::milliseconds timeout)
    -> result<std::size_t> {
    std::unique_lock lock(link_->mutex);
    auto& inbox = link_->inbox[side_];

    link_->readable.wait_for(lock, timeout, [&] { return !inbox.empty() || link_->closed; });

    if (inbox.empty()) {
        if (link_->closed) {
            return unexpected(error{error_code::channel_closed});
        }
        return std::size_t{0};
    }

    auto count = std::min(buffer.size(), inbox.size());
    std::copy_n(inbox.begin(), count, buffer.begin());
    inbox.erase(inbox.begin(), inbox.begin() + static_cast<std::ptrdiff_t>(count));

    auto& stats = link_->stats[side_];
    stats.bytes_read += count;
    ++stats.read_calls;
    return count;
}

auto memory_channel::write(std::span<const std::byte> data) -> result<std::size_t> {
    write_filter filter;
    {
        std::lock_guard lock(link_->mutex);
        if (link_->closed) {
            return unexpected(error{error_code::channel_closed});
        }
        filter = link_->filters[side_];
    }

    // The filter runs unlocked so it may call back into the channel
    auto action = filter ? filter(data) : write_action::deliver;

    std::lock_guard lock(link_->mutex);
    if (link_->closed) {
        return unexpected(error{error_code::channel_closed});
    }

    auto& stats = link_->stats[side_];
    stats.bytes_written += data.size();
    ++stats.write_calls;

    if (action == write_action::drop) {
        return data.size();
    }

    auto& peer = link_->inbox[1 - side_];
    auto first = peer.size();
    peer.insert(peer.end(), data.begin(), data.end());

    if (action == write_action::corrupt && !data.empty()) {
        auto& victim = peer[first + data.size() / 2];
        victim = ~victim;
    }

    link_->readable.notify_all();
    return data.size();
}

void memory_channel::close() {
    std::lock_guard lock(link_->mutex);
    link_->closed = true;
    link_->readable.notify_all();
}

auto memory_channel::get_statistics() const -> channel_statistics {
    std::lock_guard lock(link_->mutex);
    return link_->stats[side_];
}

void memory_channel::set_write_filter(write_filter filter) {
    std::lock_guard lock(link_->mutex);
    link_->filters[side_] = std::move(filter);
}

void memory_channel::inject(std::span<const std::byte> data) {
    std::lock_guard lock(link_->mutex);
    auto& peer = link_->inbox[1 - side_];
    peer.insert(peer.end(), data.begin(), data.end());
    link_->readable.notify_all();
}

}  // namespace kcenon::serial_transfer
