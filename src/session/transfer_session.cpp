/**
 * @file transfer_session.cpp
 * @brief Implementation of the transfer session
 */

#include <kcenon/serial_transfer/session/transfer_session.h>

#include <kcenon/serial_transfer/core/error_codes.h>
#include <kcenon/serial_transfer/core/logging.h>
#include <kcenon/serial_transfer/protocol/frame_decoder.h>
#include <kcenon/serial_transfer/session/file_receiver.h>
#include <kcenon/serial_transfer/session/file_sender.h>
#include <kcenon/serial_transfer/session/frame_link.h>
#include <kcenon/serial_transfer/session/retry_controller.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace kcenon::serial_transfer {

namespace {

constexpr std::size_t read_buffer_size = 4096;

}  // namespace

struct transfer_session::impl {
    session_config config;

    byte_channel* channel = nullptr;
    std::unique_ptr<frame_link> link;
    std::unique_ptr<retry_controller> retry;
    std::unique_ptr<file_sender> sender;
    std::unique_ptr<file_receiver> receiver;
    frame_decoder decoder;

    std::thread reader_thread;
    std::thread sender_thread;
    std::atomic<bool> reader_stop{false};
    std::atomic<bool> handshaking{false};
    std::atomic<bool> sending_file{false};

    // Guards everything below
    mutable std::mutex mutex;
    std::condition_variable queue_cv;
    std::condition_variable closed_cv;
    std::deque<std::filesystem::path> queue;
    bool started = false;
    bool finishing = false;
    bool closing = false;
    bool closed = false;
    bool waited = false;
    std::optional<error> fatal_error;
    session_summary summary;
    session_state current_state = session_state::idle;

    std::mutex callback_mutex;
    progress_callback progress_cb;
    file_complete_callback complete_cb;
    state_changed_callback state_cb;

    explicit impl(session_config cfg) : config(std::move(cfg)) {}

    auto compute_state() const -> session_state {
        if (closed) return session_state::closed;
        if (handshaking.load()) return session_state::handshake;
        if (sending_file.load()) return session_state::sending;
        if (receiver && receiver->is_receiving()) return session_state::receiving;
        if (started && receives_files(config.mode)) return session_state::listening;
        return session_state::idle;
    }

    void update_state() {
        session_state old_state;
        session_state new_state;
        {
            std::lock_guard lock(mutex);
            new_state = compute_state();
            if (new_state == current_state) {
                return;
            }
            old_state = current_state;
            current_state = new_state;
        }

        ST_LOG_DEBUG(log_category::session,
                     std::string("State ") + to_string(old_state) + " -> " + to_string(new_state));

        state_changed_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = state_cb;
        }
        if (cb) {
            cb(new_state);
        }
    }

    void report_progress(const progress_report& report) {
        progress_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = progress_cb;
        }
        if (cb) {
            cb(report);
        }
    }

    void record_result(const file_transfer_result& outcome) {
        {
            std::lock_guard lock(mutex);
            summary.files.push_back(outcome);
        }

        file_complete_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = complete_cb;
        }
        if (cb) {
            cb(outcome);
        }
    }

    void request_close(std::optional<error> err) {
        {
            std::lock_guard lock(mutex);
            if (err && !fatal_error) {
                fatal_error = err;
            }
            closing = true;
        }
        if (err) {
            retry->fail(*err);
        }
        retry->cancel();
        queue_cv.notify_all();
        closed_cv.notify_all();
    }

    // A stop() already closed the session; a channel error closes it now
    void close_after(const error& err) {
        if (err.code != error_code::transfer_cancelled) {
            request_close(err);
        }
    }

    auto ensure_handshake() -> result<void> {
        if (sender->is_handshake_complete()) {
            return {};
        }
        handshaking.store(true);
        update_state();
        auto shaken = sender->handshake();
        handshaking.store(false);
        update_state();
        return shaken;
    }

    void sender_loop() {
        if (config.mode == session_mode::send) {
            if (auto shaken = ensure_handshake(); !shaken) {
                close_after(shaken.error());
                return;
            }
        }

        for (;;) {
            std::filesystem::path path;
            {
                std::unique_lock lock(mutex);
                queue_cv.wait(lock, [this] { return !queue.empty() || finishing || closing; });
                if (closing) {
                    return;
                }
                if (queue.empty()) {
                    break;
                }
                path = std::move(queue.front());
                queue.pop_front();
            }

            if (auto shaken = ensure_handshake(); !shaken) {
                file_transfer_result outcome;
                outcome.filename = path.filename().string();
                outcome.path = path;
                outcome.direction = transfer_direction::send;
                outcome.failure = shaken.error();
                record_result(outcome);
                if (is_session_fatal(shaken.error().code)) {
                    close_after(shaken.error());
                    return;
                }
                continue;
            }

            sending_file.store(true);
            update_state();
            auto outcome = sender->send_file(path);
            sending_file.store(false);
            record_result(outcome);
            update_state();

            if (!outcome.success && outcome.failure && is_session_fatal(outcome.failure->code)) {
                close_after(*outcome.failure);
                return;
            }
        }

        if (config.mode != session_mode::send) {
            ST_LOG_INFO(log_category::session, "Send queue drained; still listening");
            return;
        }

        auto ended = sender->end_session();
        if (!ended) {
            if (is_channel_error(ended.error().code)) {
                request_close(ended.error());
                return;
            }
            ST_LOG_WARN(log_category::session,
                        "Peer did not confirm SESSION_END: " + ended.error().message);
        }
        ST_LOG_INFO(log_category::session, "All files processed");
        request_close(std::nullopt);
    }

    void dispatch(const frame& f) {
        if (is_acknowledgement(f.type)) {
            retry->on_acknowledgement(f);
            return;
        }

        if (!receiver) {
            ST_LOG_DEBUG(log_category::session,
                         std::string("Ignoring ") + std::string(to_string(f.type)) +
                             " on a send-only session");
            return;
        }

        if (auto handled = receiver->handle(f); !handled) {
            request_close(handled.error());
        }
        update_state();
    }

    void drain_frames() {
        bool nak_sent = false;
        for (;;) {
            auto next = decoder.next();
            if (next) {
                dispatch(next.value());
                continue;
            }
            if (next.error().code == error_code::frame_incomplete) {
                return;
            }
            // One NAK per read is enough to trigger a retransmission
            if (receiver && !nak_sent) {
                nak_sent = true;
                if (auto nak = receiver->on_corrupt_frame(); !nak) {
                    request_close(nak.error());
                    return;
                }
            }
        }
    }

    void reader_loop() {
        std::vector<std::byte> buffer(read_buffer_size);
        auto last_input = std::chrono::steady_clock::now();

        while (!reader_stop.load()) {
            auto count = channel->read(buffer, config.poll_interval);
            if (!count) {
                if (reader_stop.load()) {
                    break;
                }
                ST_LOG_ERROR(log_category::session, "Channel failed: " + count.error().message);
                request_close(count.error());
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (count.value() > 0) {
                decoder.feed(std::span<const std::byte>(buffer.data(), count.value()));
                last_input = now;
                drain_frames();
            } else if (decoder.pending_bytes() > 0 &&
                       now - last_input >= config.inter_frame_timeout()) {
                auto dropped = decoder.discard_pending();
                ST_LOG_DEBUG(log_category::frame,
                             "Discarded " + std::to_string(dropped) + " bytes of an unfinished frame");
            }

            if (receiver) {
                receiver->check_stall(now);
                update_state();
            }
        }
    }
};

// Builder implementation
transfer_session::builder::builder() = default;

auto transfer_session::builder::with_mode(session_mode mode) -> builder& {
    config_.mode = mode;
    return *this;
}

auto transfer_session::builder::with_chunk_size(uint32_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto transfer_session::builder::with_baud_rate(uint32_t baud_rate) -> builder& {
    config_.baud_rate = baud_rate;
    return *this;
}

auto transfer_session::builder::with_max_retries(uint32_t retries) -> builder& {
    config_.max_retries = retries;
    return *this;
}

auto transfer_session::builder::with_handshake_retries(uint32_t retries) -> builder& {
    config_.handshake_retries = retries;
    return *this;
}

auto transfer_session::builder::with_ack_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.ack_timeout = timeout;
    return *this;
}

auto transfer_session::builder::with_receive_stall_timeout(
    std::chrono::milliseconds timeout) -> builder& {
    config_.receive_stall_timeout = timeout;
    return *this;
}

auto transfer_session::builder::with_output_directory(
    const std::filesystem::path& dir) -> builder& {
    config_.output_directory = dir;
    return *this;
}

auto transfer_session::builder::with_rate_window(std::size_t samples) -> builder& {
    config_.rate_window_size = samples;
    return *this;
}

auto transfer_session::builder::with_poll_interval(
    std::chrono::milliseconds interval) -> builder& {
    config_.poll_interval = interval;
    return *this;
}

auto transfer_session::builder::build() -> result<transfer_session> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    return transfer_session{config_};
}

// transfer_session implementation
transfer_session::transfer_session(session_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

transfer_session::transfer_session(transfer_session&&) noexcept = default;

auto transfer_session::operator=(transfer_session&& other) noexcept -> transfer_session& {
    if (this != &other) {
        if (impl_ && is_running()) {
            stop();
            (void)wait();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

transfer_session::~transfer_session() {
    if (impl_ && is_running()) {
        stop();
        (void)wait();
    }
}

auto transfer_session::start(byte_channel& channel) -> result<void> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->started) {
        return unexpected(error{error_code::already_initialized, "session already started"});
    }
    if (!channel.is_open()) {
        return unexpected(error{error_code::channel_closed, "channel is not open"});
    }

    const auto& cfg = impl_->config;
    impl_->channel = &channel;
    impl_->link = std::make_unique<frame_link>(channel);
    impl_->retry = std::make_unique<retry_controller>(
        *impl_->link, retry_controller::config{cfg.effective_ack_timeout(), cfg.max_retries});

    auto* state = impl_.get();
    if (sends_files(cfg.mode)) {
        impl_->sender = std::make_unique<file_sender>(*impl_->retry, cfg);
        impl_->sender->set_progress_callback(
            [state](const progress_report& report) { state->report_progress(report); });
    }
    if (receives_files(cfg.mode)) {
        impl_->receiver = std::make_unique<file_receiver>(*impl_->link, cfg);
        impl_->receiver->set_progress_callback(
            [state](const progress_report& report) { state->report_progress(report); });
        impl_->receiver->set_file_complete_callback(
            [state](const file_transfer_result& outcome) { state->record_result(outcome); });
    }

    ST_LOG_INFO(log_category::session,
                std::string("Starting ") + to_string(cfg.mode) + " session on " +
                    std::string(channel.type()) + " channel (chunk " +
                    std::to_string(cfg.chunk_size) + ", ack timeout " +
                    std::to_string(cfg.effective_ack_timeout().count()) + " ms)");

    impl_->started = true;
    impl_->reader_thread = std::thread([state] { state->reader_loop(); });
    if (impl_->sender) {
        impl_->sender_thread = std::thread([state] { state->sender_loop(); });
    }
    return {};
}

auto transfer_session::enqueue(const std::filesystem::path& path) -> result<void> {
    if (!sends_files(impl_->config.mode)) {
        return unexpected(
            error{error_code::invalid_configuration, "receive-only session cannot send files"});
    }

    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->finishing || impl_->closing) {
            return unexpected(
                error{error_code::invalid_configuration, "session no longer accepts files"});
        }
        impl_->queue.push_back(path);
    }
    impl_->queue_cv.notify_all();

    ST_LOG_DEBUG(log_category::session, "Queued " + path.string());
    return {};
}

void transfer_session::finish() {
    {
        std::lock_guard lock(impl_->mutex);
        impl_->finishing = true;
    }
    impl_->queue_cv.notify_all();
}

void transfer_session::stop() {
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->started || impl_->closing) {
            return;
        }
        impl_->summary.cancelled = true;
    }
    ST_LOG_INFO(log_category::session, "Stop requested");
    impl_->request_close(std::nullopt);
}

auto transfer_session::wait() -> result<session_summary> {
    {
        std::unique_lock lock(impl_->mutex);
        if (!impl_->started) {
            return unexpected(error{error_code::not_initialized, "session not started"});
        }
        if (!impl_->waited) {
            impl_->closed_cv.wait(lock, [this] { return impl_->closing; });
        }
    }

    if (impl_->sender_thread.joinable()) {
        impl_->sender_thread.join();
    }
    impl_->reader_stop.store(true);
    if (impl_->reader_thread.joinable()) {
        impl_->reader_thread.join();
    }

    bool first_wait = false;
    {
        std::lock_guard lock(impl_->mutex);
        first_wait = !impl_->waited;
        impl_->waited = true;
    }

    if (first_wait) {
        if (impl_->receiver) {
            impl_->receiver->shutdown();
        }

        auto retry_stats = impl_->retry->get_statistics();
        {
            std::lock_guard lock(impl_->mutex);
            impl_->summary.frames_retransmitted = retry_stats.retransmissions;
            impl_->summary.corrupt_frames = impl_->decoder.get_statistics().corrupt_frames;
            impl_->closed = true;
        }
        impl_->update_state();

        std::lock_guard lock(impl_->mutex);
        ST_LOG_INFO(log_category::session,
                    "Session closed: " + std::to_string(impl_->summary.succeeded_count()) +
                        " succeeded, " + std::to_string(impl_->summary.failed_count()) +
                        " failed");
    }

    std::lock_guard lock(impl_->mutex);
    if (impl_->fatal_error) {
        return unexpected(*impl_->fatal_error);
    }
    return impl_->summary;
}

auto transfer_session::wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(impl_->mutex);
    if (!impl_->started) {
        return true;
    }
    return impl_->closed_cv.wait_for(lock, timeout, [this] { return impl_->closing; });
}

auto transfer_session::state() const -> session_state {
    std::lock_guard lock(impl_->mutex);
    return impl_->current_state;
}

auto transfer_session::is_running() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->started && !impl_->waited;
}

auto transfer_session::config() const -> const session_config& {
    return impl_->config;
}

void transfer_session::on_progress(progress_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->progress_cb = std::move(callback);
}

void transfer_session::on_file_complete(file_complete_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->complete_cb = std::move(callback);
}

void transfer_session::on_state_changed(state_changed_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->state_cb = std::move(callback);
}

}  // namespace kcenon::serial_transfer
