/**
 * @file file_receiver.cpp
 * @brief Implementation of the receiving side
 */

#include <kcenon/serial_transfer/session/file_receiver.h>

#include <kcenon/serial_transfer/core/logging.h>
#include <kcenon/serial_transfer/protocol/payload_codec.h>

namespace kcenon::serial_transfer {

file_receiver::file_receiver(frame_link& link, const session_config& config)
    : link_(link),
      config_(config),
      assembler_(config.output_directory),
      accountant_(progress_accountant::config{config.rate_window_size}) {}

auto file_receiver::handle(const frame& f) -> result<void> {
    if (synced_ && f.sequence == last_sequence_) {
        ST_LOG_DEBUG(log_category::receiver,
                     "Duplicate " + std::string(to_string(f.type)) + " seq " +
                         std::to_string(f.sequence) + ", re-acknowledging");
        if (active_) {
            active_->last_activity = std::chrono::steady_clock::now();
        }
        return link_.send_ack(f.sequence, f.type);
    }

    if (is_acknowledgement(f.type)) {
        return {};
    }

    // Anything but a sync point must continue the open file in order
    if (!is_sync_point(f.type)) {
        if (!active_) {
            return reject(f, error_code::no_active_file);
        }
        if (!in_sequence(f)) {
            return reject(f, error_code::chunk_sequence_error);
        }
    }

    switch (f.type) {
        case frame_type::hello:
            return handle_hello(f);
        case frame_type::session_end:
            return handle_session_end(f);
        case frame_type::file_meta:
            return handle_file_meta(f);
        case frame_type::data:
            return handle_data(f);
        case frame_type::file_end:
            return handle_file_end(f);
        case frame_type::ack:
        case frame_type::nak:
            break;
    }
    return {};
}

auto file_receiver::on_corrupt_frame() -> result<void> {
    return link_.send_nak(last_sequence_, error_code::frame_corrupt);
}

auto file_receiver::reject(const frame& f, error_code reason) -> result<void> {
    ST_LOG_WARN(log_category::receiver,
                "Rejecting " + std::string(to_string(f.type)) + " seq " +
                    std::to_string(f.sequence) + ": " + to_string(reason));
    return link_.send_nak(f.sequence, reason);
}

auto file_receiver::accept(const frame& f) -> result<void> {
    synced_ = true;
    last_sequence_ = f.sequence;
    return link_.send_ack(f.sequence, f.type);
}

auto file_receiver::in_sequence(const frame& f) const -> bool {
    return synced_ && f.sequence == next_sequence(last_sequence_);
}

auto file_receiver::handle_hello(const frame& f) -> result<void> {
    auto hello = payload_codec::decode_hello(f.payload);
    if (!hello) {
        return reject(f, error_code::invalid_payload);
    }

    const auto& peer = hello.value();
    if (!peer.version.is_compatible_with(current_protocol_version)) {
        ST_LOG_ERROR(log_category::receiver,
                     "Peer protocol " + peer.version.to_string() + " incompatible with " +
                         current_protocol_version.to_string());
        return reject(f, error_code::protocol_mismatch);
    }

    if (active_) {
        abandon_active(error{error_code::transfer_cancelled, "peer restarted the session"});
    }

    ST_LOG_INFO(log_category::receiver,
                "Peer HELLO: protocol " + peer.version.to_string() + ", role " +
                    to_string(peer.role) + ", chunk size " + std::to_string(peer.chunk_size));
    session_chunk_size_ = peer.chunk_size;
    return accept(f);
}

auto file_receiver::handle_session_end(const frame& f) -> result<void> {
    if (active_) {
        abandon_active(error{error_code::transfer_cancelled, "session ended mid-file"});
    }

    ST_LOG_INFO(log_category::receiver, "Peer ended the session");
    auto acked = link_.send_ack(f.sequence, f.type);

    // A new session starts from a fresh HELLO at any sequence
    synced_ = false;
    last_sequence_ = 0xFFFF;
    session_chunk_size_.reset();
    return acked;
}

auto file_receiver::handle_file_meta(const frame& f) -> result<void> {
    auto meta = payload_codec::decode_file_meta(f.payload);
    if (!meta) {
        return reject(f, error_code::invalid_payload);
    }

    if (session_chunk_size_ && meta.value().chunk_size != *session_chunk_size_) {
        return reject(f, error_code::invalid_chunk_size);
    }

    if (active_) {
        abandon_active(error{error_code::transfer_cancelled, "superseded by a new file"});
    }

    auto now = std::chrono::steady_clock::now();
    auto path = assembler_.begin_file(meta.value());
    if (!path) {
        file_transfer_result outcome;
        outcome.filename = meta.value().filename;
        outcome.direction = transfer_direction::receive;
        outcome.total_bytes = meta.value().file_size;
        outcome.failure = path.error();
        ST_LOG_ERROR(log_category::receiver,
                     "Cannot accept " + outcome.filename + ": " + path.error().message);
        if (on_file_complete_) {
            on_file_complete_(outcome);
        }
        return reject(f, path.error().code);
    }

    active_file incoming;
    incoming.outcome.filename = meta.value().filename;
    incoming.outcome.path = path.value();
    incoming.outcome.direction = transfer_direction::receive;
    incoming.outcome.total_bytes = meta.value().file_size;
    incoming.started = now;
    incoming.last_activity = now;
    active_ = std::move(incoming);
    receiving_.store(true);

    accountant_.start(meta.value().file_size, now);

    transfer_log_context ctx;
    ctx.filename = meta.value().filename;
    ctx.direction = "receive";
    ctx.file_size = meta.value().file_size;
    ctx.total_chunks = meta.value().total_chunks;
    ST_LOG_INFO_CTX(log_category::receiver, "Receiving file", ctx);

    return accept(f);
}

auto file_receiver::handle_data(const frame& f) -> result<void> {
    auto data = payload_codec::decode_data(f.payload);
    if (!data) {
        return reject(f, error_code::invalid_payload);
    }

    auto written = assembler_.write_chunk(data.value().chunk_index, data.value().data);
    if (!written) {
        auto nak = reject(f, written.error().code);
        abandon_active(written.error());
        return nak;
    }

    auto now = std::chrono::steady_clock::now();
    active_->last_activity = now;

    if (written.value() == chunk_write_status::written) {
        auto sample = accountant_.record_confirmed(data.value().data.size(), now);
        active_->outcome.bytes_confirmed = sample.bytes_confirmed;
        if (on_progress_) {
            on_progress_(make_progress_report(active_->outcome.filename,
                                              transfer_direction::receive, sample));
        }
    }

    return accept(f);
}

auto file_receiver::handle_file_end(const frame& f) -> result<void> {
    auto end = payload_codec::decode_file_end(f.payload);
    if (!end) {
        return reject(f, error_code::invalid_payload);
    }

    auto finalized =
        assembler_.finalize(end.value().total_chunks, end.value().file_size, end.value().digest);
    if (!finalized) {
        auto nak = reject(f, finalized.error().code);
        complete_active(false, finalized.error());
        return nak;
    }

    auto acked = accept(f);

    if (end.value().total_chunks == 0 && on_progress_) {
        on_progress_(make_progress_report(active_->outcome.filename, transfer_direction::receive,
                                          accountant_.snapshot()));
    }

    active_->outcome.bytes_confirmed = end.value().file_size;
    complete_active(true, std::nullopt);
    return acked;
}

void file_receiver::check_stall(std::chrono::steady_clock::time_point now) {
    if (!active_) {
        return;
    }
    auto idle = now - active_->last_activity;
    if (idle < config_.effective_receive_stall_timeout()) {
        return;
    }
    abandon_active(error{
        error_code::receive_stalled,
        "no frames for " +
            std::to_string(
                std::chrono::duration_cast<std::chrono::milliseconds>(idle).count()) +
            " ms after " + std::to_string(active_->outcome.bytes_confirmed) + " bytes"});
}

void file_receiver::shutdown() {
    if (active_) {
        abandon_active(error{error_code::transfer_cancelled, "session stopped"});
    }
}

void file_receiver::abandon_active(const error& reason) {
    assembler_.abandon();
    complete_active(false, reason);
}

void file_receiver::complete_active(bool success, std::optional<error> failure) {
    if (!active_) {
        return;
    }

    auto outcome = std::move(active_->outcome);
    outcome.success = success;
    outcome.failure = std::move(failure);
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - active_->started);
    active_.reset();
    receiving_.store(false);

    transfer_log_context ctx;
    ctx.filename = outcome.filename;
    ctx.direction = "receive";
    ctx.bytes_confirmed = outcome.bytes_confirmed;
    ctx.file_size = outcome.total_bytes;
    ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed.count());
    if (success) {
        ctx.rate_bps = accountant_.snapshot().average_rate;
        ST_LOG_INFO_CTX(log_category::receiver, "File received and verified", ctx);
    } else {
        ctx.error_message = outcome.failure ? outcome.failure->message : std::string{};
        ST_LOG_WARN_CTX(log_category::receiver, "File abandoned", ctx);
    }

    if (on_file_complete_) {
        on_file_complete_(outcome);
    }
}

void file_receiver::set_progress_callback(progress_callback callback) {
    on_progress_ = std::move(callback);
}

void file_receiver::set_file_complete_callback(file_complete_callback callback) {
    on_file_complete_ = std::move(callback);
}

auto file_receiver::is_receiving() const -> bool {
    return receiving_.load();
}

auto file_receiver::last_accepted_sequence() const -> std::optional<uint16_t> {
    if (!synced_) {
        return std::nullopt;
    }
    return last_sequence_;
}

}  // namespace kcenon::serial_transfer
