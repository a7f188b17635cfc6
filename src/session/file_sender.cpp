/**
 * @file file_sender.cpp
 * @brief Implementation of the sending side
 */

#include <kcenon/serial_transfer/session/file_sender.h>

#include <kcenon/serial_transfer/core/logging.h>
#include <kcenon/serial_transfer/core/progress_accountant.h>
#include <kcenon/serial_transfer/protocol/payload_codec.h>

#include <chrono>

namespace kcenon::serial_transfer {

namespace {

auto elapsed_since(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

}  // namespace

file_sender::file_sender(retry_controller& retry, const session_config& config)
    : retry_(retry), config_(config), splitter_(chunk_config{config.chunk_size}) {}

auto file_sender::make_frame(frame_type type, std::vector<std::byte> payload) -> frame {
    frame f{type, next_sequence_, std::move(payload)};
    next_sequence_ = next_sequence(next_sequence_);
    return f;
}

auto file_sender::handshake() -> result<void> {
    hello_payload hello;
    hello.version = current_protocol_version;
    hello.chunk_size = config_.chunk_size;
    hello.role = config_.mode;

    ST_LOG_INFO(log_category::sender,
                "Sending HELLO (protocol " + current_protocol_version.to_string() +
                    ", chunk size " + std::to_string(config_.chunk_size) + ")");

    auto confirmed = retry_.send_and_confirm(
        make_frame(frame_type::hello, payload_codec::encode_hello(hello)),
        config_.handshake_retries);

    if (!confirmed) {
        const auto& err = confirmed.error();
        if (err.code == error_code::retries_exhausted ||
            err.code == error_code::transfer_rejected) {
            ST_LOG_ERROR(log_category::sender, "Handshake failed: " + err.message);
            return unexpected(error{error_code::handshake_failed, err.message});
        }
        return confirmed;
    }

    handshake_complete_.store(true);
    ST_LOG_INFO(log_category::sender, "Handshake complete");
    return {};
}

auto file_sender::send_file(const std::filesystem::path& path) -> file_transfer_result {
    auto start = std::chrono::steady_clock::now();

    file_transfer_result outcome;
    outcome.filename = path.filename().string();
    outcome.path = path;
    outcome.direction = transfer_direction::send;

    auto fail = [&](const error& err) -> file_transfer_result {
        outcome.success = false;
        outcome.failure = err;
        outcome.elapsed = elapsed_since(start);

        transfer_log_context ctx;
        ctx.filename = outcome.filename;
        ctx.direction = "send";
        ctx.bytes_confirmed = outcome.bytes_confirmed;
        ctx.error_message = err.message;
        ST_LOG_ERROR_CTX(log_category::sender, "File transfer failed", ctx);
        return outcome;
    };

    auto meta = splitter_.calculate_metadata(path);
    if (!meta) {
        return fail(meta.error());
    }
    outcome.total_bytes = meta.value().file_size;

    auto chunks = splitter_.split(path);
    if (!chunks) {
        return fail(chunks.error());
    }
    auto& iter = chunks.value();

    {
        transfer_log_context ctx;
        ctx.filename = meta.value().filename;
        ctx.direction = "send";
        ctx.file_size = meta.value().file_size;
        ctx.total_chunks = meta.value().total_chunks;
        ST_LOG_INFO_CTX(log_category::sender, "Sending file", ctx);
    }

    if (auto sent = retry_.send_and_confirm(
            make_frame(frame_type::file_meta, payload_codec::encode_file_meta(meta.value())));
        !sent) {
        return fail(sent.error());
    }

    progress_accountant accountant(progress_accountant::config{config_.rate_window_size});
    accountant.start(meta.value().file_size);
    hasher_.reset();

    while (iter.has_next()) {
        if (retry_.is_cancelled()) {
            return fail(error{error_code::transfer_cancelled,
                              "stopped after " + std::to_string(outcome.bytes_confirmed) +
                                  " bytes"});
        }
        auto next = iter.next();
        if (!next) {
            return fail(next.error());
        }
        const auto& piece = next.value();
        hasher_.update(piece.data);

        if (auto sent = retry_.send_and_confirm(
                make_frame(frame_type::data, payload_codec::encode_data(piece.index, piece.data)));
            !sent) {
            return fail(sent.error());
        }

        auto sample = accountant.record_confirmed(piece.data.size());
        outcome.bytes_confirmed = sample.bytes_confirmed;

        ST_LOG_TRACE(log_category::sender,
                     "Chunk " + std::to_string(piece.index + 1) + "/" +
                         std::to_string(iter.total_chunks()) + " confirmed");

        if (on_progress_) {
            on_progress_(make_progress_report(outcome.filename, transfer_direction::send, sample));
        }
    }

    file_end_payload end;
    end.total_chunks = meta.value().total_chunks;
    end.file_size = meta.value().file_size;
    end.digest = hasher_.finalize();

    if (auto sent = retry_.send_and_confirm(
            make_frame(frame_type::file_end, payload_codec::encode_file_end(end)));
        !sent) {
        return fail(sent.error());
    }

    if (meta.value().total_chunks == 0 && on_progress_) {
        on_progress_(make_progress_report(outcome.filename, transfer_direction::send,
                                          accountant.snapshot()));
    }

    outcome.success = true;
    outcome.bytes_confirmed = meta.value().file_size;
    outcome.elapsed = elapsed_since(start);

    transfer_log_context ctx;
    ctx.filename = outcome.filename;
    ctx.direction = "send";
    ctx.file_size = meta.value().file_size;
    ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed.count());
    ctx.rate_bps = accountant.snapshot().average_rate;
    ST_LOG_INFO_CTX(log_category::sender,
                    "File confirmed, sha256 " + checksum::to_hex(end.digest), ctx);
    return outcome;
}

auto file_sender::end_session() -> result<void> {
    ST_LOG_INFO(log_category::sender, "Sending SESSION_END");
    return retry_.send_and_confirm(make_frame(frame_type::session_end, {}));
}

void file_sender::set_progress_callback(progress_callback callback) {
    on_progress_ = std::move(callback);
}

auto file_sender::is_handshake_complete() const -> bool {
    return handshake_complete_.load();
}

}  // namespace kcenon::serial_transfer
