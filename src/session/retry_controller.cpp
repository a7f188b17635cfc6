/**
 * @file retry_controller.cpp
 * @brief Implementation of the retry controller
 */

#include <kcenon/serial_transfer/session/retry_controller.h>

#include <kcenon/serial_transfer/core/error_codes.h>
#include <kcenon/serial_transfer/core/logging.h>
#include <kcenon/serial_transfer/protocol/payload_codec.h>

namespace kcenon::serial_transfer {

retry_controller::retry_controller(frame_link& link, config cfg)
    : link_(link), config_(cfg) {}

auto retry_controller::send_and_confirm(const frame& f) -> result<void> {
    return send_and_confirm(f, config_.max_retries);
}

auto retry_controller::send_and_confirm(const frame& f, uint32_t max_retries) -> result<void> {
    auto encoded = link_.codec().encode(f);
    if (!encoded) {
        return unexpected(encoded.error());
    }

    const std::string label =
        std::string(to_string(f.type)) + " seq " + std::to_string(f.sequence);

    for (uint32_t attempt = 0; attempt <= max_retries; ++attempt) {
        {
            std::lock_guard lock(mutex_);
            if (link_failure_) {
                awaiting_ = false;
                return unexpected(*link_failure_);
            }
            if (cancelled_) {
                awaiting_ = false;
                return unexpected(error{error_code::transfer_cancelled,
                                        label + (attempt > 0 ? " not retransmitted"
                                                             : " not sent") +
                                            ": session stopping"});
            }
            if (attempt > 0) {
                ++stats_.retransmissions;
            }
            awaiting_ = true;
            awaiting_sequence_ = f.sequence;
            awaiting_type_ = f.type;
            outcome_ = outcome::pending;
        }

        if (attempt > 0) {
            transfer_log_context ctx;
            ctx.sequence = f.sequence;
            ctx.attempt = attempt;
            ST_LOG_DEBUG_CTX(log_category::retry, "Retransmitting " + label, ctx);
        }

        if (auto sent = link_.send_encoded(encoded.value()); !sent) {
            std::lock_guard lock(mutex_);
            awaiting_ = false;
            return sent;
        }

        std::unique_lock lock(mutex_);
        bool answered = cv_.wait_for(lock, config_.ack_timeout, [this] {
            return outcome_ != outcome::pending || link_failure_.has_value();
        });

        if (link_failure_) {
            awaiting_ = false;
            return unexpected(*link_failure_);
        }

        if (!answered) {
            ++stats_.timeouts;
            continue;
        }

        switch (outcome_) {
            case outcome::confirmed:
                awaiting_ = false;
                ++stats_.frames_confirmed;
                return {};
            case outcome::rejected:
                awaiting_ = false;
                return unexpected(error{error_code::transfer_rejected,
                                        label + " rejected by peer: " +
                                            to_string(reject_reason_)});
            case outcome::retransmit:
            case outcome::pending:
                break;
        }
    }

    std::lock_guard lock(mutex_);
    awaiting_ = false;
    if (cancelled_) {
        return unexpected(error{error_code::transfer_cancelled,
                                label + " unconfirmed: session stopping"});
    }
    ST_LOG_WARN(log_category::retry,
                label + " unconfirmed after " + std::to_string(max_retries + 1) + " attempts");
    return unexpected(error{error_code::retries_exhausted,
                            label + " unconfirmed after " + std::to_string(max_retries + 1) +
                                " attempts"});
}

void retry_controller::on_acknowledgement(const frame& f) {
    std::lock_guard lock(mutex_);

    if (f.type == frame_type::nak) {
        ++stats_.naks_received;
    }

    if (!awaiting_ || outcome_ != outcome::pending) {
        return;
    }

    if (f.type == frame_type::ack) {
        auto ack = payload_codec::decode_ack(f.payload);
        if (!ack) {
            ST_LOG_DEBUG(log_category::retry, "Ignoring malformed ACK");
            return;
        }
        if (f.sequence != awaiting_sequence_ || ack.value().acked_type != awaiting_type_) {
            return;  // stale
        }
        outcome_ = outcome::confirmed;
        cv_.notify_all();
        return;
    }

    if (f.type != frame_type::nak) {
        return;
    }

    auto nak = payload_codec::decode_nak(f.payload);
    if (!nak) {
        ST_LOG_DEBUG(log_category::retry, "Ignoring malformed NAK");
        return;
    }
    auto reason = nak.value().reason;

    if (is_retryable(reason)) {
        // The peer names its last accepted sequence; anything but the one
        // right before ours says nothing about the pending frame.
        if (f.sequence == static_cast<uint16_t>(awaiting_sequence_ - 1)) {
            outcome_ = outcome::retransmit;
            cv_.notify_all();
        }
        return;
    }

    if (f.sequence == awaiting_sequence_) {
        reject_reason_ = reason;
        outcome_ = outcome::rejected;
        cv_.notify_all();
    }
}

void retry_controller::cancel() {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
}

void retry_controller::fail(const error& err) {
    std::lock_guard lock(mutex_);
    if (!link_failure_) {
        link_failure_ = err;
    }
    cv_.notify_all();
}

auto retry_controller::is_cancelled() const -> bool {
    std::lock_guard lock(mutex_);
    return cancelled_;
}

auto retry_controller::get_statistics() const -> statistics {
    std::lock_guard lock(mutex_);
    return stats_;
}

}  // namespace kcenon::serial_transfer
