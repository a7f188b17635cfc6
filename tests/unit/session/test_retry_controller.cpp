/**
 * @file test_retry_controller.cpp
 * @brief Unit tests for stop-and-wait confirmation
 */

#include <gtest/gtest.h>

#include <kcenon/serial_transfer/protocol/frame_decoder.h>
#include <kcenon/serial_transfer/protocol/payload_codec.h>
#include <kcenon/serial_transfer/session/retry_controller.h>
#include <kcenon/serial_transfer/transport/memory_channel.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace kcenon::serial_transfer::test {

using namespace std::chrono_literals;

class RetryControllerTest : public ::testing::Test {
protected:
    // Decides the answer to the n-th copy (0-based) of a received frame
    using responder = std::function<std::optional<frame>(const frame&, std::size_t copy)>;

    void SetUp() override {
        auto pair = memory_channel::create_pair();
        local_ = std::move(pair.first);
        remote_ = std::move(pair.second);
        link_ = std::make_unique<frame_link>(*local_);
    }

    void TearDown() override {
        stop_peer();
        local_->close();
    }

    void make_retry(std::chrono::milliseconds timeout, uint32_t retries) {
        retry_ = std::make_unique<retry_controller>(
            *link_, retry_controller::config{timeout, retries});
    }

    void start_peer(responder respond) {
        peer_ = std::thread([this, respond = std::move(respond)] {
            frame_decoder decoder;
            std::vector<std::byte> buffer(1024);
            while (!stop_.load()) {
                auto n = remote_->read(buffer, 10ms);
                if (!n) return;
                decoder.feed(std::span<const std::byte>(buffer.data(), n.value()));

                for (auto next = decoder.next(); next; next = decoder.next()) {
                    std::size_t copy;
                    {
                        std::lock_guard lock(mutex_);
                        received_.push_back(next.value());
                        copy = 0;
                        for (const auto& f : received_) {
                            if (f.sequence == next.value().sequence) ++copy;
                        }
                    }
                    if (auto answer = respond(next.value(), copy - 1)) {
                        retry_->on_acknowledgement(*answer);
                    }
                }
            }
        });
    }

    void stop_peer() {
        stop_.store(true);
        if (peer_.joinable()) peer_.join();
    }

    auto received() -> std::vector<frame> {
        std::lock_guard lock(mutex_);
        return received_;
    }

    static auto ack(const frame& f) -> frame {
        return frame(frame_type::ack, f.sequence, payload_codec::encode_ack({f.type}));
    }

    static auto nak(uint16_t seq, error_code reason) -> frame {
        return frame(frame_type::nak, seq, payload_codec::encode_nak({reason}));
    }

    static auto data_frame(uint16_t seq) -> frame {
        return frame(frame_type::data, seq,
                     payload_codec::encode_data(seq, std::vector<std::byte>(16, std::byte{7})));
    }

    std::unique_ptr<memory_channel> local_;
    std::unique_ptr<memory_channel> remote_;
    std::unique_ptr<frame_link> link_;
    std::unique_ptr<retry_controller> retry_;

    std::thread peer_;
    std::atomic<bool> stop_{false};
    std::mutex mutex_;
    std::vector<frame> received_;
};

TEST_F(RetryControllerTest, ConfirmedByMatchingAck) {
    make_retry(2000ms, 3);
    start_peer([](const frame& f, std::size_t) { return std::optional<frame>(ack(f)); });

    auto sent = retry_->send_and_confirm(data_frame(5));
    ASSERT_TRUE(sent.has_value()) << sent.error().message;

    auto stats = retry_->get_statistics();
    EXPECT_EQ(stats.frames_confirmed, 1u);
    EXPECT_EQ(stats.retransmissions, 0u);
    EXPECT_EQ(received().size(), 1u);
}

TEST_F(RetryControllerTest, RetransmitsAfterLostFrame) {
    make_retry(50ms, 3);
    start_peer([](const frame& f, std::size_t copy) {
        return copy == 0 ? std::nullopt : std::optional<frame>(ack(f));
    });

    auto sent = retry_->send_and_confirm(data_frame(1));
    ASSERT_TRUE(sent.has_value());

    auto stats = retry_->get_statistics();
    EXPECT_EQ(stats.retransmissions, 1u);
    EXPECT_EQ(stats.timeouts, 1u);
    EXPECT_EQ(received().size(), 2u);
}

TEST_F(RetryControllerTest, ExhaustsRetries) {
    make_retry(30ms, 2);
    start_peer([](const frame&, std::size_t) { return std::optional<frame>(); });

    auto sent = retry_->send_and_confirm(data_frame(9));
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::retries_exhausted);

    stop_peer();
    EXPECT_EQ(received().size(), 3u);
    EXPECT_EQ(retry_->get_statistics().timeouts, 3u);
    EXPECT_EQ(retry_->get_statistics().retransmissions, 2u);
}

TEST_F(RetryControllerTest, PerCallRetryBudget) {
    make_retry(30ms, 5);
    start_peer([](const frame&, std::size_t) { return std::optional<frame>(); });

    auto sent = retry_->send_and_confirm(data_frame(0), 0);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::retries_exhausted);

    stop_peer();
    EXPECT_EQ(received().size(), 1u);
}

TEST_F(RetryControllerTest, CorruptNakTriggersImmediateRetransmit) {
    make_retry(5000ms, 3);
    start_peer([](const frame& f, std::size_t copy) {
        if (copy == 0) {
            return std::optional<frame>(nak(f.sequence - 1, error_code::frame_corrupt));
        }
        return std::optional<frame>(ack(f));
    });

    auto start = std::chrono::steady_clock::now();
    auto sent = retry_->send_and_confirm(data_frame(20));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(sent.has_value());
    EXPECT_LT(elapsed, 2000ms);
    EXPECT_EQ(retry_->get_statistics().retransmissions, 1u);
    EXPECT_EQ(retry_->get_statistics().naks_received, 1u);
    EXPECT_EQ(retry_->get_statistics().timeouts, 0u);
}

TEST_F(RetryControllerTest, CorruptNakBeforeFirstSequenceWraps) {
    make_retry(5000ms, 3);
    start_peer([](const frame& f, std::size_t copy) {
        if (copy == 0) {
            return std::optional<frame>(nak(0xFFFF, error_code::frame_corrupt));
        }
        return std::optional<frame>(ack(f));
    });

    auto start = std::chrono::steady_clock::now();
    auto sent = retry_->send_and_confirm(frame(frame_type::hello, 0,
                                               payload_codec::encode_hello({})));

    ASSERT_TRUE(sent.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);
}

TEST_F(RetryControllerTest, UnrelatedNakIsIgnored) {
    make_retry(100ms, 3);
    start_peer([](const frame& f, std::size_t copy) {
        if (copy == 0) {
            // Names a sequence that says nothing about the pending frame
            return std::optional<frame>(nak(f.sequence + 5, error_code::frame_corrupt));
        }
        return std::optional<frame>(ack(f));
    });

    auto start = std::chrono::steady_clock::now();
    auto sent = retry_->send_and_confirm(data_frame(3));

    ASSERT_TRUE(sent.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
    EXPECT_EQ(retry_->get_statistics().timeouts, 1u);
}

TEST_F(RetryControllerTest, RejectionNakFailsWithoutRetransmit) {
    make_retry(5000ms, 3);
    start_peer([](const frame& f, std::size_t) {
        return std::optional<frame>(nak(f.sequence, error_code::chunk_sequence_error));
    });

    auto sent = retry_->send_and_confirm(data_frame(4));
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::transfer_rejected);
    EXPECT_NE(sent.error().message.find("chunk sequence error"), std::string::npos);

    stop_peer();
    EXPECT_EQ(received().size(), 1u);
}

TEST_F(RetryControllerTest, StaleAckIsIgnored) {
    make_retry(100ms, 3);
    start_peer([](const frame& f, std::size_t copy) {
        if (copy == 0) {
            // Right sequence, wrong type
            return std::optional<frame>(
                frame(frame_type::ack, f.sequence,
                      payload_codec::encode_ack({frame_type::file_meta})));
        }
        return std::optional<frame>(ack(f));
    });

    auto sent = retry_->send_and_confirm(data_frame(6));
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(retry_->get_statistics().retransmissions, 1u);
}

TEST_F(RetryControllerTest, CancelStopsRetransmission) {
    make_retry(100ms, 10);
    start_peer([](const frame&, std::size_t) { return std::optional<frame>(); });

    std::thread canceller([this] {
        std::this_thread::sleep_for(30ms);
        retry_->cancel();
    });

    auto sent = retry_->send_and_confirm(data_frame(1));
    canceller.join();

    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::transfer_cancelled);
    EXPECT_TRUE(retry_->is_cancelled());

    stop_peer();
    EXPECT_EQ(received().size(), 1u);
}

TEST_F(RetryControllerTest, NothingIsWrittenAfterCancel) {
    make_retry(100ms, 3);
    start_peer([](const frame& f, std::size_t) { return std::optional<frame>(ack(f)); });

    ASSERT_TRUE(retry_->send_and_confirm(data_frame(1)).has_value());
    retry_->cancel();

    auto sent = retry_->send_and_confirm(data_frame(2));
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::transfer_cancelled);

    std::this_thread::sleep_for(50ms);
    stop_peer();
    auto frames = received();
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].sequence, 1);
    EXPECT_EQ(local_->get_statistics().write_calls, 1u);
}

TEST_F(RetryControllerTest, FailWakesWaiterImmediately) {
    make_retry(10000ms, 3);

    std::thread failer([this] {
        std::this_thread::sleep_for(30ms);
        retry_->fail(error{error_code::channel_read_error, "device unplugged"});
    });

    auto start = std::chrono::steady_clock::now();
    auto sent = retry_->send_and_confirm(data_frame(1));
    failer.join();

    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::channel_read_error);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5000ms);

    auto later = retry_->send_and_confirm(data_frame(2));
    ASSERT_FALSE(later.has_value());
    EXPECT_EQ(later.error().code, error_code::channel_read_error);
}

TEST_F(RetryControllerTest, WriteFailureIsReported) {
    make_retry(1000ms, 3);
    local_->close();

    auto sent = retry_->send_and_confirm(data_frame(1));
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::channel_closed);
}

TEST_F(RetryControllerTest, OversizeFrameIsNotSent) {
    make_retry(1000ms, 3);

    frame huge(frame_type::data, 1, std::vector<std::byte>(default_max_payload_size + 1));
    auto sent = retry_->send_and_confirm(huge);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::frame_too_large);
    EXPECT_EQ(link_->frames_sent(), 0u);
}

}  // namespace kcenon::serial_transfer::test
