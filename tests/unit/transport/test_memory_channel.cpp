/**
 * @file test_memory_channel.cpp
 * @brief Unit tests for the in-memory channel pair
 */

#include <gtest/gtest.h>

#include <kcenon/serial_transfer/transport/memory_channel.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

namespace kcenon::serial_transfer::test {

using namespace std::chrono_literals;

class MemoryChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto pair = memory_channel::create_pair();
        a_ = std::move(pair.first);
        b_ = std::move(pair.second);
    }

    static auto bytes(std::size_t size, uint8_t first = 0) -> std::vector<std::byte> {
        std::vector<std::byte> out(size);
        for (std::size_t i = 0; i < size; ++i) {
            out[i] = static_cast<std::byte>(first + i);
        }
        return out;
    }

    std::unique_ptr<memory_channel> a_;
    std::unique_ptr<memory_channel> b_;
};

TEST_F(MemoryChannelTest, Type) {
    EXPECT_EQ(a_->type(), "memory");
    EXPECT_TRUE(a_->is_open());
}

TEST_F(MemoryChannelTest, WriteIsReadableOnPeerOnly) {
    auto data = bytes(10);
    auto written = a_->write(data);
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written.value(), 10u);

    std::vector<std::byte> buffer(64);
    auto own = a_->read(buffer, 10ms);
    ASSERT_TRUE(own.has_value());
    EXPECT_EQ(own.value(), 0u);

    auto peer = b_->read(buffer, 100ms);
    ASSERT_TRUE(peer.has_value());
    ASSERT_EQ(peer.value(), 10u);
    EXPECT_TRUE(std::equal(data.begin(), data.end(), buffer.begin()));
}

TEST_F(MemoryChannelTest, ReadTimesOutWithZero) {
    std::vector<std::byte> buffer(8);
    auto start = std::chrono::steady_clock::now();

    auto read = b_->read(buffer, 30ms);

    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read.value(), 0u);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST_F(MemoryChannelTest, PartialReadsPreserveOrder) {
    ASSERT_TRUE(a_->write(bytes(10, 0)).has_value());
    ASSERT_TRUE(a_->write(bytes(10, 10)).has_value());

    std::vector<std::byte> received;
    std::vector<std::byte> buffer(7);
    while (received.size() < 20) {
        auto n = b_->read(buffer, 100ms);
        ASSERT_TRUE(n.has_value());
        ASSERT_GT(n.value(), 0u);
        received.insert(received.end(), buffer.begin(), buffer.begin() + n.value());
    }

    EXPECT_EQ(received, bytes(20, 0));
}

TEST_F(MemoryChannelTest, BlockedReadWakesOnWrite) {
    std::vector<std::byte> buffer(8);
    std::size_t got = 0;

    std::thread reader([&] {
        auto n = b_->read(buffer, 2000ms);
        if (n) got = n.value();
    });

    std::this_thread::sleep_for(20ms);
    ASSERT_TRUE(a_->write(bytes(3)).has_value());
    reader.join();

    EXPECT_EQ(got, 3u);
}

TEST_F(MemoryChannelTest, CloseWakesReaderAndClosesBothEnds) {
    std::vector<std::byte> buffer(8);
    std::optional<error_code> seen;

    std::thread reader([&] {
        auto n = b_->read(buffer, 5000ms);
        if (!n) seen = n.error().code;
    });

    std::this_thread::sleep_for(20ms);
    a_->close();
    reader.join();

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(*seen, error_code::channel_closed);
    EXPECT_FALSE(a_->is_open());
    EXPECT_FALSE(b_->is_open());

    auto write = b_->write(bytes(1));
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error().code, error_code::channel_closed);
}

TEST_F(MemoryChannelTest, DeliveredBytesReadableAfterClose) {
    ASSERT_TRUE(a_->write(bytes(4)).has_value());
    a_->close();

    std::vector<std::byte> buffer(8);
    auto first = b_->read(buffer, 10ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 4u);

    auto second = b_->read(buffer, 10ms);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::channel_closed);
}

TEST_F(MemoryChannelTest, WriteFilterDropsAndCorrupts) {
    int calls = 0;
    a_->set_write_filter([&](std::span<const std::byte>) {
        ++calls;
        if (calls == 1) return write_action::drop;
        if (calls == 2) return write_action::corrupt;
        return write_action::deliver;
    });

    auto original = bytes(6, 0x10);
    ASSERT_TRUE(a_->write(original).has_value());
    ASSERT_TRUE(a_->write(original).has_value());
    ASSERT_TRUE(a_->write(original).has_value());

    std::vector<std::byte> buffer(64);
    auto n = b_->read(buffer, 100ms);
    ASSERT_TRUE(n.has_value());
    ASSERT_EQ(n.value(), 12u);

    // Second write arrives with its middle byte inverted, third intact
    auto damaged = original;
    damaged[3] = ~damaged[3];
    EXPECT_TRUE(std::equal(damaged.begin(), damaged.end(), buffer.begin()));
    EXPECT_TRUE(std::equal(original.begin(), original.end(), buffer.begin() + 6));

    // Dropped writes still count as written
    EXPECT_EQ(a_->get_statistics().bytes_written, 18u);
    EXPECT_EQ(a_->get_statistics().write_calls, 3u);
    EXPECT_EQ(b_->get_statistics().bytes_read, 12u);
}

TEST_F(MemoryChannelTest, InjectBypassesFilter) {
    a_->set_write_filter([](std::span<const std::byte>) { return write_action::drop; });

    auto data = bytes(5);
    a_->inject(data);

    std::vector<std::byte> buffer(8);
    auto n = b_->read(buffer, 100ms);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n.value(), 5u);
}

}  // namespace kcenon::serial_transfer::test
