/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_SERIAL_TRANSFER_TEST_FIXTURES_H
#define KCENON_SERIAL_TRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/serial_transfer/serial_transfer.h>
#include <kcenon/serial_transfer/protocol/frame_codec.h>
#include <kcenon/serial_transfer/protocol/payload_codec.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::serial_transfer::test {

using namespace std::chrono_literals;

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("serial_trans_test_" + std::to_string(std::random_device{}()));
        source_dir_ = test_dir_ / "source";
        output_dir_ = test_dir_ / "received";
        std::filesystem::create_directories(source_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size, unsigned seed = 42)
        -> std::filesystem::path {
        auto path = source_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(seed);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    static auto files_equal(const std::filesystem::path& a, const std::filesystem::path& b)
        -> bool {
        if (!std::filesystem::exists(a) || !std::filesystem::exists(b)) {
            return false;
        }
        if (std::filesystem::file_size(a) != std::filesystem::file_size(b)) {
            return false;
        }

        std::ifstream fa(a, std::ios::binary);
        std::ifstream fb(b, std::ios::binary);
        return std::equal(std::istreambuf_iterator<char>(fa), std::istreambuf_iterator<char>(),
                          std::istreambuf_iterator<char>(fb));
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_dir_;
    std::filesystem::path output_dir_;
};

/**
 * @brief Collects session callbacks fired on the session's threads
 */
class session_recorder {
public:
    void attach(transfer_session& session) {
        session.on_progress([this](const progress_report& report) {
            std::lock_guard lock(mutex_);
            progress_.push_back(report);
        });
        session.on_file_complete([this](const file_transfer_result& outcome) {
            std::lock_guard lock(mutex_);
            completed_.push_back(outcome);
        });
        session.on_state_changed([this](session_state state) {
            std::lock_guard lock(mutex_);
            states_.push_back(state);
        });
    }

    auto completed() const -> std::vector<file_transfer_result> {
        std::lock_guard lock(mutex_);
        return completed_;
    }

    auto completed_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return completed_.size();
    }

    auto progress() const -> std::vector<progress_report> {
        std::lock_guard lock(mutex_);
        return progress_;
    }

    auto states() const -> std::vector<session_state> {
        std::lock_guard lock(mutex_);
        return states_;
    }

    auto saw_state(session_state state) const -> bool {
        std::lock_guard lock(mutex_);
        return std::find(states_.begin(), states_.end(), state) != states_.end();
    }

private:
    mutable std::mutex mutex_;
    std::vector<progress_report> progress_;
    std::vector<file_transfer_result> completed_;
    std::vector<session_state> states_;
};

/**
 * @brief Two endpoints joined by an in-memory link
 *
 * Filters installed on sender_channel_ act on frames travelling towards the
 * receiver; filters on receiver_channel_ act on the acknowledgements.
 */
class SessionPairFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        auto pair = memory_channel::create_pair();
        sender_channel_ = std::move(pair.first);
        receiver_channel_ = std::move(pair.second);
    }

    void TearDown() override {
        sessions_.clear();
        sender_channel_->close();
        TempDirectoryFixture::TearDown();
    }

    // Short timeouts keep the failure paths fast
    auto make_builder(session_mode mode) -> transfer_session::builder {
        auto b = transfer_session::builder();
        b.with_mode(mode)
            .with_chunk_size(chunk_size_)
            .with_baud_rate(4000000)
            .with_ack_timeout(ack_timeout_)
            .with_max_retries(3)
            .with_handshake_retries(3)
            .with_poll_interval(5ms)
            .with_output_directory(output_dir_);
        return b;
    }

    auto make_session(session_mode mode) -> transfer_session& {
        auto built = make_builder(mode).build();
        EXPECT_TRUE(built.has_value());
        sessions_.push_back(std::make_unique<transfer_session>(std::move(built.value())));
        return *sessions_.back();
    }

    static auto wait_until(const std::function<bool()>& condition,
                           std::chrono::milliseconds timeout = 15000ms) -> bool {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!condition()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    // Every write() on a session's channel carries exactly one frame
    static auto frame_of(std::span<const std::byte> bytes) -> std::optional<frame> {
        frame_codec codec;
        auto decoded = codec.decode(bytes);
        if (!decoded) {
            return std::nullopt;
        }
        return decoded.value().value;
    }

    uint32_t chunk_size_ = 64;
    std::chrono::milliseconds ack_timeout_{100};

    std::unique_ptr<memory_channel> sender_channel_;
    std::unique_ptr<memory_channel> receiver_channel_;
    std::vector<std::unique_ptr<transfer_session>> sessions_;
};

}  // namespace kcenon::serial_transfer::test

#endif  // KCENON_SERIAL_TRANSFER_TEST_FIXTURES_H
