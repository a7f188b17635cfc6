/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, result, session modes)
 */

#include <gtest/gtest.h>

#include <kcenon/serial_transfer/core/error_codes.h>
#include <kcenon/serial_transfer/core/types.h>

#include <memory>
#include <string>

namespace kcenon::serial_transfer::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Frame errors: -100 to -119
    EXPECT_EQ(to_int(error_code::frame_incomplete), -100);
    EXPECT_EQ(to_int(error_code::invalid_payload), -104);

    // Transfer errors: -120 to -139
    EXPECT_EQ(to_int(error_code::ack_timeout), -120);
    EXPECT_EQ(to_int(error_code::receive_stalled), -129);

    // Channel errors: -140 to -159
    EXPECT_EQ(to_int(error_code::channel_open_failed), -140);
    EXPECT_EQ(to_int(error_code::channel_closed), -144);

    // File system errors: -160 to -179
    EXPECT_EQ(to_int(error_code::file_not_found), -160);
    EXPECT_EQ(to_int(error_code::file_write_error), -164);

    // Configuration errors: -180 to -199
    EXPECT_EQ(to_int(error_code::invalid_chunk_size), -180);
    EXPECT_EQ(to_int(error_code::invalid_baud_rate), -182);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::frame_corrupt), "frame corrupt");
    EXPECT_STREQ(to_string(error_code::ack_timeout), "acknowledgement timeout");
    EXPECT_STREQ(to_string(error_code::retries_exhausted), "retries exhausted");
    EXPECT_STREQ(to_string(error_code::channel_closed), "channel closed");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST_F(ErrorCodeTest, Classification) {
    EXPECT_TRUE(is_frame_error(error_code::frame_corrupt));
    EXPECT_FALSE(is_frame_error(error_code::ack_timeout));

    EXPECT_TRUE(is_transfer_error(to_int(error_code::chunk_sequence_error)));
    EXPECT_FALSE(is_transfer_error(to_int(error_code::channel_closed)));

    EXPECT_TRUE(is_channel_error(error_code::channel_read_error));
    EXPECT_TRUE(is_channel_error(error_code::channel_closed));
    EXPECT_FALSE(is_channel_error(error_code::file_write_error));

    EXPECT_TRUE(is_file_system_error(error_code::file_not_found));
    EXPECT_FALSE(is_file_system_error(error_code::invalid_chunk_size));

    EXPECT_TRUE(is_config_error(to_int(error_code::invalid_baud_rate)));
    EXPECT_FALSE(is_config_error(-99));
}

TEST_F(ErrorCodeTest, RetryableCodes) {
    EXPECT_TRUE(is_retryable(error_code::frame_incomplete));
    EXPECT_TRUE(is_retryable(error_code::frame_corrupt));
    EXPECT_TRUE(is_retryable(error_code::frame_too_large));
    EXPECT_TRUE(is_retryable(error_code::invalid_frame_type));
    EXPECT_TRUE(is_retryable(error_code::ack_timeout));

    EXPECT_FALSE(is_retryable(error_code::invalid_payload));
    EXPECT_FALSE(is_retryable(error_code::chunk_sequence_error));
    EXPECT_FALSE(is_retryable(error_code::no_active_file));
    EXPECT_FALSE(is_retryable(error_code::file_write_error));
    EXPECT_FALSE(is_retryable(error_code::channel_closed));
    EXPECT_FALSE(is_retryable(error_code::success));
}

TEST_F(ErrorCodeTest, SessionFatalCodes) {
    EXPECT_TRUE(is_session_fatal(error_code::channel_closed));
    EXPECT_TRUE(is_session_fatal(error_code::channel_write_error));
    EXPECT_TRUE(is_session_fatal(error_code::transfer_cancelled));

    EXPECT_FALSE(is_session_fatal(error_code::retries_exhausted));
    EXPECT_FALSE(is_session_fatal(error_code::file_hash_mismatch));
    EXPECT_FALSE(is_session_fatal(error_code::file_not_found));
}

// =============================================================================
// error / result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ErrorDefaultMessage) {
    error err{error_code::receive_stalled};
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "receive stalled");

    error none;
    EXPECT_FALSE(static_cast<bool>(none));
}

TEST_F(ResultTest, ValueAndError) {
    result<int> ok = 42;
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 42);

    result<int> failed = unexpected(error{error_code::file_not_found, "missing.bin"});
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::file_not_found);
    EXPECT_EQ(failed.error().message, "missing.bin");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::channel_closed});
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().code, error_code::channel_closed);
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r = std::make_unique<int>(5);
    ASSERT_TRUE(r.has_value());
    auto owned = std::move(r).value();
    EXPECT_EQ(*owned, 5);
}

// =============================================================================
// Session Mode Tests
// =============================================================================

class SessionModeTest : public ::testing::Test {};

TEST_F(SessionModeTest, ToString) {
    EXPECT_STREQ(to_string(session_mode::send), "send");
    EXPECT_STREQ(to_string(session_mode::recv), "recv");
    EXPECT_STREQ(to_string(session_mode::both), "both");
    EXPECT_STREQ(to_string(transfer_direction::send), "send");
    EXPECT_STREQ(to_string(transfer_direction::receive), "receive");
}

TEST_F(SessionModeTest, SubProtocols) {
    EXPECT_TRUE(sends_files(session_mode::send));
    EXPECT_FALSE(receives_files(session_mode::send));

    EXPECT_FALSE(sends_files(session_mode::recv));
    EXPECT_TRUE(receives_files(session_mode::recv));

    EXPECT_TRUE(sends_files(session_mode::both));
    EXPECT_TRUE(receives_files(session_mode::both));
}

// =============================================================================
// Metadata Tests
// =============================================================================

TEST(FileMetadataTest, Equality) {
    file_metadata a;
    a.filename = "a.bin";
    a.file_size = 10;
    a.total_chunks = 3;
    a.chunk_size = 4;

    auto b = a;
    EXPECT_EQ(a, b);

    b.total_chunks = 2;
    EXPECT_NE(a, b);
}

TEST(AssemblyProgressTest, CompletionPercentage) {
    assembly_progress empty{0, 0, 0};
    EXPECT_DOUBLE_EQ(empty.completion_percentage(), 100.0);

    assembly_progress half{4, 2, 8};
    EXPECT_DOUBLE_EQ(half.completion_percentage(), 50.0);
}

}  // namespace kcenon::serial_transfer::test
