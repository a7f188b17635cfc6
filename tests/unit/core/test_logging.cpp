/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging
 */

#include <gtest/gtest.h>

#include <kcenon/serial_transfer/core/logging.h>

#include <regex>
#include <string>
#include <tuple>
#include <vector>

namespace kcenon::serial_transfer::test {

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, BasicFieldsToJson) {
    transfer_log_context ctx;
    ctx.filename = "a.bin";
    ctx.file_size = 1024;
    ctx.sequence = 7;

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"filename\":\"a.bin\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":1024"), std::string::npos);
    EXPECT_NE(json.find("\"sequence\":7"), std::string::npos);
}

TEST_F(TransferLogContextTest, AllFieldsToJson) {
    transfer_log_context ctx;
    ctx.filename = "data.bin";
    ctx.direction = "send";
    ctx.sequence = 65535;
    ctx.chunk_index = 5;
    ctx.total_chunks = 10;
    ctx.file_size = 40960;
    ctx.bytes_confirmed = 20480;
    ctx.attempt = 2;
    ctx.rate_bps = 11520.5;
    ctx.duration_ms = 1000;
    ctx.error_message = "acknowledgement timeout";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"filename\":\"data.bin\""), std::string::npos);
    EXPECT_NE(json.find("\"direction\":\"send\""), std::string::npos);
    EXPECT_NE(json.find("\"sequence\":65535"), std::string::npos);
    EXPECT_NE(json.find("\"chunk_index\":5"), std::string::npos);
    EXPECT_NE(json.find("\"total_chunks\":10"), std::string::npos);
    EXPECT_NE(json.find("\"size\":40960"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_confirmed\":20480"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"rate_bps\":11520.50"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":1000"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"acknowledgement timeout\""), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonEscaping) {
    transfer_log_context ctx;
    ctx.filename = "name-with-\"quotes\"";
    ctx.error_message = "Error:\nLine break\tand\ttabs";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
}

TEST_F(TransferLogContextTest, ControlCharactersEscaped) {
    transfer_log_context ctx;
    ctx.filename = std::string("bell\x07");

    EXPECT_NE(ctx.to_json().find("\\u0007"), std::string::npos);
}

// =============================================================================
// Structured Log Entry Tests
// =============================================================================

class StructuredLogEntryTest : public ::testing::Test {};

TEST_F(StructuredLogEntryTest, BasicEntryToJson) {
    structured_log_entry entry;
    entry.timestamp = "2026-01-05T10:30:00.000Z";
    entry.level = log_level::info;
    entry.category = "serial_transfer.sender";
    entry.message = "File confirmed";

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"timestamp\":\"2026-01-05T10:30:00.000Z\""), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"serial_transfer.sender\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"File confirmed\""), std::string::npos);
}

TEST_F(StructuredLogEntryTest, ContextFieldsAreFlattened) {
    structured_log_entry entry;
    entry.timestamp = "2026-01-05T10:30:00.000Z";
    entry.category = "serial_transfer.receiver";
    entry.message = "File complete";

    transfer_log_context ctx;
    ctx.filename = "b.bin";
    ctx.file_size = 0;
    entry.context = ctx;

    auto json = entry.to_json();

    EXPECT_NE(json.find(",\"filename\":\"b.bin\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":0"), std::string::npos);
}

TEST_F(StructuredLogEntryTest, EntryWithSourceLocation) {
    structured_log_entry entry;
    entry.timestamp = "2026-01-05T10:30:00.000Z";
    entry.level = log_level::error;
    entry.category = "serial_transfer.channel";
    entry.message = "Read failed";
    entry.source_file = "/src/serial_channel.cpp";
    entry.source_line = 42;
    entry.function_name = "read";

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"source\":{"), std::string::npos);
    EXPECT_NE(json.find("\"file\":\"/src/serial_channel.cpp\""), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
    EXPECT_NE(json.find("\"function\":\"read\""), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BasicBuilder) {
    auto entry = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::sender)
        .with_message("Handshake complete")
        .build();

    EXPECT_EQ(entry.level, log_level::info);
    EXPECT_EQ(entry.category, log_category::sender);
    EXPECT_EQ(entry.message, "Handshake complete");
    EXPECT_FALSE(entry.timestamp.empty());
    EXPECT_FALSE(entry.context.has_value());
}

TEST_F(LogEntryBuilderTest, BuilderWithContextFields) {
    auto entry = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::receiver)
        .with_message("Chunk stored")
        .with_filename("a.bin")
        .with_sequence(3)
        .with_chunk_index(2)
        .with_file_size(10)
        .with_bytes_confirmed(8)
        .with_duration_ms(15)
        .build();

    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->filename, "a.bin");
    EXPECT_EQ(entry.context->sequence.value(), 3u);
    EXPECT_EQ(entry.context->chunk_index.value(), 2u);
    EXPECT_EQ(entry.context->file_size.value(), 10u);
    EXPECT_EQ(entry.context->bytes_confirmed.value(), 8u);
    EXPECT_EQ(entry.context->duration_ms.value(), 15u);
}

TEST_F(LogEntryBuilderTest, BuilderWithExistingContext) {
    transfer_log_context ctx;
    ctx.filename = "existing.bin";
    ctx.attempt = 3;

    auto entry = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::retry)
        .with_message("Retransmitting")
        .with_context(ctx)
        .build();

    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->filename, "existing.bin");
    EXPECT_EQ(entry.context->attempt.value(), 3u);
}

TEST_F(LogEntryBuilderTest, BuilderWithErrorMessage) {
    auto entry = log_entry_builder()
        .with_level(log_level::error)
        .with_category(log_category::sender)
        .with_message("File failed")
        .with_error_message("retries exhausted")
        .build();

    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->error_message.value(), "retries exhausted");
}

TEST_F(LogEntryBuilderTest, BuilderWithSourceLocation) {
    auto entry = log_entry_builder()
        .with_level(log_level::error)
        .with_category(log_category::frame)
        .with_message("Error occurred")
        .with_source_location("test.cpp", 100, "test_func")
        .build();

    EXPECT_EQ(entry.source_file.value(), "test.cpp");
    EXPECT_EQ(entry.source_line.value(), 100);
    EXPECT_EQ(entry.function_name.value(), "test_func");
}

TEST_F(LogEntryBuilderTest, BuildJson) {
    auto json = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::session)
        .with_message("Test message")
        .build_json();

    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"serial_transfer.session\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Test message\""), std::string::npos);
}

TEST_F(LogEntryBuilderTest, TimestampFormat) {
    auto entry = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::session)
        .with_message("Test")
        .build();

    // ISO 8601 format: YYYY-MM-DDTHH:MM:SS.mmmZ
    std::regex iso8601_regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(entry.timestamp, iso8601_regex));
}

// =============================================================================
// Log Level Tests
// =============================================================================

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::error), "ERROR");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Integration Tests
// =============================================================================

class SerialTransferLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().enable_json_output(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
        get_logger().enable_json_output(false);
    }
};

TEST_F(SerialTransferLoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());
}

TEST_F(SerialTransferLoggerTest, SetOutputFormat) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(SerialTransferLoggerTest, EnableJsonOutput) {
    get_logger().enable_json_output(true);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().enable_json_output(false);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(SerialTransferLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    ST_LOG_INFO(log_category::session, "Test message");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::session);
    EXPECT_EQ(std::get<2>(captured[0]), "Test message");
}

TEST_F(SerialTransferLoggerTest, CallbackReceivesContext) {
    std::optional<transfer_log_context> seen;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const transfer_log_context* ctx) {
        if (ctx) seen = *ctx;
    });

    transfer_log_context ctx;
    ctx.filename = "a.bin";
    ctx.sequence = 4;
    ST_LOG_DEBUG_CTX(log_category::receiver, "DATA accepted", ctx);

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->filename, "a.bin");
    EXPECT_EQ(seen->sequence.value(), 4u);
}

TEST_F(SerialTransferLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const transfer_log_context*) {
        captured.push_back(std::string(message));
    });

    get_logger().set_level(log_level::warn);

    ST_LOG_DEBUG(log_category::retry, "Debug message");
    ST_LOG_INFO(log_category::retry, "Info message");
    ST_LOG_WARN(log_category::retry, "Warn message");
    ST_LOG_ERROR(log_category::retry, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

TEST_F(SerialTransferLoggerTest, IsEnabled) {
    get_logger().set_level(log_level::error);

    EXPECT_FALSE(get_logger().is_enabled(log_level::warn));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
    EXPECT_TRUE(get_logger().is_enabled(log_level::fatal));
}

}  // namespace kcenon::serial_transfer::test
