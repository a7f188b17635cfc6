// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define SERIAL_TRANSFER_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::serial_transfer {

/**
 * @brief Log categories for serial transfer system
 */
struct log_category {
    static constexpr std::string_view channel = "serial_transfer.channel";
    static constexpr std::string_view frame = "serial_transfer.frame";
    static constexpr std::string_view retry = "serial_transfer.retry";
    static constexpr std::string_view sender = "serial_transfer.sender";
    static constexpr std::string_view receiver = "serial_transfer.receiver";
    static constexpr std::string_view session = "serial_transfer.session";
    static constexpr std::string_view chunk = "serial_transfer.chunk";
};

/**
 * @brief Log levels for serial transfer system
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

[[nodiscard]] inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);

    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }

    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for transfer operations
 */
struct transfer_log_context {
    std::string filename;
    std::optional<std::string> direction;
    std::optional<uint16_t> sequence;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_confirmed;
    std::optional<uint32_t> attempt;
    std::optional<double> rate_bps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON object string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, std::string_view value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!filename.empty()) add_field("filename", filename);
        if (direction) add_field("direction", *direction);
        if (sequence) add_uint("sequence", *sequence);
        if (chunk_index) add_uint("chunk_index", *chunk_index);
        if (total_chunks) add_uint("total_chunks", *total_chunks);
        if (file_size) add_uint("size", *file_size);
        if (bytes_confirmed) add_uint("bytes_confirmed", *bytes_confirmed);
        if (attempt) add_uint("attempt", *attempt);
        if (rate_bps) add_double("rate_bps", *rate_bps);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    /**
     * @brief Convert to complete JSON format
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * Example usage:
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::sender)
 *     .with_message("File confirmed")
 *     .with_filename("data.bin")
 *     .with_file_size(1048576)
 *     .with_duration_ms(500)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_filename(std::string_view filename) -> log_entry_builder& {
        ensure_context();
        entry_.context->filename = std::string(filename);
        return *this;
    }

    auto with_sequence(uint16_t sequence) -> log_entry_builder& {
        ensure_context();
        entry_.context->sequence = sequence;
        return *this;
    }

    auto with_chunk_index(uint64_t index) -> log_entry_builder& {
        ensure_context();
        entry_.context->chunk_index = index;
        return *this;
    }

    auto with_file_size(uint64_t size) -> log_entry_builder& {
        ensure_context();
        entry_.context->file_size = size;
        return *this;
    }

    auto with_bytes_confirmed(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_confirmed = bytes;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    /**
     * @brief Set the source file location
     */
    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Serial transfer logging interface
 *
 * Routes to logger_system when the library is built with it, otherwise
 * writes single lines to stderr.
 */
class serial_transfer_logger {
public:
    using log_callback = std::function<
        void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;

    serial_transfer_logger() = default;
    ~serial_transfer_logger() = default;

    serial_transfer_logger(const serial_transfer_logger&) = delete;
    serial_transfer_logger& operator=(const serial_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     * Called when a session is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef SERIAL_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#ifdef SERIAL_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef SERIAL_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        output_format_.store(format);
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        return output_format_.load();
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    /**
     * @brief Set custom log callback, invoked for every enabled message
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        std::string line_text;
        if (output_format_.load() == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            line_text = builder.build_json();
        } else {
            line_text = format_message(category, message, context);
        }

#ifdef SERIAL_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
            return;
        }
#endif
        output_to_stderr(get_timestamp() + " [" + std::string(log_level_to_string(level)) +
                         "] " + line_text);
    }

    void flush() {
#ifdef SERIAL_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_message(std::string_view category,
                               std::string_view message,
                               const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

#ifdef SERIAL_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<log_output_format> output_format_{log_output_format::text};
    log_callback callback_;
    std::mutex callback_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline serial_transfer_logger& get_logger() {
    static serial_transfer_logger instance;
    return instance;
}

// Logging macros for convenience
#define ST_LOG(level, category, message) \
    kcenon::serial_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define ST_LOG_CTX(level, category, message, context) \
    kcenon::serial_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define ST_LOG_TRACE(category, message) \
    ST_LOG(kcenon::serial_transfer::log_level::trace, category, message)
#define ST_LOG_DEBUG(category, message) \
    ST_LOG(kcenon::serial_transfer::log_level::debug, category, message)
#define ST_LOG_INFO(category, message) \
    ST_LOG(kcenon::serial_transfer::log_level::info, category, message)
#define ST_LOG_WARN(category, message) \
    ST_LOG(kcenon::serial_transfer::log_level::warn, category, message)
#define ST_LOG_ERROR(category, message) \
    ST_LOG(kcenon::serial_transfer::log_level::error, category, message)
#define ST_LOG_FATAL(category, message) \
    ST_LOG(kcenon::serial_transfer::log_level::fatal, category, message)

#define ST_LOG_TRACE_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::serial_transfer::log_level::trace, category, message, ctx)
#define ST_LOG_DEBUG_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::serial_transfer::log_level::debug, category, message, ctx)
#define ST_LOG_INFO_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::serial_transfer::log_level::info, category, message, ctx)
#define ST_LOG_WARN_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::serial_transfer::log_level::warn, category, message, ctx)
#define ST_LOG_ERROR_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::serial_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::serial_transfer
