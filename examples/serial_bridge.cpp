/**
 * @file serial_bridge.cpp
 * @brief Command-line file transfer over a serial link
 *
 * This example demonstrates how to:
 * - Open a serial device as a byte channel
 * - Run a send, receive or bidirectional session on it
 * - Render progress with format_progress_line()
 * - Queue files interactively from stdin
 * - Stop gracefully on SIGINT/SIGTERM
 *
 * Exit codes: 0 success, 1 channel or handshake failure, 2 some files
 * failed, 64 usage error.
 */

#include <kcenon/serial_transfer/serial_transfer.h>
#include <kcenon/serial_transfer/core/logging.h>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

using namespace kcenon::serial_transfer;

namespace {

constexpr int exit_ok = 0;
constexpr int exit_session_failed = 1;
constexpr int exit_files_failed = 2;
constexpr int exit_usage = 64;

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested.store(true);
}

struct options {
    session_mode mode = session_mode::send;
    std::string device;
    uint32_t baud_rate = 115200;
    std::string output_dir = ".";
    std::optional<uint32_t> chunk_size;
    std::optional<uint32_t> retries;
    std::optional<uint32_t> timeout_ms;
    bool interactive = false;
    bool json_log = false;
    bool verbose = false;
    std::vector<std::string> files;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <send|recv|both> --device <dev> [options] [files...]"
              << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --device <path>       Serial device (required)" << std::endl;
    std::cout << "  --baud <rate>         Baud rate (default: 115200)" << std::endl;
    std::cout << "  --out <dir>           Directory for received files (default: .)" << std::endl;
    std::cout << "  --chunk-size <bytes>  Chunk size (default: 4096)" << std::endl;
    std::cout << "  --retries <n>         Retransmissions per frame (default: 3)" << std::endl;
    std::cout << "  --timeout-ms <ms>     ACK timeout (default: derived from baud rate)" << std::endl;
    std::cout << "  --interactive         Read more file paths from stdin ('exit' ends input)"
              << std::endl;
    std::cout << "  --json-log            Log as JSON lines" << std::endl;
    std::cout << "  --verbose             Log debug detail" << std::endl;
}

auto parse_number(const std::string& text) -> std::optional<uint32_t> {
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > UINT32_MAX) {
            return std::nullopt;
        }
    }
    return static_cast<uint32_t>(value);
}

auto parse_args(int argc, char* argv[]) -> std::optional<options> {
    if (argc < 2) {
        return std::nullopt;
    }

    options opts;
    std::string command = argv[1];
    if (command == "send") {
        opts.mode = session_mode::send;
    } else if (command == "recv") {
        opts.mode = session_mode::recv;
    } else if (command == "both") {
        opts.mode = session_mode::both;
    } else {
        std::cerr << "Unknown command: " << command << std::endl;
        return std::nullopt;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        auto number = [&]() -> std::optional<uint32_t> {
            auto text = value();
            if (!text) {
                return std::nullopt;
            }
            auto parsed = parse_number(*text);
            if (!parsed) {
                std::cerr << arg << " expects a non-negative integer, got " << *text << std::endl;
            }
            return parsed;
        };

        if (arg == "--device") {
            auto v = value();
            if (!v) return std::nullopt;
            opts.device = *v;
        } else if (arg == "--baud") {
            auto v = number();
            if (!v) return std::nullopt;
            opts.baud_rate = *v;
        } else if (arg == "--out") {
            auto v = value();
            if (!v) return std::nullopt;
            opts.output_dir = *v;
        } else if (arg == "--chunk-size") {
            auto v = number();
            if (!v) return std::nullopt;
            opts.chunk_size = *v;
        } else if (arg == "--retries") {
            auto v = number();
            if (!v) return std::nullopt;
            opts.retries = *v;
        } else if (arg == "--timeout-ms") {
            auto v = number();
            if (!v || *v == 0) return std::nullopt;
            opts.timeout_ms = *v;
        } else if (arg == "--interactive") {
            opts.interactive = true;
        } else if (arg == "--json-log") {
            opts.json_log = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            opts.files.push_back(arg);
        }
    }

    if (opts.device.empty()) {
        std::cerr << "--device is required" << std::endl;
        return std::nullopt;
    }
    if (opts.mode == session_mode::recv && (!opts.files.empty() || opts.interactive)) {
        std::cerr << "recv does not take files to send" << std::endl;
        return std::nullopt;
    }
    return opts;
}

/**
 * @brief Feeds paths typed on stdin into the session until 'exit' or EOF
 */
class stdin_feeder {
public:
    explicit stdin_feeder(transfer_session& session) : session_(session) {
        thread_ = std::thread([this] { run(); });
    }

    ~stdin_feeder() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    stdin_feeder(const stdin_feeder&) = delete;
    auto operator=(const stdin_feeder&) -> stdin_feeder& = delete;

private:
    void run() {
        std::string pending;
        char buffer[512];

        while (!done_.load()) {
            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ready = ::poll(&pfd, 1, 100);
            if (ready <= 0) {
                continue;
            }

            ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
            if (n <= 0) {
                session_.finish();
                return;
            }
            pending.append(buffer, static_cast<std::size_t>(n));

            std::size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, newline);
                pending.erase(0, newline + 1);
                if (!handle_line(line)) {
                    session_.finish();
                    return;
                }
            }
        }
    }

    auto handle_line(const std::string& line) -> bool {
        std::istringstream words(line);
        std::string word;
        while (words >> word) {
            if (word == "exit") {
                return false;
            }
            if (auto queued = session_.enqueue(word); !queued) {
                std::cerr << "Cannot queue " << word << ": " << queued.error().message
                          << std::endl;
            }
        }
        return true;
    }

    transfer_session& session_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage(argv[0]);
        return exit_usage;
    }
    const auto& opts = *parsed;

    auto& logger = get_logger();
    logger.initialize();
    logger.set_level(opts.verbose ? log_level::debug : log_level::info);
    logger.enable_json_output(opts.json_log);

    auto builder = transfer_session::builder();
    builder.with_mode(opts.mode)
        .with_baud_rate(opts.baud_rate)
        .with_output_directory(opts.output_dir);
    if (opts.chunk_size) builder.with_chunk_size(*opts.chunk_size);
    if (opts.retries) builder.with_max_retries(*opts.retries);
    if (opts.timeout_ms) builder.with_ack_timeout(std::chrono::milliseconds{*opts.timeout_ms});

    auto session_result = builder.build();
    if (!session_result.has_value()) {
        std::cerr << "Invalid configuration: " << session_result.error().message << std::endl;
        return exit_usage;
    }
    auto& session = session_result.value();

    auto channel = serial_channel::open(serial_channel_config{opts.device, opts.baud_rate});
    if (!channel.has_value()) {
        std::cerr << "Cannot open " << opts.device << ": " << channel.error().message
                  << std::endl;
        return exit_session_failed;
    }

    std::mutex output_mutex;

    session.on_progress([&](const progress_report& report) {
        std::lock_guard lock(output_mutex);
        std::cout << "\r" << (report.direction == transfer_direction::send ? "> " : "< ")
                  << report.filename << " " << format_progress_line(report) << std::flush;
    });

    session.on_file_complete([&](const file_transfer_result& outcome) {
        std::lock_guard lock(output_mutex);
        std::cout << std::endl;
        if (outcome.success) {
            std::cout << "[ok] " << to_string(outcome.direction) << " " << outcome.filename
                      << " (" << outcome.bytes_confirmed << " bytes, "
                      << outcome.elapsed.count() << " ms)" << std::endl;
        } else {
            std::cout << "[failed] " << to_string(outcome.direction) << " " << outcome.filename
                      << ": " << (outcome.failure ? outcome.failure->message : "unknown error")
                      << std::endl;
        }
    });

    session.on_state_changed([&](session_state state) {
        if (opts.verbose) {
            std::lock_guard lock(output_mutex);
            std::cout << "[session] " << to_string(state) << std::endl;
        }
    });

    for (const auto& file : opts.files) {
        if (auto queued = session.enqueue(file); !queued) {
            std::cerr << "Cannot queue " << file << ": " << queued.error().message << std::endl;
        }
    }
    if (sends_files(opts.mode) && !opts.interactive) {
        session.finish();
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    if (auto started = session.start(*channel.value()); !started) {
        std::cerr << "Cannot start session: " << started.error().message << std::endl;
        return exit_session_failed;
    }

    std::optional<stdin_feeder> feeder;
    if (opts.interactive) {
        feeder.emplace(session);
    }

    while (!session.wait_for(std::chrono::milliseconds{100})) {
        if (g_stop_requested.load()) {
            session.stop();
        }
    }

    auto summary = session.wait();
    feeder.reset();
    channel.value()->close();
    logger.flush();

    if (!summary.has_value()) {
        std::cerr << "Session failed: " << summary.error().message << std::endl;
        return exit_session_failed;
    }

    const auto& totals = summary.value();
    std::cout << "Transferred " << totals.succeeded_count() << " file(s), "
              << totals.failed_count() - totals.interrupted_count() << " failed, "
              << totals.interrupted_count() << " interrupted, "
              << totals.frames_retransmitted << " retransmission(s)" << std::endl;

    // An interactive stop is a clean exit even with a file cut short
    return totals.has_errors() ? exit_files_failed : exit_ok;
}
