/**
 * @file loopback_demo.cpp
 * @brief Transfer files between two in-process sessions over a lossy link
 *
 * This example demonstrates how to:
 * - Connect a sender and a receiver with memory_channel::create_pair()
 * - Inject frame loss and corruption with a write filter
 * - Observe retransmissions in the session summary
 *
 * Usage: loopback_demo <file>... [--loss <every-nth>] [--out <dir>]
 */

#include <kcenon/serial_transfer/serial_transfer.h>

#include <atomic>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace kcenon::serial_transfer;

int main(int argc, char* argv[]) {
    std::vector<std::string> files;
    std::size_t every_nth = 5;
    std::filesystem::path out_dir = std::filesystem::temp_directory_path() / "loopback_demo";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--loss" && i + 1 < argc) {
            every_nth = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "--out" && i + 1 < argc) {
            out_dir = argv[++i];
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        std::cout << "Usage: " << argv[0] << " <file>... [--loss <every-nth>] [--out <dir>]"
                  << std::endl;
        return 1;
    }

    auto [sender_end, receiver_end] = memory_channel::create_pair();

    // Alternate between losing and damaging every n-th frame the sender writes
    std::atomic<std::size_t> writes{0};
    if (every_nth > 0) {
        sender_end->set_write_filter([&](std::span<const std::byte>) {
            auto n = ++writes;
            if (n % every_nth != 0) return write_action::deliver;
            return (n / every_nth) % 2 == 0 ? write_action::drop : write_action::corrupt;
        });
    }

    auto receiver = transfer_session::builder()
        .with_mode(session_mode::recv)
        .with_baud_rate(4000000)
        .with_output_directory(out_dir)
        .build();
    auto sender = transfer_session::builder()
        .with_mode(session_mode::send)
        .with_baud_rate(4000000)
        .with_ack_timeout(std::chrono::milliseconds{100})
        .build();

    if (!receiver.has_value() || !sender.has_value()) {
        std::cerr << "Failed to build sessions" << std::endl;
        return 1;
    }

    sender.value().on_progress([](const progress_report& report) {
        std::cout << "\r" << report.filename << " " << format_progress_line(report) << std::flush;
    });
    sender.value().on_file_complete([](const file_transfer_result& outcome) {
        std::cout << std::endl
                  << (outcome.success ? "[ok] " : "[failed] ") << outcome.filename << std::endl;
    });

    for (const auto& file : files) {
        if (auto queued = sender.value().enqueue(file); !queued) {
            std::cerr << "Cannot queue " << file << ": " << queued.error().message << std::endl;
        }
    }
    sender.value().finish();

    if (auto started = receiver.value().start(*receiver_end); !started) {
        std::cerr << "Receiver: " << started.error().message << std::endl;
        return 1;
    }
    if (auto started = sender.value().start(*sender_end); !started) {
        std::cerr << "Sender: " << started.error().message << std::endl;
        return 1;
    }

    auto summary = sender.value().wait();
    receiver.value().stop();
    auto received = receiver.value().wait();

    if (!summary.has_value()) {
        std::cerr << "Sender failed: " << summary.error().message << std::endl;
        return 1;
    }

    std::cout << "Sent " << summary.value().succeeded_count() << "/" << files.size()
              << " file(s) to " << out_dir << " with "
              << summary.value().frames_retransmitted << " retransmission(s)";
    if (received.has_value()) {
        std::cout << ", receiver dropped " << received.value().corrupt_frames
                  << " corrupt frame(s)";
    }
    std::cout << std::endl;

    return summary.value().all_succeeded() ? 0 : 2;
}
