/**
 * @file bench_session_throughput.cpp
 * @brief Benchmarks for complete transfers between two sessions
 *
 * Runs the full stop-and-wait protocol over an in-memory link, so the
 * numbers show protocol and disk cost without any line-rate limit. Compare
 * against line_rates::raw_bytes_per_second() for the link you target.
 */

#include <benchmark/benchmark.h>

#include <kcenon/serial_transfer/core/logging.h>
#include <kcenon/serial_transfer/serial_transfer.h>

#include "utils/benchmark_helpers.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

namespace kcenon::serial_transfer::benchmark {

namespace {

auto make_session(session_mode mode, uint32_t chunk_size, const std::filesystem::path& out)
    -> result<transfer_session> {
    return transfer_session::builder()
        .with_mode(mode)
        .with_chunk_size(chunk_size)
        .with_baud_rate(line_rates::fast_baud)
        .with_poll_interval(std::chrono::milliseconds{1})
        .with_output_directory(out)
        .build();
}

}  // namespace

/**
 * @brief Benchmark for one file sent from a SEND session to a RECV session
 *
 * Includes the handshake, FILE_META, every DATA round trip, FILE_END digest
 * verification and SESSION_END.
 */
static void BM_Session_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<uint32_t>(state.range(1));

    get_logger().set_level(log_level::warn);

    temp_file_manager temp_files;
    auto test_file = temp_files.create_random_file("session_test.bin", file_size, 42);
    auto out_dir = temp_files.base_dir() / "received";

    uint64_t frames = 0;

    for (auto _ : state) {
        auto [near_end, far_end] = memory_channel::create_pair();

        auto receiver = make_session(session_mode::recv, chunk_size, out_dir);
        auto sender = make_session(session_mode::send, chunk_size, out_dir);
        if (!receiver || !sender) {
            state.SkipWithError("Failed to build sessions");
            return;
        }

        std::atomic<bool> received{false};
        receiver.value().on_file_complete(
            [&](const file_transfer_result& outcome) { received.store(outcome.success); });

        if (!sender.value().enqueue(test_file)) {
            state.SkipWithError("Failed to queue file");
            return;
        }
        sender.value().finish();

        if (!receiver.value().start(*far_end) || !sender.value().start(*near_end)) {
            state.SkipWithError("Failed to start sessions");
            return;
        }

        auto summary = sender.value().wait();
        if (!summary || !summary.value().all_succeeded()) {
            state.SkipWithError("Transfer failed");
            return;
        }

        while (!received.load()) {
            std::this_thread::yield();
        }
        receiver.value().stop();
        (void)receiver.value().wait();

        frames = near_end->get_statistics().write_calls;
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.counters["frames"] = static_cast<double>(frames);
    state.counters["line_115200_s"] =
        static_cast<double>(file_size + frames * (frame_overhead + 8)) /
        line_rates::raw_bytes_per_second(line_rates::slow_baud);
}

BENCHMARK(BM_Session_SingleFile)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::small_chunk)})
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::serial_transfer::benchmark
