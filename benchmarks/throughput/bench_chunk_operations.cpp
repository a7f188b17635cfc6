/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunk splitting and assembling operations
 */

#include <benchmark/benchmark.h>

#include <kcenon/serial_transfer/core/chunk_assembler.h>
#include <kcenon/serial_transfer/core/chunk_splitter.h>
#include <kcenon/serial_transfer/core/checksum.h>

#include "utils/benchmark_helpers.h"

#include <filesystem>
#include <vector>

namespace kcenon::serial_transfer::benchmark {

/**
 * @brief Benchmark for chunk_splitter with various file and chunk sizes
 */
static void BM_ChunkSplitter_Split(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<uint32_t>(state.range(1));

    temp_file_manager temp_files;
    auto test_file = temp_files.create_random_file("split_test.bin", file_size, 42);

    chunk_splitter splitter(chunk_config{chunk_size});

    for (auto _ : state) {
        auto result = splitter.split(test_file);
        if (!result) {
            state.SkipWithError("Failed to create splitter iterator");
            return;
        }

        auto& iterator = result.value();
        while (iterator.has_next()) {
            auto chunk_result = iterator.next();
            if (!chunk_result) {
                state.SkipWithError("Failed to get chunk");
                return;
            }
            ::benchmark::DoNotOptimize(chunk_result.value());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>((file_size + chunk_size - 1) / chunk_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for in-order assembly with digest verification
 */
static void BM_ChunkAssembler_Assemble(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<uint32_t>(state.range(1));

    temp_file_manager temp_files;
    auto test_file = temp_files.create_random_file("assemble_source.bin", file_size, 42);

    chunk_splitter splitter(chunk_config{chunk_size});
    auto meta = splitter.calculate_metadata(test_file);
    auto split_result = splitter.split(test_file);
    if (!meta || !split_result) {
        state.SkipWithError("Failed to prepare chunks");
        return;
    }

    // Pre-read all chunks
    std::vector<chunk> chunks;
    auto& iterator = split_result.value();
    while (iterator.has_next()) {
        auto chunk_result = iterator.next();
        if (!chunk_result) {
            state.SkipWithError("Failed to get chunk");
            return;
        }
        chunks.push_back(std::move(chunk_result.value()));
    }

    auto digest = checksum::sha256_file(test_file);
    if (!digest) {
        state.SkipWithError("Failed to hash source");
        return;
    }

    chunk_assembler assembler(temp_files.base_dir() / "assembled");
    auto announced = meta.value();
    announced.filename = "output.bin";

    for (auto _ : state) {
        if (!assembler.begin_file(announced)) {
            state.SkipWithError("Failed to open destination");
            return;
        }

        for (const auto& c : chunks) {
            if (!assembler.write_chunk(c.index, c.data)) {
                state.SkipWithError("Failed to write chunk");
                return;
            }
        }

        auto finalized = assembler.finalize(announced.total_chunks, announced.file_size,
                                            digest.value());
        if (!finalized) {
            state.SkipWithError("Digest verification failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(chunks.size()) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for SHA-256 file hash calculation
 */
static void BM_Checksum_SHA256_File(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto test_file = temp_files.create_random_file("sha256_test.bin", file_size, 42);

    for (auto _ : state) {
        auto result = checksum::sha256_file(test_file);
        if (!result) {
            state.SkipWithError("Failed to calculate file hash");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
}

// Chunk Splitter benchmarks
BENCHMARK(BM_ChunkSplitter_Split)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::small_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Unit(::benchmark::kMillisecond);

// Chunk Assembler benchmarks
BENCHMARK(BM_ChunkAssembler_Assemble)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Unit(::benchmark::kMillisecond);

// SHA-256 File benchmarks
BENCHMARK(BM_Checksum_SHA256_File)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Arg(static_cast<int64_t>(sizes::large_file))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::serial_transfer::benchmark
