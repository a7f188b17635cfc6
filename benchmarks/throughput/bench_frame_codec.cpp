/**
 * @file bench_frame_codec.cpp
 * @brief Benchmarks for frame encoding, deframing and integrity checks
 */

#include <benchmark/benchmark.h>

#include <kcenon/serial_transfer/core/checksum.h>
#include <kcenon/serial_transfer/protocol/frame_codec.h>
#include <kcenon/serial_transfer/protocol/frame_decoder.h>
#include <kcenon/serial_transfer/protocol/payload_codec.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>

namespace kcenon::serial_transfer::benchmark {

/**
 * @brief Benchmark for encoding one DATA frame
 */
static void BM_FrameCodec_Encode(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(payload_size, 42);

    frame_codec codec;
    frame f{frame_type::data, 7, payload_codec::encode_data(3, data)};

    for (auto _ : state) {
        auto encoded = codec.encode(f);
        if (!encoded) {
            state.SkipWithError("Encoding failed");
            return;
        }
        ::benchmark::DoNotOptimize(encoded.value().data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(payload_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for decoding one complete DATA frame
 */
static void BM_FrameCodec_Decode(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    auto stream = make_data_stream(1, payload_size);

    frame_codec codec;

    for (auto _ : state) {
        auto decoded = codec.decode(stream);
        if (!decoded) {
            state.SkipWithError("Decoding failed");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value().consumed);
    }

    state.SetBytesProcessed(static_cast<int64_t>(stream.size()) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for deframing a stream delivered in serial-sized reads
 */
static void BM_FrameDecoder_Stream(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    const auto read_size = static_cast<std::size_t>(state.range(1));
    constexpr std::size_t frame_count = 64;

    auto stream = make_data_stream(frame_count, payload_size);

    for (auto _ : state) {
        frame_decoder decoder;
        std::size_t frames = 0;

        for (std::size_t offset = 0; offset < stream.size(); offset += read_size) {
            auto n = std::min(read_size, stream.size() - offset);
            decoder.feed(std::span<const std::byte>(stream.data() + offset, n));
            while (decoder.next()) {
                ++frames;
            }
        }

        if (frames != frame_count) {
            state.SkipWithError("Frames lost while deframing");
            return;
        }
        ::benchmark::DoNotOptimize(frames);
    }

    state.SetBytesProcessed(static_cast<int64_t>(stream.size()) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(frame_count) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for resynchronising after line noise
 */
static void BM_FrameDecoder_NoisyStream(::benchmark::State& state) {
    const auto noise_size = static_cast<std::size_t>(state.range(0));

    auto noise = test_data_generator::generate_random_data(noise_size, 7);
    auto frames = make_data_stream(16, sizes::small_chunk);

    std::vector<std::byte> stream(noise);
    stream.insert(stream.end(), frames.begin(), frames.end());

    for (auto _ : state) {
        frame_decoder decoder;
        decoder.feed(stream);
        std::size_t decoded = 0;
        for (;;) {
            auto next = decoder.next();
            if (next) {
                ++decoded;
                continue;
            }
            if (next.error().code == error_code::frame_incomplete) {
                break;
            }
        }
        ::benchmark::DoNotOptimize(decoded);
    }

    state.SetBytesProcessed(static_cast<int64_t>(stream.size()) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for the frame trailer CRC
 */
static void BM_Checksum_CRC32(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(data);
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for the header CRC
 */
static void BM_Checksum_CRC16(::benchmark::State& state) {
    auto header = test_data_generator::generate_random_data(frame_header_size - 2, 42);

    for (auto _ : state) {
        auto crc = checksum::crc16_ccitt(header);
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for the whole-file digest carried in FILE_END
 */
static void BM_Checksum_SHA256(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);

    for (auto _ : state) {
        auto digest = checksum::sha256(data);
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_FrameCodec_Encode)
    ->Arg(16)
    ->Arg(sizes::small_chunk)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::max_chunk);

BENCHMARK(BM_FrameCodec_Decode)
    ->Arg(16)
    ->Arg(sizes::small_chunk)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::max_chunk);

// payload size, bytes per read()
BENCHMARK(BM_FrameDecoder_Stream)
    ->Args({static_cast<int64_t>(sizes::small_chunk), 64})
    ->Args({static_cast<int64_t>(sizes::default_chunk), 64})
    ->Args({static_cast<int64_t>(sizes::default_chunk), 4096})
    ->Args({static_cast<int64_t>(sizes::max_chunk), 4096});

BENCHMARK(BM_FrameDecoder_NoisyStream)->Arg(64)->Arg(1024)->Arg(16 * 1024);

BENCHMARK(BM_Checksum_CRC32)
    ->Arg(sizes::small_chunk)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::max_chunk);

BENCHMARK(BM_Checksum_CRC16);

BENCHMARK(BM_Checksum_SHA256)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::max_chunk)
    ->Arg(sizes::medium_file);

}  // namespace kcenon::serial_transfer::benchmark
