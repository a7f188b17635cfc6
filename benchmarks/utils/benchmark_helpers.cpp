/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <kcenon/serial_transfer/protocol/frame_codec.h>
#include <kcenon/serial_transfer/protocol/payload_codec.h>

#include <fstream>

namespace kcenon::serial_transfer::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto make_data_stream(std::size_t count, std::size_t payload_size, uint32_t seed)
    -> std::vector<std::byte> {
    frame_codec codec;
    auto data = test_data_generator::generate_random_data(payload_size, seed);

    std::vector<std::byte> stream;
    stream.reserve(count * (payload_size + 8 + frame_overhead));

    for (std::size_t i = 0; i < count; ++i) {
        frame f{frame_type::data, static_cast<uint16_t>(i),
                payload_codec::encode_data(i, data)};
        auto encoded = codec.encode(f);
        if (!encoded) {
            break;
        }
        stream.insert(stream.end(), encoded.value().begin(), encoded.value().end());
    }

    return stream;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() / "serial_trans_benchmarks";
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_file(
    const std::string& name,
    const std::vector<std::byte>& data) -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::create_random_file(
    const std::string& name,
    std::size_t size,
    uint32_t seed) -> std::filesystem::path {
    auto data = test_data_generator::generate_random_data(size, seed);
    return create_file(name, data);
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

}  // namespace kcenon::serial_transfer::benchmark
