/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_SERIAL_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_SERIAL_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::serial_transfer::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Encode @p count DATA frames carrying @p payload_size bytes each
 *
 * The frames are concatenated the way they would arrive on the line, with
 * consecutive sequence numbers starting at 0.
 */
auto make_data_stream(std::size_t count, std::size_t payload_size, uint32_t seed = 42)
    -> std::vector<std::byte>;

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with the given content
     * @param name File name
     * @param data File content
     * @return Path to created file
     */
    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    /**
     * @brief Create a temporary file with random data
     * @param name File name
     * @param size File size
     * @param seed Random seed
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Get the base directory
     * @return Base directory path
     */
    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 64 * KB;
constexpr std::size_t medium_file = 1 * MB;
constexpr std::size_t large_file = 16 * MB;

// Chunk sizes accepted on the wire
constexpr std::size_t small_chunk = 256;
constexpr std::size_t default_chunk = 4 * KB;
constexpr std::size_t max_chunk = 64 * KB;
}  // namespace sizes

/**
 * @brief Line rates the protocol is tuned for
 */
namespace line_rates {
constexpr uint32_t slow_baud = 115200;
constexpr uint32_t fast_baud = 4000000;

// Payload bytes per second a line can carry at 10 bits per byte
constexpr auto raw_bytes_per_second(uint32_t baud) -> double {
    return static_cast<double>(baud) / 10.0;
}
}  // namespace line_rates

}  // namespace kcenon::serial_transfer::benchmark

#endif  // KCENON_SERIAL_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
