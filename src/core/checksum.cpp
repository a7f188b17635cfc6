/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/serial_transfer/core/checksum.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::serial_transfer {

namespace {

// CRC32 polynomial (IEEE 802.3, reflected)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

// CRC-16/CCITT polynomial (non-reflected)
constexpr uint16_t CRC16_POLYNOMIAL = 0x1021;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC32_POLYNOMIAL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto generate_crc16_table() -> std::array<uint16_t, 256> {
    std::array<uint16_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        auto crc = static_cast<uint16_t>(i << 8);
        for (int j = 0; j < 8; ++j) {
            if (crc & 0x8000) {
                crc = static_cast<uint16_t>((crc << 1) ^ CRC16_POLYNOMIAL);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();
constexpr auto CRC16_TABLE = generate_crc16_table();

constexpr std::array<uint32_t, 64> SHA256_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1,
    0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786,
    0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147,
    0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a,
    0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

constexpr std::array<uint32_t, 8> SHA256_H0 = {0x6a09e667, 0xbb67ae85, 0x3c6ef372,
                                               0xa54ff53a, 0x510e527f, 0x9b05688c,
                                               0x1f83d9ab, 0x5be0cd19};

constexpr auto rotr(uint32_t x, int n) -> uint32_t {
    return (x >> n) | (x << (32 - n));
}

void sha256_transform(std::array<uint32_t, 8>& state, const uint8_t* block) {
    std::array<uint32_t, 64> w{};

    for (int i = 0; i < 16; ++i) {
        w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
               (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
               static_cast<uint32_t>(block[i * 4 + 3]);
    }

    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    std::array<uint32_t, 8> v = state;

    for (int i = 0; i < 64; ++i) {
        uint32_t big_s1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
        uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
        uint32_t t1 = v[7] + big_s1 + ch + SHA256_K[i] + w[i];
        uint32_t big_s0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
        uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
        uint32_t t2 = big_s0 + maj;

        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + t1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = t1 + t2;
    }

    for (std::size_t i = 0; i < state.size(); ++i) {
        state[i] += v[i];
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// checksum
// ---------------------------------------------------------------------------

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    return crc32_update(0, data);
}

auto checksum::crc32_update(uint32_t crc, std::span<const std::byte> data) -> uint32_t {
    crc ^= 0xFFFFFFFF;

    for (std::byte b : data) {
        uint8_t index = static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b));
        crc = CRC32_TABLE[index] ^ (crc >> 8);
    }

    return crc ^ 0xFFFFFFFF;
}

auto checksum::verify_crc32(std::span<const std::byte> data, uint32_t expected) -> bool {
    return crc32(data) == expected;
}

auto checksum::crc16_ccitt(std::span<const std::byte> data) -> uint16_t {
    uint16_t crc = 0xFFFF;

    for (std::byte b : data) {
        uint8_t index = static_cast<uint8_t>((crc >> 8) ^ static_cast<uint8_t>(b));
        crc = static_cast<uint16_t>((crc << 8) ^ CRC16_TABLE[index]);
    }

    return crc;
}

auto checksum::sha256(std::span<const std::byte> data) -> sha256_digest {
    sha256_hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<sha256_digest> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    sha256_hasher hasher;
    std::vector<std::byte> buffer(64 * 1024);

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0) {
            hasher.update(std::span<const std::byte>(
                buffer.data(), static_cast<std::size_t>(bytes_read)));
        }
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return hasher.finalize();
}

auto checksum::to_hex(const sha256_digest& digest) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::byte b : digest) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

// ---------------------------------------------------------------------------
// sha256_hasher
// ---------------------------------------------------------------------------

sha256_hasher::sha256_hasher() {
    reset();
}

void sha256_hasher::reset() {
    state_ = SHA256_H0;
    block_.fill(0);
    block_pos_ = 0;
    total_bytes_ = 0;
}

void sha256_hasher::update(std::span<const std::byte> data) {
    total_bytes_ += data.size();

    for (std::byte b : data) {
        block_[block_pos_++] = static_cast<uint8_t>(b);
        if (block_pos_ == block_.size()) {
            sha256_transform(state_, block_.data());
            block_pos_ = 0;
        }
    }
}

auto sha256_hasher::finalize() -> sha256_digest {
    uint64_t bit_length = total_bytes_ * 8;
    block_[block_pos_++] = 0x80;

    if (block_pos_ > 56) {
        while (block_pos_ < 64) {
            block_[block_pos_++] = 0;
        }
        sha256_transform(state_, block_.data());
        block_pos_ = 0;
    }

    while (block_pos_ < 56) {
        block_[block_pos_++] = 0;
    }

    // Length in bits, big-endian
    for (int i = 7; i >= 0; --i) {
        block_[block_pos_++] = static_cast<uint8_t>(bit_length >> (i * 8));
    }

    sha256_transform(state_, block_.data());

    sha256_digest digest{};
    for (std::size_t i = 0; i < state_.size(); ++i) {
        digest[i * 4] = static_cast<std::byte>(state_[i] >> 24);
        digest[i * 4 + 1] = static_cast<std::byte>(state_[i] >> 16);
        digest[i * 4 + 2] = static_cast<std::byte>(state_[i] >> 8);
        digest[i * 4 + 3] = static_cast<std::byte>(state_[i]);
    }

    reset();
    return digest;
}

}  // namespace kcenon::serial_transfer
