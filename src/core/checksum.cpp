/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/p2p_convert/core/checksum.h>

#include <array>

namespace kcenon::p2p_convert {

namespace {

// CRC32 polynomial (IEEE 802.3, reflected)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32_POLYNOMIAL : crc >> 1;
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

}  // namespace

auto checksum::crc32_update(uint32_t crc, std::span<const std::byte> data) -> uint32_t {
    uint32_t value = ~crc;
    for (auto b : data) {
        value = CRC32_TABLE[(value ^ static_cast<uint8_t>(b)) & 0xFF] ^ (value >> 8);
    }
    return ~value;
}

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    return crc32_update(0, data);
}

auto checksum::verify_crc32(std::span<const std::byte> data, uint32_t expected) -> bool {
    return crc32(data) == expected;
}

auto checksum::frame_sum(std::span<const uint8_t> data) -> uint16_t {
    uint32_t sum = 0;
    for (auto b : data) {
        sum += b;
    }
    return static_cast<uint16_t>(sum & 0xFFFF);
}

}  // namespace kcenon::p2p_convert
