/**
 * @file checksum.h
 * @brief Checksum utilities for chunk and frame integrity
 */

#ifndef KCENON_P2P_CONVERT_CORE_CHECKSUM_H
#define KCENON_P2P_CONVERT_CORE_CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <span>

namespace kcenon::p2p_convert {

/**
 * @brief Checksum utilities
 *
 * - CRC32 (IEEE 802.3) protects each chunk payload end to end
 * - A 16-bit additive sum protects each wire frame
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 checksum of data
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Continue a CRC32 computation over another block
     * @param crc Value returned by a previous crc32 / crc32_update call
     */
    [[nodiscard]] static auto crc32_update(uint32_t crc, std::span<const std::byte> data)
        -> uint32_t;

    [[nodiscard]] static auto verify_crc32(std::span<const std::byte> data,
                                           uint32_t expected) -> bool;

    /**
     * @brief Sum of all bytes modulo 65536
     */
    [[nodiscard]] static auto frame_sum(std::span<const uint8_t> data) -> uint16_t;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_CHECKSUM_H
