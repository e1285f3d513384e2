/**
 * @file chunk_types.h
 * @brief Transfer identifier and chunk data structures
 * @version 0.1.0
 *
 * A transfer is split into ordered chunks. The chunk index is the only
 * ordering key; chunks may arrive in any order at the receiver.
 */

#ifndef KCENON_P2P_CONVERT_CORE_CHUNK_TYPES_H
#define KCENON_P2P_CONVERT_CORE_CHUNK_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::p2p_convert {

/**
 * @brief Raw byte buffer used for file payloads
 */
using byte_buffer = std::vector<std::byte>;

/**
 * @brief Unique identifier for a transfer (16-byte UUID)
 */
struct transfer_id {
    std::array<uint8_t, 16> bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

    constexpr transfer_id() noexcept = default;

    explicit constexpr transfer_id(const std::array<uint8_t, 16>& b) noexcept
        : bytes(b) {}

    /**
     * @brief Generate a new random transfer ID (RFC 4122 version 4)
     */
    [[nodiscard]] static auto generate() -> transfer_id;

    /**
     * @brief Convert to string representation (UUID format)
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief First eight characters of the UUID, for display only
     */
    [[nodiscard]] auto short_string() const -> std::string;

    /**
     * @brief Parse from UUID string
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<transfer_id>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const transfer_id& other) const
        noexcept -> bool = default;

    [[nodiscard]] constexpr auto operator<(const transfer_id& other) const
        noexcept -> bool {
        return bytes < other.bytes;
    }
};

/**
 * @brief One ordered slice of a transfer payload
 */
struct chunk {
    transfer_id id;
    uint64_t index = 0;
    byte_buffer data;
    bool is_final = false;
    uint32_t checksum = 0;  // CRC32 of data

    chunk() = default;

    chunk(const transfer_id& tid, uint64_t idx, byte_buffer d, bool final_chunk,
          uint32_t crc)
        : id(tid), index(idx), data(std::move(d)), is_final(final_chunk), checksum(crc) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return data.size(); }
};

}  // namespace kcenon::p2p_convert

// Hash support for transfer_id
template <>
struct std::hash<kcenon::p2p_convert::transfer_id> {
    auto operator()(const kcenon::p2p_convert::transfer_id& id) const noexcept
        -> std::size_t {
        std::size_t result = 0;
        for (std::size_t i = 0; i < 16; i += sizeof(std::size_t)) {
            std::size_t block = 0;
            for (std::size_t j = 0; j < sizeof(std::size_t) && (i + j) < 16; ++j) {
                block |= static_cast<std::size_t>(id.bytes[i + j]) << (j * 8);
            }
            result ^= block + 0x9e3779b9 + (result << 6) + (result >> 2);
        }
        return result;
    }
};

#endif  // KCENON_P2P_CONVERT_CORE_CHUNK_TYPES_H
