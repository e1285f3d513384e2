/**
 * @file protocol_types.h
 * @brief Wire protocol message types and frame layout
 * @version 0.1.0
 *
 * All multi-byte fields use big-endian byte order for network transmission.
 *
 * Frame layout:
 * @code
 * +--------+------+-------------+---------+----------+-------------+
 * | magic  | type | payload_len | payload | checksum | length_echo |
 * | 4 B    | 1 B  | 4 B         | N B     | 2 B      | 2 B         |
 * +--------+------+-------------+---------+----------+-------------+
 * @endcode
 *
 * checksum is the sum of every header and payload byte modulo 65536;
 * length_echo repeats the low 16 bits of payload_len.
 */

#ifndef KCENON_P2P_CONVERT_CORE_PROTOCOL_TYPES_H
#define KCENON_P2P_CONVERT_CORE_PROTOCOL_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "chunk_types.h"

namespace kcenon::p2p_convert {

/**
 * @brief Protocol magic number ("P2PC")
 */
inline constexpr uint32_t protocol_magic = 0x50325043;

/**
 * @brief Message type enumeration
 *
 * - 0x10-0x1F: Transfer negotiation
 * - 0x20-0x2F: Data transfer
 * - 0xF0-0xFF: Control/Error
 */
enum class message_type : uint8_t {
    // Transfer negotiation (0x10-0x1F)
    transfer_request = 0x10,
    transfer_accept = 0x11,
    transfer_response = 0x13,

    // Data transfer (0x20-0x2F)
    chunk_data = 0x20,

    // Control/Error (0xF0-0xFF)
    error = 0xFF,
};

[[nodiscard]] constexpr auto to_string(message_type type) noexcept -> std::string_view {
    switch (type) {
        case message_type::transfer_request:
            return "TRANSFER_REQUEST";
        case message_type::transfer_accept:
            return "TRANSFER_ACCEPT";
        case message_type::transfer_response:
            return "TRANSFER_RESPONSE";
        case message_type::chunk_data:
            return "CHUNK_DATA";
        case message_type::error:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

[[nodiscard]] constexpr auto is_known_message_type(uint8_t value) noexcept -> bool {
    switch (static_cast<message_type>(value)) {
        case message_type::transfer_request:
        case message_type::transfer_accept:
        case message_type::transfer_response:
        case message_type::chunk_data:
        case message_type::error:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Frame size constants
 */
struct frame_layout {
    static constexpr std::size_t header_size = 9;   // magic + type + payload_len
    static constexpr std::size_t trailer_size = 4;  // checksum + length_echo
    static constexpr std::size_t overhead = header_size + trailer_size;

    /// Largest accepted payload (a converted document can exceed the chunk size)
    static constexpr std::size_t max_payload_size = 256ULL * 1024 * 1024;
};

/**
 * @brief One decoded frame
 */
struct frame {
    message_type type = message_type::error;
    std::vector<uint8_t> payload;
};

/**
 * @brief Sent by the receiver once a transfer_request is accepted
 */
struct transfer_accept {
    transfer_id id;
};

/**
 * @brief Protocol-level error report
 */
struct error_message {
    transfer_id id;
    int32_t code = 0;
    std::string message;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_PROTOCOL_TYPES_H
