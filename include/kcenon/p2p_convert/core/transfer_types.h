/**
 * @file transfer_types.h
 * @brief Transfer-related data structures for p2p_convert_system
 * @version 0.1.0
 *
 * Request and response descriptors exchanged between peers, the transfer
 * status set, and the result handed back to callers of the sender.
 */

#ifndef KCENON_P2P_CONVERT_CORE_TRANSFER_TYPES_H
#define KCENON_P2P_CONVERT_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "chunk_types.h"
#include "error_codes.h"

namespace kcenon::p2p_convert {

/**
 * @brief Protocol identifier negotiated when a stream is opened
 */
inline constexpr std::string_view protocol_id = "/convert/1.0.0";

/**
 * @brief Transfer status enumeration
 *
 * Forward path: connecting -> negotiating -> sending -> waiting_response ->
 * completed. failed and cancelled are reachable from any non-terminal status.
 */
enum class transfer_status : uint8_t {
    connecting,
    negotiating,
    sending,
    waiting_response,
    completed,
    failed,
    cancelled,
};

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept
    -> std::string_view {
    switch (status) {
        case transfer_status::connecting:
            return "connecting";
        case transfer_status::negotiating:
            return "negotiating";
        case transfer_status::sending:
            return "sending";
        case transfer_status::waiting_response:
            return "waiting_response";
        case transfer_status::completed:
            return "completed";
        case transfer_status::failed:
            return "failed";
        case transfer_status::cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

/**
 * @brief Check if transfer status is terminal (final)
 */
[[nodiscard]] constexpr auto is_terminal_status(transfer_status status) noexcept -> bool {
    return status == transfer_status::completed || status == transfer_status::failed ||
           status == transfer_status::cancelled;
}

/**
 * @brief File formats understood by the conversion layer
 */
enum class file_format : uint8_t {
    unknown = 0,
    pdf = 1,
    text = 2,
};

[[nodiscard]] constexpr auto to_string(file_format format) noexcept -> std::string_view {
    switch (format) {
        case file_format::pdf:
            return "PDF";
        case file_format::text:
            return "Text";
        default:
            return "Unknown";
    }
}

using duration = std::chrono::milliseconds;
using steady_time = std::chrono::steady_clock::time_point;

/**
 * @brief Reachable remote peer
 */
struct peer_address {
    std::string peer_id;  // Opaque identity
    std::string address;  // Transport address, e.g. "host:port"

    peer_address() = default;
    peer_address(std::string id, std::string addr = {})
        : peer_id(std::move(id)), address(std::move(addr)) {}

    [[nodiscard]] auto to_string() const -> std::string {
        return address.empty() ? peer_id : peer_id + "@" + address;
    }

    [[nodiscard]] auto operator==(const peer_address& other) const noexcept -> bool = default;
};

/**
 * @brief Immutable descriptor of one send, created once per send call
 */
struct transfer_request {
    transfer_id id;
    std::string filename;
    uint64_t file_size = 0;
    file_format source_format = file_format::unknown;
    std::optional<std::string> target_format;
    bool return_result = false;
    uint64_t chunk_count = 0;
};

/**
 * @brief Final answer from the receiving peer
 */
struct transfer_response {
    transfer_id id;
    bool success = false;
    std::optional<std::string> error;
    std::optional<byte_buffer> converted_data;
    std::optional<std::string> converted_filename;
    uint64_t processing_time_ms = 0;

    [[nodiscard]] static auto rejected(const transfer_id& tid, std::string reason)
        -> transfer_response {
        transfer_response response;
        response.id = tid;
        response.success = false;
        response.error = std::move(reason);
        return response;
    }
};

/**
 * @brief Outcome handed to callers of wait_for_completion
 */
struct send_result {
    transfer_id id;
    bool success = false;
    uint64_t bytes_sent = 0;
    duration elapsed{0};
    std::optional<std::string> error;
    std::optional<transfer_response> response;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_TRANSFER_TYPES_H
