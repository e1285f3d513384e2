/**
 * @file transport_interface.h
 * @brief Peer transport abstraction
 * @version 0.1.0
 *
 * The sender and receiver talk to peers exclusively through this interface,
 * which lets the in-memory transport stand in for a real network in tests.
 */

#ifndef KCENON_P2P_CONVERT_TRANSPORT_TRANSPORT_INTERFACE_H
#define KCENON_P2P_CONVERT_TRANSPORT_TRANSPORT_INTERFACE_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/p2p_convert/core/transfer_types.h"
#include "kcenon/p2p_convert/core/types.h"

namespace kcenon::p2p_convert {

using connection_handle = uint64_t;
using stream_handle = uint64_t;

/**
 * @brief Transport event types
 */
enum class transport_event_type {
    established,       ///< Outbound connection established
    closed,            ///< Connection closed
    outbound_failure,  ///< Dial failed
};

[[nodiscard]] constexpr auto to_string(transport_event_type type) -> const char* {
    switch (type) {
        case transport_event_type::established: return "established";
        case transport_event_type::closed: return "closed";
        case transport_event_type::outbound_failure: return "outbound_failure";
        default: return "unknown";
    }
}

/**
 * @brief Transport event data
 */
struct transport_event {
    transport_event_type type = transport_event_type::established;
    peer_address peer;
    connection_handle connection = 0;
    std::string detail;
};

using transport_event_callback = std::function<void(const transport_event&)>;

/**
 * @brief Invoked for every stream a remote peer opens towards us
 *
 * Runs on the transport's thread; handlers must hand the stream off to a
 * worker instead of serving it inline.
 */
using inbound_stream_callback =
    std::function<void(stream_handle stream, const peer_address& remote)>;

/**
 * @brief Message-oriented peer transport
 *
 * One send() corresponds to exactly one receive() on the other end of the
 * stream.
 *
 * @code
 * auto conn = transport->dial(peer, std::chrono::seconds(5));
 * if (conn) {
 *     auto stream = transport->open_stream(conn.value(), protocol_id);
 *     ...
 * }
 * @endcode
 */
class peer_transport {
public:
    peer_transport() = default;
    virtual ~peer_transport() = default;

    // Non-copyable
    peer_transport(const peer_transport&) = delete;
    auto operator=(const peer_transport&) -> peer_transport& = delete;

    /**
     * @brief Get the transport type identifier (e.g. "memory", "tcp")
     */
    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    // ========================================================================
    // Connection Management
    // ========================================================================

    /**
     * @brief Establish a connection to @p peer
     * @return connection_failed, connection_refused or connection_timeout on
     *         failure
     */
    [[nodiscard]] virtual auto dial(const peer_address& peer, duration timeout)
        -> result<connection_handle> = 0;

    /**
     * @brief Close a connection and every stream opened on it
     */
    virtual auto close(connection_handle connection) -> result<void> = 0;

    // ========================================================================
    // Streams
    // ========================================================================

    /**
     * @brief Open a stream speaking @p protocol on an established connection
     * @return protocol_mismatch if the peer does not serve @p protocol
     */
    [[nodiscard]] virtual auto open_stream(connection_handle connection,
                                           std::string_view protocol)
        -> result<stream_handle> = 0;

    /**
     * @brief Send one message on a stream
     */
    [[nodiscard]] virtual auto send(stream_handle stream, std::span<const uint8_t> message)
        -> result<void> = 0;

    /**
     * @brief Receive the next message on a stream
     * @return receive_timeout when nothing arrives in time, connection_lost
     *         when the stream was closed
     */
    [[nodiscard]] virtual auto receive(stream_handle stream, duration timeout)
        -> result<std::vector<uint8_t>> = 0;

    virtual auto close_stream(stream_handle stream) -> result<void> = 0;

    // ========================================================================
    // Callbacks
    // ========================================================================

    virtual void on_event(transport_event_callback callback) = 0;

    virtual void on_inbound_stream(inbound_stream_callback callback) = 0;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_TRANSPORT_TRANSPORT_INTERFACE_H
