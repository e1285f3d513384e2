/**
 * @file tcp_transport.h
 * @brief Outbound TCP transport on network_system
 * @version 0.1.0
 *
 * Each dial opens one network_system messaging_client connection carrying a
 * single protocol stream. Inbound streams are not served by this transport.
 */

#ifndef KCENON_P2P_CONVERT_TRANSPORT_TCP_TRANSPORT_H
#define KCENON_P2P_CONVERT_TRANSPORT_TCP_TRANSPORT_H

#include <memory>
#include <optional>
#include <utility>

#include "transport_interface.h"

namespace kcenon::p2p_convert {

/**
 * @brief TCP transport configuration
 */
struct tcp_transport_config {
    /// Connection establishment timeout
    duration connect_timeout{std::chrono::seconds(10)};

    /// Client identifier handed to network_system
    std::string client_id = "p2p_convert";

    [[nodiscard]] auto validate() const -> result<void> {
        if (connect_timeout.count() <= 0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "connect_timeout must be positive"}};
        }
        return {};
    }
};

/**
 * @brief Split "host:port" into its parts
 * @return nullopt when the port is missing or out of range
 */
[[nodiscard]] auto parse_host_port(const std::string& address)
    -> std::optional<std::pair<std::string, uint16_t>>;

/**
 * @brief TCP transport implementation
 *
 * @code
 * auto transport = tcp_peer_transport::create();
 * auto conn = transport->dial(peer_address{"receiver", "127.0.0.1:9000"},
 *                             std::chrono::seconds(5));
 * @endcode
 */
class tcp_peer_transport : public peer_transport {
public:
    [[nodiscard]] static auto create(const tcp_transport_config& config = {})
        -> std::unique_ptr<tcp_peer_transport>;

    ~tcp_peer_transport() override;

    [[nodiscard]] auto type() const -> std::string_view override;

    [[nodiscard]] auto dial(const peer_address& peer, duration timeout)
        -> result<connection_handle> override;

    auto close(connection_handle connection) -> result<void> override;

    [[nodiscard]] auto open_stream(connection_handle connection, std::string_view protocol)
        -> result<stream_handle> override;

    [[nodiscard]] auto send(stream_handle stream, std::span<const uint8_t> message)
        -> result<void> override;

    [[nodiscard]] auto receive(stream_handle stream, duration timeout)
        -> result<std::vector<uint8_t>> override;

    auto close_stream(stream_handle stream) -> result<void> override;

    void on_event(transport_event_callback callback) override;

    /**
     * @brief Not supported; inbound connections are never accepted
     */
    void on_inbound_stream(inbound_stream_callback callback) override;

private:
    explicit tcp_peer_transport(tcp_transport_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_TRANSPORT_TCP_TRANSPORT_H
