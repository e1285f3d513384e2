/**
 * @file tcp_transport.cpp
 * @brief TCP transport implementation
 */

#include "kcenon/p2p_convert/transport/tcp_transport.h"
#include "kcenon/p2p_convert/core/logging.h"
#include "kcenon/p2p_convert/core/wire_codec.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <unordered_map>

#include <kcenon/network/core/messaging_client.h>

namespace kcenon::p2p_convert {

auto parse_host_port(const std::string& address)
    -> std::optional<std::pair<std::string, uint16_t>> {
    const auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
        return std::nullopt;
    }

    uint32_t port = 0;
    for (std::size_t i = colon + 1; i < address.size(); ++i) {
        const char c = address[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        port = port * 10 + static_cast<uint32_t>(c - '0');
        if (port > 65535) {
            return std::nullopt;
        }
    }
    if (port == 0) {
        return std::nullopt;
    }
    return std::make_pair(address.substr(0, colon), static_cast<uint16_t>(port));
}

namespace {

/**
 * @brief One TCP connection carrying at most one protocol stream
 */
struct tcp_connection {
    peer_address remote;
    std::shared_ptr<network_system::core::messaging_client> client;
    bool stream_open = false;

    std::mutex receive_mutex;
    std::condition_variable receive_cv;
    frame_decoder decoder;
    std::deque<std::vector<uint8_t>> messages;
    std::optional<error> failure;
    bool closed = false;
};

}  // namespace

struct tcp_peer_transport::impl {
    tcp_transport_config config;

    std::mutex mutex;
    std::unordered_map<connection_handle, std::shared_ptr<tcp_connection>> connections;
    std::atomic<connection_handle> next_handle{1};

    std::mutex callback_mutex;
    transport_event_callback event_callback;

    explicit impl(tcp_transport_config cfg) : config(std::move(cfg)) {}

    auto find(connection_handle handle) -> std::shared_ptr<tcp_connection> {
        std::lock_guard lock(mutex);
        auto it = connections.find(handle);
        return it == connections.end() ? nullptr : it->second;
    }

    void emit(const transport_event& event) {
        transport_event_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = event_callback;
        }
        if (cb) {
            cb(event);
        }
    }

    static void on_bytes(tcp_connection& conn, const std::vector<uint8_t>& data) {
        {
            std::lock_guard lock(conn.receive_mutex);
            conn.decoder.feed(data);
            while (true) {
                auto next = conn.decoder.next();
                if (!next) {
                    conn.failure = next.error();
                    break;
                }
                if (!next.value()) {
                    break;
                }
                const auto& f = *next.value();
                conn.messages.push_back(wire_codec::encode_frame(f.type, f.payload));
            }
        }
        conn.receive_cv.notify_all();
    }
};

tcp_peer_transport::tcp_peer_transport(tcp_transport_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    get_logger().initialize();
    P2PC_LOG_DEBUG(log_category::transport, "TCP transport created");
}

tcp_peer_transport::~tcp_peer_transport() {
    std::vector<connection_handle> handles;
    {
        std::lock_guard lock(impl_->mutex);
        for (const auto& [handle, conn] : impl_->connections) {
            handles.push_back(handle);
        }
    }
    for (auto handle : handles) {
        if (auto closed = close(handle); !closed) {
            P2PC_LOG_WARN(log_category::transport,
                          "Closing connection " + std::to_string(handle) +
                              " failed: " + closed.error().message);
        }
    }
}

auto tcp_peer_transport::create(const tcp_transport_config& config)
    -> std::unique_ptr<tcp_peer_transport> {
    if (auto valid = config.validate(); !valid) {
        P2PC_LOG_ERROR(log_category::transport,
                       "Invalid TCP transport configuration: " + valid.error().message);
        return nullptr;
    }
    return std::unique_ptr<tcp_peer_transport>(new tcp_peer_transport(config));
}

auto tcp_peer_transport::type() const -> std::string_view {
    return "tcp";
}

auto tcp_peer_transport::dial(const peer_address& peer, duration timeout)
    -> result<connection_handle> {
    auto endpoint = parse_host_port(peer.address);
    if (!endpoint) {
        error err{error_code::connection_failed, "Invalid peer address: " + peer.address};
        impl_->emit(transport_event{transport_event_type::outbound_failure, peer, 0, err.message});
        return unexpected{err};
    }
    (void)timeout;  // messaging_client applies its own connect timeout

    auto conn = std::make_shared<tcp_connection>();
    conn->remote = peer;
    conn->client = std::make_shared<network_system::core::messaging_client>(impl_->config.client_id);

    P2PC_LOG_INFO(log_category::transport, "TCP transport connecting to " + peer.address);

    auto started = conn->client->start_client(endpoint->first, endpoint->second);
    if (started.is_err()) {
        error err{error_code::connection_failed, "Connection failed: " + started.error().message};
        P2PC_LOG_ERROR(log_category::transport, err.message);
        impl_->emit(transport_event{transport_event_type::outbound_failure, peer, 0, err.message});
        return unexpected{err};
    }

    std::weak_ptr<tcp_connection> weak = conn;
    conn->client->set_receive_callback([weak](const std::vector<uint8_t>& data) {
        if (auto c = weak.lock()) {
            impl::on_bytes(*c, data);
        }
    });

    const auto handle = impl_->next_handle.fetch_add(1);
    {
        std::lock_guard lock(impl_->mutex);
        impl_->connections.emplace(handle, conn);
    }

    P2PC_LOG_INFO(log_category::transport, "TCP transport connected to " + peer.address);
    impl_->emit(transport_event{transport_event_type::established, peer, handle, {}});
    return handle;
}

auto tcp_peer_transport::close(connection_handle connection) -> result<void> {
    std::shared_ptr<tcp_connection> conn;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->connections.find(connection);
        if (it == impl_->connections.end()) {
            return unexpected{error{error_code::connection_lost,
                                    "Unknown connection " + std::to_string(connection)}};
        }
        conn = it->second;
        impl_->connections.erase(it);
    }

    {
        std::lock_guard lock(conn->receive_mutex);
        conn->closed = true;
    }
    conn->receive_cv.notify_all();

    auto stopped = conn->client->stop_client();
    impl_->emit(transport_event{transport_event_type::closed, conn->remote, connection, {}});
    if (stopped.is_err()) {
        return unexpected{error{error_code::connection_lost,
                                "Disconnect failed: " + stopped.error().message}};
    }
    P2PC_LOG_INFO(log_category::transport, "TCP transport disconnected from " + conn->remote.address);
    return {};
}

auto tcp_peer_transport::open_stream(connection_handle connection, std::string_view protocol)
    -> result<stream_handle> {
    if (protocol != protocol_id) {
        return unexpected{error{error_code::protocol_mismatch,
                                "Unsupported protocol " + std::string(protocol)}};
    }

    auto conn = impl_->find(connection);
    if (!conn) {
        return unexpected{error{error_code::connection_lost,
                                "Unknown connection " + std::to_string(connection)}};
    }

    std::lock_guard lock(conn->receive_mutex);
    if (conn->stream_open) {
        return unexpected{error{error_code::stream_error,
                                "Connection " + std::to_string(connection) +
                                    " already carries a stream"}};
    }
    conn->stream_open = true;
    // The single stream shares the connection's handle
    return connection;
}

auto tcp_peer_transport::send(stream_handle stream, std::span<const uint8_t> message)
    -> result<void> {
    auto conn = impl_->find(stream);
    if (!conn) {
        return unexpected{error{error_code::stream_error,
                                "Unknown stream " + std::to_string(stream)}};
    }

    std::vector<uint8_t> data(message.begin(), message.end());
    auto sent = conn->client->send_packet(std::move(data));
    if (sent.is_err()) {
        return unexpected{error{error_code::send_failed, "Send failed: " + sent.error().message}};
    }
    return {};
}

auto tcp_peer_transport::receive(stream_handle stream, duration timeout)
    -> result<std::vector<uint8_t>> {
    auto conn = impl_->find(stream);
    if (!conn) {
        return unexpected{error{error_code::stream_error,
                                "Unknown stream " + std::to_string(stream)}};
    }

    std::unique_lock lock(conn->receive_mutex);
    const bool ready = conn->receive_cv.wait_for(lock, timeout, [&conn] {
        return !conn->messages.empty() || conn->failure.has_value() || conn->closed;
    });
    if (!ready) {
        return unexpected{error{error_code::receive_timeout, "Receive timeout"}};
    }
    if (!conn->messages.empty()) {
        auto message = std::move(conn->messages.front());
        conn->messages.pop_front();
        return message;
    }
    if (conn->failure) {
        return unexpected{*conn->failure};
    }
    return unexpected{error{error_code::connection_lost, "Connection lost"}};
}

auto tcp_peer_transport::close_stream(stream_handle stream) -> result<void> {
    auto conn = impl_->find(stream);
    if (!conn) {
        return unexpected{error{error_code::stream_error,
                                "Unknown stream " + std::to_string(stream)}};
    }
    std::lock_guard lock(conn->receive_mutex);
    conn->stream_open = false;
    conn->messages.clear();
    conn->decoder.reset();
    return {};
}

void tcp_peer_transport::on_event(transport_event_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->event_callback = std::move(callback);
}

void tcp_peer_transport::on_inbound_stream(inbound_stream_callback callback) {
    (void)callback;
    P2PC_LOG_WARN(log_category::transport,
                  "TCP transport is outbound only; inbound stream handler ignored");
}

}  // namespace kcenon::p2p_convert
