/**
 * @file memory_transport.h
 * @brief In-process transport over a shared hub
 * @version 0.1.0
 *
 * Every memory_transport registers itself on a memory_network under its
 * peer id. Dialing another peer id on the same hub yields a connection whose
 * streams are pairs of in-memory message queues.
 *
 * The hub supports fault injection:
 * - set_dial_failures(): fail the next N dials to a peer
 * - set_reachable(): make a peer time out on every dial
 * - set_send_delay(): delay every message by a fixed duration
 */

#ifndef KCENON_P2P_CONVERT_TRANSPORT_MEMORY_TRANSPORT_H
#define KCENON_P2P_CONVERT_TRANSPORT_MEMORY_TRANSPORT_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "transport_interface.h"

namespace kcenon::p2p_convert {

class memory_transport;

/**
 * @brief Shared hub connecting memory transports
 */
class memory_network {
public:
    [[nodiscard]] static auto create() -> std::shared_ptr<memory_network>;

    /**
     * @brief Fail the next @p count dials to @p peer_id with connection_failed
     */
    void set_dial_failures(const std::string& peer_id, uint32_t count);

    /**
     * @brief Make dials to @p peer_id fail with connection_timeout
     */
    void set_reachable(const std::string& peer_id, bool reachable);

    /**
     * @brief Delay applied to every message sent on any stream
     */
    void set_send_delay(duration delay);

    [[nodiscard]] auto send_delay() const -> duration;

    /**
     * @brief Total messages delivered through the hub
     */
    [[nodiscard]] auto messages_sent() const -> uint64_t;

    [[nodiscard]] auto dial_attempts() const -> uint64_t;

private:
    friend class memory_transport;

    memory_network() = default;

    auto attach(const std::string& peer_id, std::weak_ptr<memory_transport> transport)
        -> result<void>;
    void detach(const std::string& peer_id);

    /**
     * @brief Resolve @p peer_id, applying injected faults when dialing
     */
    auto resolve(const std::string& peer_id, bool dialing)
        -> result<std::shared_ptr<memory_transport>>;

    auto next_handle() -> uint64_t { return next_handle_.fetch_add(1); }
    void count_message() { messages_sent_.fetch_add(1); }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<memory_transport>> peers_;
    std::unordered_map<std::string, uint32_t> dial_failures_;
    std::unordered_set<std::string> unreachable_;
    duration send_delay_{0};

    std::atomic<uint64_t> next_handle_{1};
    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> dial_attempts_{0};
};

/**
 * @brief peer_transport implementation backed by a memory_network
 */
class memory_transport : public peer_transport {
public:
    /**
     * @brief Create a transport and attach it to @p network as @p local
     * @return already_initialized if the peer id is taken
     */
    [[nodiscard]] static auto create(std::shared_ptr<memory_network> network,
                                     peer_address local)
        -> result<std::shared_ptr<memory_transport>>;

    ~memory_transport() override;

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

    void on_inbound_stream(inbound_stream_callback callback) override;

    [[nodiscard]] auto local_address() const -> const peer_address& { return local_; }

    [[nodiscard]] auto open_stream_count() const -> std::size_t;

private:
    struct channel;
    struct stream_end;

    memory_transport(std::shared_ptr<memory_network> network, peer_address local);

    /**
     * @brief Register the remote half of a stream opened by another peer
     */
    auto accept_stream(stream_handle handle, std::shared_ptr<stream_end> end,
                       const peer_address& from, std::string_view protocol) -> result<void>;

    auto find_stream(stream_handle handle) const -> std::shared_ptr<stream_end>;
    void emit(const transport_event& event);

    std::shared_ptr<memory_network> network_;
    peer_address local_;

    mutable std::mutex mutex_;
    std::unordered_map<connection_handle, peer_address> connections_;
    std::unordered_map<stream_handle, std::shared_ptr<stream_end>> streams_;

    std::mutex callback_mutex_;
    transport_event_callback event_callback_;
    inbound_stream_callback inbound_callback_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_TRANSPORT_MEMORY_TRANSPORT_H
