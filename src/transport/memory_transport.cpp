/**
 * @file memory_transport.cpp
 * @brief In-process transport implementation
 */

#include "kcenon/p2p_convert/transport/memory_transport.h"
#include "kcenon/p2p_convert/core/logging.h"

#include <condition_variable>
#include <deque>
#include <thread>

namespace kcenon::p2p_convert {

// ============================================================================
// memory_network
// ============================================================================

auto memory_network::create() -> std::shared_ptr<memory_network> {
    return std::shared_ptr<memory_network>(new memory_network());
}

void memory_network::set_dial_failures(const std::string& peer_id, uint32_t count) {
    std::lock_guard lock(mutex_);
    if (count == 0) {
        dial_failures_.erase(peer_id);
    } else {
        dial_failures_[peer_id] = count;
    }
}

void memory_network::set_reachable(const std::string& peer_id, bool reachable) {
    std::lock_guard lock(mutex_);
    if (reachable) {
        unreachable_.erase(peer_id);
    } else {
        unreachable_.insert(peer_id);
    }
}

void memory_network::set_send_delay(duration delay) {
    std::lock_guard lock(mutex_);
    send_delay_ = delay;
}

auto memory_network::send_delay() const -> duration {
    std::lock_guard lock(mutex_);
    return send_delay_;
}

auto memory_network::messages_sent() const -> uint64_t {
    return messages_sent_.load();
}

auto memory_network::dial_attempts() const -> uint64_t {
    return dial_attempts_.load();
}

auto memory_network::attach(const std::string& peer_id, std::weak_ptr<memory_transport> transport)
    -> result<void> {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it != peers_.end() && !it->second.expired()) {
        return unexpected{error{error_code::already_initialized,
                                "Peer id already attached: " + peer_id}};
    }
    peers_[peer_id] = std::move(transport);
    return {};
}

void memory_network::detach(const std::string& peer_id) {
    std::lock_guard lock(mutex_);
    auto it = peers_.find(peer_id);
    if (it != peers_.end() && it->second.expired()) {
        peers_.erase(it);
    }
}

auto memory_network::resolve(const std::string& peer_id, bool dialing)
    -> result<std::shared_ptr<memory_transport>> {
    std::lock_guard lock(mutex_);
    if (dialing) {
        dial_attempts_.fetch_add(1);
        if (auto it = dial_failures_.find(peer_id); it != dial_failures_.end()) {
            if (--it->second == 0) {
                dial_failures_.erase(it);
            }
            return unexpected{error{error_code::connection_failed,
                                    "Injected dial failure for peer " + peer_id}};
        }
        if (unreachable_.count(peer_id) > 0) {
            return unexpected{error{error_code::connection_timeout,
                                    "Peer " + peer_id + " is unreachable"}};
        }
    }

    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return unexpected{error{error_code::connection_refused, "No peer listening as " + peer_id}};
    }
    auto transport = it->second.lock();
    if (!transport) {
        peers_.erase(it);
        return unexpected{error{error_code::connection_refused, "No peer listening as " + peer_id}};
    }
    return transport;
}

// ============================================================================
// memory_transport
// ============================================================================

struct memory_transport::channel {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::vector<uint8_t>> messages;
    bool closed = false;

    void close() {
        {
            std::lock_guard lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }
};

struct memory_transport::stream_end {
    stream_handle handle = 0;
    connection_handle connection = 0;
    peer_address remote;
    std::shared_ptr<channel> inbound;
    std::shared_ptr<channel> outbound;
};

memory_transport::memory_transport(std::shared_ptr<memory_network> network, peer_address local)
    : network_(std::move(network)), local_(std::move(local)) {}

auto memory_transport::create(std::shared_ptr<memory_network> network, peer_address local)
    -> result<std::shared_ptr<memory_transport>> {
    if (!network) {
        return unexpected{error{error_code::invalid_configuration, "Memory network is null"}};
    }
    if (local.peer_id.empty()) {
        return unexpected{error{error_code::invalid_configuration, "Peer id must not be empty"}};
    }

    auto transport = std::shared_ptr<memory_transport>(new memory_transport(network, local));
    if (auto attached = network->attach(local.peer_id, transport); !attached) {
        return unexpected{attached.error()};
    }

    P2PC_LOG_DEBUG(log_category::transport, "Memory transport attached as " + local.to_string());
    return transport;
}

memory_transport::~memory_transport() {
    std::unordered_map<stream_handle, std::shared_ptr<stream_end>> streams;
    {
        std::lock_guard lock(mutex_);
        streams.swap(streams_);
        connections_.clear();
    }
    for (auto& [handle, end] : streams) {
        end->inbound->close();
        end->outbound->close();
    }
    network_->detach(local_.peer_id);
}

auto memory_transport::type() const -> std::string_view {
    return "memory";
}

auto memory_transport::dial(const peer_address& peer, duration timeout)
    -> result<connection_handle> {
    auto remote = network_->resolve(peer.peer_id, true);
    if (!remote) {
        P2PC_LOG_DEBUG(log_category::transport,
                       "Dial to " + peer.to_string() + " failed: " + remote.error().message);
        emit(transport_event{transport_event_type::outbound_failure, peer, 0,
                             remote.error().message});
        return unexpected{remote.error()};
    }
    (void)timeout;  // Resolution is immediate

    const auto handle = network_->next_handle();
    {
        std::lock_guard lock(mutex_);
        connections_.emplace(handle, peer);
    }

    P2PC_LOG_DEBUG(log_category::transport, "Connected to " + peer.to_string() +
                                                " (connection " + std::to_string(handle) + ")");
    emit(transport_event{transport_event_type::established, peer, handle, {}});
    return handle;
}

auto memory_transport::close(connection_handle connection) -> result<void> {
    peer_address remote;
    std::vector<std::shared_ptr<stream_end>> closing;
    {
        std::lock_guard lock(mutex_);
        auto it = connections_.find(connection);
        if (it == connections_.end()) {
            return unexpected{error{error_code::connection_lost,
                                    "Unknown connection " + std::to_string(connection)}};
        }
        remote = it->second;
        connections_.erase(it);

        for (auto s = streams_.begin(); s != streams_.end();) {
            if (s->second->connection == connection) {
                closing.push_back(s->second);
                s = streams_.erase(s);
            } else {
                ++s;
            }
        }
    }

    for (const auto& end : closing) {
        end->inbound->close();
        end->outbound->close();
    }

    emit(transport_event{transport_event_type::closed, remote, connection, {}});
    return {};
}

auto memory_transport::open_stream(connection_handle connection, std::string_view protocol)
    -> result<stream_handle> {
    peer_address remote_address;
    {
        std::lock_guard lock(mutex_);
        auto it = connections_.find(connection);
        if (it == connections_.end()) {
            return unexpected{error{error_code::connection_lost,
                                    "Unknown connection " + std::to_string(connection)}};
        }
        remote_address = it->second;
    }

    auto remote = network_->resolve(remote_address.peer_id, false);
    if (!remote) {
        return unexpected{error{error_code::connection_lost,
                                "Peer " + remote_address.peer_id +
                                    " went away: " + remote.error().message}};
    }

    auto to_remote = std::make_shared<channel>();
    auto to_local = std::make_shared<channel>();
    const auto handle = network_->next_handle();

    auto local_end = std::make_shared<stream_end>();
    local_end->handle = handle;
    local_end->connection = connection;
    local_end->remote = remote_address;
    local_end->inbound = to_local;
    local_end->outbound = to_remote;

    auto remote_end = std::make_shared<stream_end>();
    remote_end->handle = handle;
    remote_end->remote = local_;
    remote_end->inbound = to_remote;
    remote_end->outbound = to_local;

    {
        std::lock_guard lock(mutex_);
        streams_.emplace(handle, local_end);
    }

    if (auto accepted = remote.value()->accept_stream(handle, remote_end, local_, protocol);
        !accepted) {
        std::lock_guard lock(mutex_);
        streams_.erase(handle);
        return unexpected{accepted.error()};
    }
    return handle;
}

auto memory_transport::accept_stream(stream_handle handle, std::shared_ptr<stream_end> end,
                                     const peer_address& from, std::string_view protocol)
    -> result<void> {
    inbound_stream_callback callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = inbound_callback_;
    }
    if (!callback || protocol != protocol_id) {
        return unexpected{error{error_code::protocol_mismatch,
                                "Peer " + local_.peer_id + " does not serve protocol " +
                                    std::string(protocol)}};
    }

    {
        std::lock_guard lock(mutex_);
        streams_.emplace(handle, std::move(end));
    }
    callback(handle, from);
    return {};
}

auto memory_transport::find_stream(stream_handle handle) const -> std::shared_ptr<stream_end> {
    std::lock_guard lock(mutex_);
    auto it = streams_.find(handle);
    return it == streams_.end() ? nullptr : it->second;
}

auto memory_transport::send(stream_handle stream, std::span<const uint8_t> message)
    -> result<void> {
    auto end = find_stream(stream);
    if (!end) {
        return unexpected{error{error_code::stream_error,
                                "Unknown stream " + std::to_string(stream)}};
    }

    const auto delay = network_->send_delay();
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    {
        std::lock_guard lock(end->outbound->mutex);
        if (end->outbound->closed) {
            return unexpected{error{error_code::send_failed,
                                    "Stream " + std::to_string(stream) + " is closed"}};
        }
        end->outbound->messages.emplace_back(message.begin(), message.end());
    }
    end->outbound->cv.notify_one();
    network_->count_message();
    return {};
}

auto memory_transport::receive(stream_handle stream, duration timeout)
    -> result<std::vector<uint8_t>> {
    auto end = find_stream(stream);
    if (!end) {
        return unexpected{error{error_code::stream_error,
                                "Unknown stream " + std::to_string(stream)}};
    }

    auto& in = *end->inbound;
    std::unique_lock lock(in.mutex);
    if (!in.cv.wait_for(lock, timeout, [&in] { return !in.messages.empty() || in.closed; })) {
        return unexpected{error{error_code::receive_timeout,
                                "No message within " + std::to_string(timeout.count()) + "ms"}};
    }
    if (in.messages.empty()) {
        return unexpected{error{error_code::connection_lost,
                                "Stream " + std::to_string(stream) + " closed by peer"}};
    }

    auto message = std::move(in.messages.front());
    in.messages.pop_front();
    return message;
}

auto memory_transport::close_stream(stream_handle stream) -> result<void> {
    std::shared_ptr<stream_end> end;
    {
        std::lock_guard lock(mutex_);
        auto it = streams_.find(stream);
        if (it == streams_.end()) {
            return unexpected{error{error_code::stream_error,
                                    "Unknown stream " + std::to_string(stream)}};
        }
        end = it->second;
        streams_.erase(it);
    }

    // Pending inbound messages stay readable by the peer until drained
    end->outbound->close();
    end->inbound->close();
    return {};
}

void memory_transport::on_event(transport_event_callback callback) {
    std::lock_guard lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

void memory_transport::on_inbound_stream(inbound_stream_callback callback) {
    std::lock_guard lock(callback_mutex_);
    inbound_callback_ = std::move(callback);
}

auto memory_transport::open_stream_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return streams_.size();
}

void memory_transport::emit(const transport_event& event) {
    transport_event_callback callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = event_callback_;
    }
    if (callback) {
        callback(event);
    }
}

}  // namespace kcenon::p2p_convert
