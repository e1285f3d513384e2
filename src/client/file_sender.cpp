/**
 * @file file_sender.cpp
 * @brief Sender orchestrator implementation
 */

#include "kcenon/p2p_convert/client/file_sender.h"

#include <kcenon/p2p_convert/adapters/thread_pool_adapter.h>
#include <kcenon/p2p_convert/conversion/format_detector.h>
#include <kcenon/p2p_convert/core/chunk_splitter.h>
#include <kcenon/p2p_convert/core/cleanup_reaper.h>
#include <kcenon/p2p_convert/core/logging.h>
#include <kcenon/p2p_convert/core/retry_controller.h>
#include <kcenon/p2p_convert/core/transfer_registry.h>
#include <kcenon/p2p_convert/core/wire_codec.h>

#include <array>
#include <condition_variable>
#include <fstream>
#include <future>
#include <mutex>
#include <unordered_map>

namespace kcenon::p2p_convert {

namespace {

/// Longest single blocking receive; bounds how late cancellation is noticed
constexpr std::chrono::milliseconds receive_slice{100};

auto cancelled_error() -> error {
    return error{error_code::transfer_cancelled, "Transfer was cancelled"};
}

/**
 * @brief Closes the stream and connection of one attempt on scope exit
 */
class attempt_channel {
public:
    attempt_channel(peer_transport& transport, connection_handle connection)
        : transport_(transport), connection_(connection) {}

    ~attempt_channel() {
        if (stream_) {
            if (auto closed = transport_.close_stream(*stream_); !closed) {
                P2PC_LOG_DEBUG(log_category::transport,
                               "close_stream: " + closed.error().message);
            }
        }
        if (auto closed = transport_.close(connection_); !closed) {
            P2PC_LOG_DEBUG(log_category::transport, "close: " + closed.error().message);
        }
    }

    attempt_channel(const attempt_channel&) = delete;
    auto operator=(const attempt_channel&) -> attempt_channel& = delete;

    void set_stream(stream_handle stream) { stream_ = stream; }

private:
    peer_transport& transport_;
    connection_handle connection_;
    std::optional<stream_handle> stream_;
};

/**
 * @brief Counts attempt functions still alive, including abandoned ones
 */
class attempt_tracker {
public:
    void acquire() {
        std::lock_guard lock(mutex_);
        ++count_;
    }

    void release() {
        std::lock_guard lock(mutex_);
        if (--count_ == 0) {
            idle_cv_.notify_all();
        }
    }

    auto wait_idle(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock lock(mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] { return count_ == 0; });
    }

    [[nodiscard]] auto count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return count_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t count_ = 0;
};

/**
 * @brief Holds an attempt_tracker slot for as long as any copy is alive
 */
class attempt_lease {
public:
    explicit attempt_lease(attempt_tracker& tracker) : tracker_(&tracker) { tracker_->acquire(); }
    attempt_lease(const attempt_lease& other) : tracker_(other.tracker_) { tracker_->acquire(); }
    auto operator=(const attempt_lease&) -> attempt_lease& = delete;
    ~attempt_lease() { tracker_->release(); }

private:
    attempt_tracker* tracker_;
};

/**
 * @brief Read enough of @p path for content detection
 */
auto read_head(const std::filesystem::path& path) -> result<byte_buffer> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "Failed to open file: " + path.string()}};
    }
    byte_buffer head(format_detector::sample_size + 1);
    file.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "Failed to read file: " + path.string()}};
    }
    head.resize(static_cast<std::size_t>(file.gcount()));
    return head;
}

auto make_log_context(const transfer_request& request, const peer_address& peer)
    -> transfer_log_context {
    transfer_log_context ctx;
    ctx.transfer_id = request.id.to_string();
    ctx.filename = request.filename;
    ctx.file_size = request.file_size;
    ctx.total_chunks = request.chunk_count;
    ctx.peer_id = peer.peer_id;
    ctx.peer_address = peer.address;
    return ctx;
}

}  // namespace

// ============================================================================
// file_sender::impl
// ============================================================================

struct file_sender::impl {
    sender_config config;
    std::shared_ptr<peer_transport> transport;
    std::shared_ptr<conversion_service> conversion;

    chunk_splitter splitter;
    transfer_registry registry;
    progress_notifier notifier;
    cleanup_reaper reaper;
    statistics_collector stats;
    std::shared_ptr<adapters::task_pool_interface> pool;

    std::mutex workers_mutex;
    std::unordered_map<transfer_id, std::future<void>> workers;
    std::atomic<bool> shutting_down{false};
    attempt_tracker attempts;

    mutable std::mutex responses_mutex;
    std::unordered_map<transfer_id, transfer_response> responses;

    impl(sender_config cfg, std::shared_ptr<peer_transport> t,
         std::shared_ptr<conversion_service> conv)
        : config(std::move(cfg)),
          transport(std::move(t)),
          conversion(std::move(conv)),
          splitter(chunk_config(config.chunk_size, config.max_file_size)),
          registry(config.max_concurrent_transfers),
          notifier(config.progress_queue_capacity),
          reaper(registry, config.reaper),
          pool(adapters::task_pool_factory::create(config.worker_count, "p2p_convert_sender")) {
        reaper.on_expired([this](const transfer_id& id) {
            if (auto snapshot = registry.get_snapshot(id)) {
                notifier.publish(*snapshot);
            }
        });
        reaper.on_evicted([this](const transfer_id& id) {
            std::lock_guard lock(responses_mutex);
            responses.erase(id);
        });
    }

    ~impl() { shutdown(); }

    void shutdown() {
        if (shutting_down.exchange(true)) {
            return;
        }

        for (const auto& state : registry.list_active()) {
            if (auto cancelled = registry.cancel(state.id()); cancelled) {
                notifier.publish(cancelled.value());
            }
        }

        std::unordered_map<transfer_id, std::future<void>> pending;
        {
            std::lock_guard lock(workers_mutex);
            pending.swap(workers);
        }
        for (auto& [id, worker] : pending) {
            if (!worker.valid()) {
                continue;
            }
            try {
                worker.get();
            } catch (const std::exception& e) {
                P2PC_LOG_ERROR(log_category::sender,
                               "Worker for " + id.short_string() + " failed: " + e.what());
            }
        }

        while (!attempts.wait_idle(std::chrono::seconds(1))) {
            P2PC_LOG_WARN(log_category::sender,
                          "Waiting for " + std::to_string(attempts.count()) +
                              " abandoned attempt(s) to return");
        }

        reaper.stop();
        if (!notifier.flush(std::chrono::seconds(1))) {
            P2PC_LOG_WARN(log_category::progress, "Progress queue not drained at shutdown");
        }
        notifier.stop();
        P2PC_LOG_INFO(log_category::sender, "Sender stopped");
    }

    void reap_finished_workers() {
        std::lock_guard lock(workers_mutex);
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                try {
                    it->second.get();
                } catch (const std::exception& e) {
                    P2PC_LOG_ERROR(log_category::sender, "Worker for " +
                                                             it->first.short_string() +
                                                             " failed: " + e.what());
                }
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    // ------------------------------------------------------------------------
    // State helpers
    // ------------------------------------------------------------------------

    /**
     * @brief Apply @p fn and publish the result
     *
     * A rejected mutation after cancellation or a stall is reported as
     * transfer_cancelled so the retry loop stops.
     */
    auto update(const transfer_id& id, const transfer_registry::mutation& fn,
                const attempt_context& ctx) -> result<void> {
        auto snapshot = registry.mutate(id, fn);
        if (!snapshot) {
            if (ctx.is_cancelled()) {
                return unexpected{cancelled_error()};
            }
            return unexpected{snapshot.error()};
        }
        notifier.publish(snapshot.value());
        return {};
    }

    auto transition(const transfer_id& id, transfer_status next, const attempt_context& ctx)
        -> result<void> {
        return update(id, [next](transfer_state& s) { return s.advance(next); }, ctx);
    }

    /**
     * @brief Receive and unwrap the next frame within the attempt deadline
     */
    auto receive_frame(stream_handle stream, const attempt_context& ctx, std::string_view what)
        -> result<frame> {
        while (true) {
            if (ctx.is_cancelled()) {
                return unexpected{cancelled_error()};
            }
            const auto remaining = ctx.remaining();
            if (ctx.expired() || remaining.count() == 0) {
                return unexpected{error{error_code::attempt_timeout,
                                        "Timed out waiting for " + std::string(what)}};
            }

            auto message = transport->receive(stream, std::min(remaining, receive_slice));
            if (message) {
                return wire_codec::decode_frame(message.value());
            }
            if (message.error().code != error_code::receive_timeout) {
                return unexpected{message.error()};
            }
        }
    }

    static auto peer_error(const frame& f) -> error {
        auto decoded = wire_codec::decode_error(f);
        if (!decoded) {
            return decoded.error();
        }
        return error{error_code::transfer_rejected,
                     "Peer reported error " + std::to_string(decoded.value().code) + ": " +
                         decoded.value().message};
    }

    // ------------------------------------------------------------------------
    // Attempt
    // ------------------------------------------------------------------------

    /**
     * @brief One complete exchange with the peer
     * @return The peer's response; a rejection is returned as a value so
     *         that it is not retried
     */
    auto run_attempt(const transfer_request& request, const peer_address& peer,
                     const std::filesystem::path& path, const attempt_context& ctx)
        -> result<transfer_response> {
        const auto& id = request.id;
        if (ctx.is_cancelled()) {
            return unexpected{cancelled_error()};
        }

        auto connection = transport->dial(peer, ctx.remaining());
        if (!connection) {
            return unexpected{connection.error()};
        }
        attempt_channel channel(*transport, connection.value());

        if (auto moved = transition(id, transfer_status::negotiating, ctx); !moved) {
            return unexpected{moved.error()};
        }

        auto stream = transport->open_stream(connection.value(), protocol_id);
        if (!stream) {
            return unexpected{stream.error()};
        }
        channel.set_stream(stream.value());

        auto encoded = wire_codec::encode(request);
        if (!encoded) {
            return unexpected{encoded.error()};
        }
        if (auto sent = transport->send(stream.value(), encoded.value()); !sent) {
            return unexpected{sent.error()};
        }

        auto reply = receive_frame(stream.value(), ctx, "transfer accept");
        if (!reply) {
            return unexpected{reply.error()};
        }
        switch (reply.value().type) {
            case message_type::transfer_accept: {
                auto accept = wire_codec::decode_accept(reply.value());
                if (!accept) {
                    return unexpected{accept.error()};
                }
                if (accept.value().id != id) {
                    return unexpected{error{error_code::transfer_id_mismatch,
                                            "Accept for " + accept.value().id.to_string() +
                                                " while negotiating " + id.to_string()}};
                }
                break;
            }
            case message_type::transfer_response: {
                auto rejection = wire_codec::decode_response(reply.value());
                if (!rejection) {
                    return unexpected{rejection.error()};
                }
                P2PC_LOG_WARN(log_category::sender,
                              "Transfer " + id.short_string() + " rejected by " + peer.peer_id +
                                  ": " + rejection.value().error.value_or("no reason given"));
                return rejection;
            }
            case message_type::error:
                return unexpected{peer_error(reply.value())};
            default:
                return unexpected{error{error_code::unexpected_message,
                                        "Unexpected " + std::string(to_string(reply.value().type)) +
                                            " while negotiating"}};
        }

        if (auto moved = transition(id, transfer_status::sending, ctx); !moved) {
            return unexpected{moved.error()};
        }

        if (auto streamed = stream_chunks(request, path, stream.value(), ctx); !streamed) {
            return unexpected{streamed.error()};
        }

        if (auto moved = transition(id, transfer_status::waiting_response, ctx); !moved) {
            return unexpected{moved.error()};
        }

        auto answer = receive_frame(stream.value(), ctx, "transfer response");
        if (!answer) {
            return unexpected{answer.error()};
        }
        if (answer.value().type == message_type::error) {
            return unexpected{peer_error(answer.value())};
        }
        auto response = wire_codec::decode_response(answer.value());
        if (!response) {
            return unexpected{response.error()};
        }
        if (response.value().id != id) {
            return unexpected{error{error_code::transfer_id_mismatch,
                                    "Response for " + response.value().id.to_string() +
                                        " while waiting for " + id.to_string()}};
        }
        return response;
    }

    auto stream_chunks(const transfer_request& request, const std::filesystem::path& path,
                       stream_handle stream, const attempt_context& ctx) -> result<void> {
        auto chunks = splitter.split(path, request.id);
        if (!chunks) {
            return unexpected{chunks.error()};
        }
        auto& iterator = chunks.value();
        if (iterator.total_chunks() != request.chunk_count) {
            return unexpected{error{error_code::file_read_error,
                                    "File changed since the transfer was requested: " +
                                        path.string()}};
        }

        while (iterator.has_next()) {
            if (ctx.is_cancelled()) {
                return unexpected{cancelled_error()};
            }
            if (ctx.expired()) {
                return unexpected{error{error_code::attempt_timeout,
                                        "Attempt deadline reached at chunk " +
                                            std::to_string(iterator.current_index())}};
            }

            auto next = iterator.next();
            if (!next) {
                return unexpected{next.error()};
            }
            const auto index = next.value().index;
            const auto size = static_cast<uint64_t>(next.value().size());

            auto encoded = wire_codec::encode(next.value());
            if (!encoded) {
                return unexpected{encoded.error()};
            }
            if (auto sent = transport->send(stream, encoded.value()); !sent) {
                return unexpected{sent.error()};
            }

            if (auto counted = update(
                    request.id,
                    [index, size](transfer_state& s) { return s.record_chunk_sent(index, size); },
                    ctx);
                !counted) {
                return counted;
            }
            stats.record_chunk(size);

            P2PC_LOG_TRACE(log_category::chunk, "Sent chunk " + std::to_string(index + 1) + "/" +
                                                    std::to_string(request.chunk_count) + " of " +
                                                    request.id.short_string());
        }
        return {};
    }

    // ------------------------------------------------------------------------
    // Transfer
    // ------------------------------------------------------------------------

    void run_transfer(const transfer_request& request, const peer_address& peer,
                      const std::filesystem::path& path, const cancellation_token& token) {
        auto log_ctx = make_log_context(request, peer);
        P2PC_LOG_INFO_CTX(log_category::sender, "Transfer started", log_ctx);

        retry_hooks hooks;
        hooks.on_attempt = [this, &request](uint32_t attempt) {
            auto snapshot =
                registry.mutate(request.id, [](transfer_state& s) { return s.begin_attempt(); });
            if (snapshot) {
                notifier.publish(snapshot.value());
            }
            P2PC_LOG_DEBUG(log_category::sender, "Transfer " + request.id.short_string() +
                                                     " attempt " + std::to_string(attempt));
        };
        hooks.on_retry = [this, &request](uint32_t, const error& err,
                                          std::chrono::milliseconds) {
            stats.record_retry(err);
            (void)registry.mutate(request.id, [&err](transfer_state& s) -> result<void> {
                s.set_last_error(err.message);
                return {};
            });
        };

        auto outcome = retry_controller::execute<transfer_response>(
            config.retry, token,
            [this, lease = attempt_lease(attempts), request, peer,
             path](const attempt_context& ctx) { return run_attempt(request, peer, path, ctx); },
            hooks);

        finalize(request, outcome, token, log_ctx);
    }

    auto settle(const transfer_id& id, const result<transfer_response>& outcome,
                const cancellation_token& token) -> result<transfer_state> {
        if (outcome) {
            const auto& response = outcome.value();
            {
                std::lock_guard lock(responses_mutex);
                responses.insert_or_assign(id, response);
            }
            if (response.success) {
                return registry.mutate(
                    id, [](transfer_state& s) { return s.advance(transfer_status::completed); });
            }
            auto reason = response.error.value_or("Transfer rejected by peer");
            return registry.mutate(id, [&reason](transfer_state& s) { return s.fail(reason); });
        }
        if (outcome.error().code == error_code::transfer_cancelled || token.is_cancelled()) {
            return registry.mutate(id, [](transfer_state& s) { return s.cancel(); });
        }
        const auto& reason = outcome.error().message;
        return registry.mutate(id, [&reason](transfer_state& s) { return s.fail(reason); });
    }

    /**
     * @brief Close the statistics entry of a terminal transfer
     *
     * A failure whose attempt saw cancellation was stalled out by the reaper
     * and counts as a timeout.
     */
    void record_outcome(const transfer_state& state, const result<transfer_response>& outcome) {
        switch (state.status()) {
            case transfer_status::completed:
                stats.record_completed(state.bytes_moved(), state.elapsed());
                break;
            case transfer_status::cancelled:
                stats.record_cancelled();
                break;
            case transfer_status::failed:
                if (outcome) {
                    stats.record_failed(error_code::transfer_rejected);
                } else if (outcome.error().code == error_code::transfer_cancelled) {
                    stats.record_failed(error_code::attempt_timeout);
                } else {
                    stats.record_failed(outcome.error().code);
                }
                break;
            default:
                break;
        }
    }

    void finalize(const transfer_request& request, const result<transfer_response>& outcome,
                  const cancellation_token& token, transfer_log_context& log_ctx) {
        const auto& id = request.id;
        auto final_state = settle(id, outcome, token);

        if (!final_state) {
            // Already terminal: cancelled by the caller or failed by the reaper
            P2PC_LOG_DEBUG(log_category::sender, "Transfer " + id.short_string() +
                                                     " finalized elsewhere: " +
                                                     final_state.error().message);
            if (auto terminal = registry.get_snapshot(id)) {
                record_outcome(*terminal, outcome);
            } else {
                stats.record_failed(error_code::transfer_not_found);
            }
            return;
        }

        notifier.publish(final_state.value());
        record_outcome(final_state.value(), outcome);

        const auto& state = final_state.value();
        log_ctx.bytes_transferred = state.bytes_moved();
        log_ctx.duration_ms = static_cast<uint64_t>(state.elapsed().count());
        log_ctx.attempt = state.connection_attempts();
        switch (state.status()) {
            case transfer_status::completed:
                P2PC_LOG_INFO_CTX(log_category::sender, "Transfer completed", log_ctx);
                break;
            case transfer_status::cancelled:
                P2PC_LOG_INFO_CTX(log_category::sender, "Transfer cancelled", log_ctx);
                break;
            default:
                log_ctx.error_message = state.last_error();
                P2PC_LOG_ERROR_CTX(log_category::sender, "Transfer failed", log_ctx);
                break;
        }
    }
};

// ============================================================================
// file_sender::builder
// ============================================================================

file_sender::builder::builder() = default;

auto file_sender::builder::with_transport(std::shared_ptr<peer_transport> transport) -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto file_sender::builder::with_conversion_service(std::shared_ptr<conversion_service> service)
    -> builder& {
    conversion_ = std::move(service);
    return *this;
}

auto file_sender::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto file_sender::builder::with_max_file_size(uint64_t bytes) -> builder& {
    config_.max_file_size = bytes;
    return *this;
}

auto file_sender::builder::with_max_concurrent_transfers(std::size_t count) -> builder& {
    config_.max_concurrent_transfers = count;
    return *this;
}

auto file_sender::builder::with_retry_policy(const retry_policy& policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto file_sender::builder::with_reaper_config(const reaper_config& config) -> builder& {
    config_.reaper = config;
    return *this;
}

auto file_sender::builder::with_progress_queue_capacity(std::size_t capacity) -> builder& {
    config_.progress_queue_capacity = capacity;
    return *this;
}

auto file_sender::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto file_sender::builder::build() -> result<file_sender> {
    if (!transport_) {
        return unexpected{error{error_code::invalid_configuration,
                                "A transport is required to build a sender"}};
    }
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }
    if (!conversion_) {
        conversion_ = make_default_conversion_service();
    }

    file_sender sender{std::move(config_), std::move(transport_), std::move(conversion_)};
    if (auto started = sender.impl_->reaper.start(); !started) {
        return unexpected{started.error()};
    }
    return sender;
}

// ============================================================================
// file_sender
// ============================================================================

file_sender::file_sender(sender_config config, std::shared_ptr<peer_transport> transport,
                         std::shared_ptr<conversion_service> conversion)
    : impl_(std::make_unique<impl>(std::move(config), std::move(transport),
                                   std::move(conversion))) {
    get_logger().initialize();
    P2PC_LOG_INFO(log_category::sender,
                  "Sender ready (" + std::string(impl_->transport->type()) + " transport, max " +
                      std::to_string(impl_->config.max_concurrent_transfers) +
                      " concurrent transfers)");
}

file_sender::file_sender(file_sender&&) noexcept = default;
auto file_sender::operator=(file_sender&&) noexcept -> file_sender& = default;
file_sender::~file_sender() = default;

auto file_sender::send(const peer_address& peer, const std::filesystem::path& file,
                       const send_options& options) -> result<transfer_id> {
    if (impl_->shutting_down.load()) {
        return unexpected{error{error_code::not_initialized, "Sender is shutting down"}};
    }

    auto reject = [this](error err) -> result<transfer_id> {
        impl_->stats.record_rejected(err);
        return unexpected{std::move(err)};
    };

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return reject(error{error_code::file_not_found, "File not found: " + file.string()});
    }
    const auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        return reject(error{error_code::file_read_error,
                            "Failed to stat " + file.string() + ": " + ec.message()});
    }
    if (size > impl_->config.max_file_size) {
        return reject(error{error_code::file_too_large,
                            "File size " + std::to_string(size) +
                                " exceeds maximum allowed size " +
                                std::to_string(impl_->config.max_file_size)});
    }

    auto head = read_head(file);
    if (!head) {
        return reject(head.error());
    }

    transfer_request request;
    request.id = transfer_id::generate();
    request.filename = file.filename().string();
    request.file_size = size;
    request.source_format = impl_->conversion->detect_format(head.value());
    request.target_format = options.target_format;
    request.return_result = options.return_result;
    request.chunk_count = impl_->splitter.config().calculate_chunk_count(size);
    if (auto encodable = wire_codec::encode(request); !encodable) {
        return reject(encodable.error());
    }

    auto state = transfer_state::create(request, peer);
    if (auto registered = impl_->registry.register_transfer(state); !registered) {
        P2PC_LOG_WARN(log_category::sender, "Refusing " + request.filename + ": " +
                                                registered.error().message);
        return reject(registered.error());
    }
    impl_->stats.record_started();
    impl_->notifier.publish(state);

    auto cancellation = impl_->registry.cancellation(request.id);
    if (!cancellation) {
        return unexpected{error{error_code::internal_error,
                                "Transfer vanished right after registration"}};
    }

    P2PC_LOG_INFO(log_category::sender,
                  "Queued " + request.filename + " (" + std::to_string(size) + " bytes, " +
                      std::string(to_string(request.source_format)) + ", " +
                      std::to_string(request.chunk_count) + " chunks) for " + peer.to_string() +
                      " as " + request.id.short_string());

    impl_->reap_finished_workers();

    auto* self = impl_.get();
    auto worker = impl_->pool->submit(
        [self, request, peer, file, token = *cancellation]() {
            self->run_transfer(request, peer, file, token);
        },
        adapters::stage::send);

    {
        std::lock_guard lock(impl_->workers_mutex);
        impl_->workers.emplace(request.id, std::move(worker));
    }
    return request.id;
}

auto file_sender::wait_for_completion(const transfer_id& id,
                                      std::optional<std::chrono::milliseconds> timeout)
    -> result<send_result> {
    auto snapshot = impl_->registry.wait_for_terminal(id, timeout);
    if (!snapshot) {
        return unexpected{error{error_code::transfer_not_found,
                                "Transfer not found: " + id.to_string()}};
    }
    if (!snapshot->is_terminal()) {
        return unexpected{error{error_code::receive_timeout,
                                "Transfer " + id.short_string() + " still " +
                                    std::string(to_string(snapshot->status()))}};
    }

    send_result outcome;
    outcome.id = id;
    outcome.success = snapshot->status() == transfer_status::completed;
    outcome.bytes_sent = snapshot->bytes_moved();
    outcome.elapsed = snapshot->elapsed();
    if (snapshot->status() == transfer_status::cancelled) {
        outcome.error = "Transfer was cancelled";
    } else if (!outcome.success) {
        outcome.error = snapshot->last_error();
    }

    std::lock_guard lock(impl_->responses_mutex);
    if (auto it = impl_->responses.find(id); it != impl_->responses.end()) {
        outcome.response = it->second;
    }
    return outcome;
}

auto file_sender::cancel(const transfer_id& id) -> result<void> {
    auto cancelled = impl_->registry.cancel(id);
    if (!cancelled) {
        return unexpected{cancelled.error()};
    }
    impl_->notifier.publish(cancelled.value());
    P2PC_LOG_INFO(log_category::sender, "Cancellation requested for " + id.short_string());
    return {};
}

auto file_sender::get_progress(const transfer_id& id) const -> std::optional<progress_update> {
    auto snapshot = impl_->registry.get_snapshot(id);
    if (!snapshot) {
        return std::nullopt;
    }
    return progress_update(std::move(*snapshot));
}

auto file_sender::list_active() const -> std::vector<transfer_state> {
    return impl_->registry.list_active();
}

auto file_sender::active_count() const -> std::size_t {
    return impl_->registry.active_count();
}

void file_sender::set_progress_callback(progress_callback callback) {
    impl_->notifier.set_callback(std::move(callback));
}

auto file_sender::statistics() const -> transfer_statistics {
    return impl_->stats.get_snapshot();
}

auto file_sender::config() const -> const sender_config& {
    return impl_->config;
}

}  // namespace kcenon::p2p_convert
