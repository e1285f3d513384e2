/**
 * @file file_receiver.cpp
 * @brief Receiver service implementation
 */

#include "kcenon/p2p_convert/server/file_receiver.h"

#include <kcenon/p2p_convert/adapters/thread_pool_adapter.h>
#include <kcenon/p2p_convert/core/checksum.h>
#include <kcenon/p2p_convert/core/logging.h>
#include <kcenon/p2p_convert/core/receiver_assembly.h>
#include <kcenon/p2p_convert/core/wire_codec.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <future>
#include <mutex>
#include <unordered_map>
#include <type_traits>
#include <utility>
#include <vector>

namespace kcenon::p2p_convert {

namespace {

auto write_file(const std::filesystem::path& path, const byte_buffer& data) -> result<void> {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected{error{error_code::file_write_error,
                                "Cannot open " + path.string() + " for writing"}};
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        return unexpected{error{error_code::file_write_error,
                                "Write to " + path.string() + " failed"}};
    }
    return {};
}

/**
 * @brief Strip one trailing ".pdf" and then one trailing ".txt"
 */
auto strip_known_extension(std::string name) -> std::string {
    for (std::string_view ext : {".pdf", ".txt"}) {
        if (name.size() >= ext.size() &&
            name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
            name.erase(name.size() - ext.size());
        }
    }
    return name;
}

auto elapsed_ms(std::chrono::steady_clock::time_point since) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - since)
                                     .count());
}

}  // namespace

// ============================================================================
// file_receiver::impl
// ============================================================================

struct file_receiver::impl {
    /**
     * @brief Lets the transport callback outlive the receiver safely
     *
     * The callback holds the gate, not the receiver. Shutdown clears the
     * target under the gate's lock, so no dispatch is in flight afterwards.
     */
    struct dispatch_gate {
        std::mutex mutex;
        impl* target = nullptr;
    };

    struct inbound_transfer {
        transfer_request request;
        peer_address peer;
        receiver_assembly assembly;
    };

    receiver_config config;
    std::shared_ptr<peer_transport> transport;
    std::shared_ptr<conversion_service> conversion;
    std::shared_ptr<adapters::task_pool_interface> pool;

    mutable std::mutex transfers_mutex;
    std::unordered_map<transfer_id, inbound_transfer> transfers;

    mutable std::mutex stats_mutex;
    receiver_statistics stats;

    std::mutex workers_mutex;
    std::vector<std::future<void>> workers;
    std::atomic<bool> stopping{false};
    std::shared_ptr<dispatch_gate> gate = std::make_shared<dispatch_gate>();

    impl(receiver_config cfg, std::shared_ptr<peer_transport> t,
         std::shared_ptr<conversion_service> conv)
        : config(std::move(cfg)),
          transport(std::move(t)),
          conversion(std::move(conv)),
          pool(adapters::task_pool_factory::create(config.worker_count, "p2p_convert_receiver")) {}

    ~impl() { shutdown(); }

    void attach() {
        if (!transport) {
            return;
        }
        {
            std::lock_guard lock(gate->mutex);
            gate->target = this;
        }
        transport->on_inbound_stream(
            [gate = gate, transport = std::weak_ptr<peer_transport>(transport)](
                stream_handle stream, const peer_address& remote) {
                std::lock_guard lock(gate->mutex);
                if (gate->target) {
                    gate->target->accept_stream(stream, remote);
                } else if (auto owner = transport.lock()) {
                    (void)owner->close_stream(stream);
                }
            });
    }

    void shutdown() {
        if (stopping.exchange(true)) {
            return;
        }
        {
            std::lock_guard lock(gate->mutex);
            gate->target = nullptr;
        }
        if (transport) {
            transport->on_inbound_stream(nullptr);
        }

        std::vector<std::future<void>> pending;
        {
            std::lock_guard lock(workers_mutex);
            pending.swap(workers);
        }
        for (auto& worker : pending) {
            if (!worker.valid()) {
                continue;
            }
            try {
                worker.get();
            } catch (const std::exception& e) {
                P2PC_LOG_ERROR(log_category::receiver, std::string("Stream worker failed: ") + e.what());
            }
        }

        std::lock_guard lock(transfers_mutex);
        if (!transfers.empty()) {
            P2PC_LOG_WARN(log_category::receiver,
                          "Dropping " + std::to_string(transfers.size()) +
                              " unfinished transfers at shutdown");
            transfers.clear();
        }
    }

    template <typename Fn>
    void update_stats(Fn&& fn) {
        std::lock_guard lock(stats_mutex);
        fn(stats);
    }

    // ------------------------------------------------------------------------
    // Admission and assembly
    // ------------------------------------------------------------------------

    auto handle_request(const transfer_request& request, const peer_address& peer)
        -> std::optional<transfer_response> {
        auto reject = [&](const std::string& reason) {
            P2PC_LOG_WARN(log_category::receiver, "Rejecting " + request.filename + " from " +
                                                      peer.peer_id + ": " + reason);
            update_stats([](receiver_statistics& s) { ++s.requests_rejected; });
            return transfer_response::rejected(request.id, reason);
        };

        if (request.file_size > config.max_file_size) {
            return reject("File size " + std::to_string(request.file_size) +
                          " exceeds maximum allowed size " +
                          std::to_string(config.max_file_size));
        }

        {
            std::lock_guard lock(transfers_mutex);
            if (transfers.size() >= config.max_concurrent_transfers) {
                const auto active = transfers.size();
                return reject("Too many concurrent transfers (" + std::to_string(active) + "/" +
                              std::to_string(config.max_concurrent_transfers) + ")");
            }
            if (transfers.count(request.id) > 0) {
                return reject("Transfer " + request.id.to_string() + " is already in progress");
            }
            transfers.emplace(request.id,
                              inbound_transfer{request, peer,
                                               receiver_assembly(request.id, request.chunk_count,
                                                                 request.file_size)});
        }

        update_stats([](receiver_statistics& s) { ++s.requests_accepted; });

        transfer_log_context ctx;
        ctx.transfer_id = request.id.to_string();
        ctx.filename = request.filename;
        ctx.file_size = request.file_size;
        ctx.total_chunks = request.chunk_count;
        ctx.peer_id = peer.peer_id;
        ctx.peer_address = peer.address;
        P2PC_LOG_INFO_CTX(log_category::receiver, "Accepted transfer", ctx);
        return std::nullopt;
    }

    auto handle_chunk(chunk c) -> result<bool> {
        if (!checksum::verify_crc32(c.data, c.checksum)) {
            return unexpected{error{error_code::chunk_checksum_error,
                                    "Checksum mismatch in chunk " + std::to_string(c.index) +
                                        " of " + c.id.short_string()}};
        }

        std::lock_guard lock(transfers_mutex);
        auto it = transfers.find(c.id);
        if (it == transfers.end()) {
            return unexpected{error{error_code::unknown_transfer,
                                    "Chunk for unknown transfer " + c.id.to_string()}};
        }
        auto& assembly = it->second.assembly;
        auto added = assembly.add_chunk(c.index, std::move(c.data));
        if (!added) {
            return unexpected{added.error()};
        }
        if (!added.value()) {
            P2PC_LOG_DEBUG(log_category::chunk, "Duplicate chunk " + std::to_string(c.index) +
                                                    " of " + c.id.short_string() + " ignored");
        }
        P2PC_LOG_TRACE(log_category::chunk,
                       "Received chunk " + std::to_string(c.index + 1) + "/" +
                           std::to_string(assembly.chunk_count()) + " of " + c.id.short_string());
        return assembly.is_complete();
    }

    auto take(const transfer_id& id) -> std::optional<inbound_transfer> {
        std::lock_guard lock(transfers_mutex);
        auto it = transfers.find(id);
        if (it == transfers.end()) {
            return std::nullopt;
        }
        auto transfer = std::move(it->second);
        transfers.erase(it);
        return transfer;
    }

    auto complete(const transfer_id& id) -> transfer_response {
        const auto started = std::chrono::steady_clock::now();

        auto taken = take(id);
        if (!taken) {
            return transfer_response::rejected(id, "Unknown transfer: " + id.to_string());
        }
        auto& transfer = *taken;
        const auto& request = transfer.request;

        auto fail = [&](const std::string& reason) {
            P2PC_LOG_ERROR(log_category::receiver,
                           "Transfer " + id.short_string() + " failed: " + reason);
            update_stats([](receiver_statistics& s) { ++s.transfers_abandoned; });
            auto response = transfer_response::rejected(id, reason);
            response.processing_time_ms = elapsed_ms(started);
            return response;
        };

        auto assembled = transfer.assembly.assemble();
        if (!assembled) {
            return fail("File assembly failed: " + assembled.error().message);
        }
        const auto& data = assembled.value();

        const auto detected = conversion->detect_format(data);
        P2PC_LOG_INFO(log_category::receiver,
                      "Transfer " + id.short_string() + ": detected " +
                          std::string(to_string(detected)) + " for " + request.filename);

        const auto stored_name = std::filesystem::path(request.filename).filename();
        if (stored_name.empty() || stored_name == "." || stored_name == "..") {
            return fail("Failed to save file: invalid file name '" + request.filename + "'");
        }
        const auto original_path = config.output_dir / stored_name;
        if (auto saved = write_file(original_path, data); !saved) {
            return fail("Failed to save file: " + saved.error().message);
        }
        P2PC_LOG_INFO(log_category::receiver, "Saved " + original_path.string() + " (" +
                                                  std::to_string(data.size()) + " bytes)");

        transfer_response response;
        response.id = id;
        response.success = true;

        if (config.auto_convert && request.target_format) {
            const auto& target_name = *request.target_format;
            auto converted = conversion->convert(data, detected, parse_target_format(target_name));
            if (converted) {
                const auto converted_name =
                    strip_known_extension(stored_name.string()) + "." + target_name;
                const auto converted_path = config.output_dir / converted_name;
                if (auto saved = write_file(converted_path, converted.value()); !saved) {
                    P2PC_LOG_WARN(log_category::conversion,
                                  "Failed to save converted file: " + saved.error().message);
                } else {
                    P2PC_LOG_INFO(log_category::conversion,
                                  "Saved converted file " + converted_path.string() + " (" +
                                      std::to_string(converted.value().size()) + " bytes)");
                }
                response.converted_filename = converted_name;
                if (request.return_result) {
                    response.converted_data = std::move(converted).value();
                }
                update_stats([](receiver_statistics& s) { ++s.conversions_succeeded; });
            } else {
                P2PC_LOG_WARN(log_category::conversion, "Conversion failed for " +
                                                            id.short_string() + ": " +
                                                            converted.error().message);
                response.error = "Conversion failed: " + converted.error().message;
                update_stats([](receiver_statistics& s) { ++s.conversions_failed; });
            }
        }

        response.processing_time_ms = elapsed_ms(started);
        update_stats([&data](receiver_statistics& s) {
            ++s.transfers_completed;
            s.bytes_received += data.size();
        });
        P2PC_LOG_INFO(log_category::receiver,
                      "Transfer " + id.short_string() + " processed in " +
                          std::to_string(response.processing_time_ms) + "ms");
        return response;
    }

    auto abandon(const transfer_id& id, const std::string& reason) -> bool {
        auto taken = take(id);
        if (!taken) {
            return false;
        }
        update_stats([](receiver_statistics& s) { ++s.transfers_abandoned; });

        transfer_log_context ctx;
        ctx.transfer_id = id.to_string();
        ctx.filename = taken->request.filename;
        ctx.bytes_transferred = taken->assembly.bytes_received();
        ctx.total_chunks = taken->assembly.chunk_count();
        ctx.peer_id = taken->peer.peer_id;
        ctx.error_message = reason;
        P2PC_LOG_WARN_CTX(log_category::receiver, "Transfer abandoned", ctx);
        return true;
    }

    // ------------------------------------------------------------------------
    // Stream serving
    // ------------------------------------------------------------------------

    void accept_stream(stream_handle stream, const peer_address& remote) {
        auto worker = pool->submit([this, stream, remote]() { serve_stream(stream, remote); },
                                   adapters::stage::serve);

        std::lock_guard lock(workers_mutex);
        workers.erase(std::remove_if(workers.begin(), workers.end(),
                                     [](std::future<void>& f) {
                                         return f.wait_for(std::chrono::seconds(0)) ==
                                                std::future_status::ready;
                                     }),
                      workers.end());
        workers.push_back(std::move(worker));
    }

    auto receive_frame(stream_handle stream) -> result<frame> {
        auto message = transport->receive(stream, config.stall_timeout);
        if (!message) {
            return unexpected{message.error()};
        }
        return wire_codec::decode_frame(message.value());
    }

    // An unencodable reply is replaced by a short error frame
    void reply(stream_handle stream, const transfer_id& id,
               const result<std::vector<uint8_t>>& encoded) {
        if (!encoded) {
            P2PC_LOG_WARN(log_category::receiver, "Reply for " + id.short_string() +
                                                      " could not be encoded: " +
                                                      encoded.error().message);
            auto fallback = wire_codec::encode(
                std::type_identity_t<struct error_message>{id, static_cast<int32_t>(encoded.error().code),
                              "Reply could not be encoded"});
            if (fallback) {
                send_reply(stream, fallback.value());
            }
            return;
        }
        send_reply(stream, encoded.value());
    }

    void send_reply(stream_handle stream, const std::vector<uint8_t>& bytes) {
        if (auto sent = transport->send(stream, bytes); !sent) {
            P2PC_LOG_WARN(log_category::receiver, "Reply failed: " + sent.error().message);
        }
    }

    void reply_error(stream_handle stream, const transfer_id& id, const error& err) {
        reply(stream, id,
              wire_codec::encode(
                  std::type_identity_t<struct error_message>{id, static_cast<int32_t>(err.code), err.message}));
    }

    void finish_stream(stream_handle stream) {
        if (auto closed = transport->close_stream(stream); !closed) {
            P2PC_LOG_DEBUG(log_category::transport, "close_stream: " + closed.error().message);
        }
    }

    void serve_stream(stream_handle stream, const peer_address& remote) {
        P2PC_LOG_DEBUG(log_category::receiver, "Serving stream from " + remote.to_string());

        auto opening = receive_frame(stream);
        if (!opening) {
            P2PC_LOG_WARN(log_category::receiver, "No request from " + remote.peer_id + ": " +
                                                      opening.error().message);
            finish_stream(stream);
            return;
        }
        auto request = wire_codec::decode_request(opening.value());
        if (!request) {
            reply_error(stream, transfer_id{}, request.error());
            finish_stream(stream);
            return;
        }
        const auto& id = request.value().id;

        if (auto rejection = handle_request(request.value(), remote)) {
            reply(stream, id, wire_codec::encode(*rejection));
            finish_stream(stream);
            return;
        }
        reply(stream, id, wire_codec::encode(transfer_accept{id}));

        bool complete_set = request.value().chunk_count == 0;
        while (!complete_set) {
            if (stopping.load()) {
                abandon(id, "receiver shutting down");
                finish_stream(stream);
                return;
            }

            auto incoming = receive_frame(stream);
            if (!incoming) {
                const auto& err = incoming.error();
                if (err.code == error_code::receive_timeout) {
                    abandon(id, "stalled");
                } else if (err.code == error_code::connection_lost) {
                    abandon(id, "stream closed by sender");
                } else {
                    abandon(id, err.message);
                    reply_error(stream, id, err);
                }
                finish_stream(stream);
                return;
            }

            auto received = wire_codec::decode_chunk(incoming.value());
            result<bool> stored = unexpected{error{error_code::internal_error}};
            if (!received) {
                stored = unexpected{received.error()};
            } else if (received.value().id != id) {
                stored = unexpected{error{error_code::transfer_id_mismatch,
                                          "Chunk for " + received.value().id.to_string() +
                                              " on stream of " + id.to_string()}};
            } else {
                stored = handle_chunk(std::move(received.value()));
            }

            if (!stored) {
                abandon(id, stored.error().message);
                reply(stream, id,
                      wire_codec::encode(
                          transfer_response::rejected(id, stored.error().message)));
                finish_stream(stream);
                return;
            }
            complete_set = stored.value();
        }

        auto response = complete(id);
        reply(stream, id, wire_codec::encode(response));
        finish_stream(stream);
    }
};

// ============================================================================
// file_receiver::builder
// ============================================================================

file_receiver::builder::builder() = default;

auto file_receiver::builder::with_transport(std::shared_ptr<peer_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto file_receiver::builder::with_conversion_service(std::shared_ptr<conversion_service> service)
    -> builder& {
    conversion_ = std::move(service);
    return *this;
}

auto file_receiver::builder::with_output_dir(const std::filesystem::path& dir) -> builder& {
    config_.output_dir = dir;
    return *this;
}

auto file_receiver::builder::with_max_file_size(uint64_t bytes) -> builder& {
    config_.max_file_size = bytes;
    return *this;
}

auto file_receiver::builder::with_max_concurrent_transfers(std::size_t count) -> builder& {
    config_.max_concurrent_transfers = count;
    return *this;
}

auto file_receiver::builder::with_auto_convert(bool enabled) -> builder& {
    config_.auto_convert = enabled;
    return *this;
}

auto file_receiver::builder::with_stall_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.stall_timeout = timeout;
    return *this;
}

auto file_receiver::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto file_receiver::builder::build() -> result<file_receiver> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.output_dir, ec);
    if (ec || !std::filesystem::is_directory(config_.output_dir)) {
        return unexpected{error{error_code::file_write_error,
                                "Cannot create output directory " + config_.output_dir.string() +
                                    (ec ? ": " + ec.message() : std::string{})}};
    }

    if (!conversion_) {
        conversion_ = make_default_conversion_service();
    }
    file_receiver receiver{std::move(config_), std::move(transport_), std::move(conversion_)};
    receiver.impl_->attach();
    return receiver;
}

// ============================================================================
// file_receiver
// ============================================================================

file_receiver::file_receiver(receiver_config config, std::shared_ptr<peer_transport> transport,
                             std::shared_ptr<conversion_service> conversion)
    : impl_(std::make_unique<impl>(std::move(config), std::move(transport),
                                   std::move(conversion))) {
    get_logger().initialize();
    P2PC_LOG_INFO(log_category::receiver,
                  "Receiver ready, writing to " + impl_->config.output_dir.string() +
                      (impl_->transport
                           ? " (serving " + std::string(protocol_id) + " over " +
                                 std::string(impl_->transport->type()) + ")"
                           : std::string{}));
}

file_receiver::file_receiver(file_receiver&&) noexcept = default;
auto file_receiver::operator=(file_receiver&&) noexcept -> file_receiver& = default;
file_receiver::~file_receiver() = default;

auto file_receiver::handle_request(const transfer_request& request, const peer_address& peer)
    -> std::optional<transfer_response> {
    return impl_->handle_request(request, peer);
}

auto file_receiver::handle_chunk(chunk c) -> result<bool> {
    return impl_->handle_chunk(std::move(c));
}

auto file_receiver::complete(const transfer_id& id) -> transfer_response {
    return impl_->complete(id);
}

auto file_receiver::abandon(const transfer_id& id, const std::string& reason) -> bool {
    return impl_->abandon(id, reason);
}

auto file_receiver::active_count() const -> std::size_t {
    std::lock_guard lock(impl_->transfers_mutex);
    return impl_->transfers.size();
}

auto file_receiver::is_receiving(const transfer_id& id) const -> bool {
    std::lock_guard lock(impl_->transfers_mutex);
    return impl_->transfers.count(id) > 0;
}

auto file_receiver::statistics() const -> receiver_statistics {
    std::lock_guard lock(impl_->stats_mutex);
    return impl_->stats;
}

auto file_receiver::config() const -> const receiver_config& {
    return impl_->config;
}

}  // namespace kcenon::p2p_convert
