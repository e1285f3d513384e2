/**
 * @file file_sender.h
 * @brief Sending side of a peer-to-peer conversion transfer
 */

#ifndef KCENON_P2P_CONVERT_CLIENT_FILE_SENDER_H
#define KCENON_P2P_CONVERT_CLIENT_FILE_SENDER_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "kcenon/p2p_convert/client/client_types.h"
#include "kcenon/p2p_convert/conversion/conversion_service.h"
#include "kcenon/p2p_convert/core/progress_notifier.h"
#include "kcenon/p2p_convert/core/statistics_collector.h"
#include "kcenon/p2p_convert/core/transfer_state.h"
#include "kcenon/p2p_convert/core/transfer_types.h"
#include "kcenon/p2p_convert/core/types.h"
#include "kcenon/p2p_convert/transport/transport_interface.h"

namespace kcenon::p2p_convert {

/**
 * @brief Streams files to peers and collects their conversion responses
 *
 * Every send runs as an independent task on the worker pool. Each attempt
 * dials the peer, negotiates the protocol, streams the chunks in index
 * order and waits for the receiver's response. Network failures are retried
 * with exponential backoff; everything else ends the transfer.
 *
 * @code
 * auto sender_result = file_sender::builder()
 *     .with_transport(transport)
 *     .with_chunk_size(256 * 1024)
 *     .build();
 *
 * if (sender_result.has_value()) {
 *     auto& sender = sender_result.value();
 *     auto id = sender.send(peer, "report.txt", {.target_format = "pdf"});
 *     if (id) {
 *         auto outcome = sender.wait_for_completion(id.value());
 *     }
 * }
 * @endcode
 */
class file_sender {
public:
    /**
     * @brief Builder for file_sender
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the transport used to reach peers (required)
         */
        auto with_transport(std::shared_ptr<peer_transport> transport) -> builder&;

        /**
         * @brief Set the conversion service used for format detection
         * @note Defaults to the built-in detecting_conversion_service
         */
        auto with_conversion_service(std::shared_ptr<conversion_service> service) -> builder&;

        /**
         * @brief Set chunk size (default: 1MB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Set the largest file accepted for sending (default: 100MB)
         */
        auto with_max_file_size(uint64_t bytes) -> builder&;

        /**
         * @brief Set the number of simultaneously active transfers (default: 5)
         */
        auto with_max_concurrent_transfers(std::size_t count) -> builder&;

        auto with_retry_policy(const retry_policy& policy) -> builder&;

        /**
         * @brief Set retention, stall timeout and sweep intervals
         */
        auto with_reaper_config(const reaper_config& config) -> builder&;

        auto with_progress_queue_capacity(std::size_t capacity) -> builder&;

        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Build the sender instance
         * @return invalid_configuration when a setting is out of range or no
         *         transport was given
         */
        [[nodiscard]] auto build() -> result<file_sender>;

    private:
        sender_config config_;
        std::shared_ptr<peer_transport> transport_;
        std::shared_ptr<conversion_service> conversion_;
    };

    // Non-copyable, movable
    file_sender(const file_sender&) = delete;
    auto operator=(const file_sender&) -> file_sender& = delete;
    file_sender(file_sender&&) noexcept;
    auto operator=(file_sender&&) noexcept -> file_sender&;

    /**
     * @brief Cancels in-flight transfers and waits for their workers
     */
    ~file_sender();

    /**
     * @brief Start sending @p file to @p peer
     *
     * The file is checked before anything touches the network.
     *
     * @return Transfer ID, or file_not_found, file_too_large,
     *         capacity_exceeded
     */
    [[nodiscard]] auto send(const peer_address& peer, const std::filesystem::path& file,
                            const send_options& options = {}) -> result<transfer_id>;

    /**
     * @brief Block until the transfer reaches a terminal status
     * @param timeout Maximum wait; none waits indefinitely
     * @return Outcome, transfer_not_found, or receive_timeout when the
     *         transfer is still running after @p timeout
     */
    [[nodiscard]] auto wait_for_completion(
        const transfer_id& id,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) -> result<send_result>;

    /**
     * @brief Request cancellation
     *
     * Streaming stops at the next chunk boundary.
     */
    [[nodiscard]] auto cancel(const transfer_id& id) -> result<void>;

    [[nodiscard]] auto get_progress(const transfer_id& id) const -> std::optional<progress_update>;

    [[nodiscard]] auto list_active() const -> std::vector<transfer_state>;

    [[nodiscard]] auto active_count() const -> std::size_t;

    /**
     * @brief Observe every chunk boundary and status transition
     *
     * Called asynchronously on the notifier thread.
     */
    void set_progress_callback(progress_callback callback);

    /**
     * @brief Aggregate counts over every transfer this sender has handled
     *
     * Requests refused by send() count as rejected. A transfer refused by
     * the receiver counts as failed with a protocol error.
     */
    [[nodiscard]] auto statistics() const -> transfer_statistics;

    [[nodiscard]] auto config() const -> const sender_config&;

private:
    file_sender(sender_config config, std::shared_ptr<peer_transport> transport,
                std::shared_ptr<conversion_service> conversion);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CLIENT_FILE_SENDER_H
