/**
 * @file file_receiver.h
 * @brief Receiving side of a peer-to-peer conversion transfer
 */

#ifndef KCENON_P2P_CONVERT_SERVER_FILE_RECEIVER_H
#define KCENON_P2P_CONVERT_SERVER_FILE_RECEIVER_H

#include <memory>
#include <optional>
#include <string>

#include "kcenon/p2p_convert/conversion/conversion_service.h"
#include "kcenon/p2p_convert/core/chunk_types.h"
#include "kcenon/p2p_convert/core/transfer_types.h"
#include "kcenon/p2p_convert/core/types.h"
#include "kcenon/p2p_convert/server/server_types.h"
#include "kcenon/p2p_convert/transport/transport_interface.h"

namespace kcenon::p2p_convert {

/**
 * @brief Reassembles inbound transfers, stores them and runs conversions
 *
 * When built with a transport, the receiver registers for inbound streams on
 * the conversion protocol and serves each one as a task on its worker pool.
 * The request, chunk and completion steps are also exposed directly so they
 * can be driven without a transport.
 *
 * @code
 * auto receiver_result = file_receiver::builder()
 *     .with_transport(transport)
 *     .with_output_dir("/data/incoming")
 *     .build();
 * @endcode
 */
class file_receiver {
public:
    /**
     * @brief Builder for file_receiver
     */
    class builder {
    public:
        builder();

        /**
         * @brief Serve inbound streams from @p transport
         * @note Optional; without one only the direct API is available
         */
        auto with_transport(std::shared_ptr<peer_transport> transport) -> builder&;

        /**
         * @brief Set the conversion service
         * @note Defaults to the built-in detecting_conversion_service
         */
        auto with_conversion_service(std::shared_ptr<conversion_service> service) -> builder&;

        /**
         * @brief Set the directory received files are written to
         *        (default: ./received_files)
         */
        auto with_output_dir(const std::filesystem::path& dir) -> builder&;

        auto with_max_file_size(uint64_t bytes) -> builder&;

        auto with_max_concurrent_transfers(std::size_t count) -> builder&;

        auto with_auto_convert(bool enabled) -> builder&;

        auto with_stall_timeout(std::chrono::milliseconds timeout) -> builder&;

        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Build the receiver instance
         *
         * Creates the output directory.
         *
         * @return invalid_configuration for an out-of-range setting,
         *         file_write_error when the output directory cannot be created
         */
        [[nodiscard]] auto build() -> result<file_receiver>;

    private:
        receiver_config config_;
        std::shared_ptr<peer_transport> transport_;
        std::shared_ptr<conversion_service> conversion_;
    };

    // Non-copyable, movable
    file_receiver(const file_receiver&) = delete;
    auto operator=(const file_receiver&) -> file_receiver& = delete;
    file_receiver(file_receiver&&) noexcept;
    auto operator=(file_receiver&&) noexcept -> file_receiver&;

    /**
     * @brief Stops serving and waits for in-flight streams
     */
    ~file_receiver();

    /**
     * @brief Admit a transfer
     * @return A rejection response, or nullopt when the transfer is accepted
     */
    [[nodiscard]] auto handle_request(const transfer_request& request, const peer_address& peer)
        -> std::optional<transfer_response>;

    /**
     * @brief Store one chunk of an admitted transfer
     *
     * The checksum is verified before the transfer table is locked, so a
     * corrupt chunk reports chunk_checksum_error even for an unknown id.
     *
     * @return true when every chunk has arrived; chunk_checksum_error,
     *         unknown_transfer or invalid_chunk_index on failure
     */
    [[nodiscard]] auto handle_chunk(chunk c) -> result<bool>;

    /**
     * @brief Assemble, save and optionally convert a finished transfer
     *
     * The transfer is forgotten afterwards regardless of the outcome.
     */
    [[nodiscard]] auto complete(const transfer_id& id) -> transfer_response;

    /**
     * @brief Drop an unfinished transfer
     * @return false if @p id was not being received
     */
    auto abandon(const transfer_id& id, const std::string& reason) -> bool;

    [[nodiscard]] auto active_count() const -> std::size_t;

    [[nodiscard]] auto is_receiving(const transfer_id& id) const -> bool;

    [[nodiscard]] auto statistics() const -> receiver_statistics;

    [[nodiscard]] auto config() const -> const receiver_config&;

private:
    file_receiver(receiver_config config, std::shared_ptr<peer_transport> transport,
                  std::shared_ptr<conversion_service> conversion);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_SERVER_FILE_RECEIVER_H
