/**
 * @file server_types.h
 * @brief Receiver-side type definitions for p2p_convert_system
 */

#ifndef KCENON_P2P_CONVERT_SERVER_SERVER_TYPES_H
#define KCENON_P2P_CONVERT_SERVER_SERVER_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>

#include "kcenon/p2p_convert/core/chunk_config.h"
#include "kcenon/p2p_convert/core/transfer_registry.h"
#include "kcenon/p2p_convert/core/types.h"

namespace kcenon::p2p_convert {

// Forward declaration
class file_receiver;

/**
 * @brief Receiver configuration
 */
struct receiver_config {
    uint64_t max_file_size = chunk_config::default_max_file_size;
    std::size_t max_concurrent_transfers = transfer_registry::default_max_active;
    std::filesystem::path output_dir = "./received_files";

    /// Convert when the request names a target format
    bool auto_convert = true;

    /// Longest silence tolerated on a stream before the transfer is abandoned
    std::chrono::milliseconds stall_timeout{300000};

    std::size_t worker_count = 4;

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_file_size == 0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "max_file_size must be greater than 0"}};
        }
        if (max_concurrent_transfers == 0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "max_concurrent_transfers must be at least 1"}};
        }
        if (output_dir.empty()) {
            return unexpected{error{error_code::invalid_configuration,
                                    "output_dir must not be empty"}};
        }
        if (stall_timeout.count() <= 0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "stall_timeout must be positive"}};
        }
        if (worker_count == 0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "worker_count must be at least 1"}};
        }
        return {};
    }
};

/**
 * @brief Receiver counters
 */
struct receiver_statistics {
    uint64_t requests_accepted = 0;
    uint64_t requests_rejected = 0;
    uint64_t transfers_completed = 0;
    uint64_t transfers_abandoned = 0;
    uint64_t conversions_succeeded = 0;
    uint64_t conversions_failed = 0;
    uint64_t bytes_received = 0;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_SERVER_SERVER_TYPES_H
