/**
 * @file client_types.h
 * @brief Sender-side type definitions for p2p_convert_system
 */

#ifndef KCENON_P2P_CONVERT_CLIENT_CLIENT_TYPES_H
#define KCENON_P2P_CONVERT_CLIENT_CLIENT_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "kcenon/p2p_convert/core/chunk_config.h"
#include "kcenon/p2p_convert/core/cleanup_reaper.h"
#include "kcenon/p2p_convert/core/progress_notifier.h"
#include "kcenon/p2p_convert/core/retry_policy.h"
#include "kcenon/p2p_convert/core/transfer_registry.h"
#include "kcenon/p2p_convert/core/types.h"

namespace kcenon::p2p_convert {

// Forward declaration
class file_sender;

/**
 * @brief Sender configuration
 */
struct sender_config {
    std::size_t chunk_size = chunk_config::default_chunk_size;
    uint64_t max_file_size = chunk_config::default_max_file_size;
    std::size_t max_concurrent_transfers = transfer_registry::default_max_active;
    retry_policy retry;
    reaper_config reaper;
    std::size_t progress_queue_capacity = progress_notifier::default_capacity;
    std::size_t worker_count = 4;

    [[nodiscard]] auto validate() const -> result<void> {
        if (auto chunks = chunk_config(chunk_size, max_file_size).validate(); !chunks) {
            return chunks;
        }
        if (max_concurrent_transfers == 0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "max_concurrent_transfers must be at least 1"}};
        }
        if (progress_queue_capacity == 0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "progress_queue_capacity must be at least 1"}};
        }
        if (worker_count == 0) {
            return unexpected{error{error_code::invalid_configuration,
                                    "worker_count must be at least 1"}};
        }
        if (auto r = retry.validate(); !r) {
            return r;
        }
        return reaper.validate();
    }
};

/**
 * @brief Options for a single send
 */
struct send_options {
    /// Requested conversion ("pdf", "txt"); none means store only
    std::optional<std::string> target_format;

    /// Ask the receiver to return the converted bytes
    bool return_result = false;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CLIENT_CLIENT_TYPES_H
