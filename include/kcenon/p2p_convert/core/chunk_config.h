/**
 * @file chunk_config.h
 * @brief Configuration for chunk operations
 */

#ifndef KCENON_P2P_CONVERT_CORE_CHUNK_CONFIG_H
#define KCENON_P2P_CONVERT_CORE_CHUNK_CONFIG_H

#include <kcenon/p2p_convert/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace kcenon::p2p_convert {

/**
 * @brief Configuration for chunk operations
 */
struct chunk_config {
    /// Default chunk size (1MB)
    static constexpr std::size_t default_chunk_size = 1024 * 1024;

    /// Minimum allowed chunk size
    static constexpr std::size_t min_chunk_size = 1;

    /// Maximum allowed chunk size (1MB)
    static constexpr std::size_t max_chunk_size = 1024 * 1024;

    /// Default maximum file size accepted for transfer (100MB)
    static constexpr uint64_t default_max_file_size = 100ULL * 1024 * 1024;

    /// Chunk size to use for splitting
    std::size_t chunk_size = default_chunk_size;

    /// Files larger than this are rejected before any network activity
    uint64_t max_file_size = default_max_file_size;

    chunk_config() = default;

    explicit chunk_config(std::size_t size) : chunk_size(size) {}

    chunk_config(std::size_t size, uint64_t max_size)
        : chunk_size(size), max_file_size(max_size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size < min_chunk_size) {
            return unexpected(error{error_code::invalid_configuration,
                                    "chunk size must be at least " +
                                        std::to_string(min_chunk_size)});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        if (max_file_size == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "maximum file size must be positive"});
        }
        return {};
    }

    /**
     * @brief Calculate number of chunks for a given file size
     * @param file_size Size of the file in bytes
     * @return Number of chunks needed (0 for an empty file)
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 0;
        return (file_size + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_CHUNK_CONFIG_H
