/**
 * @file receiver_assembly.h
 * @brief Per-transfer accumulation of received chunks
 */

#ifndef KCENON_P2P_CONVERT_CORE_RECEIVER_ASSEMBLY_H
#define KCENON_P2P_CONVERT_CORE_RECEIVER_ASSEMBLY_H

#include <kcenon/p2p_convert/core/chunk_types.h>
#include <kcenon/p2p_convert/core/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <vector>

namespace kcenon::p2p_convert {

/**
 * @brief Sparse chunk map for one inbound transfer
 *
 * Chunks may arrive in any order. A duplicate index replaces nothing and is
 * reported as already present. Not thread-safe; the owner serializes access.
 */
class receiver_assembly {
public:
    using clock = std::chrono::steady_clock;

    receiver_assembly(const transfer_id& id, uint64_t chunk_count, uint64_t expected_size);

    /**
     * @brief Store a chunk payload
     * @return true if the chunk was new, false for a duplicate index;
     *         invalid_chunk_index when index >= chunk_count,
     *         chunk_size_error when the total would exceed the expected size
     */
    [[nodiscard]] auto add_chunk(uint64_t index, byte_buffer data) -> result<bool>;

    [[nodiscard]] auto is_complete() const -> bool;

    [[nodiscard]] auto missing_chunks() const -> std::vector<uint64_t>;

    /**
     * @brief Concatenate all chunks in index order
     * @return File bytes, or incomplete_transfer naming the missing indices
     */
    [[nodiscard]] auto assemble() const -> result<byte_buffer>;

    [[nodiscard]] auto id() const -> const transfer_id& { return id_; }
    [[nodiscard]] auto chunk_count() const -> uint64_t { return chunk_count_; }
    [[nodiscard]] auto expected_size() const -> uint64_t { return expected_size_; }
    [[nodiscard]] auto received_chunks() const -> uint64_t { return chunks_.size(); }
    [[nodiscard]] auto bytes_received() const -> uint64_t { return bytes_received_; }
    [[nodiscard]] auto started_at() const -> clock::time_point { return started_at_; }
    [[nodiscard]] auto last_activity() const -> clock::time_point { return last_activity_; }

private:
    transfer_id id_;
    uint64_t chunk_count_;
    uint64_t expected_size_;
    std::map<uint64_t, byte_buffer> chunks_;
    uint64_t bytes_received_ = 0;
    clock::time_point started_at_;
    clock::time_point last_activity_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_RECEIVER_ASSEMBLY_H
