/**
 * @file chunk_codec.h
 * @brief Pure chunk split and reassembly functions
 *
 * @code
 * auto chunks = chunk_codec::split(payload, 1024 * 1024, id);
 * std::map<uint64_t, byte_buffer> received;
 * for (auto& c : chunks.value()) received.emplace(c.index, std::move(c.data));
 * auto restored = chunk_codec::reassemble(received, chunks.value().size());
 * @endcode
 */

#ifndef KCENON_P2P_CONVERT_CORE_CHUNK_CODEC_H
#define KCENON_P2P_CONVERT_CORE_CHUNK_CODEC_H

#include <kcenon/p2p_convert/core/chunk_types.h>
#include <kcenon/p2p_convert/core/types.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace kcenon::p2p_convert {

/**
 * @brief Stateless codec turning byte buffers into ordered chunks and back
 */
class chunk_codec {
public:
    /**
     * @brief Split a buffer into fixed-size chunks
     *
     * Every chunk except the last holds exactly @p chunk_size bytes; the last
     * holds the remainder and is flagged final. An empty buffer yields no
     * chunks.
     *
     * @return Chunks in index order, or invalid_configuration when chunk_size is 0
     */
    [[nodiscard]] static auto split(std::span<const std::byte> data, std::size_t chunk_size,
                                    const transfer_id& id) -> result<std::vector<chunk>>;

    /**
     * @brief Build one chunk with its CRC32 and final flag
     */
    [[nodiscard]] static auto make_chunk(const transfer_id& id, uint64_t index,
                                         uint64_t chunk_count, byte_buffer data) -> chunk;

    /**
     * @brief Indices in [0, expected_count) absent from @p chunks, ascending
     */
    [[nodiscard]] static auto find_missing(const std::map<uint64_t, byte_buffer>& chunks,
                                           uint64_t expected_count) -> std::vector<uint64_t>;

    /**
     * @brief Concatenate chunk payloads in index order
     *
     * Fails with incomplete_transfer, naming every missing index, unless all
     * of [0, expected_count) are present. Never returns partial data.
     */
    [[nodiscard]] static auto reassemble(const std::map<uint64_t, byte_buffer>& chunks,
                                         uint64_t expected_count) -> result<byte_buffer>;

    /**
     * @brief Render an index list as "0, 2, 5"
     */
    [[nodiscard]] static auto format_indices(const std::vector<uint64_t>& indices)
        -> std::string;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_CHUNK_CODEC_H
