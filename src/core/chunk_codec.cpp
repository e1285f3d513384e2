/**
 * @file chunk_codec.cpp
 * @brief Implementation of chunk split and reassembly
 */

#include <kcenon/p2p_convert/core/chunk_codec.h>

#include <kcenon/p2p_convert/core/checksum.h>

#include <algorithm>

namespace kcenon::p2p_convert {

auto chunk_codec::make_chunk(const transfer_id& id, uint64_t index, uint64_t chunk_count,
                             byte_buffer data) -> chunk {
    const auto crc = checksum::crc32(std::span<const std::byte>(data));
    return chunk(id, index, std::move(data), index + 1 == chunk_count, crc);
}

auto chunk_codec::split(std::span<const std::byte> data, std::size_t chunk_size,
                        const transfer_id& id) -> result<std::vector<chunk>> {
    if (chunk_size == 0) {
        return unexpected(
            error{error_code::invalid_configuration, "chunk size must be positive"});
    }

    const uint64_t count = (data.size() + chunk_size - 1) / chunk_size;

    std::vector<chunk> chunks;
    chunks.reserve(static_cast<std::size_t>(count));

    for (uint64_t index = 0; index < count; ++index) {
        const auto offset = static_cast<std::size_t>(index) * chunk_size;
        const auto length = std::min(chunk_size, data.size() - offset);
        auto piece = data.subspan(offset, length);
        chunks.push_back(make_chunk(id, index, count, byte_buffer(piece.begin(), piece.end())));
    }

    return chunks;
}

auto chunk_codec::find_missing(const std::map<uint64_t, byte_buffer>& chunks,
                               uint64_t expected_count) -> std::vector<uint64_t> {
    std::vector<uint64_t> missing;
    for (uint64_t index = 0; index < expected_count; ++index) {
        if (chunks.find(index) == chunks.end()) {
            missing.push_back(index);
        }
    }
    return missing;
}

auto chunk_codec::reassemble(const std::map<uint64_t, byte_buffer>& chunks,
                             uint64_t expected_count) -> result<byte_buffer> {
    if (!chunks.empty() && chunks.rbegin()->first >= expected_count) {
        return unexpected(error{error_code::invalid_chunk_index,
                                "Invalid chunk index " +
                                    std::to_string(chunks.rbegin()->first) + " (expected < " +
                                    std::to_string(expected_count) + ")"});
    }

    auto missing = find_missing(chunks, expected_count);
    if (!missing.empty()) {
        return unexpected(error{error_code::incomplete_transfer,
                                "Missing chunks: " + format_indices(missing)});
    }

    std::size_t total = 0;
    for (const auto& [index, data] : chunks) {
        total += data.size();
    }

    byte_buffer output;
    output.reserve(total);
    // std::map iterates in key order, which is chunk index order
    for (const auto& [index, data] : chunks) {
        output.insert(output.end(), data.begin(), data.end());
    }
    return output;
}

auto chunk_codec::format_indices(const std::vector<uint64_t>& indices) -> std::string {
    std::string text;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) text += ", ";
        text += std::to_string(indices[i]);
    }
    return text;
}

}  // namespace kcenon::p2p_convert
