/**
 * @file receiver_assembly.cpp
 * @brief Implementation of per-transfer chunk accumulation
 */

#include <kcenon/p2p_convert/core/receiver_assembly.h>

#include <kcenon/p2p_convert/core/chunk_codec.h>

#include <string>

namespace kcenon::p2p_convert {

receiver_assembly::receiver_assembly(const transfer_id& id, uint64_t chunk_count,
                                     uint64_t expected_size)
    : id_(id),
      chunk_count_(chunk_count),
      expected_size_(expected_size),
      started_at_(clock::now()),
      last_activity_(started_at_) {}

auto receiver_assembly::add_chunk(uint64_t index, byte_buffer data) -> result<bool> {
    if (index >= chunk_count_) {
        return unexpected(error{error_code::invalid_chunk_index,
                                "Invalid chunk index " + std::to_string(index) + " (expected < " +
                                    std::to_string(chunk_count_) + ")"});
    }

    last_activity_ = clock::now();

    if (chunks_.find(index) != chunks_.end()) {
        return false;
    }

    if (bytes_received_ + data.size() > expected_size_) {
        return unexpected(error{error_code::chunk_size_error,
                                "chunk " + std::to_string(index) +
                                    " overflows declared file size " +
                                    std::to_string(expected_size_)});
    }

    bytes_received_ += data.size();
    chunks_.emplace(index, std::move(data));
    return true;
}

auto receiver_assembly::is_complete() const -> bool {
    return chunks_.size() == chunk_count_;
}

auto receiver_assembly::missing_chunks() const -> std::vector<uint64_t> {
    return chunk_codec::find_missing(chunks_, chunk_count_);
}

auto receiver_assembly::assemble() const -> result<byte_buffer> {
    auto data = chunk_codec::reassemble(chunks_, chunk_count_);
    if (!data) {
        return unexpected(data.error());
    }
    if (data.value().size() != expected_size_) {
        return unexpected(error{error_code::chunk_size_error,
                                "assembled " + std::to_string(data.value().size()) +
                                    " bytes, expected " + std::to_string(expected_size_)});
    }
    return data;
}

}  // namespace kcenon::p2p_convert
