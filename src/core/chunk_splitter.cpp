/**
 * @file chunk_splitter.cpp
 * @brief Implementation of file splitting into chunks
 */

#include <kcenon/p2p_convert/core/chunk_splitter.h>

#include <kcenon/p2p_convert/core/chunk_codec.h>

namespace kcenon::p2p_convert {

// chunk_iterator implementation

chunk_splitter::chunk_iterator::chunk_iterator(std::ifstream file, std::size_t chunk_size,
                                               transfer_id id, uint64_t file_size,
                                               uint64_t total_chunks)
    : file_(std::move(file)),
      chunk_size_(chunk_size),
      transfer_id_(id),
      file_size_(file_size),
      total_chunks_(total_chunks),
      current_index_(0) {}

chunk_splitter::chunk_iterator::chunk_iterator(chunk_iterator&& other) noexcept
    : file_(std::move(other.file_)),
      chunk_size_(other.chunk_size_),
      transfer_id_(other.transfer_id_),
      file_size_(other.file_size_),
      total_chunks_(other.total_chunks_),
      current_index_(other.current_index_) {
    other.total_chunks_ = 0;
    other.current_index_ = 0;
}

auto chunk_splitter::chunk_iterator::operator=(chunk_iterator&& other) noexcept
    -> chunk_iterator& {
    if (this != &other) {
        file_ = std::move(other.file_);
        chunk_size_ = other.chunk_size_;
        transfer_id_ = other.transfer_id_;
        file_size_ = other.file_size_;
        total_chunks_ = other.total_chunks_;
        current_index_ = other.current_index_;

        other.total_chunks_ = 0;
        other.current_index_ = 0;
    }
    return *this;
}

chunk_splitter::chunk_iterator::~chunk_iterator() = default;

auto chunk_splitter::chunk_iterator::has_next() const -> bool {
    return current_index_ < total_chunks_;
}

auto chunk_splitter::chunk_iterator::next() -> result<chunk> {
    if (!has_next()) {
        return unexpected(error{error_code::invalid_chunk_index, "no more chunks available"});
    }

    if (!file_.good()) {
        return unexpected(error{error_code::file_read_error, "file stream error"});
    }

    const uint64_t offset = current_index_ * chunk_size_;
    const auto bytes_to_read =
        static_cast<std::size_t>(std::min<uint64_t>(chunk_size_, file_size_ - offset));

    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file_.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed"});
    }

    byte_buffer data(bytes_to_read);
    file_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(bytes_to_read));
    if (static_cast<std::size_t>(file_.gcount()) != bytes_to_read) {
        return unexpected(error{error_code::file_read_error,
                                "short read at chunk " + std::to_string(current_index_)});
    }

    auto c = chunk_codec::make_chunk(transfer_id_, current_index_, total_chunks_, std::move(data));
    ++current_index_;
    return c;
}

auto chunk_splitter::chunk_iterator::current_index() const -> uint64_t {
    return current_index_;
}

auto chunk_splitter::chunk_iterator::total_chunks() const -> uint64_t {
    return total_chunks_;
}

auto chunk_splitter::chunk_iterator::file_size() const -> uint64_t {
    return file_size_;
}

// chunk_splitter implementation

chunk_splitter::chunk_splitter() : config_() {}

chunk_splitter::chunk_splitter(const chunk_config& config) : config_(config) {}

auto chunk_splitter::split(const std::filesystem::path& file_path, const transfer_id& id)
    -> result<chunk_iterator> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + file_path.string()});
    }

    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_read_error, "cannot get file size: " + file_path.string()});
    }

    if (file_size > config_.max_file_size) {
        return unexpected(error{error_code::file_too_large,
                                "File size " + std::to_string(file_size) +
                                    " exceeds maximum allowed size " +
                                    std::to_string(config_.max_file_size)});
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + file_path.string()});
    }

    return chunk_iterator(std::move(file), config_.chunk_size, id, file_size,
                          config_.calculate_chunk_count(file_size));
}

auto chunk_splitter::config() const -> const chunk_config& {
    return config_;
}

}  // namespace kcenon::p2p_convert
