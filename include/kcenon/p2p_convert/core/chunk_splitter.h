/**
 * @file chunk_splitter.h
 * @brief Streams a file on disk as ordered chunks
 */

#ifndef KCENON_P2P_CONVERT_CORE_CHUNK_SPLITTER_H
#define KCENON_P2P_CONVERT_CORE_CHUNK_SPLITTER_H

#include <kcenon/p2p_convert/core/chunk_config.h>
#include <kcenon/p2p_convert/core/chunk_types.h>
#include <kcenon/p2p_convert/core/types.h>

#include <filesystem>
#include <fstream>

namespace kcenon::p2p_convert {

/**
 * @brief Splits files into chunks for streaming transfer
 *
 * Files are read one chunk at a time, never loaded whole. A fresh iterator
 * is created for every send attempt so a retry starts again at index 0.
 */
class chunk_splitter {
public:
    /**
     * @brief Iterator for streaming chunk access
     */
    class chunk_iterator {
    public:
        [[nodiscard]] auto has_next() const -> bool;

        /**
         * @brief Read the next chunk from disk
         * @return Next chunk or file_read_error
         */
        [[nodiscard]] auto next() -> result<chunk>;

        [[nodiscard]] auto current_index() const -> uint64_t;
        [[nodiscard]] auto total_chunks() const -> uint64_t;
        [[nodiscard]] auto file_size() const -> uint64_t;

        chunk_iterator(chunk_iterator&&) noexcept;
        auto operator=(chunk_iterator&&) noexcept -> chunk_iterator&;
        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        auto operator=(const chunk_iterator&) -> chunk_iterator& = delete;

    private:
        friend class chunk_splitter;

        chunk_iterator(std::ifstream file, std::size_t chunk_size, transfer_id id,
                       uint64_t file_size, uint64_t total_chunks);

        std::ifstream file_;
        std::size_t chunk_size_;
        transfer_id transfer_id_;
        uint64_t file_size_;
        uint64_t total_chunks_;
        uint64_t current_index_;
    };

    chunk_splitter();

    explicit chunk_splitter(const chunk_config& config);

    /**
     * @brief Create chunk iterator for a file
     * @param file_path Path to the file to split
     * @param id Transfer ID stamped on every chunk
     * @return Chunk iterator, or file_not_found / file_read_error / file_too_large
     */
    [[nodiscard]] auto split(const std::filesystem::path& file_path, const transfer_id& id)
        -> result<chunk_iterator>;

    [[nodiscard]] auto config() const -> const chunk_config&;

private:
    chunk_config config_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_CHUNK_SPLITTER_H
