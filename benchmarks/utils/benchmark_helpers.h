/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_P2P_CONVERT_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_P2P_CONVERT_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::p2p_convert::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate printable text that format detection classifies as text
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of text bytes
     */
    static auto generate_text_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate a buffer carrying a PDF signature and header line
     *
     * The body after the header is random; only the signature matters to
     * format detection.
     */
    static auto generate_pdf_like_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate text that opens with a UTF-8 byte order mark
     */
    static auto generate_bom_text_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    // Movable
    temp_file_manager(temp_file_manager&&) noexcept;
    auto operator=(temp_file_manager&&) noexcept -> temp_file_manager&;

    /**
     * @brief Create a temporary file with the given content
     * @param name File name
     * @param data File content
     * @return Path to created file
     */
    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    /**
     * @brief Create a temporary file with random data
     * @param name File name
     * @param size File size
     * @param seed Random seed
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Create a temporary file of generated prose
     */
    auto create_text_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Get the base directory
     * @return Base directory path
     */
    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;    // 100 KB
constexpr std::size_t medium_file = 10 * MB;    // 10 MB
constexpr std::size_t large_file = 100 * MB;    // 100 MB, the default size limit

// Chunk sizes for testing
constexpr std::size_t min_chunk = 64 * KB;      // 64 KB
constexpr std::size_t default_chunk = 1 * MB;   // 1 MB
}  // namespace sizes

}  // namespace kcenon::p2p_convert::benchmark

#endif  // KCENON_P2P_CONVERT_BENCHMARKS_BENCHMARK_HELPERS_H
