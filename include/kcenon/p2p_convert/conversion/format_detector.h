/**
 * @file format_detector.h
 * @brief Content-based file format detection
 */

#ifndef KCENON_P2P_CONVERT_CONVERSION_FORMAT_DETECTOR_H
#define KCENON_P2P_CONVERT_CONVERSION_FORMAT_DETECTOR_H

#include <cstddef>
#include <filesystem>
#include <span>

#include "kcenon/p2p_convert/core/transfer_types.h"
#include "kcenon/p2p_convert/core/types.h"

namespace kcenon::p2p_convert {

/**
 * @brief Magic-number and heuristic format detection
 *
 * Detection order:
 * 1. "%PDF" signature -> PDF
 * 2. UTF-8 byte order mark -> text
 * 3. Sample of the first 1024 bytes with no NUL, valid UTF-8 and more than
 *    70% printable ASCII characters -> text
 * 4. Otherwise unknown
 */
class format_detector {
public:
    static constexpr std::size_t sample_size = 1024;
    static constexpr double printable_threshold = 0.7;

    [[nodiscard]] static auto detect(std::span<const std::byte> data) -> file_format;

    /**
     * @brief Detect the format of a file from its leading bytes
     * @return file_not_found or file_read_error on I/O failure
     */
    [[nodiscard]] static auto detect_file(const std::filesystem::path& path)
        -> result<file_format>;

    [[nodiscard]] static auto is_likely_text(std::span<const std::byte> data) -> bool;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CONVERSION_FORMAT_DETECTOR_H
