/**
 * @file conversion_service.h
 * @brief Document conversion abstraction
 * @version 0.1.0
 *
 * The receiver delegates format detection and conversion to a
 * conversion_service. Rendering routines (text to PDF, PDF text extraction)
 * live outside this library and are plugged in by implementing the
 * interface.
 */

#ifndef KCENON_P2P_CONVERT_CONVERSION_CONVERSION_SERVICE_H
#define KCENON_P2P_CONVERT_CONVERSION_CONVERSION_SERVICE_H

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "kcenon/p2p_convert/core/chunk_types.h"
#include "kcenon/p2p_convert/core/transfer_types.h"
#include "kcenon/p2p_convert/core/types.h"

namespace kcenon::p2p_convert {

/**
 * @brief Map a requested target format name to a file_format
 *
 * Accepts "pdf", "txt" and "text" in any letter case.
 */
[[nodiscard]] auto parse_target_format(std::string_view name) -> file_format;

/**
 * @brief File extension written for a converted document ("pdf", "txt")
 */
[[nodiscard]] constexpr auto extension_for(file_format format) noexcept -> std::string_view {
    switch (format) {
        case file_format::pdf:
            return "pdf";
        case file_format::text:
            return "txt";
        default:
            return "bin";
    }
}

/**
 * @brief Conversion service interface
 */
class conversion_service {
public:
    virtual ~conversion_service() = default;

    /**
     * @brief Classify @p data by content
     */
    [[nodiscard]] virtual auto detect_format(std::span<const std::byte> data) const
        -> file_format = 0;

    /**
     * @brief Convert @p data from @p from to @p to
     * @return unsupported_conversion or conversion_failed on error
     */
    [[nodiscard]] virtual auto convert(std::span<const std::byte> data, file_format from,
                                       file_format to) -> result<byte_buffer> = 0;
};

/**
 * @brief Detection-only service
 *
 * Uses format_detector for detect_format() and rejects every conversion
 * with "Unsupported conversion: X to Y".
 */
class detecting_conversion_service : public conversion_service {
public:
    [[nodiscard]] auto detect_format(std::span<const std::byte> data) const
        -> file_format override;

    [[nodiscard]] auto convert(std::span<const std::byte> data, file_format from,
                               file_format to) -> result<byte_buffer> override;
};

/**
 * @brief Create the default conversion service
 */
[[nodiscard]] auto make_default_conversion_service() -> std::shared_ptr<conversion_service>;

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CONVERSION_CONVERSION_SERVICE_H
