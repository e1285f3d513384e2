/**
 * @file conversion_service.cpp
 * @brief Default detection-only conversion service
 */

#include "kcenon/p2p_convert/conversion/conversion_service.h"
#include "kcenon/p2p_convert/conversion/format_detector.h"
#include "kcenon/p2p_convert/core/logging.h"

#include <algorithm>
#include <cctype>

namespace kcenon::p2p_convert {

auto parse_target_format(std::string_view name) -> file_format {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "pdf") {
        return file_format::pdf;
    }
    if (lower == "txt" || lower == "text") {
        return file_format::text;
    }
    return file_format::unknown;
}

auto detecting_conversion_service::detect_format(std::span<const std::byte> data) const
    -> file_format {
    return format_detector::detect(data);
}

auto detecting_conversion_service::convert(std::span<const std::byte> data, file_format from,
                                           file_format to) -> result<byte_buffer> {
    (void)data;
    const auto message = "Unsupported conversion: " + std::string(to_string(from)) + " to " +
                         std::string(to_string(to));
    P2PC_LOG_DEBUG(log_category::conversion, message);
    return unexpected{error{error_code::unsupported_conversion, message}};
}

auto make_default_conversion_service() -> std::shared_ptr<conversion_service> {
    return std::make_shared<detecting_conversion_service>();
}

}  // namespace kcenon::p2p_convert
