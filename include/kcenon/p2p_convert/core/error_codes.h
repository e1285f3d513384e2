/**
 * @file error_codes.h
 * @brief Error categories and classification helpers (-700 to -799 range)
 * @version 0.1.0
 *
 * Error codes follow the range -700 to -799 as per ecosystem convention.
 * The numeric ranges double as the error taxonomy: network errors are the
 * only retryable ones, resource errors are raised before any network
 * activity, and cancellation is a terminal outcome rather than a failure.
 */

#ifndef KCENON_P2P_CONVERT_CORE_ERROR_CODES_H
#define KCENON_P2P_CONVERT_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

#include "types.h"

namespace kcenon::p2p_convert {

/**
 * @brief Taxonomy bucket of an error code
 */
enum class error_category : uint8_t {
    none,
    network,
    protocol,
    resource,
    assembly,
    state,
    cancellation,
    conversion,
    configuration,
};

[[nodiscard]] constexpr auto to_string(error_category category) noexcept
    -> std::string_view {
    switch (category) {
        case error_category::none:
            return "none";
        case error_category::network:
            return "network";
        case error_category::protocol:
            return "protocol";
        case error_category::resource:
            return "resource";
        case error_category::assembly:
            return "assembly";
        case error_category::state:
            return "state";
        case error_category::cancellation:
            return "cancellation";
        case error_category::conversion:
            return "conversion";
        case error_category::configuration:
            return "configuration";
        default:
            return "unknown";
    }
}

/**
 * @brief Check if error code is in network error range
 */
[[nodiscard]] constexpr auto is_network_error(int32_t code) noexcept -> bool {
    return code <= -700 && code >= -719;
}

/**
 * @brief Check if error code is in protocol error range
 */
[[nodiscard]] constexpr auto is_protocol_error(int32_t code) noexcept -> bool {
    return code <= -720 && code >= -739;
}

/**
 * @brief Check if error code is in resource error range
 */
[[nodiscard]] constexpr auto is_resource_error(int32_t code) noexcept -> bool {
    return code <= -740 && code >= -759;
}

/**
 * @brief Check if error code is in assembly error range
 */
[[nodiscard]] constexpr auto is_assembly_error(int32_t code) noexcept -> bool {
    return code <= -760 && code >= -769;
}

/**
 * @brief Check if error code is in state error range
 */
[[nodiscard]] constexpr auto is_state_error(int32_t code) noexcept -> bool {
    return code <= -770 && code >= -779;
}

[[nodiscard]] constexpr auto is_cancellation(int32_t code) noexcept -> bool {
    return code <= -780 && code >= -784;
}

[[nodiscard]] constexpr auto is_conversion_error(int32_t code) noexcept -> bool {
    return code <= -785 && code >= -789;
}

/**
 * @brief Check if error code is in configuration error range
 */
[[nodiscard]] constexpr auto is_config_error(int32_t code) noexcept -> bool {
    return code <= -790 && code >= -799;
}

/**
 * @brief Map an error code to its taxonomy bucket
 */
[[nodiscard]] constexpr auto category_of(error_code code) noexcept -> error_category {
    const auto value = static_cast<int32_t>(code);
    if (value == 0) return error_category::none;
    if (is_network_error(value)) return error_category::network;
    if (is_protocol_error(value)) return error_category::protocol;
    if (is_resource_error(value)) return error_category::resource;
    if (is_assembly_error(value)) return error_category::assembly;
    if (is_state_error(value)) return error_category::state;
    if (is_cancellation(value)) return error_category::cancellation;
    if (is_conversion_error(value)) return error_category::conversion;
    return error_category::configuration;
}

/**
 * @brief Check if the error is retryable
 *
 * Only network failures are retried.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return category_of(code) == error_category::network;
}

[[nodiscard]] constexpr auto is_retryable(const error& err) noexcept -> bool {
    return is_retryable(err.code);
}

/**
 * @brief Get error message for a numeric error code
 */
[[nodiscard]] inline auto error_message(int32_t code) noexcept -> std::string_view {
    return to_string(static_cast<error_code>(code));
}

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_ERROR_CODES_H
