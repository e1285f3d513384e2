/**
 * @file retry_policy.h
 * @brief Retry configuration with exponential backoff
 */

#ifndef KCENON_P2P_CONVERT_CORE_RETRY_POLICY_H
#define KCENON_P2P_CONVERT_CORE_RETRY_POLICY_H

#include <kcenon/p2p_convert/core/types.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

namespace kcenon::p2p_convert {

/**
 * @brief Retry policy for outbound connection attempts
 *
 * Pure configuration. The delay before retry n (0-based) is
 * initial_delay * multiplier^n, capped at max_delay.
 */
struct retry_policy {
    /// Maximum number of attempts, including the first one
    uint32_t max_attempts = 5;

    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{500};

    /// Upper bound for any single delay
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Deadline for one complete attempt
    std::chrono::milliseconds attempt_timeout{10000};

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_attempts < 1) {
            return unexpected(
                error{error_code::invalid_configuration, "max_attempts must be at least 1"});
        }
        if (initial_delay.count() < 0) {
            return unexpected(
                error{error_code::invalid_configuration, "initial_delay must not be negative"});
        }
        if (max_delay < initial_delay) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max_delay must be >= initial_delay"});
        }
        if (!(backoff_multiplier > 1.0)) {
            return unexpected(error{error_code::invalid_configuration,
                                    "backoff_multiplier must be greater than 1.0"});
        }
        if (attempt_timeout.count() <= 0) {
            return unexpected(
                error{error_code::invalid_configuration, "attempt_timeout must be positive"});
        }
        return {};
    }

    /**
     * @brief Delay to wait after failed attempt @p retry_index + 1
     * @param retry_index 0 for the first retry
     */
    [[nodiscard]] auto delay_for(uint32_t retry_index) const -> std::chrono::milliseconds {
        auto delay = static_cast<double>(initial_delay.count());
        const auto cap = static_cast<double>(max_delay.count());

        for (uint32_t i = 0; i < retry_index && delay < cap; ++i) {
            delay *= backoff_multiplier;
        }

        delay = std::min(delay, cap);
        return std::chrono::milliseconds(static_cast<int64_t>(delay));
    }
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_RETRY_POLICY_H
