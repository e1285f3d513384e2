/**
 * @file cleanup_reaper.h
 * @brief Background eviction of finished transfers and expiry of stalled ones
 */

#ifndef KCENON_P2P_CONVERT_CORE_CLEANUP_REAPER_H
#define KCENON_P2P_CONVERT_CORE_CLEANUP_REAPER_H

#include <kcenon/p2p_convert/core/transfer_registry.h>
#include <kcenon/p2p_convert/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace kcenon::p2p_convert {

/**
 * @brief Reaper timing configuration
 */
struct reaper_config {
    /// How long a terminal transfer stays queryable
    std::chrono::milliseconds retention{std::chrono::seconds(300)};

    /// Maximum lifetime of a non-terminal transfer
    std::chrono::milliseconds stall_timeout{std::chrono::seconds(300)};

    /// Interval of the retention sweep
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(60)};

    /// Interval of the stall check
    std::chrono::milliseconds expiry_interval{std::chrono::seconds(30)};

    [[nodiscard]] auto validate() const -> result<void> {
        if (sweep_interval.count() <= 0 || expiry_interval.count() <= 0) {
            return unexpected(
                error{error_code::invalid_configuration, "reaper intervals must be positive"});
        }
        if (retention.count() < 0 || stall_timeout.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "retention must be >= 0 and stall timeout positive"});
        }
        return {};
    }
};

/**
 * @brief Periodic cleanup of a transfer_registry
 *
 * Two independent sweeps run on their own intervals:
 * - retention: terminal transfers older than the retention window are removed
 * - stall: non-terminal transfers older than the stall timeout are failed
 *   with "stalled" and their cancellation token is fired
 *
 * Both sweeps read snapshots and act through per-ID registry calls, so they
 * never hold a registry-wide lock across the whole pass.
 */
class cleanup_reaper {
public:
    using clock = std::chrono::steady_clock;
    using transfer_callback = std::function<void(const transfer_id&)>;

    cleanup_reaper(transfer_registry& registry, reaper_config config = {});
    ~cleanup_reaper();

    cleanup_reaper(const cleanup_reaper&) = delete;
    auto operator=(const cleanup_reaper&) -> cleanup_reaper& = delete;

    /**
     * @brief Start the background thread (no-op if running)
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Stop and join the background thread
     */
    void stop();

    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Remove terminal transfers finished before now - retention
     * @return Number of transfers removed
     */
    auto sweep_retention(clock::time_point now = clock::now()) -> std::size_t;

    /**
     * @brief Fail non-terminal transfers started before now - stall_timeout
     * @return Number of transfers failed
     */
    auto sweep_stalled(clock::time_point now = clock::now()) -> std::size_t;

    void on_evicted(transfer_callback callback);
    void on_expired(transfer_callback callback);

    [[nodiscard]] auto config() const -> const reaper_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_CLEANUP_REAPER_H
