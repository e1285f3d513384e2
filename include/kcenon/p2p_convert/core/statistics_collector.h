/**
 * @file statistics_collector.h
 * @brief Aggregate transfer and error statistics across transfers
 * @version 0.1.0
 *
 * This file defines the statistics_collector class, which accumulates
 * outcome counts, byte and chunk totals, retry counts and errors by
 * category for every transfer an endpoint handles.
 */

#ifndef KCENON_P2P_CONVERT_CORE_STATISTICS_COLLECTOR_H
#define KCENON_P2P_CONVERT_CORE_STATISTICS_COLLECTOR_H

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>

#include "error_codes.h"

namespace kcenon::p2p_convert {

/**
 * @brief Point-in-time copy of aggregate statistics
 */
struct transfer_statistics {
    uint64_t transfers_started = 0;          ///< Transfers accepted for processing
    uint64_t transfers_completed = 0;        ///< Transfers ending completed
    uint64_t transfers_failed = 0;           ///< Transfers ending failed
    uint64_t transfers_cancelled = 0;        ///< Transfers ending cancelled
    uint64_t transfers_rejected = 0;         ///< Requests refused before starting
    uint64_t active_transfers = 0;           ///< Started but not yet terminal
    uint64_t peak_concurrent_transfers = 0;  ///< Highest active_transfers seen
    uint64_t bytes_transferred = 0;          ///< Payload bytes moved, all transfers
    uint64_t chunks_transferred = 0;         ///< Chunks moved, all transfers
    uint64_t retries = 0;                    ///< Attempts repeated after a failure
    uint64_t error_count = 0;                ///< Sum of errors_by_category
    std::map<error_category, uint64_t> errors_by_category;
    double average_rate = 0.0;               ///< Bytes/sec over completed transfers
    double peak_rate = 0.0;                  ///< Fastest completed transfer, bytes/sec
    std::chrono::milliseconds total_transfer_time{0};  ///< Summed duration of completed transfers

    [[nodiscard]] auto errors_in(error_category category) const -> uint64_t {
        auto it = errors_by_category.find(category);
        return it == errors_by_category.end() ? 0 : it->second;
    }

    [[nodiscard]] auto terminal_count() const -> uint64_t {
        return transfers_completed + transfers_failed + transfers_cancelled;
    }
};

/**
 * @brief Thread-safe accumulator of transfer outcomes
 *
 * Every started transfer must be closed by exactly one of
 * record_completed(), record_failed() or record_cancelled().
 *
 * @code
 * statistics_collector stats;
 * stats.record_started();
 * stats.record_chunk(65536);
 * stats.record_retry(error{error_code::connection_refused, "refused"});
 * stats.record_completed(65536, std::chrono::milliseconds(40));
 *
 * auto snapshot = stats.get_snapshot();
 * @endcode
 */
class statistics_collector {
public:
    statistics_collector();

    // Non-copyable, movable
    statistics_collector(const statistics_collector&) = delete;
    auto operator=(const statistics_collector&) -> statistics_collector& = delete;
    statistics_collector(statistics_collector&&) noexcept;
    auto operator=(statistics_collector&&) noexcept -> statistics_collector&;

    ~statistics_collector();

    /**
     * @brief Count a request refused before any transfer started
     */
    void record_rejected(const error& err);

    void record_started();

    void record_chunk(uint64_t bytes);

    /**
     * @brief Count a failed attempt that will be retried
     */
    void record_retry(const error& err);

    void record_completed(uint64_t bytes, std::chrono::milliseconds elapsed);

    void record_failed(error_code code);

    void record_cancelled();

    /**
     * @brief Count an error without changing any transfer count
     */
    void record_error(error_code code);

    void reset();

    [[nodiscard]] auto get_snapshot() const -> transfer_statistics;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_STATISTICS_COLLECTOR_H
