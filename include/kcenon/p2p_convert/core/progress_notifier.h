/**
 * @file progress_notifier.h
 * @brief Asynchronous delivery of transfer progress to an observer
 */

#ifndef KCENON_P2P_CONVERT_CORE_PROGRESS_NOTIFIER_H
#define KCENON_P2P_CONVERT_CORE_PROGRESS_NOTIFIER_H

#include <kcenon/p2p_convert/core/transfer_state.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace kcenon::p2p_convert {

/**
 * @brief Snapshot of a transfer plus its derived metrics
 */
struct progress_update {
    transfer_state snapshot;
    double percentage = 0.0;
    double throughput_bps = 0.0;
    std::optional<double> eta_seconds;
    std::string status_text;

    explicit progress_update(transfer_state state,
                             transfer_state::clock::time_point now = transfer_state::clock::now())
        : snapshot(std::move(state)),
          percentage(snapshot.percentage()),
          throughput_bps(snapshot.throughput_bps(now)),
          eta_seconds(snapshot.eta_seconds(now)),
          status_text(snapshot.status_string()) {}
};

using progress_callback = std::function<void(const progress_update&)>;

/**
 * @brief Render an update as
 *        "[1a2b3c4d] 42.0% (420/1000 bytes) - 12.5 KB/s - ETA: 3s - Sending chunk 5/10"
 */
[[nodiscard]] auto format_progress(const progress_update& update) -> std::string;

/**
 * @brief Bounded asynchronous progress dispatcher
 *
 * publish() never blocks the caller. Updates are queued and delivered on a
 * dedicated thread in publish order. When the queue is full a non-terminal
 * update is dropped; a terminal update evicts the oldest queued non-terminal
 * one instead, or grows the queue past capacity when every queued entry is
 * terminal, so final outcomes are always delivered. Exceptions thrown by the
 * callback are logged and swallowed per update.
 */
class progress_notifier {
public:
    static constexpr std::size_t default_capacity = 256;

    explicit progress_notifier(std::size_t capacity = default_capacity);
    ~progress_notifier();

    progress_notifier(const progress_notifier&) = delete;
    auto operator=(const progress_notifier&) -> progress_notifier& = delete;

    void set_callback(progress_callback callback);

    /**
     * @brief Compute metrics for @p snapshot and queue them for delivery
     * @return false if the update was dropped
     */
    auto publish(const transfer_state& snapshot) -> bool;

    /**
     * @brief Wait until every queued update has been delivered
     * @return true if the queue drained within @p timeout
     */
    auto flush(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Stop the dispatcher; queued updates are discarded
     */
    void stop();

    [[nodiscard]] auto capacity() const -> std::size_t;
    [[nodiscard]] auto pending() const -> std::size_t;
    [[nodiscard]] auto dropped_count() const -> uint64_t;
    [[nodiscard]] auto delivered_count() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Rate-limited console style reporter
 *
 * Emits a formatted line for a transfer at most once per interval, plus
 * always on terminal updates.
 */
class progress_reporter {
public:
    using sink = std::function<void(const std::string&)>;

    explicit progress_reporter(std::chrono::milliseconds interval = std::chrono::seconds(1),
                               sink output = {});

    /**
     * @brief Report @p update if the interval for its transfer has elapsed
     * @return true if a line was emitted
     */
    auto maybe_report(const progress_update& update,
                      std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now())
        -> bool;

private:
    std::chrono::milliseconds interval_;
    sink output_;
    std::unordered_map<transfer_id, std::chrono::steady_clock::time_point> last_report_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_PROGRESS_NOTIFIER_H
