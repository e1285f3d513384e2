/**
 * @file transfer_state.h
 * @brief Per-transfer state machine with progress counters and metrics
 */

#ifndef KCENON_P2P_CONVERT_CORE_TRANSFER_STATE_H
#define KCENON_P2P_CONVERT_CORE_TRANSFER_STATE_H

#include <kcenon/p2p_convert/core/transfer_types.h>
#include <kcenon/p2p_convert/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::p2p_convert {

/**
 * @brief Lifecycle record of one outbound transfer
 *
 * Holds the status, the byte and chunk counters, timestamps, attempt count
 * and the last error. Every mutator validates its precondition and returns
 * invalid_transition instead of changing a terminal state.
 *
 * Instances are value types. The transfer_registry owns the live copy and
 * hands out snapshots.
 */
class transfer_state {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @brief Create the initial state (connecting, zero attempts)
     */
    [[nodiscard]] static auto create(const transfer_request& request, const peer_address& peer)
        -> transfer_state;

    /**
     * @brief Check whether a status change is permitted
     *
     * Forward moves must be exactly one step. Any non-terminal status may
     * move to failed or cancelled. Terminal statuses accept nothing.
     */
    [[nodiscard]] static auto is_valid_transition(transfer_status from, transfer_status to)
        -> bool;

    /**
     * @brief Move to @p next, timestamping the transition
     */
    [[nodiscard]] auto advance(transfer_status next) -> result<void>;

    /**
     * @brief Move to failed and store @p reason as the last error
     */
    [[nodiscard]] auto fail(std::string reason) -> result<void>;

    [[nodiscard]] auto cancel() -> result<void>;

    /**
     * @brief Start a new connection attempt
     *
     * Increments the attempt count and re-enters connecting. The byte and
     * chunk counters are kept so progress never goes backwards.
     */
    [[nodiscard]] auto begin_attempt() -> result<void>;

    /**
     * @brief Account for one chunk handed to the transport
     *
     * Only legal while sending. A chunk already counted (a resend after a
     * retry) is accepted without changing the counters.
     */
    [[nodiscard]] auto record_chunk_sent(uint64_t index, uint64_t bytes) -> result<void>;

    /**
     * @brief Remember an error message without changing status
     */
    void set_last_error(std::string message) { last_error_ = std::move(message); }

    // Accessors
    [[nodiscard]] auto id() const -> const transfer_id& { return request_.id; }
    [[nodiscard]] auto request() const -> const transfer_request& { return request_; }
    [[nodiscard]] auto peer() const -> const peer_address& { return peer_; }
    [[nodiscard]] auto status() const -> transfer_status { return status_; }
    [[nodiscard]] auto is_terminal() const -> bool { return is_terminal_status(status_); }
    [[nodiscard]] auto total_bytes() const -> uint64_t { return request_.file_size; }
    [[nodiscard]] auto total_chunks() const -> uint64_t { return request_.chunk_count; }
    [[nodiscard]] auto bytes_moved() const -> uint64_t { return bytes_moved_; }
    [[nodiscard]] auto chunks_moved() const -> uint64_t { return chunks_moved_; }
    [[nodiscard]] auto connection_attempts() const -> uint32_t { return connection_attempts_; }
    [[nodiscard]] auto last_error() const -> const std::optional<std::string>& {
        return last_error_;
    }
    [[nodiscard]] auto started_at() const -> clock::time_point { return started_at_; }
    [[nodiscard]] auto updated_at() const -> clock::time_point { return updated_at_; }
    [[nodiscard]] auto finished_at() const -> const std::optional<clock::time_point>& {
        return finished_at_;
    }

    // Derived metrics

    /**
     * @brief Time since start, frozen once terminal
     */
    [[nodiscard]] auto elapsed(clock::time_point now = clock::now()) const -> duration;

    /**
     * @brief bytes_moved / total * 100, or 0 when total is 0
     */
    [[nodiscard]] auto percentage() const -> double;

    /**
     * @brief Average bytes per second since start, 0 when no time elapsed
     */
    [[nodiscard]] auto throughput_bps(clock::time_point now = clock::now()) const -> double;

    /**
     * @brief Remaining seconds at the current throughput
     * @return nullopt when throughput is 0 or all bytes have moved
     */
    [[nodiscard]] auto eta_seconds(clock::time_point now = clock::now()) const
        -> std::optional<double>;

    /**
     * @brief Human-readable description, e.g. "Sending chunk 3/10"
     */
    [[nodiscard]] auto status_string() const -> std::string;

private:
    transfer_state() = default;

    void touch(transfer_status next);

    transfer_request request_;
    peer_address peer_;
    transfer_status status_ = transfer_status::connecting;
    uint64_t bytes_moved_ = 0;
    uint64_t chunks_moved_ = 0;
    uint32_t connection_attempts_ = 0;
    std::optional<std::string> last_error_;
    clock::time_point started_at_;
    clock::time_point updated_at_;
    std::optional<clock::time_point> finished_at_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_TRANSFER_STATE_H
