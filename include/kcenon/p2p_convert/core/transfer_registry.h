/**
 * @file transfer_registry.h
 * @brief Concurrent map of live transfers with a concurrency limit
 */

#ifndef KCENON_P2P_CONVERT_CORE_TRANSFER_REGISTRY_H
#define KCENON_P2P_CONVERT_CORE_TRANSFER_REGISTRY_H

#include <kcenon/p2p_convert/core/cancellation_token.h>
#include <kcenon/p2p_convert/core/transfer_state.h>
#include <kcenon/p2p_convert/core/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace kcenon::p2p_convert {

/**
 * @brief Owner of every transfer_state
 *
 * Callers never hold references into the map: reads return copies and
 * writes go through mutate(), which runs under the entry's own lock with no
 * registry-wide lock held. A transfer frees its concurrency slot the moment
 * it reaches a terminal status.
 */
class transfer_registry {
public:
    using mutation = std::function<result<void>(transfer_state&)>;

    /// Default number of simultaneously active transfers
    static constexpr std::size_t default_max_active = 5;

    explicit transfer_registry(std::size_t max_active = default_max_active);

    transfer_registry(const transfer_registry&) = delete;
    auto operator=(const transfer_registry&) -> transfer_registry& = delete;

    /**
     * @brief Insert a new transfer
     * @return capacity_exceeded when the active count has reached the limit,
     *         transfer_already_exists for a duplicate ID
     */
    [[nodiscard]] auto register_transfer(transfer_state state) -> result<void>;

    /**
     * @brief Copy of the current state, if the transfer exists
     */
    [[nodiscard]] auto get_snapshot(const transfer_id& id) const -> std::optional<transfer_state>;

    /**
     * @brief Apply @p fn to the transfer under its exclusive lock
     *
     * The change is all-or-nothing: if @p fn returns an error the stored
     * state is left untouched. Terminal transfers reject every mutation.
     *
     * @return Post-mutation snapshot
     */
    [[nodiscard]] auto mutate(const transfer_id& id, const mutation& fn) -> result<transfer_state>;

    [[nodiscard]] auto list_active() const -> std::vector<transfer_state>;
    [[nodiscard]] auto list_all() const -> std::vector<transfer_state>;

    /**
     * @brief Fire the cancellation token and move the transfer to cancelled
     */
    [[nodiscard]] auto cancel(const transfer_id& id) -> result<transfer_state>;

    /**
     * @brief Token observed by the worker driving this transfer
     */
    [[nodiscard]] auto cancellation(const transfer_id& id) const
        -> std::optional<cancellation_token>;

    /**
     * @brief Drop a transfer, freeing its slot if it was still active
     * @return true if the transfer existed
     */
    auto remove(const transfer_id& id) -> bool;

    /**
     * @brief Block until the transfer is terminal or @p timeout elapses
     * @return Terminal snapshot, the current snapshot on timeout, or nullopt
     *         if the transfer does not exist
     */
    [[nodiscard]] auto wait_for_terminal(const transfer_id& id,
                                         std::optional<std::chrono::milliseconds> timeout)
        -> std::optional<transfer_state>;

    [[nodiscard]] auto active_count() const -> std::size_t { return active_count_.load(); }
    [[nodiscard]] auto max_active() const -> std::size_t { return max_active_; }
    [[nodiscard]] auto size() const -> std::size_t;

private:
    struct entry {
        mutable std::mutex mutex;
        transfer_state state;
        cancellation_token token;
        bool removed = false;

        explicit entry(transfer_state s) : state(std::move(s)) {}
    };

    [[nodiscard]] auto find_entry(const transfer_id& id) const -> std::shared_ptr<entry>;
    void notify_terminal();

    std::size_t max_active_;
    std::atomic<std::size_t> active_count_{0};

    std::unordered_map<transfer_id, std::shared_ptr<entry>> entries_;
    mutable std::shared_mutex entries_mutex_;

    std::mutex terminal_mutex_;
    std::condition_variable terminal_cv_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_TRANSFER_REGISTRY_H
