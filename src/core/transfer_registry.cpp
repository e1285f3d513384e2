/**
 * @file transfer_registry.cpp
 * @brief Implementation of the concurrent transfer registry
 */

#include <kcenon/p2p_convert/core/transfer_registry.h>

#include <kcenon/p2p_convert/core/logging.h>

#include <string>

namespace kcenon::p2p_convert {

transfer_registry::transfer_registry(std::size_t max_active) : max_active_(max_active) {}

auto transfer_registry::find_entry(const transfer_id& id) const -> std::shared_ptr<entry> {
    std::shared_lock lock(entries_mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

void transfer_registry::notify_terminal() {
    {
        std::lock_guard lock(terminal_mutex_);
    }
    terminal_cv_.notify_all();
}

auto transfer_registry::register_transfer(transfer_state state) -> result<void> {
    if (state.is_terminal()) {
        return unexpected(error{error_code::invalid_transition,
                                "cannot register a transfer in terminal status " +
                                    std::string(to_string(state.status()))});
    }

    const auto id = state.id();
    std::unique_lock lock(entries_mutex_);

    if (entries_.find(id) != entries_.end()) {
        return unexpected(error{error_code::transfer_already_exists,
                                "transfer already registered: " + id.to_string()});
    }

    const auto active = active_count_.load();
    if (active >= max_active_) {
        return unexpected(error{error_code::capacity_exceeded,
                                "Too many concurrent transfers (" + std::to_string(active) +
                                    "/" + std::to_string(max_active_) + ")"});
    }

    entries_.emplace(id, std::make_shared<entry>(std::move(state)));
    active_count_.fetch_add(1);

    P2PC_LOG_DEBUG(log_category::registry,
                   "Registered transfer " + id.short_string() + " (" +
                       std::to_string(active + 1) + "/" + std::to_string(max_active_) +
                       " active)");
    return {};
}

auto transfer_registry::get_snapshot(const transfer_id& id) const
    -> std::optional<transfer_state> {
    auto e = find_entry(id);
    if (!e) {
        return std::nullopt;
    }
    std::lock_guard lock(e->mutex);
    if (e->removed) {
        return std::nullopt;
    }
    return e->state;
}

auto transfer_registry::mutate(const transfer_id& id, const mutation& fn)
    -> result<transfer_state> {
    auto e = find_entry(id);
    if (!e) {
        return unexpected(
            error{error_code::transfer_not_found, "transfer not found: " + id.to_string()});
    }

    bool became_terminal = false;
    std::optional<transfer_state> snapshot;

    {
        std::lock_guard lock(e->mutex);
        if (e->removed) {
            return unexpected(
                error{error_code::transfer_not_found, "transfer not found: " + id.to_string()});
        }
        if (e->state.is_terminal()) {
            return unexpected(error{error_code::invalid_transition,
                                    "transfer " + id.short_string() + " is already " +
                                        std::string(to_string(e->state.status()))});
        }

        transfer_state working = e->state;
        if (auto applied = fn(working); !applied) {
            return unexpected(applied.error());
        }

        e->state = std::move(working);
        snapshot = e->state;
        became_terminal = e->state.is_terminal();
        if (became_terminal) {
            active_count_.fetch_sub(1);
        }
    }

    if (became_terminal) {
        notify_terminal();
    }
    return std::move(*snapshot);
}

auto transfer_registry::list_active() const -> std::vector<transfer_state> {
    std::vector<transfer_state> result;
    std::shared_lock lock(entries_mutex_);
    result.reserve(entries_.size());
    for (const auto& [id, e] : entries_) {
        std::lock_guard entry_lock(e->mutex);
        if (!e->state.is_terminal()) {
            result.push_back(e->state);
        }
    }
    return result;
}

auto transfer_registry::list_all() const -> std::vector<transfer_state> {
    std::vector<transfer_state> result;
    std::shared_lock lock(entries_mutex_);
    result.reserve(entries_.size());
    for (const auto& [id, e] : entries_) {
        std::lock_guard entry_lock(e->mutex);
        result.push_back(e->state);
    }
    return result;
}

auto transfer_registry::cancel(const transfer_id& id) -> result<transfer_state> {
    auto e = find_entry(id);
    if (!e) {
        return unexpected(
            error{error_code::transfer_not_found, "transfer not found: " + id.to_string()});
    }

    e->token.cancel();
    auto cancelled = mutate(id, [](transfer_state& state) { return state.cancel(); });
    if (cancelled) {
        P2PC_LOG_INFO(log_category::registry, "Cancelled transfer " + id.short_string());
    }
    return cancelled;
}

auto transfer_registry::cancellation(const transfer_id& id) const
    -> std::optional<cancellation_token> {
    auto e = find_entry(id);
    if (!e) {
        return std::nullopt;
    }
    return e->token;
}

auto transfer_registry::remove(const transfer_id& id) -> bool {
    std::shared_ptr<entry> removed;
    {
        std::unique_lock lock(entries_mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        removed = it->second;
        entries_.erase(it);
    }

    bool was_active = false;
    {
        std::lock_guard lock(removed->mutex);
        removed->removed = true;
        was_active = !removed->state.is_terminal();
    }

    if (was_active) {
        removed->token.cancel();
        active_count_.fetch_sub(1);
    }

    notify_terminal();
    return true;
}

auto transfer_registry::wait_for_terminal(const transfer_id& id,
                                          std::optional<std::chrono::milliseconds> timeout)
    -> std::optional<transfer_state> {
    std::optional<transfer_state> latest;
    auto done = [&] {
        latest = get_snapshot(id);
        return !latest || latest->is_terminal();
    };

    std::unique_lock lock(terminal_mutex_);
    if (timeout) {
        terminal_cv_.wait_for(lock, *timeout, done);
    } else {
        terminal_cv_.wait(lock, done);
    }
    return latest;
}

auto transfer_registry::size() const -> std::size_t {
    std::shared_lock lock(entries_mutex_);
    return entries_.size();
}

}  // namespace kcenon::p2p_convert
