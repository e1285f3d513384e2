/**
 * @file cleanup_reaper.cpp
 * @brief Implementation of the transfer cleanup reaper
 */

#include <kcenon/p2p_convert/core/cleanup_reaper.h>

#include <kcenon/p2p_convert/core/logging.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace kcenon::p2p_convert {

namespace {

constexpr auto stalled_reason = "stalled";

}  // namespace

struct cleanup_reaper::impl {
    transfer_registry& registry;
    reaper_config config;

    transfer_callback evicted_cb;
    transfer_callback expired_cb;
    std::mutex callback_mutex;

    std::atomic<bool> running{false};
    std::thread worker;
    std::mutex wake_mutex;
    std::condition_variable wake_cv;

    impl(transfer_registry& reg, reaper_config cfg) : registry(reg), config(cfg) {}

    ~impl() { stop(); }

    void stop() {
        if (running.exchange(false)) {
            wake_cv.notify_all();
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    void emit(const transfer_callback& cb_ref, const transfer_id& id) {
        transfer_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = cb_ref;
        }
        if (cb) {
            cb(id);
        }
    }

    auto sweep_retention(clock::time_point now) -> std::size_t {
        std::size_t removed = 0;

        for (const auto& state : registry.list_all()) {
            const auto& finished = state.finished_at();
            if (!finished || now - *finished < config.retention) {
                continue;
            }
            if (registry.remove(state.id())) {
                P2PC_LOG_DEBUG(log_category::reaper,
                               "Evicted " + std::string(to_string(state.status())) +
                                   " transfer " + state.id().short_string());
                emit(evicted_cb, state.id());
                ++removed;
            }
        }

        if (removed > 0) {
            P2PC_LOG_INFO(log_category::reaper,
                          "Evicted " + std::to_string(removed) + " finished transfers");
        }
        return removed;
    }

    auto sweep_stalled(clock::time_point now) -> std::size_t {
        std::size_t expired = 0;

        for (const auto& state : registry.list_active()) {
            if (now - state.started_at() < config.stall_timeout) {
                continue;
            }

            if (auto token = registry.cancellation(state.id())) {
                token->cancel();
            }

            auto failed = registry.mutate(state.id(), [](transfer_state& s) {
                return s.fail(stalled_reason);
            });
            if (!failed) {
                // Finished or removed between the snapshot and now
                continue;
            }

            P2PC_LOG_WARN(log_category::reaper,
                          "Transfer " + state.id().short_string() + " stalled in " +
                              std::string(to_string(state.status())) + " after " +
                              std::to_string(state.elapsed(now).count()) + "ms");
            emit(expired_cb, state.id());
            ++expired;
        }
        return expired;
    }

    void run() {
        auto next_sweep = clock::now() + config.sweep_interval;
        auto next_expiry = clock::now() + config.expiry_interval;

        while (running.load()) {
            {
                std::unique_lock lock(wake_mutex);
                wake_cv.wait_until(lock, std::min(next_sweep, next_expiry),
                                   [this] { return !running.load(); });
            }
            if (!running.load()) {
                break;
            }

            const auto now = clock::now();
            if (now >= next_expiry) {
                sweep_stalled(now);
                next_expiry = now + config.expiry_interval;
            }
            if (now >= next_sweep) {
                sweep_retention(now);
                next_sweep = now + config.sweep_interval;
            }
        }
    }
};

cleanup_reaper::cleanup_reaper(transfer_registry& registry, reaper_config config)
    : impl_(std::make_unique<impl>(registry, config)) {}

cleanup_reaper::~cleanup_reaper() = default;

auto cleanup_reaper::start() -> result<void> {
    if (auto valid = impl_->config.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (impl_->running.exchange(true)) {
        return {};
    }

    impl_->worker = std::thread([this] { impl_->run(); });
    P2PC_LOG_DEBUG(log_category::reaper,
                   "Reaper started (sweep " + std::to_string(impl_->config.sweep_interval.count()) +
                       "ms, expiry " + std::to_string(impl_->config.expiry_interval.count()) +
                       "ms)");
    return {};
}

void cleanup_reaper::stop() {
    impl_->stop();
}

auto cleanup_reaper::is_running() const -> bool {
    return impl_->running.load();
}

auto cleanup_reaper::sweep_retention(clock::time_point now) -> std::size_t {
    return impl_->sweep_retention(now);
}

auto cleanup_reaper::sweep_stalled(clock::time_point now) -> std::size_t {
    return impl_->sweep_stalled(now);
}

void cleanup_reaper::on_evicted(transfer_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->evicted_cb = std::move(callback);
}

void cleanup_reaper::on_expired(transfer_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->expired_cb = std::move(callback);
}

auto cleanup_reaper::config() const -> const reaper_config& {
    return impl_->config;
}

}  // namespace kcenon::p2p_convert
