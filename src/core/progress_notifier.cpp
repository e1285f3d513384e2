/**
 * @file progress_notifier.cpp
 * @brief Implementation of asynchronous progress delivery
 */

#include <kcenon/p2p_convert/core/progress_notifier.h>

#include <kcenon/p2p_convert/core/logging.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace kcenon::p2p_convert {

auto format_progress(const progress_update& update) -> std::string {
    const auto& state = update.snapshot;

    std::ostringstream oss;
    oss << "[" << state.id().short_string() << "] " << std::fixed << std::setprecision(1)
        << update.percentage << "% (" << state.bytes_moved() << "/" << state.total_bytes()
        << " bytes) - " << update.throughput_bps / 1024.0 << " KB/s - ETA: ";
    if (update.eta_seconds) {
        oss << std::setprecision(0) << *update.eta_seconds << "s";
    } else {
        oss << "∞";
    }
    oss << " - " << update.status_text;
    return oss.str();
}

// progress_notifier

struct progress_notifier::impl {
    std::size_t capacity;

    std::deque<progress_update> queue;
    mutable std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::condition_variable drained_cv;
    bool delivering = false;

    progress_callback callback;
    std::mutex callback_mutex;

    std::atomic<bool> running{true};
    std::atomic<uint64_t> dropped{0};
    std::atomic<uint64_t> delivered{0};
    std::thread dispatcher;

    explicit impl(std::size_t cap) : capacity(cap == 0 ? 1 : cap) {
        dispatcher = std::thread([this] { run(); });
    }

    ~impl() { stop(); }

    void stop() {
        if (running.exchange(false)) {
            queue_cv.notify_all();
            if (dispatcher.joinable()) {
                dispatcher.join();
            }
            std::lock_guard lock(queue_mutex);
            queue.clear();
            drained_cv.notify_all();
        }
    }

    void run() {
        while (true) {
            std::optional<progress_update> next;
            {
                std::unique_lock lock(queue_mutex);
                queue_cv.wait(lock, [this] { return !running.load() || !queue.empty(); });
                if (!running.load()) {
                    return;
                }
                next.emplace(std::move(queue.front()));
                queue.pop_front();
                delivering = true;
            }

            deliver(*next);

            {
                std::lock_guard lock(queue_mutex);
                delivering = false;
                if (queue.empty()) {
                    drained_cv.notify_all();
                }
            }
        }
    }

    void deliver(const progress_update& update) {
        progress_callback cb;
        {
            std::lock_guard lock(callback_mutex);
            cb = callback;
        }
        if (!cb) {
            return;
        }

        try {
            cb(update);
            delivered.fetch_add(1);
        } catch (const std::exception& e) {
            P2PC_LOG_WARN(log_category::progress,
                          "Progress callback threw for transfer " +
                              update.snapshot.id().short_string() + ": " + e.what());
        } catch (...) {
            P2PC_LOG_WARN(log_category::progress,
                          "Progress callback threw a non-standard exception for transfer " +
                              update.snapshot.id().short_string());
        }
    }
};

progress_notifier::progress_notifier(std::size_t capacity)
    : impl_(std::make_unique<impl>(capacity)) {}

progress_notifier::~progress_notifier() = default;

void progress_notifier::set_callback(progress_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->callback = std::move(callback);
}

auto progress_notifier::publish(const transfer_state& snapshot) -> bool {
    if (!impl_->running.load()) {
        return false;
    }

    progress_update update(snapshot);
    const bool terminal = snapshot.is_terminal();

    {
        std::lock_guard lock(impl_->queue_mutex);
        if (impl_->queue.size() >= impl_->capacity) {
            if (!terminal) {
                const auto total = impl_->dropped.fetch_add(1) + 1;
                P2PC_LOG_WARN(log_category::progress,
                              "Progress queue full, dropped update for " +
                                  snapshot.id().short_string() + " (" + std::to_string(total) +
                                  " dropped)");
                return false;
            }
            auto victim = std::find_if(
                impl_->queue.begin(), impl_->queue.end(),
                [](const progress_update& queued) { return !queued.snapshot.is_terminal(); });
            if (victim != impl_->queue.end()) {
                const auto evicted = victim->snapshot.id().short_string();
                impl_->queue.erase(victim);
                impl_->dropped.fetch_add(1);
                P2PC_LOG_WARN(log_category::progress,
                              "Progress queue full, evicted update for " + evicted +
                                  " to queue terminal update of " +
                                  snapshot.id().short_string());
            } else {
                P2PC_LOG_DEBUG(log_category::progress,
                               "Progress queue holds only terminal updates, growing past " +
                                   std::to_string(impl_->capacity));
            }
        }
        impl_->queue.push_back(std::move(update));
    }
    impl_->queue_cv.notify_one();
    return true;
}

auto progress_notifier::flush(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(impl_->queue_mutex);
    return impl_->drained_cv.wait_for(lock, timeout, [this] {
        return impl_->queue.empty() && !impl_->delivering;
    });
}

void progress_notifier::stop() {
    impl_->stop();
}

auto progress_notifier::capacity() const -> std::size_t {
    return impl_->capacity;
}

auto progress_notifier::pending() const -> std::size_t {
    std::lock_guard lock(impl_->queue_mutex);
    return impl_->queue.size();
}

auto progress_notifier::dropped_count() const -> uint64_t {
    return impl_->dropped.load();
}

auto progress_notifier::delivered_count() const -> uint64_t {
    return impl_->delivered.load();
}

// progress_reporter

progress_reporter::progress_reporter(std::chrono::milliseconds interval, sink output)
    : interval_(interval), output_(std::move(output)) {
    if (!output_) {
        output_ = [](const std::string& line) { P2PC_LOG_INFO(log_category::progress, line); };
    }
}

auto progress_reporter::maybe_report(const progress_update& update,
                                     std::chrono::steady_clock::time_point now) -> bool {
    const auto& id = update.snapshot.id();
    auto it = last_report_.find(id);

    const bool terminal = update.snapshot.is_terminal();
    if (!terminal && it != last_report_.end() && now - it->second < interval_) {
        return false;
    }

    output_(format_progress(update));

    if (terminal) {
        last_report_.erase(id);
    } else {
        last_report_[id] = now;
    }
    return true;
}

}  // namespace kcenon::p2p_convert
