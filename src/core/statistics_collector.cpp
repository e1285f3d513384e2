/**
 * @file statistics_collector.cpp
 * @brief Implementation of aggregate transfer statistics
 */

#include "kcenon/p2p_convert/core/statistics_collector.h"

#include <algorithm>
#include <atomic>
#include <mutex>

namespace kcenon::p2p_convert {

struct statistics_collector::impl {
    // Counters
    std::atomic<uint64_t> started{0};
    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> cancelled{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> bytes{0};
    std::atomic<uint64_t> chunks{0};
    std::atomic<uint64_t> retries{0};

    // Concurrency, rates and error buckets
    mutable std::mutex mutex;
    uint64_t active = 0;
    uint64_t peak_active = 0;
    uint64_t completed_bytes = 0;
    std::chrono::milliseconds completed_time{0};
    double peak_rate = 0.0;
    std::map<error_category, uint64_t> errors;

    void count_error(error_code code) {
        std::lock_guard lock(mutex);
        ++errors[category_of(code)];
    }

    void finish_one() {
        std::lock_guard lock(mutex);
        if (active > 0) {
            --active;
        }
    }
};

statistics_collector::statistics_collector() : impl_(std::make_unique<impl>()) {}

statistics_collector::statistics_collector(statistics_collector&&) noexcept = default;
auto statistics_collector::operator=(statistics_collector&&) noexcept
    -> statistics_collector& = default;
statistics_collector::~statistics_collector() = default;

void statistics_collector::record_rejected(const error& err) {
    impl_->rejected.fetch_add(1);
    impl_->count_error(err.code);
}

void statistics_collector::record_started() {
    impl_->started.fetch_add(1);
    std::lock_guard lock(impl_->mutex);
    ++impl_->active;
    impl_->peak_active = std::max(impl_->peak_active, impl_->active);
}

void statistics_collector::record_chunk(uint64_t bytes) {
    impl_->bytes.fetch_add(bytes);
    impl_->chunks.fetch_add(1);
}

void statistics_collector::record_retry(const error& err) {
    impl_->retries.fetch_add(1);
    impl_->count_error(err.code);
}

void statistics_collector::record_completed(uint64_t bytes, std::chrono::milliseconds elapsed) {
    impl_->completed.fetch_add(1);

    std::lock_guard lock(impl_->mutex);
    if (impl_->active > 0) {
        --impl_->active;
    }
    impl_->completed_bytes += bytes;
    impl_->completed_time += elapsed;
    if (elapsed.count() > 0) {
        const double rate =
            static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsed.count());
        impl_->peak_rate = std::max(impl_->peak_rate, rate);
    }
}

void statistics_collector::record_failed(error_code code) {
    impl_->failed.fetch_add(1);
    impl_->finish_one();
    impl_->count_error(code);
}

void statistics_collector::record_cancelled() {
    impl_->cancelled.fetch_add(1);
    impl_->finish_one();
}

void statistics_collector::record_error(error_code code) {
    impl_->count_error(code);
}

void statistics_collector::reset() {
    impl_->started.store(0);
    impl_->completed.store(0);
    impl_->failed.store(0);
    impl_->cancelled.store(0);
    impl_->rejected.store(0);
    impl_->bytes.store(0);
    impl_->chunks.store(0);
    impl_->retries.store(0);

    std::lock_guard lock(impl_->mutex);
    impl_->active = 0;
    impl_->peak_active = 0;
    impl_->completed_bytes = 0;
    impl_->completed_time = std::chrono::milliseconds{0};
    impl_->peak_rate = 0.0;
    impl_->errors.clear();
}

auto statistics_collector::get_snapshot() const -> transfer_statistics {
    transfer_statistics snapshot;
    snapshot.transfers_started = impl_->started.load();
    snapshot.transfers_completed = impl_->completed.load();
    snapshot.transfers_failed = impl_->failed.load();
    snapshot.transfers_cancelled = impl_->cancelled.load();
    snapshot.transfers_rejected = impl_->rejected.load();
    snapshot.bytes_transferred = impl_->bytes.load();
    snapshot.chunks_transferred = impl_->chunks.load();
    snapshot.retries = impl_->retries.load();

    std::lock_guard lock(impl_->mutex);
    snapshot.active_transfers = impl_->active;
    snapshot.peak_concurrent_transfers = impl_->peak_active;
    snapshot.errors_by_category = impl_->errors;
    for (const auto& [category, count] : impl_->errors) {
        snapshot.error_count += count;
    }
    snapshot.total_transfer_time = impl_->completed_time;
    if (impl_->completed_time.count() > 0) {
        snapshot.average_rate = static_cast<double>(impl_->completed_bytes) * 1000.0 /
                                static_cast<double>(impl_->completed_time.count());
    }
    snapshot.peak_rate = impl_->peak_rate;
    return snapshot;
}

}  // namespace kcenon::p2p_convert
