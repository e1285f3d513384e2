/**
 * @file test_statistics_collector.cpp
 * @brief Unit tests for statistics_collector
 */

#include <gtest/gtest.h>

#include <kcenon/p2p_convert/core/statistics_collector.h>

#include <chrono>
#include <thread>
#include <vector>

namespace kcenon::p2p_convert::test {

using namespace std::chrono_literals;

class StatisticsCollectorTest : public ::testing::Test {
protected:
    statistics_collector stats_;
};

TEST_F(StatisticsCollectorTest, InitialSnapshotIsEmpty) {
    auto snapshot = stats_.get_snapshot();

    EXPECT_EQ(snapshot.transfers_started, 0u);
    EXPECT_EQ(snapshot.terminal_count(), 0u);
    EXPECT_EQ(snapshot.error_count, 0u);
    EXPECT_TRUE(snapshot.errors_by_category.empty());
    EXPECT_DOUBLE_EQ(snapshot.average_rate, 0.0);
    EXPECT_EQ(snapshot.errors_in(error_category::network), 0u);
}

TEST_F(StatisticsCollectorTest, OutcomesCloseActiveTransfers) {
    stats_.record_started();
    stats_.record_started();
    stats_.record_started();
    EXPECT_EQ(stats_.get_snapshot().active_transfers, 3u);

    stats_.record_completed(1000, 100ms);
    stats_.record_failed(error_code::retries_exhausted);
    stats_.record_cancelled();

    auto snapshot = stats_.get_snapshot();
    EXPECT_EQ(snapshot.transfers_started, 3u);
    EXPECT_EQ(snapshot.transfers_completed, 1u);
    EXPECT_EQ(snapshot.transfers_failed, 1u);
    EXPECT_EQ(snapshot.transfers_cancelled, 1u);
    EXPECT_EQ(snapshot.terminal_count(), 3u);
    EXPECT_EQ(snapshot.active_transfers, 0u);
    EXPECT_EQ(snapshot.peak_concurrent_transfers, 3u);
}

TEST_F(StatisticsCollectorTest, ErrorsGroupedByCategory) {
    stats_.record_rejected(error{error_code::file_too_large, "too big"});
    stats_.record_rejected(error{error_code::capacity_exceeded, "full"});
    stats_.record_retry(error{error_code::connection_refused, "refused"});
    stats_.record_retry(error{error_code::attempt_timeout, "slow"});
    stats_.record_error(error_code::chunk_checksum_error);
    stats_.record_started();
    stats_.record_failed(error_code::transfer_rejected);

    auto snapshot = stats_.get_snapshot();
    EXPECT_EQ(snapshot.transfers_rejected, 2u);
    EXPECT_EQ(snapshot.retries, 2u);
    EXPECT_EQ(snapshot.errors_in(error_category::resource), 2u);
    EXPECT_EQ(snapshot.errors_in(error_category::network), 2u);
    EXPECT_EQ(snapshot.errors_in(error_category::protocol), 2u);
    EXPECT_EQ(snapshot.error_count, 6u);
}

TEST_F(StatisticsCollectorTest, RatesFromCompletedTransfers) {
    stats_.record_started();
    stats_.record_chunk(2000);
    stats_.record_completed(2000, 1000ms);

    stats_.record_started();
    stats_.record_chunk(4000);
    stats_.record_chunk(4000);
    stats_.record_completed(8000, 1000ms);

    auto snapshot = stats_.get_snapshot();
    EXPECT_EQ(snapshot.bytes_transferred, 10000u);
    EXPECT_EQ(snapshot.chunks_transferred, 3u);
    EXPECT_EQ(snapshot.total_transfer_time, 2000ms);
    EXPECT_DOUBLE_EQ(snapshot.average_rate, 5000.0);
    EXPECT_DOUBLE_EQ(snapshot.peak_rate, 8000.0);
    EXPECT_EQ(snapshot.peak_concurrent_transfers, 1u);
}

TEST_F(StatisticsCollectorTest, ResetClearsEverything) {
    stats_.record_started();
    stats_.record_chunk(10);
    stats_.record_retry(error{error_code::connection_lost, "lost"});
    stats_.reset();

    auto snapshot = stats_.get_snapshot();
    EXPECT_EQ(snapshot.transfers_started, 0u);
    EXPECT_EQ(snapshot.active_transfers, 0u);
    EXPECT_EQ(snapshot.bytes_transferred, 0u);
    EXPECT_EQ(snapshot.retries, 0u);
    EXPECT_EQ(snapshot.error_count, 0u);
}

TEST_F(StatisticsCollectorTest, ConcurrentRecording) {
    constexpr int threads = 8;
    constexpr int per_thread = 500;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this] {
            for (int i = 0; i < per_thread; ++i) {
                stats_.record_started();
                stats_.record_chunk(4);
                stats_.record_completed(4, 1ms);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto snapshot = stats_.get_snapshot();
    EXPECT_EQ(snapshot.transfers_started, static_cast<uint64_t>(threads * per_thread));
    EXPECT_EQ(snapshot.transfers_completed, static_cast<uint64_t>(threads * per_thread));
    EXPECT_EQ(snapshot.bytes_transferred, static_cast<uint64_t>(threads * per_thread * 4));
    EXPECT_EQ(snapshot.active_transfers, 0u);
    EXPECT_GE(snapshot.peak_concurrent_transfers, 1u);
}

}  // namespace kcenon::p2p_convert::test
