/**
 * @file test_progress_notifier.cpp
 * @brief Unit tests for progress_notifier, progress_update and progress_reporter
 */

#include <gtest/gtest.h>

#include <kcenon/p2p_convert/core/progress_notifier.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace kcenon::p2p_convert::test {

using namespace std::chrono_literals;

class ProgressNotifierTest : public ::testing::Test {
protected:
    static auto make_state(uint64_t size = 4000, uint64_t chunks = 4) -> transfer_state {
        transfer_request request;
        request.id = transfer_id::generate();
        request.filename = "data.txt";
        request.file_size = size;
        request.chunk_count = chunks;
        return transfer_state::create(request, peer_address("peer-b"));
    }

    static auto sending(transfer_state state) -> transfer_state {
        EXPECT_TRUE(state.begin_attempt().has_value());
        EXPECT_TRUE(state.advance(transfer_status::negotiating).has_value());
        EXPECT_TRUE(state.advance(transfer_status::sending).has_value());
        return state;
    }
};

// =============================================================================
// progress_update / format_progress
// =============================================================================

TEST_F(ProgressNotifierTest, UpdateCarriesDerivedMetrics) {
    auto state = sending(make_state());
    ASSERT_TRUE(state.record_chunk_sent(0, 1000).has_value());

    progress_update update(state, state.started_at() + 1s);

    EXPECT_DOUBLE_EQ(update.percentage, 25.0);
    EXPECT_NEAR(update.throughput_bps, 1000.0, 1e-6);
    ASSERT_TRUE(update.eta_seconds.has_value());
    EXPECT_NEAR(*update.eta_seconds, 3.0, 1e-6);
    EXPECT_EQ(update.status_text, "Sending chunk 2/4");
}

TEST_F(ProgressNotifierTest, FormatProgressLine) {
    auto state = sending(make_state());
    ASSERT_TRUE(state.record_chunk_sent(0, 1000).has_value());

    auto line = format_progress(progress_update(state, state.started_at() + 1s));

    EXPECT_EQ(line.rfind("[" + state.id().short_string() + "] 25.0%", 0), 0u) << line;
    EXPECT_NE(line.find("(1000/4000 bytes)"), std::string::npos);
    EXPECT_NE(line.find("ETA: 3s"), std::string::npos);
    EXPECT_NE(line.find("Sending chunk 2/4"), std::string::npos);
}

// =============================================================================
// progress_notifier
// =============================================================================

TEST_F(ProgressNotifierTest, DeliversInPublishOrder) {
    progress_notifier notifier;
    std::vector<transfer_status> seen;
    std::mutex mutex;

    notifier.set_callback([&](const progress_update& update) {
        std::lock_guard lock(mutex);
        seen.push_back(update.snapshot.status());
    });

    auto state = make_state();
    ASSERT_TRUE(notifier.publish(state));
    ASSERT_TRUE(state.begin_attempt().has_value());
    ASSERT_TRUE(state.advance(transfer_status::negotiating).has_value());
    ASSERT_TRUE(notifier.publish(state));
    ASSERT_TRUE(state.cancel().has_value());
    ASSERT_TRUE(notifier.publish(state));

    ASSERT_TRUE(notifier.flush(2000ms));
    std::lock_guard lock(mutex);
    EXPECT_EQ(seen, (std::vector<transfer_status>{transfer_status::connecting,
                                                  transfer_status::negotiating,
                                                  transfer_status::cancelled}));
    EXPECT_EQ(notifier.delivered_count(), 3u);
    EXPECT_EQ(notifier.pending(), 0u);
}

TEST_F(ProgressNotifierTest, FullQueueDropsProgressButKeepsTerminal) {
    progress_notifier notifier(2);
    EXPECT_EQ(notifier.capacity(), 2u);

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool released = false;
    std::vector<transfer_status> seen;

    notifier.set_callback([&](const progress_update& update) {
        std::unique_lock lock(gate_mutex);
        gate_cv.wait(lock, [&] { return released; });
        seen.push_back(update.snapshot.status());
    });

    auto state = make_state();
    // The first update occupies the dispatcher; wait until it is dequeued.
    ASSERT_TRUE(notifier.publish(state));
    for (int i = 0; i < 200 && notifier.pending() > 0; ++i) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_TRUE(notifier.publish(state));
    EXPECT_TRUE(notifier.publish(state));
    EXPECT_FALSE(notifier.publish(state));
    EXPECT_EQ(notifier.dropped_count(), 1u);

    auto finished = state;
    ASSERT_TRUE(finished.fail("peer closed").has_value());
    EXPECT_TRUE(notifier.publish(finished));
    EXPECT_EQ(notifier.dropped_count(), 2u);

    {
        std::lock_guard lock(gate_mutex);
        released = true;
    }
    gate_cv.notify_all();

    ASSERT_TRUE(notifier.flush(2000ms));
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back(), transfer_status::failed);
}

TEST_F(ProgressNotifierTest, FullQueueKeepsTerminalUpdatesOfEveryTransfer) {
    progress_notifier notifier(1);

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool released = false;
    std::vector<std::pair<transfer_id, transfer_status>> seen;

    notifier.set_callback([&](const progress_update& update) {
        std::unique_lock lock(gate_mutex);
        gate_cv.wait(lock, [&] { return released; });
        seen.emplace_back(update.snapshot.id(), update.snapshot.status());
    });

    auto blocker = make_state();
    ASSERT_TRUE(notifier.publish(blocker));
    for (int i = 0; i < 200 && notifier.pending() > 0; ++i) {
        std::this_thread::sleep_for(1ms);
    }

    auto first = make_state();
    ASSERT_TRUE(first.fail("connection refused").has_value());
    auto second = make_state();
    ASSERT_TRUE(second.cancel().has_value());

    EXPECT_TRUE(notifier.publish(first));
    EXPECT_TRUE(notifier.publish(second));
    EXPECT_EQ(notifier.pending(), 2u);
    EXPECT_EQ(notifier.dropped_count(), 0u);

    // Progress for a live transfer is still dropped while the queue is over capacity
    EXPECT_FALSE(notifier.publish(make_state()));
    EXPECT_EQ(notifier.dropped_count(), 1u);

    {
        std::lock_guard lock(gate_mutex);
        released = true;
    }
    gate_cv.notify_all();

    ASSERT_TRUE(notifier.flush(2000ms));
    EXPECT_EQ(seen, (std::vector<std::pair<transfer_id, transfer_status>>{
                        {blocker.id(), transfer_status::connecting},
                        {first.id(), transfer_status::failed},
                        {second.id(), transfer_status::cancelled}}));
}

TEST_F(ProgressNotifierTest, ThrowingCallbackDoesNotStopDelivery) {
    progress_notifier notifier;
    int calls = 0;
    notifier.set_callback([&](const progress_update&) {
        if (++calls == 1) {
            throw std::runtime_error("observer failure");
        }
    });

    auto state = make_state();
    ASSERT_TRUE(notifier.publish(state));
    ASSERT_TRUE(notifier.publish(state));
    ASSERT_TRUE(notifier.flush(2000ms));

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(notifier.delivered_count(), 1u);
}

TEST_F(ProgressNotifierTest, NonStandardThrowDoesNotStopDelivery) {
    progress_notifier notifier;
    int calls = 0;
    notifier.set_callback([&](const progress_update&) {
        if (++calls == 1) {
            throw 42;
        }
    });

    auto state = make_state();
    ASSERT_TRUE(notifier.publish(state));
    ASSERT_TRUE(notifier.publish(state));
    ASSERT_TRUE(notifier.flush(2000ms));

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(notifier.delivered_count(), 1u);
}

TEST_F(ProgressNotifierTest, StoppedNotifierRejectsPublish) {
    progress_notifier notifier;
    notifier.stop();
    EXPECT_FALSE(notifier.publish(make_state()));
}

// =============================================================================
// progress_reporter
// =============================================================================

TEST_F(ProgressNotifierTest, ReporterRateLimitsPerTransfer) {
    std::vector<std::string> lines;
    progress_reporter reporter(1000ms, [&](const std::string& line) { lines.push_back(line); });

    auto state = sending(make_state());
    const auto t0 = state.started_at();
    progress_update update(state, t0);

    EXPECT_TRUE(reporter.maybe_report(update, t0));
    EXPECT_FALSE(reporter.maybe_report(update, t0 + 500ms));
    EXPECT_TRUE(reporter.maybe_report(update, t0 + 1500ms));

    ASSERT_TRUE(state.cancel().has_value());
    EXPECT_TRUE(reporter.maybe_report(progress_update(state, t0), t0 + 1600ms));
    EXPECT_EQ(lines.size(), 3u);
}

}  // namespace kcenon::p2p_convert::test
