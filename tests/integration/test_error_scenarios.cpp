/**
 * @file test_error_scenarios.cpp
 * @brief Retry, rejection, cancellation and capacity scenarios
 */

#include "test_fixtures.h"

namespace kcenon::p2p_convert::test {

using namespace std::chrono_literals;

// =============================================================================
// Connection retry
// =============================================================================

class RetryScenarioTest : public TransferFixture {};

TEST_F(RetryScenarioTest, TransientDialFailuresAreRetried) {
    start();
    network_->set_dial_failures(receiver_peer_.peer_id, 2);

    auto path = create_text_file("retry.txt", 2000);
    auto id = sender_->send(receiver_peer_, path);
    ASSERT_TRUE(id.has_value());
    auto outcome = sender_->wait_for_completion(id.value(), 10s);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome.value().success) << outcome.value().error.value_or("");

    auto progress = sender_->get_progress(id.value());
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->snapshot.connection_attempts(), 3u);
    EXPECT_EQ(network_->dial_attempts(), 3u);
    EXPECT_EQ(read_file(output_dir_ / "retry.txt"), read_file(path));
}

TEST_F(RetryScenarioTest, PersistentDialFailureExhaustsAttempts) {
    start();
    network_->set_dial_failures(receiver_peer_.peer_id, 5);

    auto id = sender_->send(receiver_peer_, create_text_file("doomed.txt", 100));
    ASSERT_TRUE(id.has_value());
    auto outcome = sender_->wait_for_completion(id.value(), 10s);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome.value().success);
    EXPECT_TRUE(outcome.value().error.has_value());

    auto progress = sender_->get_progress(id.value());
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->snapshot.status(), transfer_status::failed);
    EXPECT_EQ(progress->snapshot.connection_attempts(), 5u);
    EXPECT_EQ(network_->dial_attempts(), 5u);
    EXPECT_EQ(receiver_->statistics().requests_accepted, 0u);
}

TEST_F(RetryScenarioTest, UnreachablePeerFails) {
    auto sender = sender_builder();
    sender.with_retry_policy(fast_retry(2));
    start(sender, receiver_builder());
    network_->set_reachable(receiver_peer_.peer_id, false);

    auto outcome = send_and_wait(create_text_file("lost.txt", 100));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(network_->dial_attempts(), 2u);
}

// =============================================================================
// Rejection by the receiver
// =============================================================================

class RejectionScenarioTest : public TransferFixture {};

TEST_F(RejectionScenarioTest, OversizedFileRejectedWithoutRetry) {
    auto receiver = receiver_builder();
    receiver.with_max_file_size(100);
    start(sender_builder(), receiver);

    auto outcome = send_and_wait(create_text_file("big.txt", 500));
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.response.has_value());
    EXPECT_FALSE(outcome.response->success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("exceeds maximum allowed size"), std::string::npos);

    EXPECT_EQ(network_->dial_attempts(), 1u);
    EXPECT_EQ(receiver_->statistics().requests_rejected, 1u);
    EXPECT_FALSE(std::filesystem::exists(output_dir_ / "big.txt"));
}

TEST_F(RejectionScenarioTest, ReceiverCapacityLimit) {
    auto receiver = receiver_builder();
    receiver.with_max_concurrent_transfers(1);
    start(sender_builder(), receiver);
    network_->set_send_delay(5ms);

    auto slow = sender_->send(receiver_peer_,
                              create_text_file("slow.txt", 40 * test_data::chunk_size));
    ASSERT_TRUE(slow.has_value());
    ASSERT_TRUE(wait_until([this] { return receiver_->active_count() == 1; }));

    auto extra = send_and_wait(create_text_file("extra.txt", 100));
    EXPECT_FALSE(extra.success);
    EXPECT_EQ(extra.error.value_or(""), "Too many concurrent transfers (1/1)");

    auto finished = sender_->wait_for_completion(slow.value(), 30s);
    ASSERT_TRUE(finished.has_value());
    EXPECT_TRUE(finished.value().success) << finished.value().error.value_or("");
}

// =============================================================================
// Cancellation and shutdown
// =============================================================================

class CancellationScenarioTest : public TransferFixture {};

TEST_F(CancellationScenarioTest, CancelDuringSending) {
    start();
    network_->set_send_delay(10ms);

    auto id = sender_->send(receiver_peer_,
                            create_text_file("cancel.txt", 100 * test_data::chunk_size));
    ASSERT_TRUE(id.has_value());

    ASSERT_TRUE(wait_until([&] {
        auto progress = sender_->get_progress(id.value());
        return progress && progress->snapshot.status() == transfer_status::sending &&
               progress->snapshot.chunks_moved() > 0;
    }));

    ASSERT_TRUE(sender_->cancel(id.value()).has_value());
    const auto sent_at_cancel = network_->messages_sent();

    auto outcome = sender_->wait_for_completion(id.value(), 5s);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome.value().success);
    EXPECT_EQ(outcome.value().error.value_or(""), "Transfer was cancelled");
    EXPECT_LT(outcome.value().bytes_sent, 100 * test_data::chunk_size);

    // Only the chunk already inside send() may reach the wire after cancel
    std::this_thread::sleep_for(30ms);
    EXPECT_LE(network_->messages_sent(), sent_at_cancel + 1);

    auto final_state = sender_->get_progress(id.value());
    ASSERT_TRUE(final_state.has_value());
    EXPECT_EQ(final_state->snapshot.status(), transfer_status::cancelled);
    EXPECT_EQ(outcome.value().bytes_sent,
              final_state->snapshot.chunks_moved() * test_data::chunk_size);

    // The receiver notices the closed stream and drops its partial state
    EXPECT_TRUE(wait_until([this] { return receiver_->active_count() == 0; }));
    EXPECT_TRUE(wait_until([this] { return receiver_->statistics().transfers_abandoned == 1; }));
    EXPECT_FALSE(std::filesystem::exists(output_dir_ / "cancel.txt"));

    // A second cancel is refused because the transfer is already final
    EXPECT_FALSE(sender_->cancel(id.value()).has_value());
}

TEST_F(CancellationScenarioTest, SenderShutdownCancelsInFlight) {
    start();
    network_->set_send_delay(10ms);

    auto id = sender_->send(receiver_peer_,
                            create_text_file("shutdown.txt", 100 * test_data::chunk_size));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_until([this] { return receiver_->active_count() == 1; }));

    sender_.reset();

    EXPECT_TRUE(wait_until([this] { return receiver_->active_count() == 0; }));
}

// =============================================================================
// Sender-side concurrency
// =============================================================================

class ConcurrencyScenarioTest : public TransferFixture {};

TEST_F(ConcurrencyScenarioTest, SenderLimitRefusesExtraSends) {
    auto sender = sender_builder();
    sender.with_max_concurrent_transfers(2);
    start(sender, receiver_builder());
    network_->set_send_delay(5ms);

    auto first = sender_->send(receiver_peer_, create_text_file("a.txt", 20 * test_data::chunk_size));
    auto second = sender_->send(receiver_peer_, create_text_file("b.txt", 20 * test_data::chunk_size));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(sender_->active_count(), 2u);
    EXPECT_EQ(sender_->list_active().size(), 2u);

    auto third = sender_->send(receiver_peer_, create_text_file("c.txt", 100));
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().code, error_code::capacity_exceeded);

    for (const auto& id : {first.value(), second.value()}) {
        auto outcome = sender_->wait_for_completion(id, 30s);
        ASSERT_TRUE(outcome.has_value());
        EXPECT_TRUE(outcome.value().success) << outcome.value().error.value_or("");
    }

    auto after = sender_->send(receiver_peer_, create_text_file("d.txt", 100));
    EXPECT_TRUE(after.has_value());
}

TEST_F(ConcurrencyScenarioTest, ParallelTransfersAllComplete) {
    start();

    std::vector<transfer_id> ids;
    std::vector<std::filesystem::path> paths;
    for (int i = 0; i < 5; ++i) {
        paths.push_back(create_binary_file("par_" + std::to_string(i) + ".bin",
                                           8 * test_data::chunk_size + static_cast<std::size_t>(i)));
        auto id = sender_->send(receiver_peer_, paths.back());
        ASSERT_TRUE(id.has_value());
        ids.push_back(id.value());
    }

    for (const auto& id : ids) {
        auto outcome = sender_->wait_for_completion(id, 30s);
        ASSERT_TRUE(outcome.has_value());
        EXPECT_TRUE(outcome.value().success) << outcome.value().error.value_or("");
    }
    for (const auto& path : paths) {
        EXPECT_EQ(read_file(output_dir_ / path.filename()), read_file(path));
    }
    EXPECT_EQ(receiver_->statistics().transfers_completed, 5u);
}

}  // namespace kcenon::p2p_convert::test
