/**
 * @file test_file_sender.cpp
 * @brief Unit tests for file_sender construction, admission and failure paths
 */

#include <gtest/gtest.h>

#include <kcenon/p2p_convert/client/file_sender.h>
#include <kcenon/p2p_convert/transport/memory_transport.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <thread>

namespace kcenon::p2p_convert::test {

using namespace std::chrono_literals;

class FileSenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("p2p_convert_sender_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(dir_);

        network_ = memory_network::create();
        auto t = memory_transport::create(network_, peer_address("sender"));
        ASSERT_TRUE(t.has_value());
        transport_ = t.value();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    auto write_file(const std::string& name, std::size_t size) -> std::filesystem::path {
        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, 'x');
        return path;
    }

    static auto fast_retry(uint32_t attempts) -> retry_policy {
        retry_policy policy;
        policy.max_attempts = attempts;
        policy.initial_delay = 1ms;
        policy.max_delay = 2ms;
        policy.attempt_timeout = 500ms;
        return policy;
    }

    auto make_sender(const retry_policy& policy = fast_retry(1)) -> file_sender {
        auto built = file_sender::builder()
                         .with_transport(transport_)
                         .with_chunk_size(16)
                         .with_max_file_size(1024)
                         .with_retry_policy(policy)
                         .with_worker_count(2)
                         .build();
        EXPECT_TRUE(built.has_value());
        return std::move(built).value();
    }

    std::filesystem::path dir_;
    std::shared_ptr<memory_network> network_;
    std::shared_ptr<memory_transport> transport_;
};

TEST_F(FileSenderTest, BuildRequiresTransport) {
    auto built = file_sender::builder().build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(FileSenderTest, BuildRejectsInvalidSettings) {
    auto no_workers = file_sender::builder().with_transport(transport_).with_worker_count(0).build();
    ASSERT_FALSE(no_workers.has_value());
    EXPECT_EQ(no_workers.error().code, error_code::invalid_configuration);

    auto no_slots =
        file_sender::builder().with_transport(transport_).with_max_concurrent_transfers(0).build();
    ASSERT_FALSE(no_slots.has_value());

    retry_policy never;
    never.max_attempts = 0;
    auto no_attempts = file_sender::builder().with_transport(transport_).with_retry_policy(never).build();
    ASSERT_FALSE(no_attempts.has_value());
    EXPECT_EQ(no_attempts.error().code, error_code::invalid_configuration);
}

TEST_F(FileSenderTest, DefaultConfig) {
    auto sender = file_sender::builder().with_transport(transport_).build();
    ASSERT_TRUE(sender.has_value());
    EXPECT_EQ(sender.value().config().chunk_size, chunk_config::default_chunk_size);
    EXPECT_EQ(sender.value().config().max_concurrent_transfers, 5u);
    EXPECT_EQ(sender.value().config().retry.max_attempts, 5u);
    EXPECT_EQ(sender.value().active_count(), 0u);
}

TEST_F(FileSenderTest, MissingFileRejectedBeforeNetwork) {
    auto sender = make_sender();
    auto id = sender.send(peer_address("receiver"), dir_ / "absent.txt");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::file_not_found);
    EXPECT_EQ(sender.active_count(), 0u);
    EXPECT_EQ(network_->dial_attempts(), 0u);
}

TEST_F(FileSenderTest, OversizedFileRejectedBeforeNetwork) {
    auto sender = make_sender();
    auto id = sender.send(peer_address("receiver"), write_file("big.txt", 2048));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::file_too_large);
    EXPECT_EQ(network_->dial_attempts(), 0u);
}

TEST_F(FileSenderTest, UnencodableRequestRejectedBeforeNetwork) {
    auto sender = make_sender();
    send_options options;
    options.target_format = std::string(70000, 'p');

    auto id = sender.send(peer_address("receiver"), write_file("note.txt", 40), options);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::malformed_message);
    EXPECT_EQ(sender.active_count(), 0u);
    EXPECT_EQ(network_->dial_attempts(), 0u);

    auto stats = sender.statistics();
    EXPECT_EQ(stats.transfers_rejected, 1u);
    EXPECT_EQ(stats.transfers_started, 0u);
    EXPECT_EQ(stats.errors_in(error_category::protocol), 1u);
}

TEST_F(FileSenderTest, UnknownTransferLookups) {
    auto sender = make_sender();
    const auto unknown = transfer_id::generate();

    auto waited = sender.wait_for_completion(unknown, 10ms);
    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().code, error_code::transfer_not_found);

    EXPECT_FALSE(sender.cancel(unknown).has_value());
    EXPECT_FALSE(sender.get_progress(unknown).has_value());
}

TEST_F(FileSenderTest, UnreachablePeerFailsAfterRetries) {
    auto sender = make_sender(fast_retry(3));
    auto id = sender.send(peer_address("nobody"), write_file("note.txt", 40));
    ASSERT_TRUE(id.has_value());

    auto outcome = sender.wait_for_completion(id.value(), 5s);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome.value().success);
    ASSERT_TRUE(outcome.value().error.has_value());
    EXPECT_FALSE(outcome.value().response.has_value());
    EXPECT_EQ(network_->dial_attempts(), 3u);

    auto progress = sender.get_progress(id.value());
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->snapshot.status(), transfer_status::failed);
    EXPECT_EQ(progress->snapshot.connection_attempts(), 3u);
    EXPECT_EQ(sender.active_count(), 0u);
}

TEST_F(FileSenderTest, ProgressCallbackSeesTerminalStatus) {
    auto sender = make_sender();
    std::atomic<bool> saw_failed{false};
    sender.set_progress_callback([&saw_failed](const progress_update& update) {
        if (update.snapshot.status() == transfer_status::failed) {
            saw_failed = true;
        }
    });

    auto id = sender.send(peer_address("nobody"), write_file("note.txt", 10));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(sender.wait_for_completion(id.value(), 5s).has_value());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!saw_failed && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(saw_failed.load());
}

TEST_F(FileSenderTest, StatisticsCountRejectionsRetriesAndFailures) {
    auto sender = make_sender(fast_retry(3));

    EXPECT_FALSE(sender.send(peer_address("receiver"), dir_ / "absent.txt").has_value());
    EXPECT_FALSE(sender.send(peer_address("receiver"), write_file("big.txt", 2048)).has_value());

    auto id = sender.send(peer_address("nobody"), write_file("note.txt", 40));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(sender.wait_for_completion(id.value(), 5s).has_value());

    // The outcome is recorded just after the terminal status is published
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (sender.statistics().terminal_count() < 1 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }

    auto stats = sender.statistics();
    EXPECT_EQ(stats.transfers_rejected, 2u);
    EXPECT_EQ(stats.transfers_started, 1u);
    EXPECT_EQ(stats.transfers_failed, 1u);
    EXPECT_EQ(stats.transfers_completed, 0u);
    EXPECT_EQ(stats.active_transfers, 0u);
    EXPECT_EQ(stats.peak_concurrent_transfers, 1u);
    EXPECT_EQ(stats.retries, 2u);
    EXPECT_EQ(stats.bytes_transferred, 0u);
    EXPECT_EQ(stats.errors_in(error_category::resource), 2u);
    EXPECT_EQ(stats.errors_in(error_category::network), 2u);
    EXPECT_EQ(stats.errors_in(error_category::state), 1u);
    EXPECT_EQ(stats.error_count, 5u);
}

}  // namespace kcenon::p2p_convert::test
