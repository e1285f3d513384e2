/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_P2P_CONVERT_TEST_FIXTURES_H
#define KCENON_P2P_CONVERT_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/p2p_convert/p2p_convert.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <random>
#include <sstream>
#include <thread>
#include <vector>

namespace kcenon::p2p_convert::test {

/**
 * @brief Test data sizes
 */
namespace test_data {
    constexpr std::size_t chunk_size = 4 * 1024;               // 4KB
    constexpr std::size_t small_file_size = 1024;              // 1KB
    constexpr std::size_t medium_file_size = 256 * 1024;       // 256KB
}

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("p2p_convert_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        output_dir_ = test_dir_ / "received";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_text_file(const std::string& name, std::size_t size) -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        const std::string pattern = "The quick brown fox jumps over the lazy dog. ";
        std::size_t written = 0;
        while (written < size) {
            const auto n = std::min(pattern.size(), size - written);
            file.write(pattern.data(), static_cast<std::streamsize>(n));
            written += n;
        }
        return path;
    }

    auto create_binary_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);
        for (std::size_t i = 0; i < size; ++i) {
            // Leading NUL keeps the content from ever looking like text
            char byte = i == 0 ? '\0' : static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
    }

    std::filesystem::path test_dir_;
    std::filesystem::path output_dir_;
};

/**
 * @brief A sender and a receiver joined by an in-process network
 *
 * Tests adjust the builders returned by sender_builder() and
 * receiver_builder() and then call start().
 */
class TransferFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        network_ = memory_network::create();

        auto sender_transport = memory_transport::create(network_, peer_address("sender"));
        ASSERT_TRUE(sender_transport.has_value()) << "Failed to create sender transport";
        sender_transport_ = sender_transport.value();

        auto receiver_transport = memory_transport::create(network_, receiver_peer_);
        ASSERT_TRUE(receiver_transport.has_value()) << "Failed to create receiver transport";
        receiver_transport_ = receiver_transport.value();
    }

    void TearDown() override {
        sender_.reset();
        receiver_.reset();
        TempDirectoryFixture::TearDown();
    }

    static auto fast_retry(uint32_t attempts = 5) -> retry_policy {
        retry_policy policy;
        policy.max_attempts = attempts;
        policy.initial_delay = std::chrono::milliseconds(1);
        policy.max_delay = std::chrono::milliseconds(5);
        policy.attempt_timeout = std::chrono::seconds(10);
        return policy;
    }

    auto sender_builder() -> file_sender::builder {
        file_sender::builder builder;
        builder.with_transport(sender_transport_)
            .with_chunk_size(test_data::chunk_size)
            .with_retry_policy(fast_retry())
            .with_worker_count(4);
        return builder;
    }

    auto receiver_builder() -> file_receiver::builder {
        file_receiver::builder builder;
        builder.with_transport(receiver_transport_).with_output_dir(output_dir_).with_worker_count(4);
        return builder;
    }

    void start(file_sender::builder sender, file_receiver::builder receiver) {
        auto receiver_result = receiver.build();
        ASSERT_TRUE(receiver_result.has_value()) << "Failed to create receiver";
        receiver_ = std::make_unique<file_receiver>(std::move(receiver_result.value()));

        auto sender_result = sender.build();
        ASSERT_TRUE(sender_result.has_value()) << "Failed to create sender";
        sender_ = std::make_unique<file_sender>(std::move(sender_result.value()));
    }

    void start() { start(sender_builder(), receiver_builder()); }

    /**
     * @brief Send @p path and block until the transfer is terminal
     */
    auto send_and_wait(const std::filesystem::path& path, const send_options& options = {})
        -> send_result {
        auto id = sender_->send(receiver_peer_, path, options);
        EXPECT_TRUE(id.has_value()) << (id ? "" : id.error().message);
        if (!id) {
            return {};
        }
        auto outcome = sender_->wait_for_completion(id.value(), std::chrono::seconds(30));
        EXPECT_TRUE(outcome.has_value());
        return outcome ? outcome.value() : send_result{};
    }

    /**
     * @brief Poll @p predicate until it holds or @p timeout passes
     */
    static auto wait_until(const std::function<bool()>& predicate,
                           std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    peer_address receiver_peer_{"receiver", "mem://receiver"};
    std::shared_ptr<memory_network> network_;
    std::shared_ptr<memory_transport> sender_transport_;
    std::shared_ptr<memory_transport> receiver_transport_;
    std::unique_ptr<file_receiver> receiver_;
    std::unique_ptr<file_sender> sender_;
};

}  // namespace kcenon::p2p_convert::test

#endif  // KCENON_P2P_CONVERT_TEST_FIXTURES_H
