/**
 * @file retry_example.cpp
 * @brief Retry policy and cancellation example
 *
 * This example demonstrates:
 * - Configuring the retry policy and its backoff
 * - Recovering from injected connection failures
 * - Cancelling a slow transfer mid-stream
 */

#include <kcenon/p2p_convert/p2p_convert.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

using namespace kcenon::p2p_convert;

namespace {

auto create_sample_file(const std::filesystem::path& path, std::size_t size)
    -> std::filesystem::path {
    std::ofstream file(path, std::ios::binary);
    file << std::string(size, 'r');
    return path;
}

/**
 * @brief Format duration to human-readable string
 */
auto format_duration(std::chrono::milliseconds ms) -> std::string {
    if (ms.count() >= 1000) {
        return std::to_string(ms.count() / 1000) + "." +
               std::to_string((ms.count() % 1000) / 100) + "s";
    }
    return std::to_string(ms.count()) + "ms";
}

void report(file_sender& sender, const transfer_id& id) {
    auto outcome = sender.wait_for_completion(id);
    if (!outcome) {
        std::cout << "  wait failed: " << outcome.error().message << std::endl;
        return;
    }
    uint32_t attempts = 0;
    if (auto progress = sender.get_progress(id)) {
        attempts = progress->snapshot.connection_attempts();
    }
    std::cout << "  " << (outcome.value().success ? "completed" : "not completed") << " after "
              << attempts << " attempt(s) in " << format_duration(outcome.value().elapsed)
              << std::endl;
    if (outcome.value().error) {
        std::cout << "  reason: " << *outcome.value().error << std::endl;
    }
}

}  // namespace

int main() {
    const auto work_dir = std::filesystem::temp_directory_path() / "p2p_convert_retry_example";
    std::filesystem::create_directories(work_dir);
    const auto file = create_sample_file(work_dir / "payload.txt", 512 * 1024);

    auto network = memory_network::create();
    auto sender_transport = memory_transport::create(network, peer_address("client"));
    auto receiver_transport = memory_transport::create(network, peer_address("server"));
    if (!sender_transport || !receiver_transport) {
        std::cerr << "Failed to create transports" << std::endl;
        return 1;
    }

    auto receiver_result = file_receiver::builder()
        .with_transport(receiver_transport.value())
        .with_output_dir(work_dir / "received")
        .build();
    if (!receiver_result) {
        std::cerr << "Failed to create receiver: " << receiver_result.error().message
                  << std::endl;
        return 1;
    }

    retry_policy policy;
    policy.max_attempts = 4;
    policy.initial_delay = std::chrono::milliseconds(100);
    policy.max_delay = std::chrono::milliseconds(1000);
    policy.backoff_multiplier = 2.0;

    std::cout << "Backoff schedule:";
    for (uint32_t retry = 0; retry + 1 < policy.max_attempts; ++retry) {
        std::cout << " " << policy.delay_for(retry).count() << "ms";
    }
    std::cout << std::endl;

    auto sender_result = file_sender::builder()
        .with_transport(sender_transport.value())
        .with_chunk_size(32 * 1024)
        .with_retry_policy(policy)
        .build();
    if (!sender_result) {
        std::cerr << "Failed to create sender: " << sender_result.error().message << std::endl;
        return 1;
    }
    auto& sender = sender_result.value();
    const peer_address server("server");

    // Two dial failures, recovered by the third attempt
    std::cout << "Sending with two injected connection failures..." << std::endl;
    network->set_dial_failures("server", 2);
    if (auto id = sender.send(server, file)) {
        report(sender, id.value());
    }

    // More failures than attempts
    std::cout << "Sending with the peer failing every dial..." << std::endl;
    network->set_dial_failures("server", 10);
    if (auto id = sender.send(server, file)) {
        report(sender, id.value());
    }
    network->set_dial_failures("server", 0);

    // Slow link, cancelled partway through
    std::cout << "Sending over a slow link and cancelling..." << std::endl;
    network->set_send_delay(std::chrono::milliseconds(20));
    if (auto id = sender.send(server, file)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (auto cancelled = sender.cancel(id.value()); !cancelled) {
            std::cout << "  cancel refused: " << cancelled.error().message << std::endl;
        }
        report(sender, id.value());
    }

    const auto stats = sender.statistics();
    std::cout << "Totals: " << stats.transfers_completed << " completed, "
              << stats.transfers_failed << " failed, " << stats.transfers_cancelled
              << " cancelled, " << stats.retries << " retries" << std::endl;
    for (const auto& [category, count] : stats.errors_by_category) {
        std::cout << "  " << to_string(category) << " errors: " << count << std::endl;
    }

    return 0;
}
