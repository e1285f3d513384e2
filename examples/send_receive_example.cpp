/**
 * @file send_receive_example.cpp
 * @brief Send a file to an in-process receiver and request a conversion
 *
 * This example demonstrates:
 * - Wiring a sender and a receiver over the memory transport
 * - Requesting a target format and the converted result
 * - Observing progress updates
 * - Reading the receiver's response
 */

#include <kcenon/p2p_convert/p2p_convert.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace kcenon::p2p_convert;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [file] [target_format]" << std::endl;
    std::cout << std::endl;
    std::cout << "  file           File to send (default: a generated sample.txt)" << std::endl;
    std::cout << "  target_format  pdf or txt (default: none, store only)" << std::endl;
}

auto create_sample_file(const std::filesystem::path& path, std::size_t size)
    -> std::filesystem::path {
    std::ofstream file(path, std::ios::binary);
    const std::string line = "Peer-to-peer conversion sample line.\n";
    for (std::size_t written = 0; written < size; written += line.size()) {
        file << line;
    }
    std::cout << "Created sample file: " << path << std::endl;
    return path;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_usage(argv[0]);
        return 0;
    }

    const auto work_dir = std::filesystem::temp_directory_path() / "p2p_convert_example";
    std::filesystem::create_directories(work_dir);

    const auto file = argc > 1 ? std::filesystem::path(argv[1])
                               : create_sample_file(work_dir / "sample.txt", 200 * 1024);

    send_options options;
    if (argc > 2) {
        options.target_format = argv[2];
        options.return_result = true;
    }

    // Two peers on one in-process network
    auto network = memory_network::create();
    auto sender_transport = memory_transport::create(network, peer_address("laptop"));
    auto receiver_transport =
        memory_transport::create(network, peer_address("converter", "mem://converter"));
    if (!sender_transport || !receiver_transport) {
        std::cerr << "Failed to create transports" << std::endl;
        return 1;
    }

    auto receiver_result = file_receiver::builder()
        .with_transport(receiver_transport.value())
        .with_output_dir(work_dir / "received")
        .build();
    if (!receiver_result.has_value()) {
        std::cerr << "Failed to create receiver: " << receiver_result.error().message
                  << std::endl;
        return 1;
    }
    auto& receiver = receiver_result.value();

    auto sender_result = file_sender::builder()
        .with_transport(sender_transport.value())
        .with_chunk_size(64 * 1024)
        .build();
    if (!sender_result.has_value()) {
        std::cerr << "Failed to create sender: " << sender_result.error().message << std::endl;
        return 1;
    }
    auto& sender = sender_result.value();

    sender.set_progress_callback([](const progress_update& update) {
        std::cout << format_progress(update) << std::endl;
    });

    auto id = sender.send(peer_address("converter"), file, options);
    if (!id) {
        std::cerr << "Send refused: " << id.error().message << std::endl;
        return 1;
    }

    auto outcome = sender.wait_for_completion(id.value());
    if (!outcome) {
        std::cerr << "Lost track of transfer: " << outcome.error().message << std::endl;
        return 1;
    }

    const auto& sent = outcome.value();
    std::cout << std::endl;
    std::cout << "Transfer " << sent.id.short_string() << ": "
              << (sent.success ? "completed" : "failed") << std::endl;
    std::cout << "  Bytes sent: " << sent.bytes_sent << std::endl;
    std::cout << "  Elapsed: " << sent.elapsed.count() << "ms" << std::endl;
    if (sent.error) {
        std::cout << "  Error: " << *sent.error << std::endl;
    }
    if (sent.response) {
        const auto& response = *sent.response;
        std::cout << "  Receiver processing: " << response.processing_time_ms << "ms"
                  << std::endl;
        if (response.error) {
            std::cout << "  Receiver note: " << *response.error << std::endl;
        }
        if (response.converted_filename) {
            std::cout << "  Converted file: " << *response.converted_filename << std::endl;
        }
        if (response.converted_data) {
            std::cout << "  Converted bytes returned: " << response.converted_data->size()
                      << std::endl;
        }
    }

    auto stats = receiver.statistics();
    std::cout << "Receiver stored " << stats.transfers_completed << " file(s) in "
              << receiver.config().output_dir << std::endl;

    return sent.success ? 0 : 1;
}
