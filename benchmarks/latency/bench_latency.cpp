/**
 * @file bench_latency.cpp
 * @brief Benchmarks for end-to-end transfer latency over the memory transport
 */

#include <benchmark/benchmark.h>

#include <kcenon/p2p_convert/p2p_convert.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <random>

namespace kcenon::p2p_convert::benchmark {

namespace {

/**
 * @brief Sender and receiver joined by an in-process network
 */
class benchmark_fixture {
public:
    benchmark_fixture() = default;
    ~benchmark_fixture() { cleanup(); }

    benchmark_fixture(const benchmark_fixture&) = delete;
    auto operator=(const benchmark_fixture&) -> benchmark_fixture& = delete;

    auto setup() -> bool {
        if (sender_) return true;

        base_dir_ = std::filesystem::temp_directory_path() /
                    ("bench_latency_" + std::to_string(std::random_device{}()));
        files_ = std::make_unique<temp_file_manager>(base_dir_ / "outgoing");

        network_ = memory_network::create();
        auto sender_transport = memory_transport::create(network_, peer_address("bench_sender"));
        auto receiver_transport = memory_transport::create(network_, receiver_peer_);
        if (!sender_transport || !receiver_transport) {
            return false;
        }

        auto receiver_result = file_receiver::builder()
                                   .with_transport(receiver_transport.value())
                                   .with_output_dir(base_dir_ / "received")
                                   .build();
        if (!receiver_result) {
            return false;
        }
        receiver_ = std::make_unique<file_receiver>(std::move(receiver_result.value()));

        auto sender_result = file_sender::builder()
                                 .with_transport(sender_transport.value())
                                 .with_chunk_size(sizes::min_chunk)
                                 .build();
        if (!sender_result) {
            return false;
        }
        sender_ = std::make_unique<file_sender>(std::move(sender_result.value()));
        return true;
    }

    auto create_file(const std::string& name, std::size_t size, bool text)
        -> std::filesystem::path {
        if (text) {
            return files_->create_text_file(name, size, 42);
        }
        return files_->create_random_file(name, size, 42);
    }

    void cleanup() {
        sender_.reset();
        receiver_.reset();
        files_.reset();

        if (!base_dir_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(base_dir_, ec);
        }
    }

    [[nodiscard]] auto sender() -> file_sender& { return *sender_; }
    [[nodiscard]] auto receiver_peer() const -> const peer_address& { return receiver_peer_; }

private:
    peer_address receiver_peer_{"bench_receiver"};
    std::filesystem::path base_dir_;
    std::unique_ptr<temp_file_manager> files_;
    std::shared_ptr<memory_network> network_;
    std::unique_ptr<file_receiver> receiver_;
    std::unique_ptr<file_sender> sender_;
};

// Global fixture shared by all latency benchmarks
benchmark_fixture g_fixture;

}  // namespace

/**
 * @brief Time from send() to a completed outcome
 */
static void BM_Transfer_RoundTrip(::benchmark::State& state) {
    if (!g_fixture.setup()) {
        state.SkipWithError("Failed to set up sender and receiver");
        return;
    }

    const auto size = static_cast<std::size_t>(state.range(0));
    auto path = g_fixture.create_file("round_trip_" + std::to_string(size) + ".bin", size, false);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        auto id = g_fixture.sender().send(g_fixture.receiver_peer(), path);
        if (!id) {
            state.SkipWithError("Send refused");
            return;
        }
        auto outcome = g_fixture.sender().wait_for_completion(id.value());
        auto end = std::chrono::high_resolution_clock::now();

        if (!outcome || !outcome.value().success) {
            state.SkipWithError("Transfer failed");
            return;
        }

        state.SetIterationTime(std::chrono::duration<double>(end - start).count());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Round trip including a conversion request the receiver declines
 */
static void BM_Transfer_ConversionRequest(::benchmark::State& state) {
    if (!g_fixture.setup()) {
        state.SkipWithError("Failed to set up sender and receiver");
        return;
    }

    auto path = g_fixture.create_file("convert.txt", sizes::small_file, true);
    send_options options;
    options.target_format = "pdf";

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        auto id = g_fixture.sender().send(g_fixture.receiver_peer(), path, options);
        if (!id) {
            state.SkipWithError("Send refused");
            return;
        }
        auto outcome = g_fixture.sender().wait_for_completion(id.value());
        auto end = std::chrono::high_resolution_clock::now();

        if (!outcome) {
            state.SkipWithError("Transfer lost");
            return;
        }

        state.SetIterationTime(std::chrono::duration<double>(end - start).count());
    }
}

BENCHMARK(BM_Transfer_RoundTrip)
    ->Arg(static_cast<int64_t>(1 * sizes::KB))
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->UseManualTime()
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Transfer_ConversionRequest)->UseManualTime()->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::p2p_convert::benchmark
