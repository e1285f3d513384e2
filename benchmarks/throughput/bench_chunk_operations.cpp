/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunk splitting, reassembly, checksums and detection
 */

#include <benchmark/benchmark.h>

#include <kcenon/p2p_convert/conversion/format_detector.h>
#include <kcenon/p2p_convert/core/checksum.h>
#include <kcenon/p2p_convert/core/chunk_codec.h>
#include <kcenon/p2p_convert/core/chunk_splitter.h>
#include <kcenon/p2p_convert/core/receiver_assembly.h>

#include "utils/benchmark_helpers.h"

#include <map>

namespace kcenon::p2p_convert::benchmark {

/**
 * @brief Benchmark for streaming a file through chunk_splitter
 */
static void BM_ChunkSplitter_Split(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto test_file = temp_files.create_random_file("split_test.bin", file_size, 42);

    chunk_splitter splitter(chunk_config(chunk_size));

    for (auto _ : state) {
        state.PauseTiming();
        auto id = transfer_id::generate();
        state.ResumeTiming();

        auto split = splitter.split(test_file, id);
        if (!split) {
            state.SkipWithError("Failed to create splitter iterator");
            return;
        }

        auto& iterator = split.value();
        while (iterator.has_next()) {
            auto next = iterator.next();
            if (!next) {
                state.SkipWithError("Failed to get chunk");
                return;
            }
            ::benchmark::DoNotOptimize(next.value());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>((file_size + chunk_size - 1) / chunk_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for in-memory splitting with per-chunk CRC32
 */
static void BM_ChunkCodec_Split(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));
    auto data = test_data_generator::generate_random_data(data_size, 42);
    const auto id = transfer_id::generate();

    for (auto _ : state) {
        auto chunks = chunk_codec::split(data, chunk_size, id);
        if (!chunks) {
            state.SkipWithError("Split failed");
            return;
        }
        ::benchmark::DoNotOptimize(chunks.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for receiver-side assembly of out-of-order chunks
 */
static void BM_ReceiverAssembly_Assemble(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));
    auto data = test_data_generator::generate_random_data(data_size, 42);
    const auto id = transfer_id::generate();

    auto split = chunk_codec::split(data, chunk_size, id);
    if (!split) {
        state.SkipWithError("Split failed");
        return;
    }
    const auto& chunks = split.value();

    for (auto _ : state) {
        state.PauseTiming();
        receiver_assembly assembly(id, chunks.size(), data_size);
        state.ResumeTiming();

        // Deliver in reverse to exercise reordering
        for (auto it = chunks.rbegin(); it != chunks.rend(); ++it) {
            auto added = assembly.add_chunk(it->index, it->data);
            if (!added) {
                state.SkipWithError("Failed to add chunk");
                return;
            }
        }
        auto assembled = assembly.assemble();
        if (!assembled) {
            state.SkipWithError("Assembly failed");
            return;
        }
        ::benchmark::DoNotOptimize(assembled.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(chunks.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for CRC32 checksum calculation
 */
static void BM_Checksum_CRC32(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(data_size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(data);
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for content-based format detection
 */
static void BM_FormatDetector_Detect(::benchmark::State& state) {
    std::vector<std::byte> data;
    const char* label = "binary";
    switch (state.range(0)) {
        case 1:
            data = test_data_generator::generate_text_data(sizes::small_file, 42);
            label = "text";
            break;
        case 2:
            data = test_data_generator::generate_bom_text_data(sizes::small_file, 42);
            label = "bom_text";
            break;
        case 3:
            data = test_data_generator::generate_pdf_like_data(sizes::small_file, 42);
            label = "pdf";
            break;
        default:
            data = test_data_generator::generate_random_data(sizes::small_file, 42);
            break;
    }

    for (auto _ : state) {
        auto format = format_detector::detect(data);
        ::benchmark::DoNotOptimize(format);
    }

    state.SetLabel(label);
}

// Chunk splitter benchmarks
BENCHMARK(BM_ChunkSplitter_Split)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Unit(::benchmark::kMillisecond);

// Chunk codec benchmarks
BENCHMARK(BM_ChunkCodec_Split)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

// Receiver assembly benchmarks
BENCHMARK(BM_ReceiverAssembly_Assemble)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Unit(::benchmark::kMillisecond);

// CRC32 benchmarks
BENCHMARK(BM_Checksum_CRC32)
    ->Arg(static_cast<int64_t>(1 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

// Format detection benchmarks
BENCHMARK(BM_FormatDetector_Detect)->DenseRange(0, 3)->Unit(::benchmark::kNanosecond);

}  // namespace kcenon::p2p_convert::benchmark
