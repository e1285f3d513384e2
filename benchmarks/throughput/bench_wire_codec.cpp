/**
 * @file bench_wire_codec.cpp
 * @brief Benchmarks for frame encoding and decoding
 */

#include <benchmark/benchmark.h>

#include <kcenon/p2p_convert/core/chunk_codec.h>
#include <kcenon/p2p_convert/core/wire_codec.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <span>
#include <vector>

namespace kcenon::p2p_convert::benchmark {

namespace {

auto make_chunk(std::size_t size) -> chunk {
    auto data = test_data_generator::generate_random_data(size, 42);
    return chunk_codec::make_chunk(transfer_id::generate(), 0, 1, std::move(data));
}

}  // namespace

/**
 * @brief Benchmark for encoding a chunk into a framed message
 */
static void BM_WireCodec_EncodeChunk(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const auto c = make_chunk(size);

    for (auto _ : state) {
        auto framed = wire_codec::encode(c);
        ::benchmark::DoNotOptimize(framed);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for frame validation plus chunk decoding
 */
static void BM_WireCodec_DecodeChunk(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const auto encoded = wire_codec::encode(make_chunk(size));
    if (!encoded) {
        state.SkipWithError(encoded.error().message.c_str());
        return;
    }
    const auto& framed = encoded.value();

    for (auto _ : state) {
        auto f = wire_codec::decode_frame(framed);
        if (!f) {
            state.SkipWithError("Frame rejected");
            return;
        }
        auto decoded = wire_codec::decode_chunk(f.value());
        if (!decoded) {
            state.SkipWithError("Chunk rejected");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for the incremental decoder fed in fixed-size pieces
 */
static void BM_FrameDecoder_Stream(::benchmark::State& state) {
    const auto piece = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t frames_per_iteration = 16;

    std::vector<uint8_t> stream;
    for (std::size_t i = 0; i < frames_per_iteration; ++i) {
        auto framed = wire_codec::encode(make_chunk(64 * sizes::KB));
        if (!framed) {
            state.SkipWithError(framed.error().message.c_str());
            return;
        }
        stream.insert(stream.end(), framed.value().begin(), framed.value().end());
    }

    for (auto _ : state) {
        frame_decoder decoder;
        std::size_t decoded = 0;
        for (std::size_t offset = 0; offset < stream.size(); offset += piece) {
            const auto n = std::min(piece, stream.size() - offset);
            decoder.feed(std::span<const uint8_t>(stream.data() + offset, n));
            while (true) {
                auto next = decoder.next();
                if (!next) {
                    state.SkipWithError("Decoder rejected stream");
                    return;
                }
                if (!next.value()) {
                    break;
                }
                ++decoded;
            }
        }
        if (decoded != frames_per_iteration) {
            state.SkipWithError("Frames lost");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(stream.size()) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_WireCodec_EncodeChunk)
    ->Arg(static_cast<int64_t>(4 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_WireCodec_DecodeChunk)
    ->Arg(static_cast<int64_t>(4 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_FrameDecoder_Stream)
    ->Arg(1500)
    ->Arg(static_cast<int64_t>(16 * sizes::KB))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::p2p_convert::benchmark
