/**
 * @file bench_chunk_planning.cpp
 * @brief Benchmarks for chunk planning and APPEND request encoding
 */

#include <benchmark/benchmark.h>

#include <kcenon/media_upload/core/chunk_segmenter.h>
#include <kcenon/media_upload/core/media_asset.h>
#include <kcenon/media_upload/protocol/upload_protocol.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::media_upload::benchmark {

/**
 * @brief Benchmark for planning chunks of payloads of various sizes
 */
static void BM_ChunkSegmenter_Plan(::benchmark::State& state) {
    const auto total = static_cast<uint64_t>(state.range(0));

    for (auto _ : state) {
        auto plan = chunk_segmenter::plan(total);
        if (!plan) {
            state.SkipWithError("Failed to plan chunks");
            return;
        }
        ::benchmark::DoNotOptimize(plan.value().data());
    }

    state.SetItemsProcessed(
        static_cast<int64_t>(chunk_segmenter::chunk_count(
            total, chunk_segmenter::calculate_chunk_size(total))) *
        static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for base64 encoding of chunk payloads
 */
static void BM_Base64_Encode(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_data(size, 42);

    for (auto _ : state) {
        auto encoded = base64_encode(data);
        ::benchmark::DoNotOptimize(encoded.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for building every APPEND request of a video
 */
static void BM_UploadProtocol_AppendFields(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    media_asset asset(test_data_generator::generate_mp4_data(size, 42), "video/mp4",
                      media_category::video);

    auto plan = chunk_segmenter::plan(asset.size());
    if (!plan) {
        state.SkipWithError("Failed to plan chunks");
        return;
    }

    for (auto _ : state) {
        for (const auto& chunk : plan.value()) {
            auto fields = upload_protocol::make_append_fields(
                "710511363345354753", chunk.index, asset.slice(chunk.offset, chunk.length));
            ::benchmark::DoNotOptimize(fields.data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for media type sniffing
 */
static void BM_MimeFromSignature(::benchmark::State& state) {
    auto data = test_data_generator::generate_mp4_data(64, 42);

    for (auto _ : state) {
        auto mime = mime_from_signature(data);
        ::benchmark::DoNotOptimize(mime);
    }
}

BENCHMARK(BM_ChunkSegmenter_Plan)
    ->Arg(static_cast<int64_t>(sizes::small_image))
    ->Arg(static_cast<int64_t>(sizes::short_video))
    ->Arg(static_cast<int64_t>(sizes::max_video))
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_Base64_Encode)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(5 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_UploadProtocol_AppendFields)
    ->Arg(static_cast<int64_t>(sizes::large_image))
    ->Arg(static_cast<int64_t>(sizes::short_video))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_MimeFromSignature)->Unit(::benchmark::kNanosecond);

}  // namespace kcenon::media_upload::benchmark
