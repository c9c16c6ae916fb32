/**
 * @file bench_upload_session.cpp
 * @brief Benchmarks for upload session overhead against a loopback transport
 */

#include <benchmark/benchmark.h>

#include <kcenon/media_upload/core/logging.h>
#include <kcenon/media_upload/session/upload_session.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::media_upload::benchmark {

/**
 * @brief Benchmark for a complete session with the given concurrency
 */
static void BM_UploadSession_Run(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    const auto concurrency = static_cast<std::size_t>(state.range(1));

    get_logger().set_level(log_level::error);

    media_asset asset(test_data_generator::generate_mp4_data(size, 42), "video/mp4",
                      media_category::video);
    auto transport = std::make_shared<loopback_transport>();
    auto timer = std::make_shared<instant_timer_service>();

    session_config config;
    config.concurrency = concurrency;
    config.chunk_spacing = std::chrono::milliseconds(0);

    for (auto _ : state) {
        upload_session session(asset, transport, config, nullptr, timer);
        auto outcome = session.run();
        if (!outcome) {
            state.SkipWithError(outcome.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(outcome.value().media_id.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["requests"] = static_cast<double>(transport->requests());
}

BENCHMARK(BM_UploadSession_Run)
    ->Args({static_cast<int64_t>(sizes::small_image), 1})
    ->Args({static_cast<int64_t>(sizes::short_video), 1})
    ->Args({static_cast<int64_t>(sizes::short_video), 4})
    ->Args({static_cast<int64_t>(sizes::long_video), 4})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::media_upload::benchmark

BENCHMARK_MAIN();
