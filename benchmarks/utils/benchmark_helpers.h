/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_MEDIA_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_MEDIA_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/media_upload/core/timer_service.h>
#include <kcenon/media_upload/transport/transport_client.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::media_upload::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Random data starting with an MP4 ftyp box
     */
    static auto generate_mp4_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Transport that acknowledges every request without I/O
 */
class loopback_transport : public transport_client {
public:
    [[nodiscard]] auto post_form(const std::string& url,
                                 const form_fields& fields,
                                 const request_options& options)
        -> result<transport_response> override;

    [[nodiscard]] auto post_json(const std::string& url,
                                 const std::string& body,
                                 const request_options& options)
        -> result<transport_response> override;

    [[nodiscard]] auto get_json(const std::string& url,
                                const query_params& query,
                                const request_options& options)
        -> result<transport_response> override;

    [[nodiscard]] auto requests() const noexcept -> uint64_t { return requests_.load(); }

private:
    std::atomic<uint64_t> requests_{0};
};

/**
 * @brief timer_service whose waits return immediately
 */
class instant_timer_service : public timer_service {
public:
    [[nodiscard]] auto now() const -> time_point override;

    auto wait_for(std::chrono::milliseconds duration,
                  const cancellation_token& token) -> bool override;

private:
    mutable std::mutex mutex_;
    time_point now_{};
};

/**
 * @brief Format bytes as human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_image = 200 * KB;
constexpr std::size_t large_image = 5 * MB;
constexpr std::size_t short_video = 12 * MB;
constexpr std::size_t long_video = 100 * MB;
constexpr std::size_t max_video = 512 * MB;
}  // namespace sizes

}  // namespace kcenon::media_upload::benchmark

#endif  // KCENON_MEDIA_UPLOAD_BENCHMARKS_BENCHMARK_HELPERS_H
