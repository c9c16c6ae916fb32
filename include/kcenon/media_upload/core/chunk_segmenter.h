/**
 * @file chunk_segmenter.h
 * @brief Chunk size policy and chunk planning
 */

#ifndef KCENON_MEDIA_UPLOAD_CORE_CHUNK_SEGMENTER_H
#define KCENON_MEDIA_UPLOAD_CORE_CHUNK_SEGMENTER_H

#include "kcenon/media_upload/core/chunk_types.h"
#include "kcenon/media_upload/core/types.h"

#include <cstddef>
#include <cstdint>

namespace kcenon::media_upload {

/**
 * @brief Chunk size bands used by the ingestion service
 */
struct chunk_config {
    static constexpr uint64_t mib = 1024 * 1024;

    /// Payloads below this size are sent as a single chunk
    static constexpr uint64_t single_chunk_threshold = 1 * mib;

    /// Payloads at or above this size use large chunks
    static constexpr uint64_t large_payload_threshold = 10 * mib;

    /// Chunk size for payloads between the two thresholds
    static constexpr uint64_t small_chunk_size = 1 * mib;

    /// Chunk size for large payloads, also the server's per-chunk ceiling
    static constexpr uint64_t max_chunk_size = 5 * mib;
};

/**
 * @brief Splits a payload length into an ordered, gap-free chunk plan
 *
 * The plan is computed once per upload session. Retries resend a chunk's
 * exact byte range under the same index.
 */
class chunk_segmenter {
public:
    /**
     * @brief Chunk size for a payload of the given length
     *
     * Under 1 MiB the whole payload is one chunk; from 1 MiB up to 10 MiB
     * chunks are 1 MiB; from 10 MiB chunks are 5 MiB.
     */
    [[nodiscard]] static auto calculate_chunk_size(uint64_t total_bytes) noexcept -> uint64_t;

    /**
     * @brief Partition [0, total_bytes) into chunks of chunk_size
     *
     * All chunks but the last have exactly chunk_size bytes.
     *
     * @return Plan, or invalid_configuration for an empty payload or a
     *         chunk size of zero or above the per-chunk ceiling
     */
    [[nodiscard]] static auto plan_chunks(uint64_t total_bytes, uint64_t chunk_size)
        -> result<chunk_plan>;

    /**
     * @brief Plan using calculate_chunk_size(total_bytes)
     */
    [[nodiscard]] static auto plan(uint64_t total_bytes) -> result<chunk_plan>;

    /**
     * @brief Number of chunks needed for a payload
     */
    [[nodiscard]] static constexpr auto chunk_count(uint64_t total_bytes,
                                                    uint64_t chunk_size) noexcept -> uint64_t {
        if (total_bytes == 0 || chunk_size == 0) return 0;
        return (total_bytes + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CORE_CHUNK_SEGMENTER_H
