/**
 * @file chunk_types.h
 * @brief Chunk plan data structures for media_upload
 * @version 0.1.0
 *
 * A chunk plan is the ordered list of byte ranges a payload is sent in,
 * one APPEND request per range.
 */

#ifndef KCENON_MEDIA_UPLOAD_CORE_CHUNK_TYPES_H
#define KCENON_MEDIA_UPLOAD_CORE_CHUNK_TYPES_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kcenon::media_upload {

/**
 * @brief Transfer status of a single chunk
 */
enum class chunk_status : uint8_t {
    pending,   ///< Not sent yet, or re-armed for a retry
    inflight,  ///< APPEND request outstanding
    acked,     ///< Server acknowledged the chunk
    failed     ///< Retries exhausted or a fatal error occurred
};

[[nodiscard]] constexpr auto to_string(chunk_status status) noexcept -> const char* {
    switch (status) {
        case chunk_status::pending: return "pending";
        case chunk_status::inflight: return "inflight";
        case chunk_status::acked: return "acked";
        case chunk_status::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief One contiguous byte range of a payload
 */
struct chunk_descriptor {
    uint32_t index = 0;        ///< 0-based segment index sent as segment_index
    uint64_t offset = 0;
    uint64_t length = 0;
    uint32_t attempt = 0;      ///< APPEND requests issued for this chunk
    chunk_status status = chunk_status::pending;

    [[nodiscard]] constexpr auto end() const noexcept -> uint64_t {
        return offset + length;
    }

    [[nodiscard]] constexpr auto is_last(std::size_t total_chunks) const noexcept -> bool {
        return static_cast<std::size_t>(index) + 1 == total_chunks;
    }
};

using chunk_plan = std::vector<chunk_descriptor>;

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CORE_CHUNK_TYPES_H
