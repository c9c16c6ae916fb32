/**
 * @file chunk_segmenter.cpp
 * @brief Implementation of chunk planning
 */

#include "kcenon/media_upload/core/chunk_segmenter.h"

#include <string>

namespace kcenon::media_upload {

auto chunk_segmenter::calculate_chunk_size(uint64_t total_bytes) noexcept -> uint64_t {
    if (total_bytes < chunk_config::single_chunk_threshold) {
        return total_bytes;
    }
    if (total_bytes < chunk_config::large_payload_threshold) {
        return chunk_config::small_chunk_size;
    }
    return chunk_config::max_chunk_size;
}

auto chunk_segmenter::plan_chunks(uint64_t total_bytes, uint64_t chunk_size)
    -> result<chunk_plan> {
    if (total_bytes == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "cannot plan chunks for an empty payload"});
    }
    if (chunk_size == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "chunk size must be greater than zero"});
    }
    if (chunk_size > chunk_config::max_chunk_size) {
        return unexpected(error{
            error_code::invalid_configuration,
            "chunk size too large (maximum: " + std::to_string(chunk_config::max_chunk_size) +
                ")"});
    }

    auto count = chunk_count(total_bytes, chunk_size);

    chunk_plan plan;
    plan.reserve(static_cast<std::size_t>(count));

    uint64_t offset = 0;
    for (uint64_t i = 0; i < count; ++i) {
        chunk_descriptor chunk;
        chunk.index = static_cast<uint32_t>(i);
        chunk.offset = offset;
        // The last chunk takes whatever remains
        chunk.length = (i == count - 1) ? total_bytes - offset : chunk_size;
        plan.push_back(chunk);
        offset += chunk.length;
    }

    return plan;
}

auto chunk_segmenter::plan(uint64_t total_bytes) -> result<chunk_plan> {
    return plan_chunks(total_bytes, calculate_chunk_size(total_bytes));
}

}  // namespace kcenon::media_upload
