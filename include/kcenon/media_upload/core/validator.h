/**
 * @file validator.h
 * @brief Pre-flight validation of media assets
 *
 * Validation is pure: no I/O, no exceptions, and every violation is
 * collected instead of stopping at the first one.
 */

#ifndef KCENON_MEDIA_UPLOAD_CORE_VALIDATOR_H
#define KCENON_MEDIA_UPLOAD_CORE_VALIDATOR_H

#include "kcenon/media_upload/core/media_asset.h"
#include "kcenon/media_upload/core/types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_upload {

/**
 * @brief Rule that a violation breaks
 */
enum class violation_code {
    empty_payload,
    size_exceeded,
    unsupported_content_type,
    category_mismatch,
    signature_mismatch,
    alt_text_too_long,
    empty_set,
    too_many_images,
    too_many_videos,
    too_many_animated_images,
    mixed_categories
};

[[nodiscard]] constexpr auto to_string(violation_code code) noexcept -> const char* {
    switch (code) {
        case violation_code::empty_payload: return "empty_payload";
        case violation_code::size_exceeded: return "size_exceeded";
        case violation_code::unsupported_content_type: return "unsupported_content_type";
        case violation_code::category_mismatch: return "category_mismatch";
        case violation_code::signature_mismatch: return "signature_mismatch";
        case violation_code::alt_text_too_long: return "alt_text_too_long";
        case violation_code::empty_set: return "empty_set";
        case violation_code::too_many_images: return "too_many_images";
        case violation_code::too_many_videos: return "too_many_videos";
        case violation_code::too_many_animated_images: return "too_many_animated_images";
        case violation_code::mixed_categories: return "mixed_categories";
        default: return "unknown";
    }
}

/**
 * @brief A single broken rule
 */
struct violation {
    violation_code code;
    std::optional<std::size_t> asset_index;  ///< Set by set validation
    std::string message;
};

/**
 * @brief Outcome of a validation run
 */
struct validation_result {
    bool ok = true;
    std::vector<violation> violations;

    /**
     * @brief Check whether a given rule was broken
     */
    [[nodiscard]] auto has(violation_code code) const -> bool;

    /**
     * @brief Collapse the violations into a validation_failed error
     */
    [[nodiscard]] auto to_error() const -> error;
};

/**
 * @brief Size-only view of an asset
 *
 * Lets callers validate payloads that are not loaded into memory yet.
 */
struct media_descriptor {
    uint64_t size = 0;
    std::string content_type;
    media_category category = media_category::image;
    std::optional<std::string> alt_text;

    [[nodiscard]] static auto of(const media_asset& asset) -> media_descriptor;
};

/**
 * @brief Limits enforced by the validator
 */
struct validation_rules {
    static constexpr uint64_t mib = 1024 * 1024;

    uint64_t max_image_bytes = 5 * mib;
    uint64_t max_animated_image_bytes = 15 * mib;
    uint64_t max_video_bytes = 512 * mib;

    /// Accessibility text limit in Unicode code points
    std::size_t max_alt_text_code_points = 1000;

    std::size_t max_images_per_post = 4;

    /// Compare the payload's magic bytes against its category
    bool check_signature = true;

    [[nodiscard]] auto max_bytes(media_category category) const noexcept -> uint64_t;

    [[nodiscard]] static auto allowed_content_types(media_category category)
        -> const std::vector<std::string>&;
};

/**
 * @brief Count UTF-8 code points (continuation bytes are not counted)
 */
[[nodiscard]] auto count_code_points(std::string_view text) noexcept -> std::size_t;

/**
 * @brief Validates single assets and per-post asset sets
 */
class media_validator {
public:
    media_validator() = default;
    explicit media_validator(validation_rules rules);

    /**
     * @brief Validate one asset, including its payload signature
     */
    [[nodiscard]] auto validate(const media_asset& asset) const -> validation_result;

    /**
     * @brief Validate size, type and accessibility text of a descriptor
     */
    [[nodiscard]] auto validate(const media_descriptor& media) const -> validation_result;

    /**
     * @brief Validate the composition of the assets attached to one post
     *
     * At most max_images_per_post images, or exactly one video, or exactly
     * one animated image; categories never mixed. Per-asset rules are
     * checked too, with asset_index set on each violation.
     */
    [[nodiscard]] auto validate_set(const std::vector<media_asset>& assets) const
        -> validation_result;

    [[nodiscard]] auto rules() const noexcept -> const validation_rules& { return rules_; }

private:
    validation_rules rules_;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CORE_VALIDATOR_H
