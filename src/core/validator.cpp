/**
 * @file validator.cpp
 * @brief Implementation of media_validator
 */

#include "kcenon/media_upload/core/validator.h"

#include <algorithm>
#include <utility>

namespace kcenon::media_upload {

namespace {

auto format_mib(uint64_t bytes) -> std::string {
    auto tenths = (bytes * 10 + validation_rules::mib / 2) / validation_rules::mib;
    return std::to_string(tenths / 10) + "." + std::to_string(tenths % 10) + " MiB";
}

void add_violation(validation_result& result, violation_code code, std::string message,
                   std::optional<std::size_t> index = std::nullopt) {
    result.ok = false;
    result.violations.push_back(violation{code, index, std::move(message)});
}

}  // namespace

// validation_result

auto validation_result::has(violation_code code) const -> bool {
    return std::any_of(violations.begin(), violations.end(),
                       [code](const violation& v) { return v.code == code; });
}

auto validation_result::to_error() const -> error {
    std::string message;
    for (const auto& v : violations) {
        if (!message.empty()) {
            message += "; ";
        }
        if (v.asset_index) {
            message += "asset " + std::to_string(*v.asset_index) + ": ";
        }
        message += v.message;
    }
    if (message.empty()) {
        message = std::string(to_string(error_code::validation_failed));
    }
    return error{error_code::validation_failed, upload_phase::idle, std::move(message)};
}

// media_descriptor

auto media_descriptor::of(const media_asset& asset) -> media_descriptor {
    media_descriptor d;
    d.size = asset.size();
    d.content_type = asset.content_type();
    d.category = asset.category();
    d.alt_text = asset.alt_text();
    return d;
}

// validation_rules

auto validation_rules::max_bytes(media_category category) const noexcept -> uint64_t {
    switch (category) {
        case media_category::image: return max_image_bytes;
        case media_category::animated_image: return max_animated_image_bytes;
        case media_category::video: return max_video_bytes;
    }
    return max_image_bytes;
}

auto validation_rules::allowed_content_types(media_category category)
    -> const std::vector<std::string>& {
    static const std::vector<std::string> images{"image/jpeg", "image/png", "image/webp"};
    static const std::vector<std::string> animated{"image/gif"};
    static const std::vector<std::string> videos{"video/mp4", "video/quicktime"};

    switch (category) {
        case media_category::image: return images;
        case media_category::animated_image: return animated;
        case media_category::video: return videos;
    }
    return images;
}

auto count_code_points(std::string_view text) noexcept -> std::size_t {
    std::size_t count = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

// media_validator

media_validator::media_validator(validation_rules rules) : rules_(std::move(rules)) {}

auto media_validator::validate(const media_descriptor& media) const -> validation_result {
    validation_result result;

    if (media.size == 0) {
        add_violation(result, violation_code::empty_payload, "payload is empty");
    }

    auto limit = rules_.max_bytes(media.category);
    if (media.size > limit) {
        add_violation(result, violation_code::size_exceeded,
                      std::string(to_string(media.category)) + " exceeds " +
                          format_mib(limit) + " limit (" + format_mib(media.size) + ")");
    }

    const auto& allowed = validation_rules::allowed_content_types(media.category);
    if (std::find(allowed.begin(), allowed.end(), media.content_type) == allowed.end()) {
        add_violation(result, violation_code::unsupported_content_type,
                      "content type '" + media.content_type + "' is not allowed for " +
                          to_string(media.category));
    }

    auto detected = category_for_content_type(media.content_type);
    if (detected && *detected != media.category) {
        add_violation(result, violation_code::category_mismatch,
                      "content type '" + media.content_type + "' is " +
                          to_string(*detected) + ", declared " + to_string(media.category));
    }

    if (media.alt_text) {
        auto length = count_code_points(*media.alt_text);
        if (length > rules_.max_alt_text_code_points) {
            add_violation(result, violation_code::alt_text_too_long,
                          "alt text has " + std::to_string(length) + " characters (max " +
                              std::to_string(rules_.max_alt_text_code_points) + ")");
        }
    }

    return result;
}

auto media_validator::validate(const media_asset& asset) const -> validation_result {
    auto result = validate(media_descriptor::of(asset));

    if (rules_.check_signature && asset.size() > 0) {
        auto sniffed = mime_from_signature(asset.data());
        if (sniffed) {
            auto sniffed_category = category_for_content_type(*sniffed);
            if (sniffed_category && *sniffed_category != asset.category()) {
                add_violation(result, violation_code::signature_mismatch,
                              "payload looks like '" + *sniffed + "', declared " +
                                  to_string(asset.category()));
            }
        }
    }

    return result;
}

auto media_validator::validate_set(const std::vector<media_asset>& assets) const
    -> validation_result {
    validation_result result;

    if (assets.empty()) {
        add_violation(result, violation_code::empty_set, "no media attached");
        return result;
    }

    std::size_t images = 0;
    std::size_t animated = 0;
    std::size_t videos = 0;

    for (std::size_t i = 0; i < assets.size(); ++i) {
        auto single = validate(assets[i]);
        for (auto& v : single.violations) {
            add_violation(result, v.code, std::move(v.message), i);
        }

        switch (assets[i].category()) {
            case media_category::image: ++images; break;
            case media_category::animated_image: ++animated; break;
            case media_category::video: ++videos; break;
        }
    }

    int kinds = (images > 0 ? 1 : 0) + (animated > 0 ? 1 : 0) + (videos > 0 ? 1 : 0);
    if (kinds > 1) {
        add_violation(result, violation_code::mixed_categories,
                      "images, animated images and videos cannot be mixed");
    }
    if (images > rules_.max_images_per_post) {
        add_violation(result, violation_code::too_many_images,
                      std::to_string(images) + " images attached (max " +
                          std::to_string(rules_.max_images_per_post) + ")");
    }
    if (videos > 1) {
        add_violation(result, violation_code::too_many_videos,
                      std::to_string(videos) + " videos attached (max 1)");
    }
    if (animated > 1) {
        add_violation(result, violation_code::too_many_animated_images,
                      std::to_string(animated) + " animated images attached (max 1)");
    }

    return result;
}

}  // namespace kcenon::media_upload
