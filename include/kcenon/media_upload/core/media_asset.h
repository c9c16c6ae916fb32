/**
 * @file media_asset.h
 * @brief Immutable description of a media payload to upload
 */

#ifndef KCENON_MEDIA_UPLOAD_CORE_MEDIA_ASSET_H
#define KCENON_MEDIA_UPLOAD_CORE_MEDIA_ASSET_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_upload {

/**
 * @brief Logical category of a media payload
 */
enum class media_category {
    image,
    animated_image,
    video
};

/**
 * @brief Where the uploaded media will be used
 */
enum class usage_context {
    post,
    direct_message
};

[[nodiscard]] constexpr auto to_string(media_category category) noexcept -> const char* {
    switch (category) {
        case media_category::image: return "image";
        case media_category::animated_image: return "animated_image";
        case media_category::video: return "video";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto to_string(usage_context context) noexcept -> const char* {
    switch (context) {
        case usage_context::post: return "post";
        case usage_context::direct_message: return "direct_message";
        default: return "unknown";
    }
}

/**
 * @brief Server-side category token for a category and usage context
 *
 * Posts use the tweet_* tokens, direct messages the dm_* tokens.
 */
[[nodiscard]] auto server_category_token(media_category category,
                                         usage_context context) -> std::string_view;

/**
 * @brief Category implied by a content type
 * @return Category, or nullopt for unsupported content types
 */
[[nodiscard]] auto category_for_content_type(std::string_view content_type)
    -> std::optional<media_category>;

/**
 * @brief Content type for a file extension (".jpg", ".MP4", ...)
 */
[[nodiscard]] auto mime_from_extension(std::string_view extension)
    -> std::optional<std::string>;

/**
 * @brief Content type sniffed from the leading bytes of a payload
 *
 * Recognizes JPEG, PNG, GIF, WebP, MP4 (ftyp box) and QuickTime.
 */
[[nodiscard]] auto mime_from_signature(std::span<const std::byte> data)
    -> std::optional<std::string>;

/**
 * @brief Immutable media payload with its upload metadata
 *
 * The payload is shared, never copied, between copies of an asset.
 *
 * @code
 * auto asset = media_asset::create(std::move(bytes), "video/mp4")
 *     .value()
 *     .with_alt_text("Launch countdown");
 * @endcode
 */
class media_asset {
public:
    /**
     * @brief Construct an asset with an explicit category
     */
    media_asset(std::vector<std::byte> payload,
                std::string content_type,
                media_category category,
                std::optional<std::string> alt_text = std::nullopt,
                usage_context context = usage_context::post);

    /**
     * @brief Construct an asset whose category is derived from its content type
     * @return Asset, or nullopt if the content type maps to no category
     */
    [[nodiscard]] static auto create(std::vector<std::byte> payload,
                                     std::string content_type,
                                     std::optional<std::string> alt_text = std::nullopt,
                                     usage_context context = usage_context::post)
        -> std::optional<media_asset>;

    /**
     * @brief Copy of this asset with accessibility text attached
     */
    [[nodiscard]] auto with_alt_text(std::string text) const -> media_asset;

    /**
     * @brief Copy of this asset for a different usage context
     */
    [[nodiscard]] auto with_usage_context(usage_context context) const -> media_asset;

    [[nodiscard]] auto data() const noexcept -> std::span<const std::byte> {
        return {payload_->data(), payload_->size()};
    }

    [[nodiscard]] auto size() const noexcept -> uint64_t { return payload_->size(); }

    [[nodiscard]] auto content_type() const noexcept -> const std::string& {
        return content_type_;
    }

    [[nodiscard]] auto category() const noexcept -> media_category { return category_; }

    [[nodiscard]] auto alt_text() const noexcept -> const std::optional<std::string>& {
        return alt_text_;
    }

    [[nodiscard]] auto context() const noexcept -> usage_context { return context_; }

    /**
     * @brief Bytes [offset, offset + length) of the payload
     */
    [[nodiscard]] auto slice(uint64_t offset, uint64_t length) const
        -> std::span<const std::byte>;

private:
    std::shared_ptr<const std::vector<std::byte>> payload_;
    std::string content_type_;
    media_category category_;
    std::optional<std::string> alt_text_;
    usage_context context_;
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_CORE_MEDIA_ASSET_H
