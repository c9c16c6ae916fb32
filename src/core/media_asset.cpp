/**
 * @file media_asset.cpp
 * @brief Implementation of media_asset and media type detection
 */

#include "kcenon/media_upload/core/media_asset.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace kcenon::media_upload {

namespace {

struct extension_entry {
    std::string_view extension;
    std::string_view content_type;
};

constexpr std::array<extension_entry, 7> extension_table{{
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".mp4", "video/mp4"},
    {".mov", "video/quicktime"},
}};

auto byte_at(std::span<const std::byte> data, std::size_t index) -> uint8_t {
    return static_cast<uint8_t>(data[index]);
}

auto matches(std::span<const std::byte> data, std::size_t offset,
             std::string_view pattern) -> bool {
    if (data.size() < offset + pattern.size()) {
        return false;
    }
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (byte_at(data, offset + i) != static_cast<uint8_t>(pattern[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace

auto server_category_token(media_category category, usage_context context)
    -> std::string_view {
    bool dm = context == usage_context::direct_message;
    switch (category) {
        case media_category::image:
            return dm ? "dm_image" : "tweet_image";
        case media_category::animated_image:
            return dm ? "dm_gif" : "tweet_gif";
        case media_category::video:
            return dm ? "dm_video" : "tweet_video";
    }
    return "tweet_image";
}

auto category_for_content_type(std::string_view content_type)
    -> std::optional<media_category> {
    if (content_type == "image/jpeg" || content_type == "image/png" ||
        content_type == "image/webp") {
        return media_category::image;
    }
    if (content_type == "image/gif") {
        return media_category::animated_image;
    }
    if (content_type == "video/mp4" || content_type == "video/quicktime") {
        return media_category::video;
    }
    return std::nullopt;
}

auto mime_from_extension(std::string_view extension) -> std::optional<std::string> {
    std::string lower(extension);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (const auto& entry : extension_table) {
        if (entry.extension == lower) {
            return std::string(entry.content_type);
        }
    }
    return std::nullopt;
}

auto mime_from_signature(std::span<const std::byte> data) -> std::optional<std::string> {
    if (data.size() < 4) {
        return std::nullopt;
    }

    if (byte_at(data, 0) == 0xFF && byte_at(data, 1) == 0xD8 && byte_at(data, 2) == 0xFF) {
        return "image/jpeg";
    }
    if (byte_at(data, 0) == 0x89 && matches(data, 1, "PNG")) {
        return "image/png";
    }
    if (matches(data, 0, "GIF8")) {
        return "image/gif";
    }
    if (matches(data, 0, "RIFF") && matches(data, 8, "WEBP")) {
        return "image/webp";
    }
    if (matches(data, 4, "ftyp")) {
        // Major brand "qt  " marks a QuickTime movie
        if (matches(data, 8, "qt  ")) {
            return "video/quicktime";
        }
        return "video/mp4";
    }
    if (matches(data, 4, "moov") || matches(data, 4, "mdat") || matches(data, 4, "wide")) {
        return "video/quicktime";
    }
    return std::nullopt;
}

// media_asset implementation

media_asset::media_asset(std::vector<std::byte> payload,
                         std::string content_type,
                         media_category category,
                         std::optional<std::string> alt_text,
                         usage_context context)
    : payload_(std::make_shared<const std::vector<std::byte>>(std::move(payload))),
      content_type_(std::move(content_type)),
      category_(category),
      alt_text_(std::move(alt_text)),
      context_(context) {}

auto media_asset::create(std::vector<std::byte> payload,
                         std::string content_type,
                         std::optional<std::string> alt_text,
                         usage_context context) -> std::optional<media_asset> {
    auto category = category_for_content_type(content_type);
    if (!category) {
        return std::nullopt;
    }
    return media_asset(std::move(payload), std::move(content_type), *category,
                       std::move(alt_text), context);
}

auto media_asset::with_alt_text(std::string text) const -> media_asset {
    media_asset copy = *this;
    copy.alt_text_ = std::move(text);
    return copy;
}

auto media_asset::with_usage_context(usage_context context) const -> media_asset {
    media_asset copy = *this;
    copy.context_ = context;
    return copy;
}

auto media_asset::slice(uint64_t offset, uint64_t length) const
    -> std::span<const std::byte> {
    auto total = payload_->size();
    if (offset >= total) {
        return {};
    }
    auto count = std::min<uint64_t>(length, total - offset);
    return data().subspan(static_cast<std::size_t>(offset), static_cast<std::size_t>(count));
}

}  // namespace kcenon::media_upload
