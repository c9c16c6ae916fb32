/**
 * @file media_upload.h
 * @brief Main header for the media_upload library
 * @version 0.1.0
 *
 * This is the primary include file for the media_upload library.
 * Include this header to access all media upload functionality.
 *
 * @code
 * #include "kcenon/media_upload/media_upload.h"
 *
 * using namespace kcenon::media_upload;
 *
 * auto uploader = media_uploader::builder()
 *     .with_transport(std::make_shared<network_transport_client>(headers))
 *     .build();
 *
 * auto asset = media_asset::create(std::move(bytes), "image/png");
 * auto outcome = uploader.value().upload(*asset);
 * @endcode
 */

#ifndef KCENON_MEDIA_UPLOAD_MEDIA_UPLOAD_H
#define KCENON_MEDIA_UPLOAD_MEDIA_UPLOAD_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/media_upload/core/types.h"
#include "kcenon/media_upload/core/media_asset.h"
#include "kcenon/media_upload/core/validator.h"
#include "kcenon/media_upload/core/chunk_segmenter.h"
#include "kcenon/media_upload/core/retry_policy.h"
#include "kcenon/media_upload/core/cancellation_token.h"
#include "kcenon/media_upload/core/timer_service.h"

// Transport
#include "kcenon/media_upload/transport/transport_client.h"
#include "kcenon/media_upload/transport/network_transport_client.h"

// Session
#include "kcenon/media_upload/session/session_types.h"
#include "kcenon/media_upload/session/upload_session.h"

// Client
#include "kcenon/media_upload/client/media_uploader.h"

namespace kcenon::media_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::media_upload

#endif  // KCENON_MEDIA_UPLOAD_MEDIA_UPLOAD_H
