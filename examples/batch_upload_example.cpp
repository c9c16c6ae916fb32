/**
 * @file batch_upload_example.cpp
 * @brief Upload the media attachments of one post
 *
 * This example demonstrates:
 * - Validating a set of attachments before any network traffic
 * - Uploading the attachments in order with upload_all
 * - Reporting which attachment failed and in which phase
 */

#include <kcenon/media_upload/media_upload.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kcenon::media_upload;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto load_asset(const std::filesystem::path& path) -> std::optional<media_asset> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Failed to open file: " << path << std::endl;
        return std::nullopt;
    }

    std::vector<std::byte> data(static_cast<std::size_t>(std::filesystem::file_size(path)));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));

    auto content_type = mime_from_extension(path.extension().string());
    if (!content_type) {
        content_type = mime_from_signature(data);
    }
    if (!content_type) {
        std::cerr << "Error: Unknown media type: " << path << std::endl;
        return std::nullopt;
    }

    auto asset = media_asset::create(std::move(data), *content_type);
    if (!asset) {
        std::cerr << "Error: Unsupported content type " << *content_type << ": " << path
                  << std::endl;
    }
    return asset;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Batch Upload Example - Media Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <file1> [file2 ...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --cookie <value>        Session cookie header" << std::endl;
    std::cout << "  --csrf <token>          CSRF token sent as x-csrf-token" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Up to 4 images, or a single GIF or video, can be attached to one post."
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string cookie;
    std::string csrf;
    std::vector<std::filesystem::path> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--cookie" || arg == "--csrf") {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return 1;
            }
            (arg == "--cookie" ? cookie : csrf) = argv[i];
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            paths.emplace_back(arg);
        }
    }

    if (paths.empty()) {
        std::cerr << "Error: No media files given" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Step 1: Load every attachment
    std::cout << "[1/3] Loading " << paths.size() << " file(s)..." << std::endl;
    std::vector<media_asset> assets;
    for (const auto& path : paths) {
        auto asset = load_asset(path);
        if (!asset) {
            return 1;
        }
        std::cout << "      " << path.filename().string() << ": " << asset->content_type()
                  << ", " << format_bytes(asset->size()) << std::endl;
        assets.push_back(std::move(*asset));
    }
    std::cout << std::endl;

    // Step 2: Check the set locally
    std::cout << "[2/3] Validating attachment set..." << std::endl;
    media_validator validator;
    auto checked = validator.validate_set(assets);
    if (!checked.ok) {
        for (const auto& v : checked.violations) {
            std::cerr << "      " << to_string(v.code) << ": " << v.message;
            if (v.asset_index) {
                std::cerr << " (" << paths[*v.asset_index].filename().string() << ")";
            }
            std::cerr << std::endl;
        }
        return 1;
    }
    std::cout << "      OK" << std::endl;
    std::cout << std::endl;

    // Step 3: Upload in order
    std::cout << "[3/3] Uploading..." << std::endl;
    std::map<std::string, std::string> headers;
    if (!cookie.empty()) {
        headers["Cookie"] = cookie;
    }
    if (!csrf.empty()) {
        headers["x-csrf-token"] = csrf;
    }

    std::size_t started = 0;
    auto uploader = media_uploader::builder()
                        .with_transport(std::make_shared<network_transport_client>(headers))
                        .on_progress([&](const progress_event& event) {
                            if (event.phase == upload_phase::initialized) {
                                ++started;
                                std::cout << "      attachment " << started << "/"
                                          << assets.size() << " started" << std::endl;
                            }
                        })
                        .build();
    if (!uploader) {
        std::cerr << "Error: " << uploader.error().message << std::endl;
        return 1;
    }

    auto outcome = uploader.value().upload_all(assets);
    if (!outcome) {
        std::cerr << "Upload failed during " << to_string(outcome.error().phase) << ": "
                  << outcome.error().message << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "Media IDs:" << std::endl;
    for (std::size_t i = 0; i < outcome.value().size(); ++i) {
        std::cout << "  " << paths[i].filename().string() << " -> "
                  << outcome.value()[i].media_id << std::endl;
    }

    return 0;
}
