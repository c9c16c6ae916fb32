/**
 * @file upload_example.cpp
 * @brief Single media upload example with progress reporting
 *
 * This example demonstrates:
 * - Loading a media file and detecting its content type
 * - Attaching credentials to the network transport
 * - Using progress callbacks to monitor chunk and processing status
 * - Interrupting an upload with a cancellation token
 * - Inspecting the result or the failure phase
 */

#include <kcenon/media_upload/media_upload.h>
#include <kcenon/media_upload/core/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
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
#include <thread>
#include <vector>

using namespace kcenon::media_upload;

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int /*signal*/) {
    g_interrupted.store(true);
}

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
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

auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    auto size = std::filesystem::file_size(path);
    std::vector<std::byte> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (!file) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return data;
}

/**
 * @brief Content type from the file extension, falling back to the payload
 */
auto detect_content_type(const std::filesystem::path& path,
                         const std::vector<std::byte>& data) -> std::optional<std::string> {
    if (auto by_extension = mime_from_extension(path.extension().string())) {
        return by_extension;
    }
    return mime_from_signature(data);
}

void print_progress(const progress_event& event) {
    std::cout << "\r  [" << std::setw(10) << std::left << to_string(event.phase) << "] ";
    if (event.processing_percent) {
        std::cout << "processing " << std::fixed << std::setprecision(0)
                  << *event.processing_percent << "%";
    } else {
        std::cout << format_bytes(event.bytes_transferred) << " / "
                  << format_bytes(event.total_bytes) << " (" << std::fixed
                  << std::setprecision(1) << event.completion_percentage() << "%)";
        if (event.chunk_index && event.total_chunks) {
            std::cout << " chunk " << (*event.chunk_index + 1) << "/" << *event.total_chunks;
        }
    }
    std::cout << "        " << std::flush;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Media Upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <media_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --cookie <value>        Session cookie header" << std::endl;
    std::cout << "  --csrf <token>          CSRF token sent as x-csrf-token" << std::endl;
    std::cout << "  --bearer <token>        Bearer token sent as authorization" << std::endl;
    std::cout << "  --alt <text>            Alt text attached after upload" << std::endl;
    std::cout << "  --type <mime>           Override detected content type" << std::endl;
    std::cout << "  --dm                    Upload for a direct message" << std::endl;
    std::cout << "  --concurrency <n>       Chunks in flight (1-4, default: 1)" << std::endl;
    std::cout << "  --upload-url <url>      Override upload endpoint" << std::endl;
    std::cout << "  --verbose               Enable debug logging" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --cookie \"auth_token=...\" --csrf abc photo.jpg" << std::endl;
    std::cout << "  " << program << " --cookie \"...\" --csrf abc --alt \"A cat\" cat.png" << std::endl;
    std::cout << "  " << program << " --cookie \"...\" --csrf abc --concurrency 3 clip.mp4" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string cookie;
    std::string csrf;
    std::string bearer;
    std::optional<std::string> alt_text;
    std::optional<std::string> content_type;
    std::optional<std::string> upload_url;
    usage_context context = usage_context::post;
    std::size_t concurrency = 1;
    bool verbose = false;
    std::string media_path;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* option) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << option << " requires an argument" << std::endl;
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--cookie") {
            auto value = next_value("--cookie");
            if (!value) return 1;
            cookie = value;
        } else if (arg == "--csrf") {
            auto value = next_value("--csrf");
            if (!value) return 1;
            csrf = value;
        } else if (arg == "--bearer") {
            auto value = next_value("--bearer");
            if (!value) return 1;
            bearer = value;
        } else if (arg == "--alt") {
            auto value = next_value("--alt");
            if (!value) return 1;
            alt_text = value;
        } else if (arg == "--type") {
            auto value = next_value("--type");
            if (!value) return 1;
            content_type = value;
        } else if (arg == "--upload-url") {
            auto value = next_value("--upload-url");
            if (!value) return 1;
            upload_url = value;
        } else if (arg == "--concurrency") {
            auto value = next_value("--concurrency");
            if (!value) return 1;
            try {
                concurrency = static_cast<std::size_t>(std::stoul(value));
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid concurrency: " << e.what() << std::endl;
                return 1;
            }
        } else if (arg == "--dm") {
            context = usage_context::direct_message;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else if (media_path.empty()) {
            media_path = arg;
        } else {
            std::cerr << "Error: Too many arguments" << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (media_path.empty()) {
        std::cerr << "Error: Missing media file" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    get_logger().set_level(verbose ? log_level::debug : log_level::warn);

    std::cout << "========================================" << std::endl;
    std::cout << "  Media Upload Example" << std::endl;
    std::cout << "  Version " << version::to_string() << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    // Step 1: Load the media file
    std::cout << "[1/4] Loading " << media_path << "..." << std::endl;
    std::vector<std::byte> payload;
    try {
        payload = read_file(media_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (!content_type) {
        content_type = detect_content_type(media_path, payload);
    }
    if (!content_type) {
        std::cerr << "Error: Could not detect content type, use --type" << std::endl;
        return 1;
    }

    auto asset = media_asset::create(std::move(payload), *content_type, alt_text, context);
    if (!asset) {
        std::cerr << "Error: Unsupported content type: " << *content_type << std::endl;
        return 1;
    }
    std::cout << "      Type:     " << asset->content_type() << " ("
              << to_string(asset->category()) << ")" << std::endl;
    std::cout << "      Size:     " << format_bytes(asset->size()) << std::endl;
    std::cout << std::endl;

    // Step 2: Configure the transport
    std::cout << "[2/4] Configuring transport..." << std::endl;
    std::map<std::string, std::string> headers;
    if (!cookie.empty()) {
        headers["Cookie"] = cookie;
    }
    if (!csrf.empty()) {
        headers["x-csrf-token"] = csrf;
    }
    if (!bearer.empty()) {
        headers["authorization"] = "Bearer " + bearer;
    }
    auto transport = std::make_shared<network_transport_client>(std::move(headers));
    if (!transport->is_available()) {
        std::cerr << "Error: No HTTP client available in this build" << std::endl;
        return 1;
    }
    std::cout << "      Authenticated: " << (transport->is_authenticated() ? "yes" : "no")
              << std::endl;
    std::cout << std::endl;

    // Step 3: Build the uploader
    std::cout << "[3/4] Building uploader..." << std::endl;
    auto builder = media_uploader::builder();
    builder.with_transport(transport)
        .with_concurrency(concurrency)
        .on_progress(print_progress);
    if (upload_url) {
        builder.with_upload_url(*upload_url);
    }

    auto uploader = builder.build();
    if (!uploader) {
        std::cerr << "Error: " << uploader.error().message << std::endl;
        return 1;
    }
    std::cout << "      Concurrency: " << concurrency << std::endl;
    std::cout << std::endl;

    // Step 4: Upload
    std::cout << "[4/4] Uploading (Ctrl+C to cancel)..." << std::endl;
    cancellation_token token;
    std::signal(SIGINT, signal_handler);

    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished.load()) {
            if (g_interrupted.load()) {
                token.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto outcome = uploader.value().upload(*asset, token);
    finished.store(true);
    watcher.join();
    std::cout << std::endl << std::endl;

    if (!outcome) {
        const auto& err = outcome.error();
        std::cerr << "Upload failed during " << to_string(err.phase) << ": "
                  << to_string(err.code) << std::endl;
        std::cerr << "  " << err.message << std::endl;
        return err.code == error_code::cancelled ? 130 : 1;
    }

    const auto& success = outcome.value();
    std::cout << "========================================" << std::endl;
    std::cout << "  Upload completed" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Media ID:   " << success.media_id << std::endl;
    if (success.media_key) {
        std::cout << "  Media key:  " << *success.media_key << std::endl;
    }
    if (success.size) {
        std::cout << "  Size:       " << format_bytes(*success.size) << std::endl;
    }
    if (success.dimensions) {
        std::cout << "  Dimensions: " << success.dimensions->width << "x"
                  << success.dimensions->height << std::endl;
    }

    return 0;
}
