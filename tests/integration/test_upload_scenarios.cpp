/**
 * @file test_upload_scenarios.cpp
 * @brief End-to-end upload scenarios against a scripted endpoint
 *
 * This file contains tests for:
 * - Image, animated image and video uploads through media_uploader
 * - Video uploads with server-side processing
 * - Transient failures recovered by retries
 * - Session expiry, cancellation and validation rejections
 */

#include "test_fixtures.h"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::media_upload::test {

using namespace std::chrono_literals;

// =============================================================================
// Scenario fixture
// =============================================================================

class UploadScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<scripted_transport>();
        timer_ = std::make_shared<manual_timer_service>();
        observer_ = std::make_shared<recording_observer>();
    }

    auto build_uploader(session_config config = test_session_config()) -> media_uploader {
        auto result = media_uploader::builder()
                          .with_transport(transport_)
                          .with_timer(timer_)
                          .with_session_config(config)
                          .with_progress_observer(observer_)
                          .build();
        EXPECT_TRUE(result.has_value()) << "Failed to create uploader";
        return std::move(result.value());
    }

    std::shared_ptr<scripted_transport> transport_;
    std::shared_ptr<manual_timer_service> timer_;
    std::shared_ptr<recording_observer> observer_;
};

// =============================================================================
// Successful uploads
// =============================================================================

TEST_F(UploadScenarioTest, LargeVideoIsSentInFiveMiBChunks) {
    auto uploader = build_uploader();

    auto outcome = uploader.upload(mp4_asset(12 * MiB));

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;

    std::vector<std::size_t> decoded_sizes;
    for (const auto& r : transport_->requests()) {
        if (r.command() == "APPEND") {
            auto data = r.field("media_data").value_or("");
            decoded_sizes.push_back(data.size() / 4 * 3 -
                                    (data.size() >= 2 && data[data.size() - 1] == '=' ? 1 : 0) -
                                    (data.size() >= 2 && data[data.size() - 2] == '=' ? 1 : 0));
        }
    }
    EXPECT_EQ(decoded_sizes,
              (std::vector<std::size_t>{5 * MiB, 5 * MiB, 2 * MiB}));
    EXPECT_EQ(transport_->commands().back(), "FINALIZE");
}

TEST_F(UploadScenarioTest, AnimatedImageUsesGifCategory) {
    auto uploader = build_uploader();

    ASSERT_TRUE(uploader.upload(gif_asset(2 * MiB)).has_value());

    auto init = transport_->requests().front();
    EXPECT_EQ(init.field("media_category").value_or(""), "tweet_gif");
    EXPECT_EQ(init.field("media_type").value_or(""), "image/gif");
    EXPECT_EQ(transport_->count("APPEND"), 2u);
}

TEST_F(UploadScenarioTest, DirectMessageImage) {
    auto uploader = build_uploader();
    auto asset = jpeg_asset(4096).with_usage_context(usage_context::direct_message);

    ASSERT_TRUE(uploader.upload(asset).has_value());

    EXPECT_EQ(transport_->requests().front().field("media_category").value_or(""), "dm_image");
}

TEST_F(UploadScenarioTest, VideoWithProcessing) {
    transport_->script("FINALIZE",
                       ok(201, finalize_body("710511363345354753",
                                             processing_info_json("pending", 5))));
    transport_->script("STATUS",
                       ok(200, status_body(processing_info_json("in_progress", 5, 50))));
    transport_->script("STATUS",
                       ok(200, status_body(processing_info_json("succeeded", std::nullopt, 100))));
    auto uploader = build_uploader();

    auto outcome = uploader.upload(mp4_asset(3 * MiB));

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(transport_->commands(),
              (std::vector<std::string>{"INIT", "APPEND", "APPEND", "APPEND", "FINALIZE",
                                        "STATUS", "STATUS"}));

    std::vector<upload_phase> phases;
    for (const auto& e : observer_->events()) {
        if (phases.empty() || phases.back() != e.phase) {
            phases.push_back(e.phase);
        }
    }
    EXPECT_EQ(phases, (std::vector<upload_phase>{upload_phase::initialized,
                                                 upload_phase::appending,
                                                 upload_phase::finalizing,
                                                 upload_phase::processing}));
}

TEST_F(UploadScenarioTest, ImageWithAltText) {
    auto uploader = build_uploader();
    media_asset asset(png_payload(4096), "image/png", media_category::image,
                      std::string("Sunset over the harbour"));

    auto outcome = uploader.upload(asset);

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(transport_->count("METADATA"), 1u);
    EXPECT_NE(transport_->requests().back().body.find("Sunset over the harbour"),
              std::string::npos);
}

// =============================================================================
// Recovery and failures
// =============================================================================

TEST_F(UploadScenarioTest, RecoversFromFlakyAppend) {
    transport_->script("APPEND", ok(204));
    transport_->script("APPEND", ok(502, "Bad Gateway"));
    transport_->script("APPEND", network_failure("connection reset by peer"));
    auto uploader = build_uploader();

    auto outcome = uploader.upload(mp4_asset(3 * MiB));

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(transport_->count("APPEND"), 5u);
}

TEST_F(UploadScenarioTest, RateLimitedInitIsRetried) {
    transport_->script("INIT", ok(429, R"({"errors":[{"message":"Rate limit exceeded"}]})"));
    auto uploader = build_uploader();

    ASSERT_TRUE(uploader.upload(jpeg_asset(1024)).has_value());
    EXPECT_EQ(transport_->count("INIT"), 2u);
}

TEST_F(UploadScenarioTest, ExpiryDuringAppend) {
    transport_->script("INIT", ok(202, init_body("42", 60)));
    transport_->set_hook([this](const recorded_request& r) {
        if (r.command() == "APPEND" && r.field("segment_index") == std::optional<std::string>("0")) {
            timer_->advance(61s);
        }
    });
    auto uploader = build_uploader();

    auto outcome = uploader.upload(mp4_asset(3 * MiB));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::session_expired);
    EXPECT_EQ(transport_->count("APPEND"), 1u);
}

TEST_F(UploadScenarioTest, ValidationRejectionsSendNothing) {
    auto uploader = build_uploader();

    EXPECT_EQ(uploader.upload(jpeg_asset(6 * MiB)).error().code, error_code::validation_failed);
    EXPECT_EQ(uploader.upload(gif_asset(16 * MiB)).error().code, error_code::validation_failed);
    EXPECT_EQ(uploader.upload(jpeg_asset(1024).with_alt_text(std::string(1001, 'a')))
                  .error()
                  .code,
              error_code::validation_failed);
    EXPECT_EQ(uploader.upload_all({mp4_asset(1024), jpeg_asset(1024)}).error().code,
              error_code::validation_failed);

    EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(UploadScenarioTest, ExpiredCredentialsDuringUpload) {
    transport_->script("APPEND", ok(204));
    transport_->script("APPEND", ok(401, R"({"errors":[{"message":"Invalid or expired token"}]})"));
    auto uploader = build_uploader();

    auto outcome = uploader.upload(mp4_asset(3 * MiB));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::auth_required);
    EXPECT_EQ(outcome.error().phase, upload_phase::appending);
    EXPECT_EQ(transport_->count("APPEND"), 2u);
    EXPECT_EQ(transport_->count("FINALIZE"), 0u);
}

// =============================================================================
// Cancellation with the real clock
// =============================================================================

TEST_F(UploadScenarioTest, CancelDuringChunkSpacing) {
    auto config = test_session_config();
    config.chunk_spacing = 10s;
    auto result = media_uploader::builder()
                      .with_transport(transport_)
                      .with_session_config(config)
                      .build();
    ASSERT_TRUE(result.has_value());
    auto uploader = std::move(result.value());

    cancellation_token token;
    auto start = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&] {
        return uploader.upload(mp4_asset(2 * MiB), token);
    });

    while (transport_->count("APPEND") < 1) {
        std::this_thread::sleep_for(5ms);
    }
    std::this_thread::sleep_for(20ms);
    token.cancel();

    auto outcome = pending.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::cancelled);
    EXPECT_EQ(transport_->count("APPEND"), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

}  // namespace kcenon::media_upload::test
