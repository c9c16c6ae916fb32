/**
 * @file test_media_uploader.cpp
 * @brief Unit tests for media_uploader and its builder
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <kcenon/media_upload/client/media_uploader.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::media_upload::test {

using namespace std::chrono_literals;

// =============================================================================
// Builder
// =============================================================================

class MediaUploaderBuilderTest : public ::testing::Test {};

TEST_F(MediaUploaderBuilderTest, RequiresTransport) {
    auto result = media_uploader::builder().build();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(MediaUploaderBuilderTest, BuildsWithDefaults) {
    auto result = media_uploader::builder()
                      .with_transport(std::make_shared<scripted_transport>())
                      .build();

    ASSERT_TRUE(result.has_value());
    const auto& config = result.value().config();
    EXPECT_EQ(config.session.concurrency, 1u);
    EXPECT_EQ(config.session.chunk_spacing, 100ms);
    EXPECT_EQ(config.session.retry.max_attempts, 3u);
    EXPECT_EQ(config.rules.max_images_per_post, 4u);
}

TEST_F(MediaUploaderBuilderTest, AppliesSettings) {
    auto result = media_uploader::builder()
                      .with_transport(std::make_shared<scripted_transport>())
                      .with_upload_url("https://upload.example.test/media")
                      .with_metadata_url("https://api.example.test/metadata")
                      .with_concurrency(3)
                      .with_chunk_spacing(50ms)
                      .with_timeouts(10s, 1min, 5min)
                      .build();

    ASSERT_TRUE(result.has_value());
    const auto& session = result.value().config().session;
    EXPECT_EQ(session.upload_url, "https://upload.example.test/media");
    EXPECT_EQ(session.metadata_url, "https://api.example.test/metadata");
    EXPECT_EQ(session.concurrency, 3u);
    EXPECT_EQ(session.chunk_spacing, 50ms);
    EXPECT_EQ(session.call_timeout, 10s);
    EXPECT_EQ(session.chunk_timeout, 1min);
    EXPECT_EQ(session.session_timeout, 5min);
}

TEST_F(MediaUploaderBuilderTest, RejectsConcurrencyAboveLimit) {
    auto result = media_uploader::builder()
                      .with_transport(std::make_shared<scripted_transport>())
                      .with_concurrency(session_config::max_concurrency + 1)
                      .build();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(MediaUploaderBuilderTest, RejectsInvalidRetryPolicy) {
    retry_policy policy;
    policy.backoff_multiplier = 0.5;

    auto result = media_uploader::builder()
                      .with_transport(std::make_shared<scripted_transport>())
                      .with_retry_policy(policy)
                      .build();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

// =============================================================================
// Uploads
// =============================================================================

class MediaUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<scripted_transport>();
        timer_ = std::make_shared<manual_timer_service>();
    }

    auto make_uploader() -> media_uploader {
        auto result = media_uploader::builder()
                          .with_transport(transport_)
                          .with_timer(timer_)
                          .with_session_config(test_session_config())
                          .on_progress([this](const progress_event& e) { events_.push_back(e); })
                          .build();
        EXPECT_TRUE(result.has_value());
        return std::move(result.value());
    }

    std::shared_ptr<scripted_transport> transport_;
    std::shared_ptr<manual_timer_service> timer_;
    std::vector<progress_event> events_;
};

TEST_F(MediaUploaderTest, UploadsValidAsset) {
    auto uploader = make_uploader();

    auto outcome = uploader.upload(jpeg_asset(1024));

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    EXPECT_EQ(outcome.value().media_id, "710511363345354753");
    EXPECT_FALSE(events_.empty());
}

TEST_F(MediaUploaderTest, RejectsOversizedImageWithoutTraffic) {
    auto uploader = make_uploader();

    auto outcome = uploader.upload(jpeg_asset(6 * MiB));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::validation_failed);
    EXPECT_EQ(outcome.error().phase, upload_phase::idle);
    EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(MediaUploaderTest, CustomRulesApply) {
    validation_rules rules;
    rules.max_image_bytes = 1024;
    auto result = media_uploader::builder()
                      .with_transport(transport_)
                      .with_timer(timer_)
                      .with_validation_rules(rules)
                      .build();
    ASSERT_TRUE(result.has_value());

    auto outcome = result.value().upload(jpeg_asset(2048));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::validation_failed);
}

TEST_F(MediaUploaderTest, UploadAllReturnsOutcomesInOrder) {
    transport_->script("INIT", ok(202, init_body("1001")));
    transport_->script("FINALIZE", ok(201, finalize_body("1001")));
    transport_->script("INIT", ok(202, init_body("1002")));
    transport_->script("FINALIZE", ok(201, finalize_body("1002")));
    auto uploader = make_uploader();

    auto outcome = uploader.upload_all({jpeg_asset(1024), jpeg_asset(2048)});

    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    ASSERT_EQ(outcome.value().size(), 2u);
    EXPECT_EQ(outcome.value()[0].media_id, "1001");
    EXPECT_EQ(outcome.value()[1].media_id, "1002");
    EXPECT_EQ(transport_->count("INIT"), 2u);
}

TEST_F(MediaUploaderTest, UploadAllRejectsFiveImages) {
    auto uploader = make_uploader();

    auto outcome = uploader.upload_all(std::vector<media_asset>(5, jpeg_asset(1024)));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::validation_failed);
    EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(MediaUploaderTest, UploadAllStopsAtFirstFailure) {
    transport_->script("INIT", ok(202, init_body("1001")));
    transport_->script("INIT", ok(403, "Forbidden"));
    auto uploader = make_uploader();

    auto outcome =
        uploader.upload_all({jpeg_asset(1024), jpeg_asset(1024), jpeg_asset(1024)});

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::auth_required);
    EXPECT_EQ(outcome.error().message.rfind("asset 1: ", 0), 0u);
    EXPECT_EQ(transport_->count("INIT"), 2u);
}

TEST_F(MediaUploaderTest, CallerTokenCancelsUpload) {
    cancellation_token token;
    token.cancel();
    auto uploader = make_uploader();

    auto outcome = uploader.upload(jpeg_asset(1024), token);

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::cancelled);
}

TEST_F(MediaUploaderTest, CancelAllStopsRunningUpload) {
    auto uploader = make_uploader();
    transport_->set_hook([&](const recorded_request& r) {
        if (r.command() == "APPEND") {
            uploader.cancel_all();
        }
    });

    auto outcome = uploader.upload(mp4_asset(3 * MiB));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::cancelled);
    EXPECT_EQ(transport_->count("APPEND"), 1u);
}

TEST_F(MediaUploaderTest, CancelAllDoesNotAffectLaterUploads) {
    auto uploader = make_uploader();
    uploader.cancel_all();

    auto outcome = uploader.upload(jpeg_asset(1024));

    EXPECT_TRUE(outcome.has_value());
}

TEST_F(MediaUploaderTest, MovedUploaderStillWorks) {
    auto uploader = make_uploader();
    media_uploader moved = std::move(uploader);

    EXPECT_TRUE(moved.upload(jpeg_asset(1024)).has_value());
}

}  // namespace kcenon::media_upload::test
