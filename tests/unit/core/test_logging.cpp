/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/media_upload/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::media_upload::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_FALSE(config.mask_media_ids);
    EXPECT_FALSE(config.mask_urls);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_media_ids);
    EXPECT_TRUE(config.mask_urls);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, DisabledMaskerPassesThrough) {
    sensitive_info_masker masker;
    std::string input = "media 1830000000000000001 at https://upload.x.com/u?token=abc";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MasksMediaIdKeepingTail) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_media_id("1830000000000000001"), "***************0001");
    EXPECT_EQ(masker.mask_media_id("123"), "123");
}

TEST_F(SensitiveInfoMaskerTest, MasksUrlQuery) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_url("https://upload.x.com/i/media/upload.json?command=STATUS"),
              "https://upload.x.com/i/media/upload.json?***");
    EXPECT_EQ(masker.mask_url("https://upload.x.com/i/media/upload.json"),
              "https://upload.x.com/i/media/upload.json");
}

TEST_F(SensitiveInfoMaskerTest, MasksIdsInFreeText) {
    masking_config config;
    config.mask_media_ids = true;
    sensitive_info_masker masker(config);

    auto masked = masker.mask("APPEND failed for 1830000000000000001 segment 12");

    EXPECT_EQ(masked.find("1830000000000000001"), std::string::npos);
    EXPECT_NE(masked.find("0001"), std::string::npos);
    // Short numbers are not ids
    EXPECT_NE(masked.find("segment 12"), std::string::npos);
}

// =============================================================================
// Log Context Tests
// =============================================================================

class UploadLogContextTest : public ::testing::Test {};

TEST_F(UploadLogContextTest, EmptyContext) {
    upload_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(UploadLogContextTest, PopulatedContext) {
    upload_log_context ctx;
    ctx.media_id = "1830000000000000001";
    ctx.phase = "appending";
    ctx.chunk_index = 2;
    ctx.total_chunks = 3;

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"media_id\":\"1830000000000000001\""), std::string::npos);
    EXPECT_NE(json.find("\"phase\":\"appending\""), std::string::npos);
    EXPECT_NE(json.find("\"chunk_index\":2"), std::string::npos);
    EXPECT_NE(json.find("\"total_chunks\":3"), std::string::npos);
}

TEST_F(UploadLogContextTest, EscapesErrorMessage) {
    upload_log_context ctx;
    ctx.error_message = "bad \"body\"\n";

    EXPECT_NE(ctx.to_json().find("bad \\\"body\\\"\\n"), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BuildsStructuredEntry) {
    auto entry = log_entry_builder()
                     .with_level(log_level::warn)
                     .with_category(log_category::retry)
                     .with_message("APPEND failed, retrying")
                     .with_attempt(2)
                     .build();

    EXPECT_EQ(entry.level, log_level::warn);
    EXPECT_EQ(entry.category, "media_upload.retry");
    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->attempt.value_or(0), 2u);

    auto json = entry.to_json();
    EXPECT_NE(json.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
}

TEST_F(LogEntryBuilderTest, MaskedJson) {
    sensitive_info_masker masker(masking_config::all_masked());
    auto json = log_entry_builder()
                    .with_message("uploaded 1830000000000000001")
                    .with_media_id("1830000000000000001")
                    .build_json_masked(masker);

    EXPECT_EQ(json.find("1830000000000000001"), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class MediaUploadLoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
    }
};

TEST_F(MediaUploadLoggerTest, LevelFiltering) {
    auto& logger = get_logger();
    logger.set_level(log_level::warn);

    EXPECT_FALSE(logger.is_enabled(log_level::info));
    EXPECT_TRUE(logger.is_enabled(log_level::warn));
    EXPECT_TRUE(logger.is_enabled(log_level::error));
}

TEST_F(MediaUploadLoggerTest, CallbackReceivesEntries) {
    auto& logger = get_logger();
    logger.set_level(log_level::debug);

    std::vector<std::string> categories;
    std::vector<std::string> messages;
    logger.set_callback([&](log_level, std::string_view category, std::string_view message,
                            const upload_log_context*) {
        categories.emplace_back(category);
        messages.emplace_back(message);
    });

    MU_LOG_DEBUG(log_category::chunk, "Chunk acknowledged");
    MU_LOG_TRACE(log_category::chunk, "filtered out");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(categories[0], "media_upload.chunk");
    EXPECT_EQ(messages[0], "Chunk acknowledged");
}

}  // namespace kcenon::media_upload::test
