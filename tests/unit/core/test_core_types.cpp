/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, error values and result<T>
 */

#include <gtest/gtest.h>

#include <kcenon/media_upload/core/error_codes.h>
#include <kcenon/media_upload/core/types.h>

#include <string>

namespace kcenon::media_upload::test {

class CoreTypesTest : public ::testing::Test {};

// error_code Tests

TEST_F(CoreTypesTest, ErrorCode_Ranges) {
    EXPECT_TRUE(is_preflight_error(static_cast<int32_t>(error_code::validation_failed)));
    EXPECT_TRUE(is_transport_error(static_cast<int32_t>(error_code::transient_transport)));
    EXPECT_TRUE(is_transport_error(static_cast<int32_t>(error_code::payload_too_large)));
    EXPECT_TRUE(is_session_error(static_cast<int32_t>(error_code::session_expired)));
    EXPECT_TRUE(is_session_error(static_cast<int32_t>(error_code::cancelled)));
    EXPECT_TRUE(is_processing_error(static_cast<int32_t>(error_code::processing_timeout)));
    EXPECT_TRUE(is_internal_error(static_cast<int32_t>(error_code::invalid_state)));

    EXPECT_FALSE(is_transport_error(static_cast<int32_t>(error_code::auth_required)));
    EXPECT_FALSE(is_preflight_error(static_cast<int32_t>(error_code::success)));
}

TEST_F(CoreTypesTest, ErrorCode_OnlyTransientIsRetryable) {
    EXPECT_TRUE(is_retryable(error_code::transient_transport));

    EXPECT_FALSE(is_retryable(error_code::validation_failed));
    EXPECT_FALSE(is_retryable(error_code::auth_required));
    EXPECT_FALSE(is_retryable(error_code::payload_too_large));
    EXPECT_FALSE(is_retryable(error_code::session_expired));
    EXPECT_FALSE(is_retryable(error_code::processing_failed));
    EXPECT_FALSE(is_retryable(error_code::unknown_server));
    EXPECT_FALSE(is_retryable(error_code::cancelled));
}

TEST_F(CoreTypesTest, ErrorCode_ToString) {
    EXPECT_EQ(to_string(error_code::success), "success");
    EXPECT_EQ(to_string(error_code::session_expired), "upload session expired");
    EXPECT_EQ(to_string(error_code::processing_timeout), "media processing timeout");
}

// upload_phase Tests

TEST_F(CoreTypesTest, UploadPhase_ToString) {
    EXPECT_STREQ(to_string(upload_phase::idle), "idle");
    EXPECT_STREQ(to_string(upload_phase::appending), "appending");
    EXPECT_STREQ(to_string(upload_phase::processing), "processing");
    EXPECT_STREQ(to_string(upload_phase::failed), "failed");
}

TEST_F(CoreTypesTest, UploadPhase_Terminal) {
    EXPECT_TRUE(is_terminal_phase(upload_phase::succeeded));
    EXPECT_TRUE(is_terminal_phase(upload_phase::failed));
    EXPECT_FALSE(is_terminal_phase(upload_phase::idle));
    EXPECT_FALSE(is_terminal_phase(upload_phase::processing));
}

// error Tests

TEST_F(CoreTypesTest, Error_DefaultIsSuccess) {
    error err;
    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST_F(CoreTypesTest, Error_CodeOnlyUsesDescription) {
    error err(error_code::auth_required);
    EXPECT_EQ(err.message, "authentication required");
    EXPECT_EQ(err.phase, upload_phase::idle);
    EXPECT_TRUE(static_cast<bool>(err));
}

TEST_F(CoreTypesTest, Error_InPhaseKeepsCodeAndMessage) {
    error err(error_code::transient_transport, "HTTP 503");
    auto tagged = err.in_phase(upload_phase::appending);

    EXPECT_EQ(tagged.code, error_code::transient_transport);
    EXPECT_EQ(tagged.phase, upload_phase::appending);
    EXPECT_EQ(tagged.message, "HTTP 503");
}

// result Tests

TEST_F(CoreTypesTest, Result_Value) {
    result<int> r(42);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(CoreTypesTest, Result_Error) {
    result<std::string> r =
        unexpected(error{error_code::unknown_server, upload_phase::finalizing, "bad body"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::unknown_server);
    EXPECT_EQ(r.error().phase, upload_phase::finalizing);
}

TEST_F(CoreTypesTest, ResultVoid) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::invalid_state});
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::invalid_state);
}

}  // namespace kcenon::media_upload::test
