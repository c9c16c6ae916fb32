/**
 * @file test_processing_poller.cpp
 * @brief Unit tests for processing_poller
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <kcenon/media_upload/session/processing_poller.h>

#include <chrono>
#include <memory>
#include <vector>

namespace kcenon::media_upload::test {

using namespace std::chrono_literals;

class ProcessingPollerTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<scripted_transport>();
        timer_ = std::make_shared<manual_timer_service>();
        config_ = test_session_config();
    }

    auto make_poller() -> std::unique_ptr<processing_poller> {
        return std::make_unique<processing_poller>(
            transport_, timer_, config_,
            [this](const processing_status& status) { ticks_.push_back(status); });
    }

    static auto status_of(processing_state state,
                          std::optional<uint32_t> check_after = std::nullopt)
        -> processing_status {
        processing_status status;
        status.state = state;
        status.check_after_secs = check_after;
        return status;
    }

    std::shared_ptr<scripted_transport> transport_;
    std::shared_ptr<manual_timer_service> timer_;
    session_config config_;
    std::vector<processing_status> ticks_;
    cancellation_token token_;
};

TEST_F(ProcessingPollerTest, TerminalInitialStatusNeedsNoPolling) {
    auto poller = make_poller();

    auto polled = poller->poll("42", status_of(processing_state::succeeded), token_);

    ASSERT_TRUE(polled.has_value());
    EXPECT_EQ(polled.value().state, processing_state::succeeded);
    EXPECT_EQ(transport_->count("STATUS"), 0u);
    EXPECT_TRUE(ticks_.empty());
}

TEST_F(ProcessingPollerTest, FollowsServerCheckAfterHints) {
    transport_->script("STATUS", ok(200, status_body(processing_info_json("in_progress", 5, 50))));
    transport_->script("STATUS", ok(200, status_body(processing_info_json("succeeded", std::nullopt, 100))));
    auto poller = make_poller();

    auto polled = poller->poll("42", status_of(processing_state::pending, 5), token_);

    ASSERT_TRUE(polled.has_value());
    EXPECT_EQ(polled.value().state, processing_state::succeeded);
    EXPECT_EQ(transport_->count("STATUS"), 2u);
    EXPECT_EQ(poller->status_requests(), 2u);

    auto waits = timer_->waits();
    ASSERT_EQ(waits.size(), 2u);
    EXPECT_EQ(waits[0], 5000ms);
    EXPECT_EQ(waits[1], 5000ms);

    ASSERT_EQ(ticks_.size(), 2u);
    EXPECT_EQ(ticks_[0].state, processing_state::in_progress);
    EXPECT_DOUBLE_EQ(ticks_[0].progress_percent.value_or(0.0), 50.0);
    EXPECT_EQ(ticks_[1].state, processing_state::succeeded);
}

TEST_F(ProcessingPollerTest, StatusQueryCarriesMediaId) {
    auto poller = make_poller();

    ASSERT_TRUE(poller->poll("42", status_of(processing_state::pending, 1), token_).has_value());

    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, recorded_request::kind::get);
    EXPECT_EQ(requests[0].url, config_.upload_url);
    EXPECT_EQ(requests[0].field("command").value_or(""), "STATUS");
    EXPECT_EQ(requests[0].field("media_id").value_or(""), "42");
}

TEST_F(ProcessingPollerTest, UsesDefaultIntervalWithoutHint) {
    config_.poller.default_check_after = 2s;
    auto poller = make_poller();

    ASSERT_TRUE(poller->poll("42", status_of(processing_state::pending), token_).has_value());

    auto waits = timer_->waits();
    ASSERT_EQ(waits.size(), 1u);
    EXPECT_EQ(waits[0], 2000ms);
}

TEST_F(ProcessingPollerTest, ZeroCheckAfterIsRaisedToMinimum) {
    transport_->script("STATUS", ok(200, status_body(processing_info_json("in_progress", 0, 40))));
    transport_->script("STATUS", ok(200, status_body(processing_info_json("succeeded", 0, 100))));
    auto poller = make_poller();

    auto polled = poller->poll("42", status_of(processing_state::pending, 0), token_);

    ASSERT_TRUE(polled.has_value());
    EXPECT_EQ(transport_->count("STATUS"), 2u);
    EXPECT_EQ(timer_->waits(), (std::vector<std::chrono::milliseconds>{1000ms, 1000ms}));
}

TEST_F(ProcessingPollerTest, NegativeMinimumIntervalIsRejected) {
    poller_config config;
    config.min_check_after = -1ms;

    auto checked = config.validate();

    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error().code, error_code::invalid_configuration);
}

TEST_F(ProcessingPollerTest, MissingProcessingInfoMeansDone) {
    transport_->script("STATUS", ok(200, R"({"media_id_string":"42"})"));
    auto poller = make_poller();

    auto polled = poller->poll("42", status_of(processing_state::in_progress, 1), token_);

    ASSERT_TRUE(polled.has_value());
    EXPECT_EQ(polled.value().state, processing_state::succeeded);
}

TEST_F(ProcessingPollerTest, FailedStateBecomesProcessingFailed) {
    transport_->script("STATUS", ok(200, status_body(processing_info_json(
                                              "failed", std::nullopt, 100,
                                              "Unsupported video codec"))));
    auto poller = make_poller();

    auto polled = poller->poll("42", status_of(processing_state::pending, 1), token_);

    ASSERT_FALSE(polled.has_value());
    EXPECT_EQ(polled.error().code, error_code::processing_failed);
    EXPECT_EQ(polled.error().phase, upload_phase::processing);
    EXPECT_NE(polled.error().message.find("Unsupported video codec"), std::string::npos);
}

TEST_F(ProcessingPollerTest, GivesUpAtWaitCeiling) {
    config_.poller.max_wait = 12s;
    for (int i = 0; i < 5; ++i) {
        transport_->script("STATUS", ok(200, status_body(processing_info_json("in_progress", 5))));
    }
    auto poller = make_poller();

    auto polled = poller->poll("42", status_of(processing_state::pending, 5), token_);

    ASSERT_FALSE(polled.has_value());
    EXPECT_EQ(polled.error().code, error_code::processing_timeout);
    EXPECT_EQ(transport_->count("STATUS"), 2u);
    EXPECT_EQ(timer_->elapsed(), 10000ms);
}

TEST_F(ProcessingPollerTest, StopsBeforeSessionDeadline) {
    for (int i = 0; i < 5; ++i) {
        transport_->script("STATUS", ok(200, status_body(processing_info_json("in_progress", 5))));
    }
    auto poller = make_poller();
    poller->set_session_deadline(timer_->now() + 7s);

    auto polled = poller->poll("42", status_of(processing_state::pending, 5), token_);

    ASSERT_FALSE(polled.has_value());
    EXPECT_EQ(polled.error().code, error_code::session_timeout);
    EXPECT_EQ(transport_->count("STATUS"), 1u);
}

TEST_F(ProcessingPollerTest, RetriesTransientStatusFailure) {
    transport_->script("STATUS", ok(503, "Service Unavailable"));
    auto poller = make_poller();

    auto polled = poller->poll("42", status_of(processing_state::pending, 5), token_);

    ASSERT_TRUE(polled.has_value());
    EXPECT_EQ(poller->status_requests(), 2u);

    auto waits = timer_->waits();
    ASSERT_EQ(waits.size(), 2u);
    EXPECT_EQ(waits[0], 5000ms);
    EXPECT_EQ(waits[1], config_.retry.initial_delay);
}

TEST_F(ProcessingPollerTest, PermanentStatusFailureIsTaggedWithPhase) {
    transport_->script("STATUS", ok(404, R"({"errors":[{"message":"Not found"}]})"));
    auto poller = make_poller();

    auto polled = poller->poll("42", status_of(processing_state::pending, 1), token_);

    ASSERT_FALSE(polled.has_value());
    EXPECT_EQ(polled.error().code, error_code::unknown_server);
    EXPECT_EQ(polled.error().phase, upload_phase::processing);
    EXPECT_EQ(transport_->count("STATUS"), 1u);
}

TEST_F(ProcessingPollerTest, CancelledTokenStopsPolling) {
    token_.cancel();
    auto poller = make_poller();

    auto polled = poller->poll("42", status_of(processing_state::pending, 1), token_);

    ASSERT_FALSE(polled.has_value());
    EXPECT_EQ(polled.error().code, error_code::cancelled);
    EXPECT_EQ(transport_->count("STATUS"), 0u);
}

}  // namespace kcenon::media_upload::test
