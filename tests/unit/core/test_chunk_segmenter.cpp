/**
 * @file test_chunk_segmenter.cpp
 * @brief Unit tests for chunk_segmenter
 */

#include <gtest/gtest.h>

#include <kcenon/media_upload/core/chunk_segmenter.h>

namespace kcenon::media_upload::test {

namespace {
constexpr uint64_t KiB = 1024;
constexpr uint64_t MiB = 1024 * 1024;
}  // namespace

class ChunkSegmenterTest : public ::testing::Test {
protected:
    static void expect_partition(const chunk_plan& plan, uint64_t total, uint64_t chunk_size) {
        ASSERT_FALSE(plan.empty());
        uint64_t expected_offset = 0;
        for (std::size_t i = 0; i < plan.size(); ++i) {
            EXPECT_EQ(plan[i].index, i);
            EXPECT_EQ(plan[i].offset, expected_offset);
            EXPECT_GT(plan[i].length, 0u);
            if (i + 1 < plan.size()) {
                EXPECT_EQ(plan[i].length, chunk_size);
            } else {
                EXPECT_LE(plan[i].length, chunk_size);
            }
            EXPECT_EQ(plan[i].status, chunk_status::pending);
            EXPECT_EQ(plan[i].attempt, 0u);
            expected_offset = plan[i].end();
        }
        EXPECT_EQ(expected_offset, total);
    }
};

// calculate_chunk_size

TEST_F(ChunkSegmenterTest, CalculateChunkSize_BelowOneMiB) {
    EXPECT_EQ(chunk_segmenter::calculate_chunk_size(1), 1u);
    EXPECT_EQ(chunk_segmenter::calculate_chunk_size(500 * KiB), 500 * KiB);
    EXPECT_EQ(chunk_segmenter::calculate_chunk_size(MiB - 1), MiB - 1);
}

TEST_F(ChunkSegmenterTest, CalculateChunkSize_MediumBand) {
    EXPECT_EQ(chunk_segmenter::calculate_chunk_size(MiB), MiB);
    EXPECT_EQ(chunk_segmenter::calculate_chunk_size(3 * MiB + 17), MiB);
    EXPECT_EQ(chunk_segmenter::calculate_chunk_size(10 * MiB - 1), MiB);
}

TEST_F(ChunkSegmenterTest, CalculateChunkSize_LargeBand) {
    EXPECT_EQ(chunk_segmenter::calculate_chunk_size(10 * MiB), 5 * MiB);
    EXPECT_EQ(chunk_segmenter::calculate_chunk_size(512 * MiB), 5 * MiB);
}

// plan

TEST_F(ChunkSegmenterTest, Plan_TwelveMiB) {
    auto plan = chunk_segmenter::plan(12 * MiB);

    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan.value().size(), 3u);
    EXPECT_EQ(plan.value()[0].length, 5 * MiB);
    EXPECT_EQ(plan.value()[1].length, 5 * MiB);
    EXPECT_EQ(plan.value()[2].length, 2 * MiB);
    EXPECT_EQ(plan.value()[2].offset, 10 * MiB);
    EXPECT_TRUE(plan.value()[2].is_last(plan.value().size()));
    EXPECT_FALSE(plan.value()[1].is_last(plan.value().size()));
}

TEST_F(ChunkSegmenterTest, Plan_SmallPayloadIsSingleChunk) {
    auto plan = chunk_segmenter::plan(200 * KiB);

    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan.value().size(), 1u);
    EXPECT_EQ(plan.value()[0].offset, 0u);
    EXPECT_EQ(plan.value()[0].length, 200 * KiB);
}

TEST_F(ChunkSegmenterTest, Plan_PartitionsAcrossBands) {
    for (uint64_t total : {uint64_t{1}, 999 * KiB, MiB, 4 * MiB + 3, 10 * MiB, 37 * MiB + 1}) {
        SCOPED_TRACE(total);
        auto plan = chunk_segmenter::plan(total);
        ASSERT_TRUE(plan.has_value());
        expect_partition(plan.value(), total, chunk_segmenter::calculate_chunk_size(total));
    }
}

TEST_F(ChunkSegmenterTest, Plan_ExactMultiple) {
    auto plan = chunk_segmenter::plan(15 * MiB);

    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan.value().size(), 3u);
    EXPECT_EQ(plan.value().back().length, 5 * MiB);
}

TEST_F(ChunkSegmenterTest, Plan_EmptyPayloadFails) {
    auto plan = chunk_segmenter::plan(0);

    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::invalid_configuration);
}

// plan_chunks

TEST_F(ChunkSegmenterTest, PlanChunks_CustomSize) {
    auto plan = chunk_segmenter::plan_chunks(10, 3);

    ASSERT_TRUE(plan.has_value());
    expect_partition(plan.value(), 10, 3);
    EXPECT_EQ(plan.value().size(), 4u);
    EXPECT_EQ(plan.value().back().length, 1u);
}

TEST_F(ChunkSegmenterTest, PlanChunks_RejectsZeroChunkSize) {
    auto plan = chunk_segmenter::plan_chunks(10, 0);

    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::invalid_configuration);
}

TEST_F(ChunkSegmenterTest, PlanChunks_RejectsChunkAboveCeiling) {
    auto plan = chunk_segmenter::plan_chunks(20 * MiB, 5 * MiB + 1);

    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::invalid_configuration);
}

// chunk_count

TEST_F(ChunkSegmenterTest, ChunkCount) {
    static_assert(chunk_segmenter::chunk_count(10, 3) == 4);
    EXPECT_EQ(chunk_segmenter::chunk_count(12 * MiB, 5 * MiB), 3u);
    EXPECT_EQ(chunk_segmenter::chunk_count(0, 5), 0u);
    EXPECT_EQ(chunk_segmenter::chunk_count(5, 0), 0u);
}

}  // namespace kcenon::media_upload::test
