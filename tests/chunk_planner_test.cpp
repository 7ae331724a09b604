#include <gtest/gtest.h>
#include <numeric>
#include "core/chunk_planner/chunk_planner.hpp"

using namespace chunkup;
using core::ChunkTask;
using core::pending_chunks;
using core::plan_chunks;

TEST(ChunkPlannerTest, ElevenMiBInFiveMiBChunks) {
    constexpr std::uint64_t kMiB = 1024 * 1024;
    auto tasks = plan_chunks(11 * kMiB, 5 * kMiB);
    ASSERT_TRUE(tasks.has_value());
    ASSERT_EQ(tasks->size(), 3u);

    EXPECT_EQ((*tasks)[0], (ChunkTask{0, 0, 5 * kMiB}));
    EXPECT_EQ((*tasks)[1], (ChunkTask{1, 5 * kMiB, 5 * kMiB}));
    EXPECT_EQ((*tasks)[2], (ChunkTask{2, 10 * kMiB, 1 * kMiB}));
}

TEST(ChunkPlannerTest, RangesAreContiguousAndCoverTheFile) {
    const std::uint64_t size = 1000003;
    auto tasks = plan_chunks(size, 4096);
    ASSERT_TRUE(tasks.has_value());
    EXPECT_EQ(tasks->size(), (size + 4095) / 4096);

    std::uint64_t expected_offset = 0;
    for (std::size_t i = 0; i < tasks->size(); ++i) {
        const auto& task = (*tasks)[i];
        EXPECT_EQ(task.index, i);
        EXPECT_EQ(task.offset, expected_offset);
        if (i + 1 < tasks->size()) {
            EXPECT_EQ(task.length, 4096u);
        }
        expected_offset = task.end();
    }
    EXPECT_EQ(expected_offset, size);
}

TEST(ChunkPlannerTest, ExactMultipleHasNoShortChunk) {
    auto tasks = plan_chunks(12, 4);
    ASSERT_TRUE(tasks.has_value());
    ASSERT_EQ(tasks->size(), 3u);
    EXPECT_EQ(tasks->back().length, 4u);
}

TEST(ChunkPlannerTest, ChunkLargerThanFile) {
    auto tasks = plan_chunks(10, 1 << 20);
    ASSERT_TRUE(tasks.has_value());
    ASSERT_EQ(tasks->size(), 1u);
    EXPECT_EQ(tasks->front().length, 10u);
}

TEST(ChunkPlannerTest, EmptyFileGetsOneZeroLengthChunk) {
    auto tasks = plan_chunks(0, 4);
    ASSERT_TRUE(tasks.has_value());
    ASSERT_EQ(tasks->size(), 1u);
    EXPECT_EQ(tasks->front(), (ChunkTask{0, 0, 0}));
}

TEST(ChunkPlannerTest, NonPositiveChunkSizeIsInvalidConfig) {
    auto zero = plan_chunks(100, 0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, infra::ErrorCode::InvalidConfig);

    auto negative = plan_chunks(100, -5);
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, infra::ErrorCode::InvalidConfig);
}

TEST(ChunkPlannerTest, TooManyChunksToIndex) {
    auto tasks = plan_chunks(std::uint64_t{1} << 40, 1);
    ASSERT_FALSE(tasks.has_value());
    EXPECT_EQ(tasks.error().code, infra::ErrorCode::InvalidConfig);
}

TEST(ChunkPlannerTest, SamePlanEveryTime) {
    auto first = plan_chunks(123456, 1000);
    auto second = plan_chunks(123456, 1000);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, *second);
}

TEST(ChunkPlannerTest, PendingSkipsConfirmedAndKeepsOrder) {
    auto tasks = plan_chunks(20, 4);
    ASSERT_TRUE(tasks.has_value());

    auto pending = pending_chunks(*tasks, {0, 2, 4});
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].index, 1u);
    EXPECT_EQ(pending[1].index, 3u);

    EXPECT_TRUE(pending_chunks(*tasks, {0, 1, 2, 3, 4}).empty());
    EXPECT_EQ(pending_chunks(*tasks, {}).size(), 5u);
}
