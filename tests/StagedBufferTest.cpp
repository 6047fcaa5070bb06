#include <gtest/gtest.h>
#include "fakes/FakeGraphicsContext.hpp"
#include "vulkan/StagedBuffer.hpp"

namespace {

void pushAll(StagedBuffer<uint32_t>& buffer, std::initializer_list<uint32_t> values) {
    auto batch = buffer.beginBatch();
    for (uint32_t v : values) batch.push(v);
}

}

TEST(StagedBuffer, AllocatesInitialCapacityUpFront) {
    FakeGraphicsContext ctx;
    auto buffer = StagedBuffer<uint32_t>::withCapacity(ctx, 4, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);

    ASSERT_EQ(ctx.buffers.size(), 1u);
    const auto& record = ctx.recordOf(buffer.getBuffer());
    EXPECT_EQ(record.size, 4 * sizeof(uint32_t));
    EXPECT_TRUE(record.usage & VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    EXPECT_TRUE(record.usage & VK_BUFFER_USAGE_TRANSFER_DST_BIT);
    EXPECT_FALSE(record.deviceLocal);
    EXPECT_EQ(buffer.getCapacity(), 4u);
    EXPECT_TRUE(buffer.empty());
    EXPECT_TRUE(ctx.writes.empty());
}

TEST(StagedBuffer, ZeroCapacityStillAllocatesOneRecord) {
    FakeGraphicsContext ctx;
    StagedBuffer<uint32_t> buffer(ctx, 0, VK_BUFFER_USAGE_INDEX_BUFFER_BIT);
    EXPECT_EQ(buffer.getCapacity(), 1u);
}

TEST(StagedBuffer, AppendWithinCapacityTransfersOnlyNewRecords) {
    FakeGraphicsContext ctx;
    StagedBuffer<uint32_t> buffer(ctx, 8, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);

    pushAll(buffer, {10, 11});
    ASSERT_EQ(ctx.writes.size(), 1u);
    EXPECT_EQ(ctx.writes[0].offset, 0u);
    EXPECT_EQ(ctx.writes[0].size, 2 * sizeof(uint32_t));

    pushAll(buffer, {12});
    ASSERT_EQ(ctx.writes.size(), 2u);
    EXPECT_EQ(ctx.writes[1].offset, 2 * sizeof(uint32_t));
    EXPECT_EQ(ctx.writes[1].size, sizeof(uint32_t));

    EXPECT_EQ(ctx.buffers.size(), 1u);
    std::vector<uint32_t> gpu = ctx.contentsAs<uint32_t>(buffer.getBuffer());
    EXPECT_EQ(gpu[0], 10u);
    EXPECT_EQ(gpu[1], 11u);
    EXPECT_EQ(gpu[2], 12u);
}

TEST(StagedBuffer, GrowthReallocatesToExactFitAndUploadsEverything) {
    FakeGraphicsContext ctx;
    StagedBuffer<uint32_t> buffer(ctx, 2, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    pushAll(buffer, {1, 2});
    Buffer before = buffer.getBuffer();

    pushAll(buffer, {3});

    EXPECT_TRUE(ctx.recordOf(before).destroyed);
    EXPECT_NE(buffer.getBuffer().buffer, before.buffer);
    EXPECT_EQ(buffer.getBuffer().size, 3 * sizeof(uint32_t));
    EXPECT_EQ(buffer.getCapacity(), 3u);
    ASSERT_EQ(ctx.writes.size(), 2u);
    EXPECT_EQ(ctx.writes[1].buffer, buffer.getBuffer().buffer);
    EXPECT_EQ(ctx.writes[1].offset, 0u);
    EXPECT_EQ(ctx.writes[1].size, 3 * sizeof(uint32_t));
    EXPECT_EQ(ctx.contentsAs<uint32_t>(buffer.getBuffer()), (std::vector<uint32_t>{1, 2, 3}));
}

TEST(StagedBuffer, EmptyBatchTransfersNothing) {
    FakeGraphicsContext ctx;
    StagedBuffer<uint32_t> buffer(ctx, 4, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    VkBuffer allocation = buffer.getBuffer().buffer;
    {
        auto batch = buffer.beginBatch();
    }
    EXPECT_TRUE(ctx.writes.empty());
    EXPECT_EQ(ctx.buffers.size(), 1u);
    EXPECT_EQ(buffer.getBuffer().buffer, allocation);

    pushAll(buffer, {7});
    ctx.writes.clear();
    {
        auto batch = buffer.beginBatch();
        batch.close();
    }
    EXPECT_TRUE(ctx.writes.empty());
    EXPECT_EQ(ctx.buffers.size(), 1u);
    EXPECT_EQ(buffer.getBuffer().buffer, allocation);
    EXPECT_EQ(ctx.destroyedBuffers, 0);
}

TEST(StagedBuffer, ClearKeepsAllocationAndRestartsAtZero) {
    FakeGraphicsContext ctx;
    StagedBuffer<uint32_t> buffer(ctx, 4, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    pushAll(buffer, {1, 2, 3});
    Buffer allocation = buffer.getBuffer();

    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.getCapacity(), 4u);
    EXPECT_EQ(buffer.getBuffer().buffer, allocation.buffer);

    ctx.writes.clear();
    pushAll(buffer, {9});
    ASSERT_EQ(ctx.writes.size(), 1u);
    EXPECT_EQ(ctx.writes[0].offset, 0u);
    EXPECT_EQ(ctx.writes[0].size, sizeof(uint32_t));
}

TEST(StagedBuffer, SecondOpenBatchIsRejected) {
    FakeGraphicsContext ctx;
    StagedBuffer<uint32_t> buffer(ctx, 4, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    auto batch = buffer.beginBatch();
    EXPECT_THROW(buffer.beginBatch(), std::logic_error);
    EXPECT_THROW(buffer.clear(), std::logic_error);

    batch.close();
    EXPECT_NO_THROW({ auto again = buffer.beginBatch(); });
}

TEST(StagedBuffer, PushAfterCloseThrows) {
    FakeGraphicsContext ctx;
    StagedBuffer<uint32_t> buffer(ctx, 4, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    auto batch = buffer.beginBatch();
    batch.close();
    EXPECT_FALSE(batch.isOpen());
    EXPECT_THROW(batch.push(1), std::logic_error);
}

TEST(StagedBuffer, MovedBatchFlushesOnce) {
    FakeGraphicsContext ctx;
    StagedBuffer<uint32_t> buffer(ctx, 4, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    {
        auto first = buffer.beginBatch();
        first.push(5);
        auto second = std::move(first);
        EXPECT_FALSE(first.isOpen());
        second.push(6);
    }
    ASSERT_EQ(ctx.writes.size(), 1u);
    EXPECT_EQ(ctx.writes[0].size, 2 * sizeof(uint32_t));
    EXPECT_EQ(buffer.size(), 2u);
}

TEST(StagedBuffer, DestructorReleasesAllocation) {
    FakeGraphicsContext ctx;
    {
        StagedBuffer<uint32_t> buffer(ctx, 4, VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
        pushAll(buffer, {1});
    }
    EXPECT_EQ(ctx.liveBufferCount(), 0u);
}
