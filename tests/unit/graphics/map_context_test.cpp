// GpuBind Graphics Tests
// map_context_test.cpp - Tests for mapped range bookkeeping

#include <gtest/gtest.h>

#include <gpubind/graphics/map_context.hpp>

namespace gpubind::graphics {
namespace {

using driver::MapMode;

TEST(ByteRangeTest, ContainsAndIntersects) {
    ByteRange outer{0, 64};
    EXPECT_TRUE(outer.contains({16, 32}));
    EXPECT_TRUE(outer.contains({0, 64}));
    EXPECT_FALSE(outer.contains({48, 72}));

    ByteRange a{0, 16};
    EXPECT_TRUE(a.intersects({8, 24}));
    EXPECT_FALSE(a.intersects({16, 32}));  // Half-open ranges that touch don't overlap
    EXPECT_EQ(a.size(), 16u);
    EXPECT_TRUE((ByteRange{4, 4}).empty());
}

TEST(MapContextTest, StartsUnmapped) {
    MapContext context(64);
    EXPECT_FALSE(context.is_mapped());
    EXPECT_FALSE(context.is_pending());
    EXPECT_FALSE(context.initial_range().has_value());
}

TEST(MapContextTest, MapRequestLifecycle) {
    MapContext context(64);
    auto generation = context.begin_map({0, 32}, MapMode::Read);
    EXPECT_TRUE(context.is_pending());
    EXPECT_FALSE(context.is_mapped());

    context.complete(generation);
    EXPECT_TRUE(context.is_mapped());
    EXPECT_EQ(context.mode(), MapMode::Read);
    EXPECT_EQ(*context.initial_range(), (ByteRange{0, 32}));

    context.reset();
    EXPECT_FALSE(context.is_mapped());
}

TEST(MapContextTest, FailedRequestUnmaps) {
    MapContext context(64);
    auto generation = context.begin_map({0, 64}, MapMode::Write);
    context.fail(generation);
    EXPECT_FALSE(context.is_mapped());
    EXPECT_FALSE(context.is_pending());

    // A new request is allowed after a failure
    context.begin_map({0, 64}, MapMode::Write);
    EXPECT_TRUE(context.is_pending());
}

TEST(MapContextTest, StaleCompletionIsIgnored) {
    MapContext context(64);
    auto first = context.begin_map({0, 64}, MapMode::Read);
    context.reset();
    auto second = context.begin_map({0, 64}, MapMode::Read);

    context.complete(first);
    EXPECT_TRUE(context.is_pending());
    context.complete(second);
    EXPECT_TRUE(context.is_mapped());
}

TEST(MapContextTest, DisjointSubRanges) {
    MapContext context(64);
    context.begin_mapped({0, 64}, MapMode::Write);

    context.add({0, 16});
    context.add({16, 32});
    context.add({48, 64});
    EXPECT_EQ(context.sub_ranges().size(), 3u);

    context.remove({16, 32});
    context.add({20, 28});
    EXPECT_EQ(context.sub_ranges().size(), 3u);
}

TEST(MapContextTest, EmptyBufferCreatedMappedStaysUnmapped) {
    MapContext context(0);
    context.begin_mapped({0, 0}, MapMode::Write);
    EXPECT_FALSE(context.is_mapped());
    EXPECT_FALSE(context.initial_range().has_value());
}

TEST(MapContextDeathTest, MapWhileMappedAborts) {
    MapContext context(64);
    context.begin_mapped({0, 64}, MapMode::Read);
    EXPECT_DEATH(context.begin_map({0, 64}, MapMode::Read), "Buffer is already mapped");
}

TEST(MapContextDeathTest, MapWhilePendingAborts) {
    MapContext context(64);
    context.begin_map({0, 64}, MapMode::Read);
    EXPECT_DEATH(context.begin_map({0, 16}, MapMode::Read), "Buffer is already mapped");
}

TEST(MapContextDeathTest, OverlappingSubRangeAborts) {
    MapContext context(64);
    context.begin_mapped({0, 64}, MapMode::Write);
    context.add({0, 32});
    EXPECT_DEATH(context.add({16, 48}), "overlaps mapped range");
}

TEST(MapContextDeathTest, SubRangeOutsideMappedRangeAborts) {
    MapContext context(64);
    context.begin_mapped({16, 32}, MapMode::Write);
    EXPECT_DEATH(context.add({0, 8}), "lies outside the mapped range");
}

TEST(MapContextDeathTest, AccessWhilePendingAborts) {
    MapContext context(64);
    context.begin_map({0, 64}, MapMode::Read);
    EXPECT_DEATH(context.add({0, 8}), "buffer is not mapped");
}

TEST(MapContextDeathTest, ResetWithLiveGuardsAborts) {
    MapContext context(64);
    context.begin_mapped({0, 64}, MapMode::Write);
    context.add({0, 8});
    EXPECT_DEATH(context.reset(), "still has accessible mapped views");
}

TEST(MapContextDeathTest, RemovingUnknownRangeAborts) {
    MapContext context(64);
    context.begin_mapped({0, 64}, MapMode::Write);
    EXPECT_DEATH(context.remove({0, 8}), "is not mapped");
}

TEST(MapContextDeathTest, EmptyRangeAborts) {
    MapContext context(64);
    EXPECT_DEATH(context.begin_map({16, 16}, MapMode::Read), "cannot map the empty range \\[16, 16\\)");
    EXPECT_FALSE(context.is_mapped());
    context.begin_map({0, 16}, MapMode::Read);
    EXPECT_TRUE(context.is_pending());
}

TEST(MapContextDeathTest, RangePastBufferEndAborts) {
    MapContext context(64);
    EXPECT_DEATH(context.begin_map({0, 128}, MapMode::Read), "exceeds buffer size 64");
}

}  // namespace
}  // namespace gpubind::graphics
