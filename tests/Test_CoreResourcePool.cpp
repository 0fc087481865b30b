#include <gtest/gtest.h>
#include <memory>

import Core;

namespace
{
    struct TestTag {};
    using Handle = Core::StrongHandle<TestTag>;
    using Pool = Core::ResourcePool<int, Handle>;
}

TEST(ResourcePool, AddGetRemoveDeferredRecycle)
{
    Pool pool;
    pool.Initialize(2);

    const Handle h0 = pool.Add(std::make_unique<int>(123));
    ASSERT_TRUE(h0.IsValid());

    auto p0 = pool.Get(h0);
    ASSERT_TRUE(p0.has_value());
    EXPECT_EQ(**p0, 123);
    EXPECT_EQ(pool.ActiveCount(), 1u);

    // Defer deletion at frame 10.
    pool.Remove(h0, 10);
    EXPECT_FALSE(pool.Get(h0).has_value());
    EXPECT_EQ(pool.ActiveCount(), 0u);

    // Not yet safe: need currentFrame > enqueued + framesInFlight. The slot
    // is still reserved, so a new resource lands elsewhere.
    pool.ProcessDeletions(12);
    const Handle other = pool.Add(std::make_unique<int>(7));
    EXPECT_NE(other.Index, h0.Index);

    // Now safe.
    pool.ProcessDeletions(13);

    // Slot should recycle and bump generation.
    const Handle h1 = pool.Add(std::make_unique<int>(456));
    EXPECT_EQ(h1.Index, h0.Index);
    EXPECT_NE(h1.Generation, h0.Generation);

    auto stale = pool.Get(h0);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error(), Core::ErrorCode::ResourceNotFound);

    auto p1 = pool.Get(h1);
    ASSERT_TRUE(p1.has_value());
    EXPECT_EQ(**p1, 456);
}

TEST(ResourcePool, OutOfRangeHandleIsNotFound)
{
    Pool pool;
    auto result = pool.Get(Handle{42, 1});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::ResourceNotFound);
}

TEST(ResourcePool, DoubleRemoveIsIgnored)
{
    Pool pool;
    pool.Initialize(0);

    const Handle h = pool.Add(std::make_unique<int>(1));
    pool.Remove(h, 0);
    pool.Remove(h, 0);
    pool.ProcessDeletions(1);

    EXPECT_EQ(pool.ActiveCount(), 0u);
}

TEST(StrongHandle, DefaultIsInvalidAndGenerationsDiffer)
{
    Handle invalid;
    EXPECT_FALSE(invalid.IsValid());
    EXPECT_FALSE(static_cast<bool>(invalid));

    EXPECT_NE((Handle{1, 1}), (Handle{1, 2}));
    EXPECT_EQ((Handle{1, 1}), (Handle{1, 1}));
}
