#include <gtest/gtest.h>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>

import Core;

namespace
{
    struct BufferTag {};
    struct PipelineTag {};

    using BufferHandle = Core::StrongHandle<BufferTag>;
    using PipelineHandle = Core::StrongHandle<PipelineTag>;
}

// -----------------------------------------------------------------------------
// Validity
// -----------------------------------------------------------------------------

TEST(StrongHandle, DefaultIsInvalid)
{
    BufferHandle h;
    EXPECT_FALSE(h.IsValid());
    EXPECT_FALSE(static_cast<bool>(h));
    EXPECT_EQ(h.Index, BufferHandle::INVALID_INDEX);
    EXPECT_EQ(h.Generation, 0u);
}

TEST(StrongHandle, ZeroIndexIsValid)
{
    BufferHandle h(0, 1);
    EXPECT_TRUE(h.IsValid());
    EXPECT_TRUE(static_cast<bool>(h));
}

TEST(StrongHandle, ConstexprConstruction)
{
    constexpr BufferHandle h(7, 3);
    static_assert(h.IsValid());
    static_assert(h.Index == 7 && h.Generation == 3);
}

// -----------------------------------------------------------------------------
// Comparison
// -----------------------------------------------------------------------------

TEST(StrongHandle, GenerationDistinguishesReusedSlot)
{
    BufferHandle first(4, 1);
    BufferHandle reused(4, 2);

    EXPECT_NE(first, reused);
    EXPECT_LT(first, reused);
    EXPECT_EQ(first, BufferHandle(4, 1));
}

TEST(StrongHandle, TagsAreDistinctTypes)
{
    static_assert(!std::is_same_v<BufferHandle, PipelineHandle>);
    static_assert(!std::is_convertible_v<BufferHandle, PipelineHandle>);
    static_assert(std::is_trivially_copyable_v<BufferHandle>);
}

// -----------------------------------------------------------------------------
// Hashing
// -----------------------------------------------------------------------------

TEST(StrongHandle, HashSeparatesIndexAndGeneration)
{
    std::hash<BufferHandle> hasher;
    EXPECT_NE(hasher(BufferHandle(1, 2)), hasher(BufferHandle(2, 1)));
    EXPECT_EQ(hasher(BufferHandle(5, 5)), hasher(BufferHandle(5, 5)));
}

TEST(StrongHandle, UsableAsContainerKey)
{
    std::unordered_set<BufferHandle> live;
    live.insert(BufferHandle(0, 1));
    live.insert(BufferHandle(0, 2));
    live.insert(BufferHandle(0, 1));
    EXPECT_EQ(live.size(), 2u);

    std::unordered_map<BufferHandle, uint64_t> sizes;
    sizes[BufferHandle(3, 1)] = 4096;
    EXPECT_EQ(sizes.at(BufferHandle(3, 1)), 4096u);
    EXPECT_FALSE(sizes.contains(BufferHandle(3, 2)));
}
