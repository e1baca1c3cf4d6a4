#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

import Avatar;
import Core;

#include "AvatarTestBuilders.h"

using namespace std::chrono_literals;

// -----------------------------------------------------------------------------
// Slots and tickets
// -----------------------------------------------------------------------------

TEST(AvatarFrameSynchronizer, TicketsCycleSlotsWithIncreasingFrameNumbers)
{
    Avatar::FrameSynchronizer sync(3);

    std::vector<Avatar::FrameTicket> tickets;
    for (int i = 0; i < 3; ++i)
        tickets.push_back(sync.Acquire());

    EXPECT_EQ(sync.GetFramesInFlight(), 3u);
    for (uint32_t i = 0; i < 3; ++i)
    {
        EXPECT_EQ(tickets[i].SlotIndex, i);
        EXPECT_EQ(tickets[i].FrameNumber, i);
    }

    ASSERT_TRUE(sync.Release(tickets[0]).has_value());
    const auto next = sync.Acquire();
    EXPECT_EQ(next.SlotIndex, 0u);
    EXPECT_EQ(next.FrameNumber, 3u);
}

TEST(AvatarFrameSynchronizer, ClampsFramesInFlight)
{
    EXPECT_EQ(Avatar::FrameSynchronizer(0).GetMaxFramesInFlight(), 1u);
    EXPECT_EQ(Avatar::FrameSynchronizer(100).GetMaxFramesInFlight(), Avatar::kMaxFramesInFlightLimit);
}

TEST(AvatarFrameSynchronizer, ExhaustedSlotsTimeOut)
{
    Avatar::FrameSynchronizer sync(2);
    const auto a = sync.Acquire();
    const auto b = sync.Acquire();

    EXPECT_FALSE(sync.TryAcquireFor(10ms).has_value());

    ASSERT_TRUE(sync.Release(b).has_value());
    const auto c = sync.TryAcquireFor(10ms);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->SlotIndex, b.SlotIndex);
    (void)a;
}

TEST(AvatarFrameSynchronizer, AcquireBlocksUntilRelease)
{
    Avatar::FrameSynchronizer sync(1);
    const auto first = sync.Acquire();

    std::atomic<bool> acquired{false};
    std::thread waiter([&]
    {
        const auto ticket = sync.Acquire();
        acquired = true;
        (void)sync.Release(ticket);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());

    ASSERT_TRUE(sync.Release(first).has_value());
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(sync.GetFramesInFlight(), 0u);
}

TEST(AvatarFrameSynchronizer, RejectsTicketsNotInFlight)
{
    Avatar::FrameSynchronizer sync(2);
    const auto ticket = sync.Acquire();

    ASSERT_TRUE(sync.Release(ticket).has_value());

    const auto twice = sync.Release(ticket);
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error(), Core::ErrorCode::InvalidState);

    EXPECT_FALSE(sync.Release({7, 0}).has_value());
    EXPECT_EQ(sync.GetFramesInFlight(), 0u);
}

TEST(AvatarFrameSynchronizer, CancelFreesSlotOutOfOrder)
{
    Avatar::FrameSynchronizer sync(3);
    const auto a = sync.Acquire();
    const auto b = sync.Acquire();
    const auto c = sync.Acquire();

    ASSERT_TRUE(sync.Cancel(b).has_value());
    const auto d = sync.Acquire();
    EXPECT_EQ(d.SlotIndex, b.SlotIndex);

    // Slots stay unique across in-flight tickets
    const std::set<uint32_t> slots = {a.SlotIndex, c.SlotIndex, d.SlotIndex};
    EXPECT_EQ(slots.size(), 3u);
}

TEST(AvatarFrameSynchronizer, ReleaseFromAnotherThread)
{
    Avatar::FrameSynchronizer sync(2);
    std::vector<std::thread> completions;
    for (int frame = 0; frame < 20; ++frame)
    {
        const auto ticket = sync.Acquire();
        completions.emplace_back([&sync, ticket] { (void)sync.Release(ticket); });
    }

    for (auto& t : completions)
        t.join();

    EXPECT_EQ(sync.GetFramesInFlight(), 0u);
    EXPECT_TRUE(sync.TryAcquireFor(1s).has_value());
    EXPECT_TRUE(sync.TryAcquireFor(1s).has_value());
}

// -----------------------------------------------------------------------------
// Scene lock
// -----------------------------------------------------------------------------

TEST(AvatarFrameSynchronizer, LockSceneExcludesOtherWriters)
{
    auto model = MakeStandardAvatar();
    std::atomic<bool> writerEntered{false};

    std::thread writer;
    {
        auto lock = Avatar::FrameSynchronizer::LockScene(*model);
        ASSERT_TRUE(lock.owns_lock());

        writer = std::thread([&]
        {
            std::lock_guard guard(model->GetMutex());
            writerEntered = true;
        });

        std::this_thread::sleep_for(50ms);
        EXPECT_FALSE(writerEntered.load());
    }

    writer.join();
    EXPECT_TRUE(writerEntered.load());
}

// -----------------------------------------------------------------------------
// Render item cache
// -----------------------------------------------------------------------------

TEST(AvatarFrameSynchronizer, RenderItemsCachedUntilInvalidated)
{
    auto model = MakeStandardAvatar();
    Avatar::FrameSynchronizer sync;

    EXPECT_FALSE(sync.HasCachedRenderItems());
    const size_t count = sync.GetRenderItems(*model).size();
    EXPECT_EQ(count, 4u);
    EXPECT_EQ(sync.GetRenderItemBuildCount(), 1u);

    (void)sync.GetRenderItems(*model);
    EXPECT_EQ(sync.GetRenderItemBuildCount(), 1u);

    sync.InvalidateRenderItems();
    EXPECT_FALSE(sync.HasCachedRenderItems());
    (void)sync.GetRenderItems(*model);
    EXPECT_EQ(sync.GetRenderItemBuildCount(), 2u);
}

TEST(AvatarFrameSynchronizer, NewModelDiscardsCache)
{
    auto first = MakeStandardAvatar();
    auto second = std::make_unique<Avatar::Model>("Second");
    AddMeshNode(*second, "Prop", "Prop", MakeMaterial("Metal"));

    Avatar::FrameSynchronizer sync;
    EXPECT_EQ(sync.GetRenderItems(*first).size(), 4u);

    const auto& items = sync.GetRenderItems(*second);
    EXPECT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].MaterialName, "Metal");
    EXPECT_EQ(sync.GetRenderItemBuildCount(), 2u);
}
