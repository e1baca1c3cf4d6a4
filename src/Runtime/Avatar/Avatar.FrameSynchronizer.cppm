module;
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <semaphore>
#include <vector>

export module Avatar:FrameSynchronizer;

import :Model;
import :RenderItem;
import Core;

export namespace Avatar
{
    inline constexpr uint32_t kDefaultFramesInFlight = 3;
    inline constexpr uint32_t kMaxFramesInFlightLimit = 16;

    // Value-type token for one in-flight frame. Safe to copy into GPU
    // completion continuations.
    struct FrameTicket
    {
        uint32_t SlotIndex = 0;
        uint64_t FrameNumber = 0;
    };

    // Bounds the number of frames the GPU may have in flight, hands out the
    // ring slot each frame writes its per-frame resources into, and caches the
    // classified render items between model loads.
    class FrameSynchronizer
    {
    public:
        explicit FrameSynchronizer(uint32_t maxFramesInFlight = kDefaultFramesInFlight);

        FrameSynchronizer(const FrameSynchronizer&) = delete;
        FrameSynchronizer& operator=(const FrameSynchronizer&) = delete;

        // Blocks until a slot is free.
        [[nodiscard]] FrameTicket Acquire();
        [[nodiscard]] std::optional<FrameTicket> TryAcquireFor(std::chrono::milliseconds timeout);

        // Returns the slot. Called on GPU completion, or for a frame abandoned
        // before submission. Rejects tickets that are not in flight.
        Core::Result Release(const FrameTicket& ticket);

        // Release for a frame abandoned before its commands were submitted.
        Core::Result Cancel(const FrameTicket& ticket);

        [[nodiscard]] uint32_t GetMaxFramesInFlight() const { return m_MaxFramesInFlight; }
        [[nodiscard]] uint32_t GetFramesInFlight() const;

        // Exclusive hold on the model for the duration of an encode.
        [[nodiscard]] static std::unique_lock<std::mutex> LockScene(const Model& model)
        {
            return std::unique_lock<std::mutex>(model.GetMutex());
        }

        // Classified items for model; rebuilt on first use, after
        // InvalidateRenderItems, or when a different model is passed.
        [[nodiscard]] const std::vector<RenderItem>& GetRenderItems(const Model& model);
        void InvalidateRenderItems();
        [[nodiscard]] bool HasCachedRenderItems() const { return m_CachedModel != nullptr; }
        [[nodiscard]] uint64_t GetRenderItemBuildCount() const { return m_BuildCount; }

    private:
        [[nodiscard]] FrameTicket ClaimSlot();

        uint32_t m_MaxFramesInFlight;
        std::counting_semaphore<kMaxFramesInFlightLimit> m_FreeSlots;

        mutable std::mutex m_SlotMutex;
        std::vector<std::optional<uint64_t>> m_SlotFrames; // Frame number occupying each slot
        uint32_t m_NextSlot = 0;
        uint64_t m_NextFrameNumber = 0;

        const Model* m_CachedModel = nullptr;
        std::vector<RenderItem> m_CachedItems;
        uint64_t m_BuildCount = 0;
    };
}
