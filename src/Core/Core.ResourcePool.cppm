module;

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <deque>
#include <expected>
#include <memory>
#include <concepts>

export module Core:ResourcePool;
import :Error;

export namespace Core
{
    template<typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
    };

    // Generational slot pool with frame-deferred destruction. A removed
    // resource stays alive until FramesInFlight frames have passed, so GPU
    // work that still references it can complete.
    template <typename T, GenerationalHandle HandleT>
    class ResourcePool
    {
    public:
        using Handle = HandleT;

        ResourcePool() = default;

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;
        ResourcePool(ResourcePool&&) noexcept = default;
        ResourcePool& operator=(ResourcePool&&) noexcept = default;

        void Initialize(const uint32_t framesInFlight)
        {
            m_FramesInFlight = framesInFlight;
        }

        Handle Add(std::unique_ptr<T> resource)
        {
            std::unique_lock lock(m_Mutex);

            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.front();
                m_FreeIndices.pop_front();
            }
            else
            {
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }

            Slot& slot = m_Slots[index];
            // The heap address of the resource stays put when m_Slots reallocates.
            slot.Data = std::move(resource);
            ++slot.Generation;
            slot.IsActive = true;
            ++m_ActiveCount;

            return {index, slot.Generation};
        }

        template<typename... Args>
        Handle Create(Args&&... args)
        {
            return Add(std::make_unique<T>(std::forward<Args>(args)...));
        }

        void Remove(Handle handle, uint64_t currentFrameNumber)
        {
            std::unique_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size()) return;

            Slot& slot = m_Slots[handle.Index];
            // Generation check rejects stale handles to reused slots
            if (slot.IsActive && slot.Generation == handle.Generation)
            {
                slot.IsActive = false;
                --m_ActiveCount;

                m_PendingKillList.push_back({
                    .SlotIndex = handle.Index,
                    .Generation = handle.Generation,
                    .KillFrameNumber = currentFrameNumber
                });
            }
        }

        void ProcessDeletions(uint64_t currentFrameNumber)
        {
            std::unique_lock lock(m_Mutex);
            if (m_PendingKillList.empty()) return;

            std::erase_if(m_PendingKillList, [&](const PendingKill& item)
            {
                if (currentFrameNumber <= item.KillFrameNumber + m_FramesInFlight)
                    return false;

                if (item.SlotIndex < m_Slots.size())
                {
                    Slot& slot = m_Slots[item.SlotIndex];
                    if (!slot.IsActive && slot.Generation == item.Generation)
                    {
                        slot.Data.reset();
                        m_FreeIndices.push_back(item.SlotIndex);
                    }
                }
                return true;
            });
        }

        [[nodiscard]] Core::Expected<T*> Get(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);

            if (handle.Index >= m_Slots.size())
                return std::unexpected(Core::ErrorCode::ResourceNotFound);

            const Slot& slot = m_Slots[handle.Index];

            if (!slot.IsActive || slot.Generation != handle.Generation)
                return std::unexpected(Core::ErrorCode::ResourceNotFound);

            return slot.Data.get();
        }

        // Hot-path access. Returns nullptr for stale handles.
        [[nodiscard]] T* GetUnchecked(Handle handle) const
        {
            std::shared_lock lock(m_Mutex);
            if (handle.Index < m_Slots.size())
            {
                const Slot& slot = m_Slots[handle.Index];
                if (slot.IsActive && slot.Generation == handle.Generation)
                    return slot.Data.get();
            }
            return nullptr;
        }

        void Clear()
        {
            std::unique_lock lock(m_Mutex);
            m_PendingKillList.clear();
            m_Slots.clear();
            m_FreeIndices.clear();
            m_ActiveCount = 0;
        }

        [[nodiscard]] size_t Capacity() const
        {
            std::shared_lock lock(m_Mutex);
            return m_Slots.size();
        }

        [[nodiscard]] size_t ActiveCount() const
        {
            std::shared_lock lock(m_Mutex);
            return m_ActiveCount;
        }

        [[nodiscard]] size_t GetPendingDeletionCount() const
        {
            std::shared_lock lock(m_Mutex);
            return m_PendingKillList.size();
        }

    private:
        struct Slot
        {
            std::unique_ptr<T> Data;
            uint32_t Generation = 0;
            bool IsActive = false;
        };

        struct PendingKill
        {
            uint32_t SlotIndex;
            uint32_t Generation;
            uint64_t KillFrameNumber;
        };

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
        std::vector<PendingKill> m_PendingKillList;
        size_t m_ActiveCount = 0;

        mutable std::shared_mutex m_Mutex;
        uint32_t m_FramesInFlight = 2;
    };
}
