module;
#include <cstdint>
#include <memory>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:FrameContext;

import :Device;

export namespace RHI
{
    // One command pool, primary command buffer and fence per frame slot.
    // A slot may only be begun after its previous submission completed;
    // ownership of that guarantee belongs to the caller's frame pacing.
    class FrameContextRing
    {
    public:
        FrameContextRing(std::shared_ptr<VulkanDevice> device, uint32_t slotCount);
        ~FrameContextRing();

        FrameContextRing(const FrameContextRing&) = delete;
        FrameContextRing& operator=(const FrameContextRing&) = delete;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] uint32_t GetSlotCount() const { return static_cast<uint32_t>(m_Slots.size()); }

        // Resets the slot's fence and command pool and opens recording. The
        // fence stays unsignalled until a successful Submit of the same slot.
        [[nodiscard]] VkCommandBuffer Begin(uint32_t slot);

        // Closes recording and submits to the graphics queue, signalling the
        // slot's fence on completion.
        [[nodiscard]] VkResult Submit(uint32_t slot);

        // False between Begin and a successful Submit. Only submitted fences
        // are waited on at destruction.
        [[nodiscard]] bool IsSubmitted(uint32_t slot) const { return m_Slots[slot].Submitted; }

        [[nodiscard]] VkFence GetFence(uint32_t slot) const { return m_Slots[slot].Fence; }
        [[nodiscard]] VkCommandBuffer GetCommandBuffer(uint32_t slot) const { return m_Slots[slot].CommandBuffer; }

    private:
        struct Slot
        {
            VkCommandPool Pool = VK_NULL_HANDLE;
            VkCommandBuffer CommandBuffer = VK_NULL_HANDLE;
            VkFence Fence = VK_NULL_HANDLE;
            bool Submitted = true; // Fences are created signalled
        };

        std::shared_ptr<VulkanDevice> m_Device;
        std::vector<Slot> m_Slots;
        bool m_IsValid = true;
    };
}
