module;
#include <algorithm>
#include <cstdint>
#include <memory>
#include "RHI.Vulkan.hpp"

module RHI:FrameContext.Impl;
import :FrameContext;
import :Device;
import Core;

namespace RHI
{
    FrameContextRing::FrameContextRing(std::shared_ptr<VulkanDevice> device, uint32_t slotCount)
        : m_Device(std::move(device)), m_Slots(std::max(1u, slotCount))
    {
        VkDevice logicalDevice = m_Device->GetLogicalDevice();

        for (auto& slot : m_Slots)
        {
            VkCommandPoolCreateInfo poolInfo{};
            poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
            poolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
            poolInfo.queueFamilyIndex = m_Device->GetQueueIndices().GraphicsFamily.value();

            if (vkCreateCommandPool(logicalDevice, &poolInfo, nullptr, &slot.Pool) != VK_SUCCESS)
            {
                Core::Log::Error("FrameContextRing: failed to create command pool");
                m_IsValid = false;
                return;
            }

            VkCommandBufferAllocateInfo allocInfo{};
            allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            allocInfo.commandPool = slot.Pool;
            allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            allocInfo.commandBufferCount = 1;

            if (vkAllocateCommandBuffers(logicalDevice, &allocInfo, &slot.CommandBuffer) != VK_SUCCESS)
            {
                Core::Log::Error("FrameContextRing: failed to allocate command buffer");
                m_IsValid = false;
                return;
            }

            // Created signalled so the first Begin on every slot is uniform
            VkFenceCreateInfo fenceInfo{};
            fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
            fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

            if (vkCreateFence(logicalDevice, &fenceInfo, nullptr, &slot.Fence) != VK_SUCCESS)
            {
                Core::Log::Error("FrameContextRing: failed to create fence");
                m_IsValid = false;
                return;
            }
        }
    }

    FrameContextRing::~FrameContextRing()
    {
        VkDevice logicalDevice = m_Device->GetLogicalDevice();
        std::vector<VkFence> fences;
        // A slot begun but never submitted holds a reset fence nothing will signal
        for (const auto& slot : m_Slots)
            if (slot.Fence && slot.Submitted) fences.push_back(slot.Fence);

        if (!fences.empty())
            vkWaitForFences(logicalDevice, static_cast<uint32_t>(fences.size()), fences.data(), VK_TRUE, UINT64_MAX);

        for (auto& slot : m_Slots)
        {
            if (slot.Fence) vkDestroyFence(logicalDevice, slot.Fence, nullptr);
            if (slot.Pool) vkDestroyCommandPool(logicalDevice, slot.Pool, nullptr);
        }
    }

    VkCommandBuffer FrameContextRing::Begin(uint32_t slot)
    {
        if (!m_IsValid || slot >= m_Slots.size()) return VK_NULL_HANDLE;

        Slot& s = m_Slots[slot];
        VkDevice logicalDevice = m_Device->GetLogicalDevice();

        VK_CHECK(vkResetFences(logicalDevice, 1, &s.Fence));
        s.Submitted = false;
        VK_CHECK(vkResetCommandPool(logicalDevice, s.Pool, 0));

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;

        if (vkBeginCommandBuffer(s.CommandBuffer, &beginInfo) != VK_SUCCESS)
        {
            Core::Log::Error("FrameContextRing: failed to begin command buffer for slot {}", slot);
            return VK_NULL_HANDLE;
        }
        return s.CommandBuffer;
    }

    VkResult FrameContextRing::Submit(uint32_t slot)
    {
        if (!m_IsValid || slot >= m_Slots.size()) return VK_ERROR_INITIALIZATION_FAILED;

        Slot& s = m_Slots[slot];
        VkResult res = vkEndCommandBuffer(s.CommandBuffer);
        if (res != VK_SUCCESS) return res;

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &s.CommandBuffer;

        res = m_Device->SubmitToGraphicsQueue(submitInfo, s.Fence);
        if (res == VK_SUCCESS)
            s.Submitted = true;
        return res;
    }
}
