module;
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Device;

import :Context;
import Core;

export namespace RHI
{
    struct QueueFamilyIndices
    {
        std::optional<uint32_t> GraphicsFamily;

        [[nodiscard]] bool IsComplete() const { return GraphicsFamily.has_value(); }
    };

    // Logical device with one graphics+compute queue, a VMA allocator and a
    // per-frame-slot deletion queue.
    class VulkanDevice
    {
    public:
        VulkanDevice(VulkanContext& context, uint32_t framesInFlight);
        ~VulkanDevice();

        VulkanDevice(const VulkanDevice&) = delete;
        VulkanDevice& operator=(const VulkanDevice&) = delete;

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] VkQueue GetGraphicsQueue() const { return m_GraphicsQueue; }
        [[nodiscard]] QueueFamilyIndices GetQueueIndices() const { return m_Indices; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] uint32_t GetFramesInFlight() const { return static_cast<uint32_t>(m_DeletionQueues.size()); }
        [[nodiscard]] bool SupportsWireframe() const { return m_SupportsWireframe; }

        [[nodiscard]] VkResult SubmitToGraphicsQueue(const VkSubmitInfo& submitInfo, VkFence fence);
        [[nodiscard]] std::mutex& GetQueueMutex() { return m_QueueMutex; }

        // Destroys everything queued while frameSlot was recording. Call once
        // the slot's previous submission has completed.
        void FlushDeletionQueue(uint32_t frameSlot);
        void SafeDestroy(std::function<void()>&& deleteFn);

    private:
        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkDevice m_Device = VK_NULL_HANDLE;
        VkQueue m_GraphicsQueue = VK_NULL_HANDLE;
        QueueFamilyIndices m_Indices;
        VmaAllocator m_Allocator = VK_NULL_HANDLE;

        bool m_IsValid = true;
        bool m_SupportsWireframe = false;

        mutable std::mutex m_QueueMutex;

        std::vector<std::vector<std::function<void()>>> m_DeletionQueues;
        uint32_t m_CurrentFrameSlot = 0;
        std::mutex m_DeletionMutex;

        void PickPhysicalDevice(VkInstance instance);
        void CreateLogicalDevice(VulkanContext& context);

        [[nodiscard]] bool IsDeviceSuitable(VkPhysicalDevice device);
        [[nodiscard]] QueueFamilyIndices FindQueueFamilies(VkPhysicalDevice device) const;
    };
}
