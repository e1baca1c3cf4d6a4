module;
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :Device;
import Core;

export namespace RHI
{
    class VulkanBuffer
    {
    public:
        // Host-visible buffers (CPU_TO_GPU / AUTO_PREFER_HOST) are persistently
        // mapped at creation. SHADER_DEVICE_ADDRESS usage is always added.
        VulkanBuffer(std::shared_ptr<VulkanDevice> device, size_t size, VkBufferUsageFlags usage,
                     VmaMemoryUsage memoryUsage);
        ~VulkanBuffer();

        VulkanBuffer(const VulkanBuffer&) = delete;
        VulkanBuffer& operator=(const VulkanBuffer&) = delete;

        [[nodiscard]] bool IsValid() const { return m_Buffer != VK_NULL_HANDLE; }
        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }
        [[nodiscard]] uint64_t GetDeviceAddress() const { return m_DeviceAddress; }
        [[nodiscard]] bool IsHostVisible() const { return m_MappedData != nullptr; }
        [[nodiscard]] size_t GetSizeBytes() const { return m_SizeBytes; }

        void Write(const void* data, size_t size, size_t offset = 0)
        {
            if (!data || size == 0) return;
            if (offset + size > m_SizeBytes)
            {
                Core::Log::Error("VulkanBuffer::Write(): out of bounds. size={} offset={} cap={}", size, offset, m_SizeBytes);
                return;
            }
            if (!m_MappedData)
            {
                Core::Log::Error("VulkanBuffer::Write(): buffer is not host-visible. size={} offset={}", size, offset);
                return;
            }

            std::memcpy(static_cast<uint8_t*>(m_MappedData) + offset, data, size);
            // No-op for coherent memory
            Flush(offset, size);
        }

        void Flush(size_t offset = 0, size_t size = std::numeric_limits<size_t>::max());

    private:
        std::shared_ptr<VulkanDevice> m_Device;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;

        void* m_MappedData = nullptr;
        uint64_t m_DeviceAddress = 0;
        size_t m_SizeBytes = 0;
    };
}
