module;
#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <utility>
#include "RHI.Vulkan.hpp"

module RHI:Buffer.Impl;
import :Buffer;
import :Device;
import Core;

namespace RHI
{
    VulkanBuffer::VulkanBuffer(std::shared_ptr<VulkanDevice> device, size_t size, VkBufferUsageFlags usage,
                               VmaMemoryUsage memoryUsage)
        : m_Device(std::move(device)), m_SizeBytes(size)
    {
        VkBufferCreateInfo bufferInfo{};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = std::max<size_t>(size, 16);
        bufferInfo.usage = usage | VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT;
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = memoryUsage;
        if (memoryUsage == VMA_MEMORY_USAGE_AUTO_PREFER_HOST || memoryUsage == VMA_MEMORY_USAGE_CPU_TO_GPU)
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;

        VmaAllocationInfo resultInfo{};
        if (vmaCreateBuffer(m_Device->GetAllocator(), &bufferInfo, &allocInfo, &m_Buffer, &m_Allocation, &resultInfo) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create buffer of {} bytes!", size);
            m_Buffer = VK_NULL_HANDLE;
            m_SizeBytes = 0;
            return;
        }

        m_MappedData = resultInfo.pMappedData;

        VkBufferDeviceAddressInfo addressInfo{};
        addressInfo.sType = VK_STRUCTURE_TYPE_BUFFER_DEVICE_ADDRESS_INFO;
        addressInfo.buffer = m_Buffer;
        m_DeviceAddress = vkGetBufferDeviceAddress(m_Device->GetLogicalDevice(), &addressInfo);
    }

    VulkanBuffer::~VulkanBuffer()
    {
        if (!m_Buffer) return;

        VkBuffer buffer = m_Buffer;
        VmaAllocation allocation = m_Allocation;
        VmaAllocator allocator = m_Device->GetAllocator();

        // In-flight frames may still read the buffer
        m_Device->SafeDestroy([allocator, buffer, allocation]()
        {
            vmaDestroyBuffer(allocator, buffer, allocation);
        });
    }

    void VulkanBuffer::Flush(size_t offset, size_t size)
    {
        if (!m_Allocation) return;
        const VkDeviceSize flushSize = size == std::numeric_limits<size_t>::max() ? VK_WHOLE_SIZE : size;
        VK_CHECK(vmaFlushAllocation(m_Device->GetAllocator(), m_Allocation, offset, flushSize));
    }
}
