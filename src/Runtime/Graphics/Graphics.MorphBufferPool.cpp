module;

#include <cstdint>
#include <memory>

#include "RHI.Vulkan.hpp"

module Graphics:MorphBufferPool.Impl;

import :MorphBufferPool;

import Core;
import RHI;
import Avatar;

namespace Graphics
{
    MorphBufferPool::MorphBufferPool(std::shared_ptr<RHI::VulkanDevice> device, uint32_t framesInFlight)
        : m_Device(std::move(device))
    {
        m_Buffers.Initialize(framesInFlight);
    }

    Avatar::MorphBufferHandle MorphBufferPool::Acquire(uint64_t key, size_t sizeBytes, uint64_t frameNumber)
    {
        if (auto it = m_ByKey.find(key); it != m_ByKey.end())
        {
            RHI::VulkanBuffer* existing = m_Buffers.GetUnchecked(it->second);
            if (existing && existing->GetSizeBytes() >= sizeBytes)
                return it->second;

            Core::Log::Debug("MorphBufferPool: retiring undersized buffer for key {:#x}", key);
            m_Buffers.Remove(it->second, frameNumber);
            m_ByKey.erase(it);
        }

        auto buffer = std::make_unique<RHI::VulkanBuffer>(m_Device, sizeBytes,
                                                          VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
                                                          VMA_MEMORY_USAGE_GPU_ONLY);
        if (!buffer->IsValid())
        {
            Core::Log::Error("MorphBufferPool: failed to allocate {} bytes for key {:#x}", sizeBytes, key);
            return {};
        }

        const Avatar::MorphBufferHandle handle = m_Buffers.Add(std::move(buffer));
        m_ByKey.emplace(key, handle);
        return handle;
    }

    RHI::VulkanBuffer* MorphBufferPool::Resolve(Avatar::MorphBufferHandle handle) const
    {
        return m_Buffers.GetUnchecked(handle);
    }

    void MorphBufferPool::Clear(uint64_t frameNumber)
    {
        for (const auto& [key, handle] : m_ByKey)
            m_Buffers.Remove(handle, frameNumber);
        m_ByKey.clear();
    }
}
