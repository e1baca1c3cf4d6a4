module;

#include <algorithm>
#include <cstdint>
#include <memory>
#include <span>
#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

module Graphics:FrameResources.Impl;

import :FrameResources;
import :GpuTypes;

import Core;
import RHI;

namespace Graphics
{
    namespace
    {
        constexpr size_t kInitialJointPaletteBytes = 256 * sizeof(glm::mat4);
        constexpr size_t kInitialMorphParamBytes = 4096;
        constexpr size_t kPlaceholderBytes = 256;
    }

    FrameResourceRing::FrameResourceRing(std::shared_ptr<RHI::VulkanDevice> device, uint32_t slotCount)
        : m_Device(std::move(device)), m_Slots(std::max(1u, slotCount))
    {
        for (Slot& slot : m_Slots)
        {
            slot.Uniforms = std::make_unique<RHI::VulkanBuffer>(m_Device, sizeof(FrameUniforms),
                                                                VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
                                                                VMA_MEMORY_USAGE_CPU_TO_GPU);
            slot.JointPalette = std::make_unique<RHI::VulkanBuffer>(m_Device, kInitialJointPaletteBytes,
                                                                    VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
                                                                    VMA_MEMORY_USAGE_CPU_TO_GPU);
            slot.MorphParams = std::make_unique<RHI::VulkanBuffer>(m_Device, kInitialMorphParamBytes,
                                                                   VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
                                                                   VMA_MEMORY_USAGE_CPU_TO_GPU);
        }

        // Zero-filled; never read while the matching flag is off
        m_Placeholder = std::make_unique<RHI::VulkanBuffer>(m_Device, kPlaceholderBytes,
                                                            VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
                                                            VMA_MEMORY_USAGE_CPU_TO_GPU);
        if (void* mapped = m_Placeholder->GetMappedData())
        {
            std::fill_n(static_cast<uint8_t*>(mapped), kPlaceholderBytes, uint8_t{0});
            m_Placeholder->Flush();
        }
    }

    Core::Result FrameResourceRing::EnsureCapacity(std::unique_ptr<RHI::VulkanBuffer>& buffer, size_t sizeBytes)
    {
        if (buffer && buffer->IsValid() && buffer->GetSizeBytes() >= sizeBytes)
            return Core::Ok();

        const size_t current = buffer ? buffer->GetSizeBytes() : 0;
        const size_t newSize = std::max(sizeBytes, current * 2);

        // The old buffer's destruction is deferred through the device queue
        buffer = std::make_unique<RHI::VulkanBuffer>(m_Device, newSize,
                                                     VK_BUFFER_USAGE_STORAGE_BUFFER_BIT,
                                                     VMA_MEMORY_USAGE_CPU_TO_GPU);
        if (!buffer->IsValid())
        {
            Core::Log::Error("FrameResourceRing: failed to grow buffer to {} bytes", newSize);
            return Core::Err(Core::ErrorCode::OutOfDeviceMemory);
        }
        return Core::Ok();
    }

    Core::Expected<uint64_t> FrameResourceRing::WriteUniforms(uint32_t slot, const FrameUniforms& uniforms)
    {
        if (slot >= m_Slots.size()) return std::unexpected(Core::ErrorCode::OutOfRange);

        RHI::VulkanBuffer& buffer = *m_Slots[slot].Uniforms;
        if (!buffer.IsValid()) return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        buffer.Write(&uniforms, sizeof(FrameUniforms));
        return buffer.GetDeviceAddress();
    }

    Core::Expected<uint64_t> FrameResourceRing::WriteJointPalette(uint32_t slot, std::span<const glm::mat4> matrices)
    {
        if (slot >= m_Slots.size()) return std::unexpected(Core::ErrorCode::OutOfRange);
        if (matrices.empty()) return GetPlaceholderAddress();

        auto& buffer = m_Slots[slot].JointPalette;
        if (auto grown = EnsureCapacity(buffer, matrices.size_bytes()); !grown)
            return std::unexpected(grown.error());

        buffer->Write(matrices.data(), matrices.size_bytes());
        return buffer->GetDeviceAddress();
    }

    Core::Result FrameResourceRing::ReserveMorphParams(uint32_t slot, size_t sizeBytes)
    {
        if (slot >= m_Slots.size()) return Core::Err(Core::ErrorCode::OutOfRange);
        return EnsureCapacity(m_Slots[slot].MorphParams, sizeBytes);
    }

    Core::Expected<uint64_t> FrameResourceRing::WriteMorphParams(uint32_t slot, size_t offset, const void* data, size_t size)
    {
        if (slot >= m_Slots.size()) return std::unexpected(Core::ErrorCode::OutOfRange);

        RHI::VulkanBuffer& buffer = *m_Slots[slot].MorphParams;
        if (offset + size > buffer.GetSizeBytes()) return std::unexpected(Core::ErrorCode::OutOfRange);

        buffer.Write(data, size, offset);
        return buffer.GetDeviceAddress() + offset;
    }
}
