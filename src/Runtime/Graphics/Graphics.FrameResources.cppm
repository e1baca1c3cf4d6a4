module;

#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:FrameResources;

import Core;
import RHI;
import :GpuTypes;

export namespace Graphics
{
    // Host-visible per-slot buffers: frame uniforms, the joint palette and the
    // morph parameter arena. A slot is only written after the synchronizer
    // handed it out, so its previous frame no longer reads it.
    class FrameResourceRing
    {
    public:
        FrameResourceRing(std::shared_ptr<RHI::VulkanDevice> device, uint32_t slotCount);

        FrameResourceRing(const FrameResourceRing&) = delete;
        FrameResourceRing& operator=(const FrameResourceRing&) = delete;

        [[nodiscard]] Core::Expected<uint64_t> WriteUniforms(uint32_t slot, const FrameUniforms& uniforms);

        // Empty palettes resolve to the placeholder buffer.
        [[nodiscard]] Core::Expected<uint64_t> WriteJointPalette(uint32_t slot, std::span<const glm::mat4> matrices);

        // Grows the slot's morph arena to hold at least sizeBytes.
        [[nodiscard]] Core::Result ReserveMorphParams(uint32_t slot, size_t sizeBytes);
        // Copies data at offset and returns its device address.
        [[nodiscard]] Core::Expected<uint64_t> WriteMorphParams(uint32_t slot, size_t offset, const void* data, size_t size);

        // Bound wherever a buffer address is required but unused (morph slot of static items).
        [[nodiscard]] uint64_t GetPlaceholderAddress() const { return m_Placeholder->GetDeviceAddress(); }
        [[nodiscard]] uint32_t GetSlotCount() const { return static_cast<uint32_t>(m_Slots.size()); }

    private:
        struct Slot
        {
            std::unique_ptr<RHI::VulkanBuffer> Uniforms;
            std::unique_ptr<RHI::VulkanBuffer> JointPalette;
            std::unique_ptr<RHI::VulkanBuffer> MorphParams;
        };

        std::shared_ptr<RHI::VulkanDevice> m_Device;
        std::vector<Slot> m_Slots;
        std::unique_ptr<RHI::VulkanBuffer> m_Placeholder;

        [[nodiscard]] Core::Result EnsureCapacity(std::unique_ptr<RHI::VulkanBuffer>& buffer, size_t sizeBytes);
    };
}
