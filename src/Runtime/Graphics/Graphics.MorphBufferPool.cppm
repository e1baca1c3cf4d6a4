module;

#include <cstdint>
#include <memory>
#include <unordered_map>

export module Graphics:MorphBufferPool;

import Core;
import RHI;
import Avatar;

export namespace Graphics
{
    // Morphed-position output buffers keyed by the stable morph key. Storage is
    // reused across frames; an undersized buffer is retired through the pool's
    // deferred deletion and replaced.
    class MorphBufferPool
    {
    public:
        MorphBufferPool(std::shared_ptr<RHI::VulkanDevice> device, uint32_t framesInFlight);

        MorphBufferPool(const MorphBufferPool&) = delete;
        MorphBufferPool& operator=(const MorphBufferPool&) = delete;

        // Returns a buffer with at least sizeBytes for key, growing it if needed.
        // Invalid handle when allocation fails.
        [[nodiscard]] Avatar::MorphBufferHandle Acquire(uint64_t key, size_t sizeBytes, uint64_t frameNumber);

        [[nodiscard]] RHI::VulkanBuffer* Resolve(Avatar::MorphBufferHandle handle) const;

        // Frees retired buffers whose last use is older than the in-flight window.
        void ProcessDeletions(uint64_t frameNumber) { m_Buffers.ProcessDeletions(frameNumber); }

        void Clear(uint64_t frameNumber);

        [[nodiscard]] size_t GetActiveCount() const { return m_Buffers.ActiveCount(); }
        [[nodiscard]] size_t GetPendingDeletionCount() const { return m_Buffers.GetPendingDeletionCount(); }

    private:
        std::shared_ptr<RHI::VulkanDevice> m_Device;
        Core::ResourcePool<RHI::VulkanBuffer, Avatar::MorphBufferHandle> m_Buffers;
        std::unordered_map<uint64_t, Avatar::MorphBufferHandle, Core::Hash::U64Hash> m_ByKey;
    };
}
