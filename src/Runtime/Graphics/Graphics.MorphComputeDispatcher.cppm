module;

#include <cstdint>

#include "RHI.Vulkan.hpp"

export module Graphics:MorphComputeDispatcher;

import Core;
import Avatar;
import :PipelineLibrary;
import :MorphBufferPool;
import :FrameResources;
import :ModelResidency;

export namespace Graphics
{
    // Records the morph accumulation pre-pass into the frame's command buffer
    // and publishes each output under its stable key.
    class MorphComputeDispatcher
    {
    public:
        MorphComputeDispatcher(PipelineLibrary& pipelines, MorphBufferPool& pool, FrameResourceRing& frameResources);

        // An empty table means every draw reads static positions. Barriers
        // before and after the dispatches are recorded here.
        [[nodiscard]] Core::Expected<Avatar::MorphBufferTable> Execute(VkCommandBuffer cmd,
                                                                       const Avatar::MorphFramePlan& plan,
                                                                       const ModelResidency& residency,
                                                                       uint32_t slot,
                                                                       uint64_t frameNumber);

        [[nodiscard]] uint32_t GetLastDispatchCount() const { return m_LastDispatchCount; }

    private:
        PipelineLibrary& m_Pipelines;
        MorphBufferPool& m_Pool;
        FrameResourceRing& m_FrameResources;
        uint32_t m_LastDispatchCount = 0;
        bool m_WarnedMissingPipeline = false;
    };
}
