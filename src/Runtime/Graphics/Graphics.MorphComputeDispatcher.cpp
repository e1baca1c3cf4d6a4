module;

#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

#include "Core.Profiling.Macros.hpp"

module Graphics:MorphComputeDispatcher.Impl;

import :MorphComputeDispatcher;
import :PipelineLibrary;
import :MorphBufferPool;
import :FrameResources;
import :ModelResidency;
import :GpuTypes;

import Core;
import RHI;
import Avatar;

namespace Graphics
{
    namespace
    {
        // buffer_reference blocks default to 16-byte alignment
        constexpr size_t AlignParam(size_t bytes) { return (bytes + 15u) & ~size_t{15u}; }

        struct PreparedDispatch
        {
            const Avatar::MorphDispatchItem* Item = nullptr;
            const PrimitiveResidency* Residency = nullptr;
            Avatar::MorphBufferHandle Output;
            RHI::VulkanBuffer* OutputBuffer = nullptr;
        };
    }

    MorphComputeDispatcher::MorphComputeDispatcher(PipelineLibrary& pipelines, MorphBufferPool& pool,
                                                   FrameResourceRing& frameResources)
        : m_Pipelines(pipelines), m_Pool(pool), m_FrameResources(frameResources)
    {
    }

    Core::Expected<Avatar::MorphBufferTable> MorphComputeDispatcher::Execute(VkCommandBuffer cmd,
                                                                             const Avatar::MorphFramePlan& plan,
                                                                             const ModelResidency& residency,
                                                                             uint32_t slot,
                                                                             uint64_t frameNumber)
    {
        PROFILE_SCOPE("MorphComputeDispatcher::Execute");

        Avatar::MorphBufferTable table;
        m_LastDispatchCount = 0;
        m_Pool.ProcessDeletions(frameNumber);

        if (!plan.ComputeRequired || plan.Dispatches.empty())
            return table;

        RHI::ComputePipeline* pipeline = m_Pipelines.GetMorphPipeline();
        if (!pipeline)
        {
            if (!m_WarnedMissingPipeline)
            {
                Core::Log::Warn("MorphComputeDispatcher: compute pipeline unavailable, drawing static positions");
                m_WarnedMissingPipeline = true;
            }
            return table;
        }

        std::vector<PreparedDispatch> prepared;
        prepared.reserve(plan.Dispatches.size());
        size_t paramBytes = 0;

        for (const Avatar::MorphDispatchItem& item : plan.Dispatches)
        {
            const PrimitiveResidency* prim = residency.Find(item.MeshIndex, item.PrimitiveIndexInMesh);
            if (!prim || !prim->HasMorphData() || prim->VertexCount != item.VertexCount)
            {
                Core::Log::Warn("MorphComputeDispatcher: no resident morph data for mesh {} primitive {}",
                                item.MeshIndex, item.PrimitiveIndexInMesh);
                continue;
            }

            const size_t outputBytes = static_cast<size_t>(item.VertexCount) * Avatar::kMorphVec4PerVertex * sizeof(glm::vec4);
            const Avatar::MorphBufferHandle handle = m_Pool.Acquire(item.Key, outputBytes, frameNumber);
            RHI::VulkanBuffer* output = handle.IsValid() ? m_Pool.Resolve(handle) : nullptr;
            if (!output)
                return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

            prepared.push_back({&item, prim, handle, output});
            paramBytes += 2 * AlignParam(item.ActiveTargets.size() * sizeof(uint32_t));
        }

        if (prepared.empty())
            return table;

        if (auto reserved = m_FrameResources.ReserveMorphParams(slot, paramBytes); !reserved)
            return std::unexpected(reserved.error());

        // Earlier submissions may still read these outputs in their vertex stage
        for (const PreparedDispatch& d : prepared)
        {
            RHI::CommandUtils::BufferBarrier(cmd, d.OutputBuffer->GetHandle(),
                                             VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_READ_BIT,
                                             VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT);
        }

        vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline->GetHandle());

        size_t offset = 0;
        for (const PreparedDispatch& d : prepared)
        {
            const Avatar::MorphDispatchItem& item = *d.Item;
            const size_t indexBytes = item.ActiveTargets.size() * sizeof(uint32_t);
            const size_t weightBytes = item.ActiveWeights.size() * sizeof(float);

            auto indexAddress = m_FrameResources.WriteMorphParams(slot, offset, item.ActiveTargets.data(), indexBytes);
            offset += AlignParam(indexBytes);
            auto weightAddress = m_FrameResources.WriteMorphParams(slot, offset, item.ActiveWeights.data(), weightBytes);
            offset += AlignParam(weightBytes);
            if (!indexAddress || !weightAddress)
                return std::unexpected(Core::ErrorCode::OutOfRange);

            MorphPushConstants push{};
            push.BaseAddress = d.Residency->MorphBase->GetDeviceAddress();
            push.DeltaAddress = d.Residency->MorphDeltas->GetDeviceAddress();
            push.ActiveTargetAddress = *indexAddress;
            push.ActiveWeightAddress = *weightAddress;
            push.OutputAddress = d.OutputBuffer->GetDeviceAddress();
            push.VertexCount = item.VertexCount;
            push.ActiveCount = static_cast<uint32_t>(item.ActiveTargets.size());
            push.TargetCount = item.TargetCount;

            vkCmdPushConstants(cmd, pipeline->GetLayout(), VK_SHADER_STAGE_COMPUTE_BIT, 0, sizeof(push), &push);
            vkCmdDispatch(cmd, (item.VertexCount + kMorphWorkgroupSize - 1) / kMorphWorkgroupSize, 1, 1);

            table.Publish(item.Key, d.Output);
            ++m_LastDispatchCount;
        }

        for (const PreparedDispatch& d : prepared)
        {
            RHI::CommandUtils::BufferBarrier(cmd, d.OutputBuffer->GetHandle(),
                                             VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
                                             VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_READ_BIT);
        }

        Core::Log::Debug("MorphComputeDispatcher: {} dispatches, {} primitives idle",
                         m_LastDispatchCount, plan.SkippedPrimitives);
        return table;
    }
}
