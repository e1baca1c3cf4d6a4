module;

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>
#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

#include "Core.Profiling.Macros.hpp"

module Graphics:ModelResidency.Impl;

import :ModelResidency;
import :GpuTypes;

import Core;
import RHI;
import Avatar;

namespace Graphics
{
    namespace
    {
        struct PendingCopy
        {
            std::unique_ptr<RHI::VulkanBuffer> Staging;
            VkBuffer Destination = VK_NULL_HANDLE;
            VkDeviceSize Size = 0;
        };

        // Device-local buffer filled through a staging copy recorded later in one batch.
        std::unique_ptr<RHI::VulkanBuffer> CreateStaticBuffer(const std::shared_ptr<RHI::VulkanDevice>& device,
                                                              const void* data, size_t size,
                                                              VkBufferUsageFlags usage,
                                                              std::vector<PendingCopy>& copies)
        {
            auto buffer = std::make_unique<RHI::VulkanBuffer>(device, size,
                                                              usage | VK_BUFFER_USAGE_TRANSFER_DST_BIT,
                                                              VMA_MEMORY_USAGE_GPU_ONLY);
            auto staging = std::make_unique<RHI::VulkanBuffer>(device, size,
                                                               VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                                                               VMA_MEMORY_USAGE_CPU_TO_GPU);
            if (!buffer->IsValid() || !staging->IsValid())
                return nullptr;

            staging->Write(data, size);
            copies.push_back({std::move(staging), buffer->GetHandle(), size});
            return buffer;
        }

        GpuVertex ToGpuVertex(const Avatar::Vertex& v)
        {
            GpuVertex out;
            out.PositionU = glm::vec4(v.Position, v.TexCoord.x);
            out.NormalV = glm::vec4(v.Normal, v.TexCoord.y);
            out.Color = v.Color;
            out.Joints = v.Joints;
            out.Weights = v.Weights;
            return out;
        }

        GpuMaterial ToGpuMaterial(const Avatar::Material& m)
        {
            GpuMaterial out;
            out.BaseColor = m.BaseColorFactor;
            out.AlphaCutoff = m.AlphaCutoff;
            out.AlphaMode = static_cast<uint32_t>(m.Mode);
            out.DoubleSided = m.DoubleSided ? 1u : 0u;
            return out;
        }
    }

    ModelResidency::ModelResidency(std::shared_ptr<RHI::VulkanDevice> device)
        : m_Device(std::move(device))
    {
    }

    void ModelResidency::Clear()
    {
        m_Primitives.clear();
        m_Materials.reset();
        m_DefaultMaterialIndex = 0;
    }

    Core::Result ModelResidency::Upload(const Avatar::Model& model)
    {
        PROFILE_SCOPE("ModelResidency::Upload");
        Clear();

        std::vector<PendingCopy> copies;
        const auto& meshes = model.GetMeshes();

        for (uint32_t meshIndex = 0; meshIndex < meshes.size(); ++meshIndex)
        {
            const Avatar::Mesh& mesh = meshes[meshIndex];
            for (uint32_t primIndex = 0; primIndex < mesh.Primitives.size(); ++primIndex)
            {
                const Avatar::Primitive& prim = mesh.Primitives[primIndex];
                PrimitiveResidency residency;
                residency.VertexCount = prim.VertexCount();
                residency.IndexCount = prim.IndexCount();
                residency.TargetCount = prim.MorphTargetCount();

                if (residency.VertexCount == 0)
                {
                    // Still registered so strict validation sees the empty primitive
                    m_Primitives.emplace(Avatar::MakeMorphKey(meshIndex, primIndex), std::move(residency));
                    continue;
                }

                std::vector<GpuVertex> vertices;
                vertices.reserve(prim.Vertices.size());
                for (const Avatar::Vertex& v : prim.Vertices)
                    vertices.push_back(ToGpuVertex(v));

                residency.Vertices = CreateStaticBuffer(m_Device, vertices.data(),
                                                        vertices.size() * sizeof(GpuVertex),
                                                        VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, copies);

                if (prim.IsIndexed())
                {
                    residency.Indices = CreateStaticBuffer(m_Device, prim.Indices.data(),
                                                           prim.Indices.size() * sizeof(uint32_t),
                                                           VK_BUFFER_USAGE_INDEX_BUFFER_BIT, copies);
                }

                if (residency.TargetCount > 0)
                {
                    const std::vector<glm::vec4> base = Avatar::PackMorphBase(prim);
                    const std::vector<glm::vec4> deltas = Avatar::PackMorphDeltas(prim);

                    residency.MorphBase = CreateStaticBuffer(m_Device, base.data(), base.size() * sizeof(glm::vec4),
                                                             VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, copies);
                    residency.MorphDeltas = CreateStaticBuffer(m_Device, deltas.data(), deltas.size() * sizeof(glm::vec4),
                                                               VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, copies);
                }

                if (!residency.HasGeometry())
                {
                    Core::Log::Error("ModelResidency: failed to allocate buffers for mesh '{}' primitive {}",
                                     mesh.Name, primIndex);
                    Clear();
                    return Core::Err(Core::ErrorCode::OutOfDeviceMemory);
                }

                m_Primitives.emplace(Avatar::MakeMorphKey(meshIndex, primIndex), std::move(residency));
            }
        }

        std::vector<GpuMaterial> materials;
        materials.reserve(model.GetMaterials().size() + 1);
        for (const Avatar::Material& material : model.GetMaterials())
            materials.push_back(ToGpuMaterial(material));
        m_DefaultMaterialIndex = static_cast<uint32_t>(materials.size());
        materials.push_back(ToGpuMaterial(Avatar::Material{}));

        m_Materials = CreateStaticBuffer(m_Device, materials.data(), materials.size() * sizeof(GpuMaterial),
                                         VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, copies);
        if (!m_Materials)
        {
            Clear();
            return Core::Err(Core::ErrorCode::OutOfDeviceMemory);
        }

        const VkResult res = RHI::CommandUtils::ExecuteImmediate(*m_Device, [&](VkCommandBuffer cmd)
        {
            for (const PendingCopy& copy : copies)
            {
                VkBufferCopy region{};
                region.size = copy.Size;
                vkCmdCopyBuffer(cmd, copy.Staging->GetHandle(), copy.Destination, 1, &region);
            }
        });
        if (res != VK_SUCCESS)
        {
            Clear();
            return Core::Err(Core::ErrorCode::SubmissionFailed);
        }

        Core::Log::Info("ModelResidency: uploaded '{}' ({} primitives, {} materials)",
                        model.GetName(), m_Primitives.size(), materials.size());
        return Core::Ok();
    }

    const PrimitiveResidency* ModelResidency::Find(uint32_t meshIndex, uint32_t primitiveIndexInMesh) const
    {
        if (auto it = m_Primitives.find(Avatar::MakeMorphKey(meshIndex, primitiveIndexInMesh)); it != m_Primitives.end())
            return &it->second;
        return nullptr;
    }
}
