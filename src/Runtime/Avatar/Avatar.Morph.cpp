module;
#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>
#include <glm/glm.hpp>

module Avatar:Morph.Impl;
import :Morph;
import :Model;
import Core;

namespace Avatar
{
    std::vector<glm::vec4> PackMorphBase(const Primitive& primitive)
    {
        std::vector<glm::vec4> packed;
        packed.reserve(primitive.Vertices.size() * kMorphVec4PerVertex);
        for (const Vertex& v : primitive.Vertices)
        {
            packed.emplace_back(v.Position, 1.0f);
            packed.emplace_back(v.Normal, 0.0f);
        }
        return packed;
    }

    std::vector<glm::vec4> PackMorphDeltas(const Primitive& primitive)
    {
        const size_t vertexCount = primitive.Vertices.size();
        std::vector<glm::vec4> packed(primitive.MorphTargets.size() * vertexCount * kMorphVec4PerVertex,
                                      glm::vec4(0.0f));

        for (size_t t = 0; t < primitive.MorphTargets.size(); ++t)
        {
            const MorphTarget& target = primitive.MorphTargets[t];
            glm::vec4* dst = packed.data() + t * vertexCount * kMorphVec4PerVertex;

            const size_t positions = std::min(target.PositionDeltas.size(), vertexCount);
            for (size_t v = 0; v < positions; ++v)
                dst[v * kMorphVec4PerVertex] = glm::vec4(target.PositionDeltas[v], 0.0f);

            const size_t normals = std::min(target.NormalDeltas.size(), vertexCount);
            for (size_t v = 0; v < normals; ++v)
                dst[v * kMorphVec4PerVertex + 1] = glm::vec4(target.NormalDeltas[v], 0.0f);
        }
        return packed;
    }

    bool IsMorphComputeRequired(const Model& model)
    {
        for (const Mesh& mesh : model.GetMeshes())
        {
            for (const Primitive& primitive : mesh.Primitives)
            {
                const uint32_t targetCount = primitive.MorphTargetCount();
                if (targetCount == 0) continue;

                if (targetCount > MorphConstants::kMaxDirectTargets)
                    return true;

                for (uint32_t t = 0; t < targetCount; ++t)
                {
                    if (mesh.MorphWeight(t) > MorphConstants::kWeightEpsilon)
                        return true;
                }
            }
        }
        return false;
    }

    MorphFramePlan PlanMorphDispatch(const Model& model, bool morphsDisabled)
    {
        MorphFramePlan plan;
        if (morphsDisabled || !IsMorphComputeRequired(model))
            return plan;

        plan.ComputeRequired = true;

        const auto& meshes = model.GetMeshes();
        for (uint32_t meshIndex = 0; meshIndex < meshes.size(); ++meshIndex)
        {
            const Mesh& mesh = meshes[meshIndex];
            for (uint32_t primIndex = 0; primIndex < mesh.Primitives.size(); ++primIndex)
            {
                const Primitive& primitive = mesh.Primitives[primIndex];
                const uint32_t targetCount = primitive.MorphTargetCount();
                if (targetCount == 0 || primitive.VertexCount() == 0) continue;

                MorphDispatchItem item;
                item.Key = MakeMorphKey(meshIndex, primIndex);
                item.MeshIndex = meshIndex;
                item.PrimitiveIndexInMesh = primIndex;
                item.VertexCount = primitive.VertexCount();
                item.TargetCount = targetCount;

                for (uint32_t t = 0; t < targetCount; ++t)
                {
                    const float weight = mesh.MorphWeight(t);
                    if (weight > MorphConstants::kWeightEpsilon)
                    {
                        item.ActiveTargets.push_back(t);
                        item.ActiveWeights.push_back(weight);
                    }
                }

                if (item.ActiveTargets.empty())
                {
                    ++plan.SkippedPrimitives;
                    continue;
                }

                plan.Dispatches.push_back(std::move(item));
            }
        }

        return plan;
    }

    PositionBinding ResolvePositionBinding(const MorphBufferTable& table,
                                           uint32_t meshIndex, uint32_t primitiveIndexInMesh)
    {
        PositionBinding binding;
        if (const auto handle = table.Find(MakeMorphKey(meshIndex, primitiveIndexInMesh)))
        {
            binding.Source = PositionSource::Morphed;
            binding.MorphedBuffer = *handle;
            binding.MorphFlag = 1;
        }
        return binding;
    }
}
