module;

#include <cstdint>
#include <memory>
#include <unordered_map>

#include "RHI.Vulkan.hpp"

export module Graphics:ModelResidency;

import Core;
import RHI;
import Avatar;

export namespace Graphics
{
    // Immutable GPU copies of one primitive. MorphBase and MorphDeltas exist
    // only for primitives with morph targets and use the Avatar::PackMorphBase
    // and Avatar::PackMorphDeltas layouts.
    struct PrimitiveResidency
    {
        std::unique_ptr<RHI::VulkanBuffer> Vertices;
        std::unique_ptr<RHI::VulkanBuffer> Indices;
        std::unique_ptr<RHI::VulkanBuffer> MorphBase;
        std::unique_ptr<RHI::VulkanBuffer> MorphDeltas;
        uint32_t VertexCount = 0;
        uint32_t IndexCount = 0;
        uint32_t TargetCount = 0;

        [[nodiscard]] bool HasGeometry() const { return Vertices && Vertices->IsValid(); }
        [[nodiscard]] bool HasMorphData() const
        {
            return MorphBase && MorphBase->IsValid() && MorphDeltas && MorphDeltas->IsValid();
        }
    };

    // GPU buffers built once per model load, keyed by Avatar::MakeMorphKey.
    class ModelResidency
    {
    public:
        explicit ModelResidency(std::shared_ptr<RHI::VulkanDevice> device);

        ModelResidency(const ModelResidency&) = delete;
        ModelResidency& operator=(const ModelResidency&) = delete;

        // Uploads every primitive and the material table. Replaces any previous model.
        [[nodiscard]] Core::Result Upload(const Avatar::Model& model);
        void Clear();

        // nullptr when the primitive was never uploaded.
        [[nodiscard]] const PrimitiveResidency* Find(uint32_t meshIndex, uint32_t primitiveIndexInMesh) const;

        [[nodiscard]] const RHI::VulkanBuffer* GetMaterials() const { return m_Materials.get(); }
        // Index of the fallback material appended after the model's own materials.
        [[nodiscard]] uint32_t GetDefaultMaterialIndex() const { return m_DefaultMaterialIndex; }
        [[nodiscard]] size_t GetPrimitiveCount() const { return m_Primitives.size(); }

    private:
        std::shared_ptr<RHI::VulkanDevice> m_Device;
        std::unordered_map<uint64_t, PrimitiveResidency, Core::Hash::U64Hash> m_Primitives;
        std::unique_ptr<RHI::VulkanBuffer> m_Materials;
        uint32_t m_DefaultMaterialIndex = 0;
    };
}
