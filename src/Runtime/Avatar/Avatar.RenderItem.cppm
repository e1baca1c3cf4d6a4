module;
#include <cstdint>
#include <optional>
#include <string>

export module Avatar:RenderItem;

import :Types;

export namespace Avatar
{
    // Result of classifying one primitive. Pure data, see ClassifyPrimitive.
    struct Classification
    {
        std::optional<RenderCategory> Category;
        uint32_t Bucket = Bucket::kOpaque;
        AlphaMode EffectiveAlphaMode = AlphaMode::Opaque;
        float EffectiveAlphaCutoff = 0.5f;
        bool EffectiveDoubleSided = false;
        bool IsFaceRelated = false;
        bool IsBodyLike = false;
        int32_t RenderQueue = RenderQueue::kGeometry;
    };

    // One drawable (node, mesh, primitive) triple. Built once per model load
    // and never mutated afterwards.
    struct RenderItem
    {
        uint32_t NodeIndex = 0;
        uint32_t MeshIndex = 0;
        uint32_t PrimitiveIndexInMesh = 0; // Morph buffer key component
        uint32_t StableIndex = 0;          // Position in enumeration order, final sort tie-break

        std::optional<uint32_t> MaterialIndex;
        std::string MaterialName;

        AlphaMode DeclaredAlphaMode = AlphaMode::Opaque;
        float DeclaredAlphaCutoff = 0.5f;
        bool DeclaredDoubleSided = false;

        Classification Class;

        [[nodiscard]] uint32_t GetBucket() const { return Class.Bucket; }
        [[nodiscard]] int32_t GetRenderQueue() const { return Class.RenderQueue; }
        [[nodiscard]] AlphaMode GetAlphaMode() const { return Class.EffectiveAlphaMode; }
        [[nodiscard]] const std::optional<RenderCategory>& GetCategory() const { return Class.Category; }
    };
}
