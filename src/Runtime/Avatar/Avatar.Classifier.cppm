module;
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

export module Avatar:Classifier;

import :Types;
import :Model;
import :RenderItem;

export namespace Avatar
{
    namespace ClassifierDefaults
    {
        inline constexpr std::string_view kUnnamedMaterial = "unnamed";
        inline constexpr float kAlphaCutoff = 0.5f;
        // Skin never cuts out below this threshold
        inline constexpr float kMinSkinAlphaCutoff = 0.5f;
    }

    struct ClassificationInput
    {
        std::string_view MaterialName;
        std::string_view NodeName;
        std::string_view MeshName;
        AlphaMode DeclaredAlphaMode = AlphaMode::Opaque;
        float DeclaredAlphaCutoff = ClassifierDefaults::kAlphaCutoff;
        bool DeclaredDoubleSided = false;
        int32_t RenderQueue = RenderQueue::kGeometry;
    };

    // Pure naming heuristic. Names are compared case-insensitively; the
    // material name is consulted first, then the node name, then the mesh name.
    [[nodiscard]] Classification ClassifyPrimitive(const ClassificationInput& input);

    // One item per (node with mesh, primitive) in node, then primitive order.
    // Nodes referencing a mesh index out of range are skipped.
    [[nodiscard]] std::vector<RenderItem> BuildRenderItems(const Model& model);

    // Debug-level table of category and declared/effective alpha per item.
    void LogClassification(const Model& model, std::span<const RenderItem> items);
}
