module;
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

export module Avatar:RenderSelection;

import :Model;
import :RenderItem;

export namespace Avatar
{
    // Restricts drawing to matching items. Names compare exactly; unnamed
    // meshes match "unnamed".
    struct RenderFilter
    {
        enum class Kind : uint8_t
        {
            Mesh,
            Material,
            Node,
            Primitive
        };

        Kind Type = Kind::Mesh;
        std::string Name;   // Mesh and Material
        uint32_t Index = 0; // Node index, or primitive index within its mesh

        static RenderFilter ByMesh(std::string name) { return {Kind::Mesh, std::move(name), 0}; }
        static RenderFilter ByMaterial(std::string name) { return {Kind::Material, std::move(name), 0}; }
        static RenderFilter ByNode(uint32_t node) { return {Kind::Node, {}, node}; }
        static RenderFilter ByPrimitive(uint32_t primitive) { return {Kind::Primitive, {}, primitive}; }
    };

    struct SelectionOptions
    {
        bool DebugSingleMesh = false; // Keep only the first item of the sorted order
        std::optional<RenderFilter> Filter;
    };

    [[nodiscard]] bool MatchesFilter(const Model& model, const RenderItem& item, const RenderFilter& filter);

    // Trims a sorted order (indices into items), preserving relative order.
    [[nodiscard]] std::vector<uint32_t> ApplyRenderSelection(const Model& model,
                                                             std::span<const RenderItem> items,
                                                             std::span<const uint32_t> sortedOrder,
                                                             const SelectionOptions& options);
}
