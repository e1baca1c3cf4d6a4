module;
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

module Avatar:RenderSelection.Impl;
import :RenderSelection;
import :Model;
import :RenderItem;

namespace Avatar
{
    bool MatchesFilter(const Model& model, const RenderItem& item, const RenderFilter& filter)
    {
        switch (filter.Type)
        {
        case RenderFilter::Kind::Mesh:
        {
            const std::string_view meshName = model.GetMeshes()[item.MeshIndex].Name;
            return (meshName.empty() ? std::string_view{"unnamed"} : meshName) == filter.Name;
        }
        case RenderFilter::Kind::Material:
            return item.MaterialName == filter.Name;
        case RenderFilter::Kind::Node:
            return item.NodeIndex == filter.Index;
        case RenderFilter::Kind::Primitive:
            return item.PrimitiveIndexInMesh == filter.Index;
        }
        return true;
    }

    std::vector<uint32_t> ApplyRenderSelection(const Model& model,
                                               std::span<const RenderItem> items,
                                               std::span<const uint32_t> sortedOrder,
                                               const SelectionOptions& options)
    {
        std::vector<uint32_t> selected;
        selected.reserve(sortedOrder.size());

        for (const uint32_t index : sortedOrder)
        {
            if (index >= items.size()) continue;
            if (options.Filter && !MatchesFilter(model, items[index], *options.Filter)) continue;

            selected.push_back(index);
            if (options.DebugSingleMesh) break;
        }

        return selected;
    }
}
