module;
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <span>
#include <vector>
#include <glm/glm.hpp>

module Avatar:SortEngine.Impl;
import :SortEngine;
import :Types;
import :Model;
import :RenderItem;

namespace Avatar
{
    bool NeedsDepthSort(const RenderItem& item)
    {
        return item.GetRenderQueue() >= RenderQueue::kTransparent || item.GetBucket() == Bucket::kBlend;
    }

    float ViewDepth(const glm::mat4& view, const glm::vec3& worldPosition)
    {
        return -(view * glm::vec4(worldPosition, 1.0f)).z;
    }

    std::vector<glm::vec3> GatherWorldPositions(const Model& model, std::span<const RenderItem> items)
    {
        std::vector<glm::vec3> positions;
        positions.reserve(items.size());
        for (const RenderItem& item : items)
            positions.emplace_back(model.NodeWorldMatrix(item.NodeIndex)[3]);
        return positions;
    }

    std::vector<uint32_t> SortRenderItems(std::span<const RenderItem> items,
                                          std::span<const glm::vec3> worldPositions,
                                          const glm::mat4& view)
    {
        // Depth once per item, not per comparison
        std::vector<float> depth(items.size(), 0.0f);
        for (size_t i = 0; i < items.size(); ++i)
        {
            if (NeedsDepthSort(items[i]))
                depth[i] = ViewDepth(view, i < worldPositions.size() ? worldPositions[i] : glm::vec3(0.0f));
        }

        std::vector<uint32_t> order(items.size());
        std::iota(order.begin(), order.end(), 0u);

        std::ranges::sort(order, [&](uint32_t a, uint32_t b)
        {
            const RenderItem& lhs = items[a];
            const RenderItem& rhs = items[b];

            if (lhs.GetBucket() != rhs.GetBucket())
                return lhs.GetBucket() < rhs.GetBucket();

            if (lhs.GetRenderQueue() != rhs.GetRenderQueue())
                return lhs.GetRenderQueue() < rhs.GetRenderQueue();

            // Same bucket and queue means both or neither need a depth sort
            if (NeedsDepthSort(lhs) && depth[a] != depth[b])
                return depth[a] > depth[b];

            return lhs.StableIndex < rhs.StableIndex;
        });

        return order;
    }
}
