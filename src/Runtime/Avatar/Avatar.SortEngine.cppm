module;
#include <cstdint>
#include <span>
#include <vector>
#include <glm/glm.hpp>

export module Avatar:SortEngine;

import :Model;
import :RenderItem;

export namespace Avatar
{
    // Items in the transparent queue range and the generic blend bucket are
    // ordered back-to-front inside their bucket/queue group.
    [[nodiscard]] bool NeedsDepthSort(const RenderItem& item);

    // Camera-space distance along the view direction (larger is farther).
    [[nodiscard]] float ViewDepth(const glm::mat4& view, const glm::vec3& worldPosition);

    // World-space origin of each item's node, index-aligned with items.
    [[nodiscard]] std::vector<glm::vec3> GatherWorldPositions(const Model& model, std::span<const RenderItem> items);

    // Returns a permutation of [0, items.size()) ordered by
    // bucket, render queue, depth (depth-sorted items only, far first), stable index.
    // worldPositions must be index-aligned with items; missing entries count as the origin.
    [[nodiscard]] std::vector<uint32_t> SortRenderItems(std::span<const RenderItem> items,
                                                        std::span<const glm::vec3> worldPositions,
                                                        const glm::mat4& view);
}
