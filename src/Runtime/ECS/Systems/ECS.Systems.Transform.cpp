module;
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module ECS:Systems.Transform.Impl;
import :Systems.Transform;
import :Components.Transform;
import :Components.Hierarchy;

namespace ECS::Systems::Transform::Detail
{
    glm::mat4 LocalMatrixOf(const entt::registry& reg, entt::entity entity,
                            const Components::Transform::Component& local)
    {
        if (const auto* raw = reg.try_get<Components::Transform::LocalMatrix>(entity))
            return raw->Matrix;
        return GetMatrix(local);
    }

    void UpdateHierarchy(entt::registry& reg, entt::entity entity,
                         const glm::mat4& parentMatrix, bool parentDirty)
    {
        auto* local = reg.try_get<Components::Transform::Component>(entity);
        auto* world = reg.try_get<Components::Transform::WorldMatrix>(entity);
        if (!local || !world) return;

        // A moved parent moves us in world space even if our local did not change
        const bool isDirty = parentDirty || reg.all_of<Components::Transform::IsDirtyTag>(entity);

        if (isDirty)
        {
            world->Matrix = parentMatrix * LocalMatrixOf(reg, entity, *local);
            reg.remove<Components::Transform::IsDirtyTag>(entity);
        }

        const glm::mat4 worldMatrix = world->Matrix;
        const auto* hierarchy = reg.try_get<Components::Hierarchy::Component>(entity);
        if (!hierarchy) return;

        entt::entity child = hierarchy->FirstChild;
        while (child != entt::null)
        {
            // Fetch the sibling before recursing; emplace in the child may move storage
            const entt::entity next = reg.get<Components::Hierarchy::Component>(child).NextSibling;
            UpdateHierarchy(reg, child, worldMatrix, isDirty);
            child = next;
        }
    }
}

namespace ECS::Systems::Transform
{
    void OnUpdate(entt::registry& registry, UpdateMode mode)
    {
        const bool forceAll = mode == UpdateMode::Full;

        auto view = registry.view<Components::Transform::Component, Components::Hierarchy::Component>();
        for (auto [entity, transform, hierarchy] : view.each())
        {
            if (hierarchy.Parent == entt::null)
                Detail::UpdateHierarchy(registry, entity, glm::mat4(1.0f), forceAll);
        }
    }
}
