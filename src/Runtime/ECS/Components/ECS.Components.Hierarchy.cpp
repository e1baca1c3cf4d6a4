module;

#include <cstdint>
#include <entt/entity/registry.hpp>

module ECS:Components.Hierarchy.Impl;
import :Components.Hierarchy;
import :Components.Transform;
import Core;

namespace ECS::Components::Hierarchy
{
    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent)
    {
        if (!registry.valid(child) || !registry.valid(newParent) || child == newParent) return;

        // get_or_emplace may relocate storage; take the parent reference last
        registry.get_or_emplace<Component>(newParent);
        auto& childComp = registry.get_or_emplace<Component>(child);

        if (childComp.Parent != entt::null)
        {
            if (childComp.Parent != newParent)
                Core::Log::Warn("Hierarchy::Attach -- entity {} already has parent {}",
                                static_cast<uint32_t>(child), static_cast<uint32_t>(childComp.Parent));
            return;
        }

        auto& parentComp = registry.get<Component>(newParent);
        childComp.Parent = newParent;
        childComp.NextSibling = parentComp.FirstChild;
        parentComp.FirstChild = child;
        parentComp.ChildCount++;

        if (registry.all_of<Transform::Component>(child))
            registry.emplace_or_replace<Transform::IsDirtyTag>(child);
    }
}
