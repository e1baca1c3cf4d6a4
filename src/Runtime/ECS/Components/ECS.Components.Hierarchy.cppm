module;
#include <cstdint>
#include <entt/entity/registry.hpp>

export module ECS:Components.Hierarchy;

export namespace ECS::Components::Hierarchy
{
    // Intrusive child list. Parent is a non-owning handle into the same registry.
    struct Component
    {
        entt::entity Parent = entt::null;
        entt::entity FirstChild = entt::null;
        entt::entity NextSibling = entt::null;
        uint32_t ChildCount = 0;
    };

    // Links an unparented child at the head of newParent's child list.
    // Nodes are parented once while the avatar is built; a child that already
    // has a parent is left untouched with a warning.
    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent);
}
