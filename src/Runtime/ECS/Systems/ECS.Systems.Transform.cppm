module;
#include <entt/fwd.hpp>

export module ECS:Systems.Transform;

export namespace ECS::Systems::Transform
{
    enum class UpdateMode
    {
        DirtyOnly, // Recompute entities tagged IsDirtyTag and their subtrees
        Full       // Recompute every node from every root
    };

    // Walks each hierarchy top-down: world = parent.world * local (local for roots).
    void OnUpdate(entt::registry& registry, UpdateMode mode = UpdateMode::DirtyOnly);
}
