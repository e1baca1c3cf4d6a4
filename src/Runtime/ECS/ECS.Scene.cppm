module;
#include <string>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

export namespace ECS
{
    // Owns the registry holding one avatar's node entities.
    class Scene
    {
    public:
        Scene() = default;
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        // Creates a root node with NameTag, Transform, WorldMatrix and Hierarchy.
        entt::entity CreateEntity(const std::string& name);

        [[nodiscard]] entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

    private:
        entt::registry m_Registry;
    };
}
