module;
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <entt/entity/registry.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

module Avatar:Model.Impl;
import :Model;
import ECS;
import Core;

namespace Avatar
{
    std::optional<uint32_t> Primitive::MaxJointIndex() const
    {
        if (!CarriesSkinning() || Vertices.empty()) return std::nullopt;

        uint32_t maxJoint = 0;
        for (const Vertex& v : Vertices)
        {
            for (int i = 0; i < 4; ++i)
            {
                if (v.Weights[i] > 0.0f)
                    maxJoint = std::max(maxJoint, v.Joints[i]);
            }
        }
        return maxJoint;
    }

    std::optional<uint32_t> Primitive::MaxIndexValue() const
    {
        if (Indices.empty()) return std::nullopt;
        return *std::ranges::max_element(Indices);
    }

    Model::Model(std::string name) : m_Name(std::move(name))
    {
    }

    uint32_t Model::AddNode(const std::string& name, std::optional<uint32_t> parentIndex)
    {
        const entt::entity entity = m_Scene.CreateEntity(name);
        const auto index = static_cast<uint32_t>(m_Nodes.size());
        m_Nodes.push_back(entity);

        if (parentIndex)
        {
            if (*parentIndex < index)
                ECS::Components::Hierarchy::Attach(m_Scene.GetRegistry(), entity, m_Nodes[*parentIndex]);
            else
                Core::Log::Warn("Model '{}': node '{}' references parent {} which does not exist yet",
                                m_Name, name, *parentIndex);
        }
        return index;
    }

    void Model::SetLocalTransform(uint32_t node, const glm::vec3& position,
                                  const glm::quat& rotation, const glm::vec3& scale)
    {
        auto& reg = m_Scene.GetRegistry();
        const entt::entity e = m_Nodes.at(node);
        auto& t = reg.get<ECS::Components::Transform::Component>(e);
        t.Position = position;
        t.Rotation = rotation;
        t.Scale = scale;
        reg.remove<ECS::Components::Transform::LocalMatrix>(e);
        reg.emplace_or_replace<ECS::Components::Transform::IsDirtyTag>(e);
    }

    void Model::SetLocalMatrix(uint32_t node, const glm::mat4& matrix)
    {
        auto& reg = m_Scene.GetRegistry();
        const entt::entity e = m_Nodes.at(node);
        reg.emplace_or_replace<ECS::Components::Transform::LocalMatrix>(e, matrix);
        reg.emplace_or_replace<ECS::Components::Transform::IsDirtyTag>(e);
    }

    void Model::SetNodeMesh(uint32_t node, uint32_t meshIndex)
    {
        m_Scene.GetRegistry().emplace_or_replace<Components::MeshRef>(m_Nodes.at(node), meshIndex);
    }

    void Model::SetNodeSkin(uint32_t node, uint32_t skinIndex)
    {
        m_Scene.GetRegistry().emplace_or_replace<Components::SkinRef>(m_Nodes.at(node), skinIndex);
    }

    std::string_view Model::NodeName(uint32_t node) const
    {
        const auto* tag = m_Scene.GetRegistry().try_get<ECS::Components::NameTag::Component>(m_Nodes.at(node));
        return tag ? std::string_view(tag->Name) : std::string_view{};
    }

    std::optional<uint32_t> Model::NodeMesh(uint32_t node) const
    {
        if (const auto* ref = m_Scene.GetRegistry().try_get<Components::MeshRef>(m_Nodes.at(node)))
            return ref->MeshIndex;
        return std::nullopt;
    }

    std::optional<uint32_t> Model::NodeSkin(uint32_t node) const
    {
        if (const auto* ref = m_Scene.GetRegistry().try_get<Components::SkinRef>(m_Nodes.at(node)))
            return ref->SkinIndex;
        return std::nullopt;
    }

    glm::mat4 Model::NodeWorldMatrix(uint32_t node) const
    {
        const auto* world = m_Scene.GetRegistry().try_get<ECS::Components::Transform::WorldMatrix>(m_Nodes.at(node));
        return world ? world->Matrix : glm::mat4(1.0f);
    }

    void Model::UpdateWorldTransforms()
    {
        ECS::Systems::Transform::OnUpdate(m_Scene.GetRegistry(), ECS::Systems::Transform::UpdateMode::Full);
    }

    uint32_t Model::AddMesh(Mesh mesh)
    {
        m_Meshes.push_back(std::move(mesh));
        return static_cast<uint32_t>(m_Meshes.size() - 1);
    }

    uint32_t Model::AddMaterial(Material material)
    {
        m_Materials.push_back(std::move(material));
        return static_cast<uint32_t>(m_Materials.size() - 1);
    }

    uint32_t Model::AddSkin(Skin skin)
    {
        m_Skins.push_back(std::move(skin));
        return static_cast<uint32_t>(m_Skins.size() - 1);
    }

    const Material* Model::FindMaterial(std::optional<uint32_t> index) const
    {
        if (!index || *index >= m_Materials.size()) return nullptr;
        return &m_Materials[*index];
    }

    uint32_t Model::PackJointPalette()
    {
        uint32_t offset = 0;
        for (Skin& skin : m_Skins)
        {
            skin.MatrixOffset = offset;
            skin.ByteOffset = static_cast<uint64_t>(offset) * sizeof(glm::mat4);
            offset += skin.JointCount();
        }
        m_JointPaletteSize = offset;
        return offset;
    }
}
