module;
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <entt/entity/registry.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

export module Avatar:Model;

import :Types;
import ECS;

export namespace Avatar
{
    struct Material
    {
        std::string Name;
        AlphaMode Mode = AlphaMode::Opaque;
        float AlphaCutoff = 0.5f;
        bool DoubleSided = false;
        int32_t RenderQueue = RenderQueue::kGeometry;
        glm::vec4 BaseColorFactor{1.0f};
    };

    struct Vertex
    {
        glm::vec3 Position{0.0f};
        glm::vec3 Normal{0.0f, 1.0f, 0.0f};
        glm::vec2 TexCoord{0.0f};
        glm::vec4 Color{1.0f};
        glm::uvec4 Joints{0u};
        glm::vec4 Weights{0.0f};
    };

    struct AttributeFlags
    {
        bool HasNormals = false;
        bool HasTexCoords = false;
        bool HasColors = false;
        bool HasJoints = false;
        bool HasWeights = false;
    };

    struct MorphTarget
    {
        std::string Name;
        std::vector<glm::vec3> PositionDeltas; // One per vertex
        std::vector<glm::vec3> NormalDeltas;   // Empty when the target has no normal deltas
    };

    struct Primitive
    {
        std::vector<Vertex> Vertices;
        std::vector<uint32_t> Indices; // Empty for non-indexed primitives
        Topology Mode = Topology::Triangles;
        std::optional<uint32_t> MaterialIndex;
        AttributeFlags Attributes;
        std::vector<MorphTarget> MorphTargets;

        [[nodiscard]] uint32_t VertexCount() const { return static_cast<uint32_t>(Vertices.size()); }
        [[nodiscard]] uint32_t IndexCount() const { return static_cast<uint32_t>(Indices.size()); }
        [[nodiscard]] bool IsIndexed() const { return !Indices.empty(); }
        [[nodiscard]] uint32_t MorphTargetCount() const { return static_cast<uint32_t>(MorphTargets.size()); }
        [[nodiscard]] bool CarriesSkinning() const { return Attributes.HasJoints && Attributes.HasWeights; }

        // Largest joint index referenced with non-zero weight, nullopt when unskinned.
        [[nodiscard]] std::optional<uint32_t> MaxJointIndex() const;
        // Largest vertex index referenced by Indices, nullopt when not indexed.
        [[nodiscard]] std::optional<uint32_t> MaxIndexValue() const;
    };

    struct Mesh
    {
        std::string Name;
        std::vector<Primitive> Primitives;
        // Current morph weights, written by the expression system under the model lock.
        std::vector<float> MorphWeights;

        // Weights beyond the vector count as zero
        [[nodiscard]] float MorphWeight(uint32_t target) const
        {
            return target < MorphWeights.size() ? MorphWeights[target] : 0.0f;
        }
    };

    struct Skin
    {
        std::string Name;
        std::vector<uint32_t> JointNodes; // Node indices
        std::vector<glm::mat4> InverseBindMatrices;

        // Placement inside the shared joint-matrix buffer, assigned by Model::PackJointPalette
        uint32_t MatrixOffset = 0;
        uint64_t ByteOffset = 0;

        [[nodiscard]] uint32_t JointCount() const { return static_cast<uint32_t>(JointNodes.size()); }
    };

    namespace Components
    {
        struct MeshRef
        {
            uint32_t MeshIndex = 0;
        };

        struct SkinRef
        {
            uint32_t SkinIndex = 0;
        };
    }

    // One loaded avatar: node graph (entities in an ECS::Scene), meshes,
    // materials and skins. Node indices follow creation order and are stable
    // for the lifetime of the model.
    class Model
    {
    public:
        explicit Model(std::string name = {});
        ~Model() = default;

        Model(const Model&) = delete;
        Model& operator=(const Model&) = delete;

        // ---------------------------------------------------------------------
        // Node graph
        // ---------------------------------------------------------------------
        uint32_t AddNode(const std::string& name, std::optional<uint32_t> parentIndex = std::nullopt);

        void SetLocalTransform(uint32_t node, const glm::vec3& position,
                               const glm::quat& rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f),
                               const glm::vec3& scale = glm::vec3(1.0f));
        void SetLocalMatrix(uint32_t node, const glm::mat4& matrix);
        void SetNodeMesh(uint32_t node, uint32_t meshIndex);
        void SetNodeSkin(uint32_t node, uint32_t skinIndex);

        [[nodiscard]] size_t NodeCount() const { return m_Nodes.size(); }
        [[nodiscard]] entt::entity NodeEntity(uint32_t node) const { return m_Nodes.at(node); }
        [[nodiscard]] std::string_view NodeName(uint32_t node) const;
        [[nodiscard]] std::optional<uint32_t> NodeMesh(uint32_t node) const;
        [[nodiscard]] std::optional<uint32_t> NodeSkin(uint32_t node) const;
        [[nodiscard]] glm::mat4 NodeWorldMatrix(uint32_t node) const;

        // Full top-down recompute of every node's world matrix.
        void UpdateWorldTransforms();

        // ---------------------------------------------------------------------
        // Resources
        // ---------------------------------------------------------------------
        uint32_t AddMesh(Mesh mesh);
        uint32_t AddMaterial(Material material);
        uint32_t AddSkin(Skin skin);

        [[nodiscard]] std::vector<Mesh>& GetMeshes() { return m_Meshes; }
        [[nodiscard]] const std::vector<Mesh>& GetMeshes() const { return m_Meshes; }
        [[nodiscard]] const std::vector<Material>& GetMaterials() const { return m_Materials; }
        [[nodiscard]] const std::vector<Skin>& GetSkins() const { return m_Skins; }

        // nullptr for a missing or out-of-range material index
        [[nodiscard]] const Material* FindMaterial(std::optional<uint32_t> index) const;

        // Lays all skins out contiguously in one joint-matrix buffer and returns
        // the total matrix count. Skin i starts after the joints of skins 0..i-1.
        uint32_t PackJointPalette();
        [[nodiscard]] uint32_t GetJointPaletteSize() const { return m_JointPaletteSize; }

        // ---------------------------------------------------------------------
        // Concurrency
        // ---------------------------------------------------------------------
        // Guards nodes, transforms and morph weights. Mutators on other threads
        // (animation, expressions) must hold it; the renderer holds it while encoding.
        [[nodiscard]] std::mutex& GetMutex() const { return m_Mutex; }

        [[nodiscard]] const std::string& GetName() const { return m_Name; }
        [[nodiscard]] ECS::Scene& GetScene() { return m_Scene; }
        [[nodiscard]] const ECS::Scene& GetScene() const { return m_Scene; }

    private:
        std::string m_Name;
        ECS::Scene m_Scene;
        std::vector<entt::entity> m_Nodes;
        std::vector<Mesh> m_Meshes;
        std::vector<Material> m_Materials;
        std::vector<Skin> m_Skins;
        uint32_t m_JointPaletteSize = 0;

        mutable std::mutex m_Mutex;
    };
}
