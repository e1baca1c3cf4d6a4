module;
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>

export module Avatar:Morph;

import :Model;
import Core;

export namespace Avatar
{
    namespace MorphConstants
    {
        // Weights at or below this are treated as inactive
        inline constexpr float kWeightEpsilon = 0.001f;
        // Targets the vertex stage could consume directly; more forces the compute path
        inline constexpr uint32_t kMaxDirectTargets = 8;
    }

    struct MorphBufferTag {};
    using MorphBufferHandle = Core::StrongHandle<MorphBufferTag>;

    // Stable lookup key shared by the compute pre-pass and the draw pass.
    [[nodiscard]] constexpr uint64_t MakeMorphKey(uint32_t meshIndex, uint32_t primitiveIndexInMesh)
    {
        return (static_cast<uint64_t>(meshIndex) << 32) | primitiveIndexInMesh;
    }

    // Morph data as the compute pre-pass consumes and produces it: two vec4 per
    // vertex, position (w = 1) then normal (w = 0). Deltas use the same pair
    // layout, target-major and vertex-minor. A target without normal deltas,
    // or with a short delta array, contributes zero for the missing entries.
    inline constexpr uint32_t kMorphVec4PerVertex = 2;

    [[nodiscard]] std::vector<glm::vec4> PackMorphBase(const Primitive& primitive);
    [[nodiscard]] std::vector<glm::vec4> PackMorphDeltas(const Primitive& primitive);

    struct MorphDispatchItem
    {
        uint64_t Key = 0;
        uint32_t MeshIndex = 0;
        uint32_t PrimitiveIndexInMesh = 0;
        uint32_t VertexCount = 0;
        uint32_t TargetCount = 0;
        std::vector<uint32_t> ActiveTargets; // Target indices with weight > epsilon
        std::vector<float> ActiveWeights;    // Parallel to ActiveTargets
    };

    struct MorphFramePlan
    {
        bool ComputeRequired = false;
        std::vector<MorphDispatchItem> Dispatches;
        uint32_t SkippedPrimitives = 0; // Morphed primitives with an empty active set
    };

    // True if any morphed primitive has a weight above epsilon or more targets
    // than the direct path supports.
    [[nodiscard]] bool IsMorphComputeRequired(const Model& model);

    // Builds the per-primitive active sets for this frame. Returns an empty plan
    // when compute is not required or morphs are disabled.
    [[nodiscard]] MorphFramePlan PlanMorphDispatch(const Model& model, bool morphsDisabled = false);

    // Per-frame publication of morph outputs. Valid for one command submission.
    class MorphBufferTable
    {
    public:
        void Publish(uint64_t key, MorphBufferHandle handle) { m_Entries[key] = handle; }
        void Clear() { m_Entries.clear(); }

        [[nodiscard]] std::optional<MorphBufferHandle> Find(uint64_t key) const
        {
            if (auto it = m_Entries.find(key); it != m_Entries.end())
                return it->second;
            return std::nullopt;
        }

        [[nodiscard]] bool Contains(uint64_t key) const { return m_Entries.contains(key); }
        [[nodiscard]] size_t Size() const { return m_Entries.size(); }
        [[nodiscard]] bool Empty() const { return m_Entries.empty(); }

    private:
        std::unordered_map<uint64_t, MorphBufferHandle, Core::Hash::U64Hash> m_Entries;
    };

    enum class PositionSource : uint8_t
    {
        Static,
        Morphed
    };

    struct PositionBinding
    {
        PositionSource Source = PositionSource::Static;
        MorphBufferHandle MorphedBuffer;
        uint32_t MorphFlag = 0; // 1 when the vertex stage reads morphed positions and normals

        [[nodiscard]] bool UsesMorphedPositions() const { return Source == PositionSource::Morphed; }
    };

    // Absent key -> static positions, flag 0. Present -> published buffer, flag 1.
    [[nodiscard]] PositionBinding ResolvePositionBinding(const MorphBufferTable& table,
                                                         uint32_t meshIndex, uint32_t primitiveIndexInMesh);
}
