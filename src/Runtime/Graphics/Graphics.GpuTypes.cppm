module;

#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>

export module Graphics:GpuTypes;

// Host mirrors of the std430 structures declared in assets/shaders/avatar_common.glsl.
// Keep the two in sync; the static_asserts pin sizes and field offsets.
export namespace Graphics
{
    inline constexpr uint32_t kMaxFrameLights = 4;
    inline constexpr uint32_t kMorphWorkgroupSize = 64;

    struct GpuVertex
    {
        glm::vec4 PositionU{0.0f}; // xyz position, w texcoord.u
        glm::vec4 NormalV{0.0f};   // xyz normal, w texcoord.v
        glm::vec4 Color{1.0f};
        glm::uvec4 Joints{0u};
        glm::vec4 Weights{0.0f};
    };
    static_assert(sizeof(GpuVertex) == 80);

    struct GpuMaterial
    {
        glm::vec4 BaseColor{1.0f};
        float AlphaCutoff = 0.5f;
        uint32_t AlphaMode = 0;
        uint32_t DoubleSided = 0;
        uint32_t Pad0 = 0;
    };
    static_assert(sizeof(GpuMaterial) == 32);

    struct FrameUniforms
    {
        glm::mat4 View{1.0f};
        glm::mat4 Projection{1.0f};
        glm::mat4 ViewProjection{1.0f};
        glm::vec4 LightDirections[kMaxFrameLights]{}; // xyz direction toward the light, w intensity
        uint32_t LightCount = 0;
        uint32_t Pad0 = 0;
        uint64_t MaterialsAddress = 0;
    };
    static_assert(sizeof(FrameUniforms) == 272);
    static_assert(offsetof(FrameUniforms, MaterialsAddress) == 264);

    struct DrawPushConstants
    {
        glm::mat4 Model{1.0f};
        uint64_t VertexAddress = 0;
        uint64_t MorphedVertexAddress = 0; // Position/normal pairs from the morph pre-pass
        uint64_t JointMatrixAddress = 0;
        uint64_t FrameUniformAddress = 0;
        uint32_t JointOffset = 0;
        uint32_t MorphFlag = 0;
        uint32_t AlphaMode = 0;
        uint32_t MaterialIndex = 0;
        float AlphaCutoff = 0.5f;
        uint32_t Pad0 = 0;
        uint32_t Pad1 = 0;
        uint32_t Pad2 = 0;
    };
    static_assert(sizeof(DrawPushConstants) == 128);
    static_assert(offsetof(DrawPushConstants, VertexAddress) == 64);
    static_assert(offsetof(DrawPushConstants, JointOffset) == 96);

    struct MorphPushConstants
    {
        uint64_t BaseAddress = 0;         // Position/normal vec4 pair per vertex
        uint64_t DeltaAddress = 0;        // Same pairs, target-major, vertex-minor
        uint64_t ActiveTargetAddress = 0; // uint per active target
        uint64_t ActiveWeightAddress = 0; // float per active target
        uint64_t OutputAddress = 0;
        uint32_t VertexCount = 0;
        uint32_t ActiveCount = 0;
        uint32_t TargetCount = 0;
        uint32_t Pad0 = 0;
    };
    static_assert(sizeof(MorphPushConstants) == 56);
}
