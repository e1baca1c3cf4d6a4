module;
#include <cstdint>
#include <optional>
#include <string_view>

export module Avatar:StateSelector;

import :Types;
import :Model;
import :RenderItem;

export namespace Avatar
{
    enum class CompareOp : uint8_t
    {
        Less,
        LessOrEqual
    };

    enum class CullMode : uint8_t
    {
        None,
        Back
    };

    // Positive values pull the surface toward the viewer. The encoder maps
    // this onto the graphics API's depth convention.
    struct DepthBias
    {
        bool Enabled = false;
        float Constant = 0.0f;
        float Slope = 0.0f;
        float Clamp = 0.0f;

        bool operator==(const DepthBias&) const = default;
    };

    struct DrawState
    {
        bool DepthTest = true;
        bool DepthWrite = true;
        CompareOp DepthCompare = CompareOp::Less;
        CullMode Cull = CullMode::Back;
        DepthBias Bias;

        bool operator==(const DrawState&) const = default;
    };

    struct PipelineVariant
    {
        bool Skinned = false;
        bool Blend = false;     // Opaque and mask share the non-blend pipeline
        bool Wireframe = false; // Overrides Blend

        bool operator==(const PipelineVariant&) const = default;
    };

    // Global debug toggles that influence selection
    struct SelectorToggles
    {
        bool Wireframe = false;
        bool DisableCulling = false;
        bool DisableSkinning = false;
    };

    namespace OverlayBias
    {
        inline constexpr DepthBias kBody{true, -1.0f, -1.0f, 0.0f};
        inline constexpr DepthBias kSkin{true, 1.0f, 1.0f, 0.01f};
        inline constexpr DepthBias kClothing{true, 1.5f, 1.5f, 0.01f};
        inline constexpr DepthBias kFaceDetail{true, 2.0f, 1.5f, 0.01f};
        inline constexpr DepthBias kEye{true, 3.0f, 2.0f, 0.01f};
        inline constexpr DepthBias kHighlight{true, 4.0f, 2.5f, 0.01f};

        // Skin and clothing step up by the material's render queue offset above
        // RenderQueue::kGeometry, capped so a layer never reaches kFaceDetail.
        inline constexpr float kQueueStep = 0.1f;
        inline constexpr int32_t kMaxQueueSteps = 4;

        [[nodiscard]] DepthBias ForLayer(const DepthBias& base, int32_t renderQueue);
    }

    // Node skin, or skin 0 for primitives that carry joints and weights.
    // nullopt when the model has no skins.
    // A node skin index beyond the model's skins also resolves to skin 0;
    // callers report that inconsistency through NodeSkinOutOfRange.
    [[nodiscard]] std::optional<uint32_t> ResolveSkinIndex(const Model& model, const RenderItem& item);

    [[nodiscard]] bool NodeSkinOutOfRange(const Model& model, const RenderItem& item);

    [[nodiscard]] bool IsSkinned(const Model& model, const RenderItem& item);

    [[nodiscard]] PipelineVariant SelectPipelineVariant(const RenderItem& item, bool skinned,
                                                        const SelectorToggles& toggles);

    [[nodiscard]] DrawState SelectDrawState(const RenderItem& item, const SelectorToggles& toggles);

    [[nodiscard]] std::string_view ToString(const PipelineVariant& variant);
}
