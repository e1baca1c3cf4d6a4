module;
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>

module Avatar:StateSelector.Impl;
import :StateSelector;
import :Types;
import :Model;
import :RenderItem;

namespace Avatar
{
    DepthBias OverlayBias::ForLayer(const DepthBias& base, int32_t renderQueue)
    {
        const int32_t steps = std::clamp(renderQueue - RenderQueue::kGeometry, 0, kMaxQueueSteps);
        DepthBias bias = base;
        bias.Constant += kQueueStep * static_cast<float>(steps);
        bias.Slope += kQueueStep * static_cast<float>(steps);
        return bias;
    }

    std::optional<uint32_t> ResolveSkinIndex(const Model& model, const RenderItem& item)
    {
        const auto& skins = model.GetSkins();
        if (skins.empty()) return std::nullopt;

        if (const std::optional<uint32_t> nodeSkin = model.NodeSkin(item.NodeIndex))
            return *nodeSkin < skins.size() ? nodeSkin : std::optional<uint32_t>(0u);

        const Primitive& primitive = model.GetMeshes()[item.MeshIndex].Primitives[item.PrimitiveIndexInMesh];
        if (primitive.CarriesSkinning())
            return 0u;

        return std::nullopt;
    }

    bool NodeSkinOutOfRange(const Model& model, const RenderItem& item)
    {
        const std::optional<uint32_t> nodeSkin = model.NodeSkin(item.NodeIndex);
        return nodeSkin && *nodeSkin >= model.GetSkins().size();
    }

    bool IsSkinned(const Model& model, const RenderItem& item)
    {
        return ResolveSkinIndex(model, item).has_value();
    }

    PipelineVariant SelectPipelineVariant(const RenderItem& item, bool skinned, const SelectorToggles& toggles)
    {
        PipelineVariant variant;
        variant.Skinned = skinned && !toggles.DisableSkinning;
        variant.Wireframe = toggles.Wireframe;
        variant.Blend = !variant.Wireframe && item.GetAlphaMode() == AlphaMode::Blend;
        return variant;
    }

    DrawState SelectDrawState(const RenderItem& item, const SelectorToggles& toggles)
    {
        DrawState state;
        const bool blend = item.GetAlphaMode() == AlphaMode::Blend;

        if (!item.GetCategory())
        {
            state.DepthCompare = CompareOp::Less;
            state.DepthWrite = !blend;
            state.Cull = item.Class.EffectiveDoubleSided ? CullMode::None : CullMode::Back;
        }
        else
        {
            state.DepthCompare = CompareOp::LessOrEqual;
            state.DepthWrite = true;

            switch (*item.GetCategory())
            {
            case RenderCategory::Body:
                state.Cull = CullMode::Back;
                state.Bias = OverlayBias::kBody;
                break;
            case RenderCategory::Clothing:
                state.Cull = CullMode::Back;
                state.Bias = OverlayBias::ForLayer(OverlayBias::kClothing, item.GetRenderQueue());
                break;
            case RenderCategory::Skin:
                state.Cull = CullMode::Back;
                state.Bias = OverlayBias::ForLayer(OverlayBias::kSkin, item.GetRenderQueue());
                break;
            case RenderCategory::FaceOverlay:
            case RenderCategory::Eyebrow:
            case RenderCategory::Eyeline:
                state.Cull = CullMode::None;
                state.Bias = OverlayBias::kFaceDetail;
                break;
            case RenderCategory::Eye:
                state.Cull = CullMode::None;
                state.Bias = OverlayBias::kEye;
                break;
            case RenderCategory::Highlight:
                state.Cull = CullMode::None;
                state.DepthWrite = false;
                state.Bias = OverlayBias::kHighlight;
                break;
            case RenderCategory::TransparentZWrite:
                state.Cull = CullMode::None;
                break;
            }
        }

        if (toggles.DisableCulling)
            state.Cull = CullMode::None;

        return state;
    }

    std::string_view ToString(const PipelineVariant& variant)
    {
        if (variant.Wireframe)
            return variant.Skinned ? "Skinned.Wireframe" : "Rigid.Wireframe";
        if (variant.Blend)
            return variant.Skinned ? "Skinned.Blend" : "Rigid.Blend";
        return variant.Skinned ? "Skinned.Opaque" : "Rigid.Opaque";
    }
}
