#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>

import Avatar;

#include "AvatarTestBuilders.h"

using Avatar::CompareOp;
using Avatar::CullMode;
using Avatar::RenderCategory;

namespace
{
    Avatar::RenderItem Categorized(std::optional<RenderCategory> category,
                                   Avatar::AlphaMode mode = Avatar::AlphaMode::Opaque,
                                   bool doubleSided = false)
    {
        Avatar::RenderItem item;
        item.Class.Category = category;
        item.Class.EffectiveAlphaMode = mode;
        item.Class.EffectiveDoubleSided = doubleSided;
        return item;
    }
}

// -----------------------------------------------------------------------------
// Draw state table
// -----------------------------------------------------------------------------

TEST(AvatarStateSelector, BodySitsBehindOverlays)
{
    const auto s = Avatar::SelectDrawState(Categorized(RenderCategory::Body), {});
    EXPECT_EQ(s.DepthCompare, CompareOp::LessOrEqual);
    EXPECT_TRUE(s.DepthWrite);
    EXPECT_EQ(s.Cull, CullMode::Back);
    EXPECT_EQ(s.Bias, Avatar::OverlayBias::kBody);
    EXPECT_LT(s.Bias.Constant, 0.0f);
}

TEST(AvatarStateSelector, CategoryTable)
{
    struct Row
    {
        RenderCategory Category;
        bool DepthWrite;
        CullMode Cull;
        Avatar::DepthBias Bias;
    };

    const Row rows[] = {
        {RenderCategory::Clothing, true, CullMode::Back, Avatar::OverlayBias::kClothing},
        {RenderCategory::Skin, true, CullMode::Back, Avatar::OverlayBias::kSkin},
        {RenderCategory::FaceOverlay, true, CullMode::None, Avatar::OverlayBias::kFaceDetail},
        {RenderCategory::Eyebrow, true, CullMode::None, Avatar::OverlayBias::kFaceDetail},
        {RenderCategory::Eyeline, true, CullMode::None, Avatar::OverlayBias::kFaceDetail},
        {RenderCategory::Eye, true, CullMode::None, Avatar::OverlayBias::kEye},
        {RenderCategory::Highlight, false, CullMode::None, Avatar::OverlayBias::kHighlight},
        {RenderCategory::TransparentZWrite, true, CullMode::None, Avatar::DepthBias{}},
    };

    for (const Row& row : rows)
    {
        const auto s = Avatar::SelectDrawState(Categorized(row.Category), {});
        EXPECT_EQ(s.DepthCompare, CompareOp::LessOrEqual) << Avatar::ToString(row.Category);
        EXPECT_EQ(s.DepthWrite, row.DepthWrite) << Avatar::ToString(row.Category);
        EXPECT_EQ(s.Cull, row.Cull) << Avatar::ToString(row.Category);
        EXPECT_EQ(s.Bias, row.Bias) << Avatar::ToString(row.Category);
    }
}

TEST(AvatarStateSelector, OverlayBiasIncreasesTowardTheViewer)
{
    EXPECT_LT(Avatar::OverlayBias::kSkin.Constant, Avatar::OverlayBias::kClothing.Constant);
    EXPECT_LT(Avatar::OverlayBias::kClothing.Constant, Avatar::OverlayBias::kFaceDetail.Constant);
    EXPECT_LT(Avatar::OverlayBias::kFaceDetail.Constant, Avatar::OverlayBias::kEye.Constant);
    EXPECT_LT(Avatar::OverlayBias::kEye.Constant, Avatar::OverlayBias::kHighlight.Constant);
}

TEST(AvatarStateSelector, LayerBiasGrowsWithRenderQueueOffset)
{
    Avatar::RenderItem skirt = Categorized(RenderCategory::Clothing);
    const float base = Avatar::SelectDrawState(skirt, {}).Bias.Constant;

    skirt.Class.RenderQueue = Avatar::RenderQueue::kGeometry + 2;
    const float layered = Avatar::SelectDrawState(skirt, {}).Bias.Constant;
    EXPECT_FLOAT_EQ(layered, base + 2.0f * Avatar::OverlayBias::kQueueStep);

    // Far above the base queue the layer still stays under face details
    skirt.Class.RenderQueue = Avatar::RenderQueue::kTransparent;
    EXPECT_LT(Avatar::SelectDrawState(skirt, {}).Bias.Constant, Avatar::OverlayBias::kFaceDetail.Constant);

    // Below the base queue nothing is subtracted
    Avatar::RenderItem skin = Categorized(RenderCategory::Skin);
    skin.Class.RenderQueue = 1000;
    EXPECT_EQ(Avatar::SelectDrawState(skin, {}).Bias, Avatar::OverlayBias::kSkin);
}

TEST(AvatarStateSelector, UncategorizedFollowsAlphaAndSidedness)
{
    const auto opaque = Avatar::SelectDrawState(Categorized(std::nullopt), {});
    EXPECT_EQ(opaque.DepthCompare, CompareOp::Less);
    EXPECT_TRUE(opaque.DepthWrite);
    EXPECT_EQ(opaque.Cull, CullMode::Back);
    EXPECT_FALSE(opaque.Bias.Enabled);

    const auto blend = Avatar::SelectDrawState(Categorized(std::nullopt, Avatar::AlphaMode::Blend, true), {});
    EXPECT_FALSE(blend.DepthWrite);
    EXPECT_EQ(blend.Cull, CullMode::None);

    const auto mask = Avatar::SelectDrawState(Categorized(std::nullopt, Avatar::AlphaMode::Mask), {});
    EXPECT_TRUE(mask.DepthWrite);
}

TEST(AvatarStateSelector, DisableCullingOverridesEveryItem)
{
    Avatar::SelectorToggles toggles;
    toggles.DisableCulling = true;

    EXPECT_EQ(Avatar::SelectDrawState(Categorized(RenderCategory::Body), toggles).Cull, CullMode::None);
    EXPECT_EQ(Avatar::SelectDrawState(Categorized(std::nullopt), toggles).Cull, CullMode::None);
}

// -----------------------------------------------------------------------------
// Pipeline variant
// -----------------------------------------------------------------------------

TEST(AvatarStateSelector, VariantMapping)
{
    const auto opaque = Categorized(std::nullopt, Avatar::AlphaMode::Opaque);
    const auto mask = Categorized(std::nullopt, Avatar::AlphaMode::Mask);
    const auto blend = Categorized(std::nullopt, Avatar::AlphaMode::Blend);

    EXPECT_EQ(Avatar::SelectPipelineVariant(opaque, false, {}), (Avatar::PipelineVariant{false, false, false}));
    EXPECT_EQ(Avatar::SelectPipelineVariant(mask, false, {}), (Avatar::PipelineVariant{false, false, false}));
    EXPECT_EQ(Avatar::SelectPipelineVariant(blend, true, {}), (Avatar::PipelineVariant{true, true, false}));
    EXPECT_EQ(Avatar::ToString(Avatar::SelectPipelineVariant(blend, true, {})), "Skinned.Blend");
}

TEST(AvatarStateSelector, WireframeOverridesBlend)
{
    Avatar::SelectorToggles toggles;
    toggles.Wireframe = true;

    const auto v = Avatar::SelectPipelineVariant(Categorized(std::nullopt, Avatar::AlphaMode::Blend), false, toggles);
    EXPECT_TRUE(v.Wireframe);
    EXPECT_FALSE(v.Blend);
    EXPECT_EQ(Avatar::ToString(v), "Rigid.Wireframe");
}

TEST(AvatarStateSelector, DisableSkinningForcesRigid)
{
    Avatar::SelectorToggles toggles;
    toggles.DisableSkinning = true;
    EXPECT_FALSE(Avatar::SelectPipelineVariant(Categorized(std::nullopt), true, toggles).Skinned);
}

// -----------------------------------------------------------------------------
// Skin resolution
// -----------------------------------------------------------------------------

TEST(AvatarStateSelector, SkinnedRequiresAtLeastOneSkin)
{
    Avatar::Model model;
    Avatar::Mesh mesh;
    mesh.Primitives.push_back(MakeTrianglePrimitive(std::nullopt, true));
    model.SetNodeMesh(model.AddNode("Body"), model.AddMesh(std::move(mesh)));

    const auto items = Avatar::BuildRenderItems(model);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_FALSE(Avatar::IsSkinned(model, items[0]));

    Avatar::Skin skin;
    skin.JointNodes = {0};
    model.AddSkin(skin);
    EXPECT_TRUE(Avatar::IsSkinned(model, items[0]));
    EXPECT_EQ(Avatar::ResolveSkinIndex(model, items[0]), 0u);
}

TEST(AvatarStateSelector, NodeSkinWinsOverFallback)
{
    Avatar::Model model;
    Avatar::Mesh mesh;
    mesh.Primitives.push_back(MakeTrianglePrimitive());
    const uint32_t node = model.AddNode("Hair");
    model.SetNodeMesh(node, model.AddMesh(std::move(mesh)));
    model.AddSkin({});
    model.AddSkin({});

    const auto items = Avatar::BuildRenderItems(model);
    EXPECT_FALSE(Avatar::IsSkinned(model, items[0])); // No joints, no node skin

    model.SetNodeSkin(node, 1);
    EXPECT_EQ(Avatar::ResolveSkinIndex(model, items[0]), 1u);

    EXPECT_FALSE(Avatar::NodeSkinOutOfRange(model, items[0]));

    model.SetNodeSkin(node, 9); // Out of range falls back to skin 0
    EXPECT_EQ(Avatar::ResolveSkinIndex(model, items[0]), 0u);
    EXPECT_TRUE(Avatar::NodeSkinOutOfRange(model, items[0]));
}
