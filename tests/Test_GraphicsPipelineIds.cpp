#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

import Core;
import Avatar;
import Graphics;
import Runtime;

// -----------------------------------------------------------------------------
// Pipeline variant ids
// -----------------------------------------------------------------------------

TEST(GraphicsPipelineIds, EveryVariantHasDistinctId)
{
    std::set<uint32_t> ids;
    for (bool skinned : {false, true})
        for (bool blend : {false, true})
            for (bool wireframe : {false, true})
                ids.insert(Graphics::PipelineVariantId({skinned, blend, wireframe}).Value);

    // Wireframe collapses the blend axis
    EXPECT_EQ(ids.size(), 6u);
}

TEST(GraphicsPipelineIds, WireframeIgnoresBlend)
{
    EXPECT_EQ(Graphics::PipelineVariantId({true, true, true}), Graphics::kPipeline_Skinned_Wireframe);
    EXPECT_EQ(Graphics::PipelineVariantId({false, true, true}), Graphics::kPipeline_Rigid_Wireframe);
    EXPECT_EQ(Graphics::PipelineVariantId({false, true, false}), Graphics::kPipeline_Rigid_Blend);
    EXPECT_EQ(Graphics::PipelineVariantId({true, false, false}), Graphics::kPipeline_Skinned_Opaque);
}

TEST(GraphicsPipelineIds, SelectorOutputMapsToLibraryIds)
{
    Avatar::RenderItem highlight;
    highlight.Class.Category = Avatar::RenderCategory::Highlight;
    highlight.Class.EffectiveAlphaMode = Avatar::AlphaMode::Blend;

    const auto variant = Avatar::SelectPipelineVariant(highlight, true, {});
    EXPECT_EQ(Graphics::PipelineVariantId(variant), Graphics::kPipeline_Skinned_Blend);
}

// -----------------------------------------------------------------------------
// Shader registry
// -----------------------------------------------------------------------------

TEST(GraphicsShaderRegistry, DefaultsResolveAgainstDirectory)
{
    Graphics::ShaderRegistry registry;
    registry.RegisterDefaults("shaders");

    EXPECT_EQ(registry.Size(), 4u);
    EXPECT_EQ(registry.Get(Graphics::kShader_AvatarVertSkinned), "shaders/avatar_skinned.vert.spv");
    EXPECT_EQ(registry.Get(Graphics::kShader_MorphComp), "shaders/morph_accumulate.comp.spv");

    Graphics::ShaderRegistry trailing;
    trailing.RegisterDefaults("bin/");
    EXPECT_EQ(trailing.Get(Graphics::kShader_AvatarFrag), "bin/avatar.frag.spv");
}

TEST(GraphicsShaderRegistry, UnknownIdIsEmpty)
{
    Graphics::ShaderRegistry registry;
    EXPECT_FALSE(registry.Get(Graphics::kShader_AvatarVert).has_value());
    EXPECT_FALSE(registry.Contains(Graphics::kShader_AvatarVert));

    registry.Register(Graphics::kShader_AvatarVert, "custom.spv");
    EXPECT_EQ(registry.Get(Graphics::kShader_AvatarVert), "custom.spv");
}

// -----------------------------------------------------------------------------
// GPU layout
// -----------------------------------------------------------------------------

TEST(GraphicsGpuTypes, PushConstantsFitMinimumLimit)
{
    // 128 bytes is the guaranteed maxPushConstantsSize
    EXPECT_LE(sizeof(Graphics::DrawPushConstants), 128u);
    EXPECT_LE(sizeof(Graphics::MorphPushConstants), 128u);
    EXPECT_EQ(sizeof(Graphics::GpuVertex) % 16, 0u);
}

// -----------------------------------------------------------------------------
// Renderer configuration
// -----------------------------------------------------------------------------

TEST(RuntimeRendererConfig, PresetsEscalateStrictness)
{
    const auto production = Runtime::RendererConfig::Production();
    const auto development = Runtime::RendererConfig::Development();
    const auto debug = Runtime::RendererConfig::Debug();

    EXPECT_EQ(production.Strict, Avatar::StrictLevel::Off);
    EXPECT_FALSE(production.EnableValidation);
    EXPECT_EQ(development.Strict, Avatar::StrictLevel::Warn);
    EXPECT_TRUE(development.EnableValidation);
    EXPECT_EQ(debug.Strict, Avatar::StrictLevel::Fail);
    EXPECT_EQ(production.MaxFramesInFlight, Avatar::kDefaultFramesInFlight);
}

TEST(RuntimeRendererConfig, TogglesFlowIntoSubsystems)
{
    Runtime::RendererConfig config;
    config.Wireframe = true;
    config.DisableSkinning = true;
    config.DebugSingleMesh = true;
    config.Filter = Avatar::RenderFilter::ByMaterial("Eye_Iris");
    config.DrawOnlyIndex = 2u;

    const auto toggles = config.GetSelectorToggles();
    EXPECT_TRUE(toggles.Wireframe);
    EXPECT_FALSE(toggles.DisableCulling);
    EXPECT_TRUE(toggles.DisableSkinning);

    const auto selection = config.GetSelectionOptions();
    EXPECT_TRUE(selection.DebugSingleMesh);
    ASSERT_TRUE(selection.Filter.has_value());
    EXPECT_EQ(selection.Filter->Name, "Eye_Iris");

    const auto validator = config.GetValidatorConfig();
    EXPECT_EQ(validator.DrawOnlyIndex, 2u);
    EXPECT_FALSE(validator.DrawUntil.has_value());
}
