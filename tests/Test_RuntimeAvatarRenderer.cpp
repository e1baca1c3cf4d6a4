#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <type_traits>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

import Core;
import RHI;
import Avatar;
import Graphics;
import Runtime;

#include "AvatarTestBuilders.h"

// ---------------------------------------------------------------------------
// Compile-time API contract tests
// ---------------------------------------------------------------------------

TEST(AvatarRenderer, NotCopyable)
{
    static_assert(!std::is_copy_constructible_v<Runtime::AvatarRenderer>);
    static_assert(!std::is_copy_assignable_v<Runtime::AvatarRenderer>);
    static_assert(!std::is_move_constructible_v<Runtime::GraphicsBackend>);
    SUCCEED();
}

// ---------------------------------------------------------------------------
// Headless integration tests (real Vulkan, no window surface)
//
// Machines without a Vulkan 1.3 device skip these.
// ---------------------------------------------------------------------------

class AvatarRendererHeadlessTest : public ::testing::Test
{
protected:
    static constexpr VkExtent2D kExtent{64, 64};

    void TearDown() override
    {
        if (!m_Renderer) return;

        m_Renderer->WaitIdle();
        const auto device = m_Renderer->GetBackend().GetDevice();
        if (m_ColorView) vkDestroyImageView(device->GetLogicalDevice(), m_ColorView, nullptr);
        if (m_ColorImage) vmaDestroyImage(device->GetAllocator(), m_ColorImage, m_ColorAllocation);
        m_Renderer.reset();
    }

    [[nodiscard]] bool CreateRenderer(const Runtime::RendererConfig& config)
    {
        auto renderer = Runtime::AvatarRenderer::Create(config);
        if (!renderer) return false;
        m_Renderer = std::move(*renderer);
        return CreateColorTarget();
    }

    [[nodiscard]] Runtime::RenderTarget GetTarget() const
    {
        Runtime::RenderTarget target;
        target.ColorImage = m_ColorImage;
        target.ColorView = m_ColorView;
        target.ColorFormat = VK_FORMAT_R8G8B8A8_UNORM;
        target.ColorFinalLayout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
        target.Extent = kExtent;
        return target;
    }

    std::unique_ptr<Runtime::AvatarRenderer> m_Renderer;

private:
    bool CreateColorTarget()
    {
        const auto device = m_Renderer->GetBackend().GetDevice();

        VkImageCreateInfo imageInfo{};
        imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        imageInfo.imageType = VK_IMAGE_TYPE_2D;
        imageInfo.format = VK_FORMAT_R8G8B8A8_UNORM;
        imageInfo.extent = {kExtent.width, kExtent.height, 1};
        imageInfo.mipLevels = 1;
        imageInfo.arrayLayers = 1;
        imageInfo.samples = VK_SAMPLE_COUNT_1_BIT;
        imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
        imageInfo.usage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
        imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VMA_MEMORY_USAGE_GPU_ONLY;

        if (vmaCreateImage(device->GetAllocator(), &imageInfo, &allocInfo, &m_ColorImage, &m_ColorAllocation,
                           nullptr) != VK_SUCCESS)
            return false;

        VkImageViewCreateInfo viewInfo{};
        viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewInfo.image = m_ColorImage;
        viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format = VK_FORMAT_R8G8B8A8_UNORM;
        viewInfo.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

        return vkCreateImageView(device->GetLogicalDevice(), &viewInfo, nullptr, &m_ColorView) == VK_SUCCESS;
    }

    VkImage m_ColorImage = VK_NULL_HANDLE;
    VmaAllocation m_ColorAllocation = VK_NULL_HANDLE;
    VkImageView m_ColorView = VK_NULL_HANDLE;
};

TEST_F(AvatarRendererHeadlessTest, MissingShadersSkipEveryItemAndLogOncePerVariant)
{
    Runtime::RendererConfig config;
    config.ShaderDirectory = "marionette-missing-shader-dir";
    config.Strict = Avatar::StrictLevel::Warn;
    if (!CreateRenderer(config))
        GTEST_SKIP() << "No headless Vulkan 1.3 device";

    EXPECT_GT(m_Renderer->GetPipelineLibrary().GetUnavailableCount(), 0u);
    ASSERT_TRUE(m_Renderer->LoadModel(MakeStandardAvatar()).has_value());

    const Runtime::FrameInputs inputs;
    ASSERT_TRUE(m_Renderer->DrawFrame(GetTarget(), inputs).has_value());

    const Runtime::FrameStats& first = m_Renderer->GetLastFrameStats();
    EXPECT_GT(first.ItemCount, 0u);
    EXPECT_EQ(first.DrawCalls, 0u);
    EXPECT_EQ(first.SkippedItems, first.ItemCount);

    // Second frame still records every skipped item, but the warning is not repeated
    Core::Log::ScopedCapture capture;
    ASSERT_TRUE(m_Renderer->DrawFrame(GetTarget(), inputs).has_value());

    const Runtime::FrameStats& second = m_Renderer->GetLastFrameStats();
    EXPECT_EQ(second.SkippedItems, second.ItemCount);

    const auto& violations = m_Renderer->GetLastFrameViolations();
    const auto unavailable = std::count_if(violations.begin(), violations.end(), [](const Avatar::StrictViolation& v)
    {
        return v.Type == Avatar::StrictViolation::Kind::PipelineUnavailable;
    });
    EXPECT_EQ(static_cast<uint32_t>(unavailable), second.ItemCount);
    EXPECT_FALSE(capture.Contains("PipelineUnavailable"));
    EXPECT_TRUE(capture.Contains("NoDrawCalls"));
}

TEST_F(AvatarRendererHeadlessTest, OneActiveMorphWeightDispatchesOnce)
{
    if (!CreateRenderer(Runtime::RendererConfig{}))
        GTEST_SKIP() << "No headless Vulkan 1.3 device";
    if (!m_Renderer->GetPipelineLibrary().GetMorphPipeline())
        GTEST_SKIP() << "Morph compute shader not built";

    auto model = std::make_shared<Avatar::Model>("Morph");
    Avatar::Mesh mesh;
    mesh.Name = "Face";
    mesh.Primitives.push_back(MakeTrianglePrimitive(model->AddMaterial(MakeMaterial("Face_00_SKIN"))));
    AddMorphTargets(mesh.Primitives[0], 3);
    mesh.MorphWeights = {0.0f, 0.5f, 0.0f};
    model->SetNodeMesh(model->AddNode("Face"), model->AddMesh(std::move(mesh)));

    ASSERT_TRUE(m_Renderer->LoadModel(model).has_value());
    ASSERT_TRUE(m_Renderer->DrawFrame(GetTarget(), Runtime::FrameInputs{}).has_value());
    EXPECT_EQ(m_Renderer->GetLastFrameStats().MorphDispatches, 1u);

    // All weights idle: no compute work at all
    model->GetMeshes()[0].MorphWeights = {0.0f, 0.0f, 0.0f};
    ASSERT_TRUE(m_Renderer->DrawFrame(GetTarget(), Runtime::FrameInputs{}).has_value());
    EXPECT_EQ(m_Renderer->GetLastFrameStats().MorphDispatches, 0u);
}

TEST_F(AvatarRendererHeadlessTest, FrameRingDestroysSlotThatWasNeverSubmitted)
{
    if (!CreateRenderer(Runtime::RendererConfig{}))
        GTEST_SKIP() << "No headless Vulkan 1.3 device";

    {
        RHI::FrameContextRing ring(m_Renderer->GetBackend().GetDevice(), 2);
        ASSERT_TRUE(ring.IsValid());
        EXPECT_TRUE(ring.IsSubmitted(0));

        VkCommandBuffer cmd = ring.Begin(0);
        ASSERT_NE(cmd, VK_NULL_HANDLE);
        EXPECT_FALSE(ring.IsSubmitted(0));
        EXPECT_TRUE(ring.IsSubmitted(1));

        // Leaving scope must not wait on the reset, unsignalled fence of slot 0
    }
    SUCCEED();
}
