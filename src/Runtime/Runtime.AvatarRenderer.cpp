module;
#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

#include "Core.Profiling.Macros.hpp"

module Runtime:AvatarRenderer.Impl;
import :AvatarRenderer;
import :RendererConfig;
import :GraphicsBackend;

import Core;
import RHI;
import Avatar;
import Graphics;

namespace Runtime
{
    AvatarRenderer::AvatarRenderer(const RendererConfig& config)
        : m_Config(config), m_Validator(config.GetValidatorConfig())
    {
    }

    Core::Expected<std::unique_ptr<AvatarRenderer>> AvatarRenderer::Create(const RendererConfig& config)
    {
        std::unique_ptr<AvatarRenderer> renderer(new AvatarRenderer(config));
        renderer->m_Synchronizer = std::make_unique<Avatar::FrameSynchronizer>(config.MaxFramesInFlight);
        const uint32_t frames = renderer->m_Synchronizer->GetMaxFramesInFlight();

        auto backend = GraphicsBackend::Create({config.AppName, config.EnableValidation, frames});
        if (!backend)
            return std::unexpected(backend.error());
        renderer->m_Backend = std::move(*backend);

        const auto device = renderer->m_Backend->GetDevice();

        renderer->m_ShaderRegistry.RegisterDefaults(config.ShaderDirectory);
        renderer->m_Pipelines = std::make_unique<Graphics::PipelineLibrary>(device, renderer->m_ShaderRegistry,
                                                                            Graphics::PipelineLibrary::Config{});
        renderer->m_Residency = std::make_unique<Graphics::ModelResidency>(device);
        renderer->m_MorphBuffers = std::make_unique<Graphics::MorphBufferPool>(device, frames);
        renderer->m_FrameResources = std::make_unique<Graphics::FrameResourceRing>(device, frames);
        renderer->m_MorphDispatcher = std::make_unique<Graphics::MorphComputeDispatcher>(
            *renderer->m_Pipelines, *renderer->m_MorphBuffers, *renderer->m_FrameResources);
        renderer->m_Encoder = std::make_unique<Graphics::DrawEncoder>(*renderer->m_Pipelines, *renderer->m_MorphBuffers);

        renderer->m_Pipelines->BuildDefaults();

        Core::Log::Info("AvatarRenderer: ready ({} frames in flight, strict level {})",
                        frames, static_cast<int>(config.Strict));
        return renderer;
    }

    AvatarRenderer::~AvatarRenderer()
    {
        WaitIdle();

        // GPU services hold device references; release them before the backend
        m_Encoder.reset();
        m_MorphDispatcher.reset();
        m_FrameResources.reset();
        m_MorphBuffers.reset();
        m_Residency.reset();
        m_Pipelines.reset();
        m_Backend.reset();
    }

    void AvatarRenderer::WaitIdle()
    {
        if (m_Backend) m_Backend->WaitIdle();
    }

    void AvatarRenderer::SetConfig(const RendererConfig& config)
    {
        const uint32_t frames = m_Config.MaxFramesInFlight;
        const std::string shaderDirectory = m_Config.ShaderDirectory;

        m_Config = config;
        m_Config.MaxFramesInFlight = frames;
        m_Config.ShaderDirectory = shaderDirectory;
        m_Validator = Avatar::StrictValidator(m_Config.GetValidatorConfig());
    }

    Core::Result AvatarRenderer::LoadModel(std::shared_ptr<Avatar::Model> model)
    {
        if (!model)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        PROFILE_SCOPE("AvatarRenderer::LoadModel");

        // In-flight frames still read the previous model's buffers
        WaitIdle();

        {
            auto lock = Avatar::FrameSynchronizer::LockScene(*model);
            model->PackJointPalette();

            if (auto uploaded = m_Residency->Upload(*model); !uploaded)
                return uploaded;
        }

        m_MorphBuffers->Clear(m_LastStats.FrameNumber);
        m_Synchronizer->InvalidateRenderItems();
        m_Model = std::move(model);

        Core::Log::Info("AvatarRenderer: loaded '{}' ({} meshes, {} materials, {} skins)",
                        m_Model->GetName(), m_Model->GetMeshes().size(),
                        m_Model->GetMaterials().size(), m_Model->GetSkins().size());
        return Core::Ok();
    }

    Core::Result AvatarRenderer::DrawFrame(const RenderTarget& target, const FrameInputs& inputs)
    {
        PROFILE_SCOPE("AvatarRenderer::DrawFrame");

        if (!m_Model)
        {
            Core::Log::Warn("AvatarRenderer: DrawFrame without a loaded model");
            return Core::Err(Core::ErrorCode::AssetNotLoaded);
        }
        if (target.ColorImage == VK_NULL_HANDLE || target.ColorView == VK_NULL_HANDLE || target.Extent.width == 0 || target.Extent.height == 0)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        // Blocks while every slot is in flight
        const Avatar::FrameTicket ticket = m_Synchronizer->Acquire();
        m_Backend->GetDevice()->FlushDeletionQueue(ticket.SlotIndex);

        VkCommandBuffer cmd = m_Backend->GetFrames().Begin(ticket.SlotIndex);
        if (cmd == VK_NULL_HANDLE)
        {
            if (auto cancelled = m_Synchronizer->Cancel(ticket); !cancelled)
                return cancelled;
            return Core::Err(Core::ErrorCode::SubmissionFailed);
        }

        Core::Result encoded;
        {
            auto lock = Avatar::FrameSynchronizer::LockScene(*m_Model);
            encoded = EncodeFrame(cmd, ticket, target, inputs);
        }

        // Whatever was recorded is submitted so the slot follows the normal release path
        if (auto submitted = Submit(ticket); !submitted)
            return submitted;

        return encoded;
    }

    Core::Result AvatarRenderer::EncodeFrame(VkCommandBuffer cmd, const Avatar::FrameTicket& ticket,
                                             const RenderTarget& target, const FrameInputs& inputs)
    {
        Avatar::Model& model = *m_Model;
        m_LastStats = FrameStats{};
        m_LastStats.FrameNumber = ticket.FrameNumber;

        {
            PROFILE_SCOPE("UpdateWorldTransforms");
            model.UpdateWorldTransforms();
        }

        m_Validator.BeginFrame();

        const bool hasDepth = target.DepthView != VK_NULL_HANDLE;
        m_Pipelines->SetTargetFormats(target.ColorFormat, hasDepth ? target.DepthFormat : VK_FORMAT_UNDEFINED);

        // Morph pre-pass, recorded ahead of the render pass
        const Avatar::MorphFramePlan plan = Avatar::PlanMorphDispatch(model, m_Config.DisableMorphs);
        auto morphTable = m_MorphDispatcher->Execute(cmd, plan, *m_Residency, ticket.SlotIndex, ticket.FrameNumber);
        if (!morphTable)
            return std::unexpected(morphTable.error());
        m_LastStats.MorphDispatches = m_MorphDispatcher->GetLastDispatchCount();

        // Per-frame uniforms and joint palette
        Graphics::FrameUniforms uniforms;
        uniforms.View = inputs.View;
        uniforms.Projection = inputs.Projection;
        uniforms.ViewProjection = inputs.Projection * inputs.View;
        uniforms.LightCount = static_cast<uint32_t>(std::min<size_t>(inputs.LightDirections.size(), Graphics::kMaxFrameLights));
        for (uint32_t i = 0; i < uniforms.LightCount; ++i)
            uniforms.LightDirections[i] = inputs.LightDirections[i];
        uniforms.MaterialsAddress = m_Residency->GetMaterials() ? m_Residency->GetMaterials()->GetDeviceAddress() : 0;

        auto uniformAddress = m_FrameResources->WriteUniforms(ticket.SlotIndex, uniforms);
        if (!uniformAddress)
            return std::unexpected(uniformAddress.error());

        auto paletteAddress = m_FrameResources->WriteJointPalette(ticket.SlotIndex, inputs.JointMatrices);
        if (!paletteAddress)
            return std::unexpected(paletteAddress.error());

        // Classification is cached per model; ordering is redone every frame
        const std::vector<Avatar::RenderItem>& items = m_Synchronizer->GetRenderItems(model);
        std::vector<uint32_t> order;
        {
            PROFILE_SCOPE("SortRenderItems");
            const std::vector<glm::vec3> positions = Avatar::GatherWorldPositions(model, items);
            order = Avatar::SortRenderItems(items, positions, inputs.View);
        }
        const std::vector<uint32_t> selected =
            Avatar::ApplyRenderSelection(model, items, order, m_Config.GetSelectionOptions());

        m_LastStats.ItemCount = static_cast<uint32_t>(items.size());
        m_LastStats.SelectedCount = static_cast<uint32_t>(selected.size());

        // Render pass
        RHI::CommandUtils::TransitionImageLayout(cmd, target.ColorImage, VK_IMAGE_ASPECT_COLOR_BIT,
                                                 target.ColorInitialLayout, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
        if (hasDepth)
        {
            RHI::CommandUtils::TransitionImageLayout(cmd, target.DepthImage, VK_IMAGE_ASPECT_DEPTH_BIT,
                                                     VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL);
        }

        VkRenderingAttachmentInfo colorAttachment{};
        colorAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
        colorAttachment.imageView = target.ColorView;
        colorAttachment.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
        colorAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        colorAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
        colorAttachment.clearValue.color = {{target.ClearColor.r, target.ClearColor.g, target.ClearColor.b, target.ClearColor.a}};

        VkRenderingAttachmentInfo depthAttachment{};
        depthAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
        depthAttachment.imageView = target.DepthView;
        depthAttachment.imageLayout = VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL;
        depthAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        depthAttachment.storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        depthAttachment.clearValue.depthStencil = {1.0f, 0};

        VkRenderingInfo renderingInfo{};
        renderingInfo.sType = VK_STRUCTURE_TYPE_RENDERING_INFO;
        renderingInfo.renderArea = {{0, 0}, target.Extent};
        renderingInfo.layerCount = 1;
        renderingInfo.colorAttachmentCount = 1;
        renderingInfo.pColorAttachments = &colorAttachment;
        renderingInfo.pDepthAttachment = hasDepth ? &depthAttachment : nullptr;

        vkCmdBeginRendering(cmd, &renderingInfo);

        VkViewport viewport{};
        viewport.width = static_cast<float>(target.Extent.width);
        viewport.height = static_cast<float>(target.Extent.height);
        viewport.minDepth = 0.0f;
        viewport.maxDepth = 1.0f;
        vkCmdSetViewport(cmd, 0, 1, &viewport);

        VkRect2D scissor{{0, 0}, target.Extent};
        vkCmdSetScissor(cmd, 0, 1, &scissor);

        Graphics::DrawContext ctx;
        ctx.Cmd = cmd;
        ctx.Model = &model;
        ctx.Items = items;
        ctx.Order = selected;
        ctx.MorphTable = &*morphTable;
        ctx.Residency = m_Residency.get();
        ctx.FrameUniformAddress = *uniformAddress;
        ctx.JointPaletteAddress = *paletteAddress;
        ctx.JointPaletteSize = static_cast<uint32_t>(inputs.JointMatrices.size());
        ctx.PlaceholderAddress = m_FrameResources->GetPlaceholderAddress();
        ctx.Toggles = m_Config.GetSelectorToggles();

        // A strict failure stops the draw loop; the pass is still closed below
        const Core::Result encoded = m_Encoder->Encode(ctx, m_Validator);

        vkCmdEndRendering(cmd);

        RHI::CommandUtils::TransitionImageLayout(cmd, target.ColorImage, VK_IMAGE_ASPECT_COLOR_BIT,
                                                 VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL, target.ColorFinalLayout);

        m_LastStats.DrawCalls = m_Encoder->GetLastDrawCount();
        m_LastStats.SkippedItems = m_Encoder->GetLastSkippedCount();

        if (!encoded)
            return encoded;

        return m_Validator.EndFrame();
    }

    Core::Result AvatarRenderer::Submit(const Avatar::FrameTicket& ticket)
    {
        RHI::FrameContextRing& frames = m_Backend->GetFrames();

        const VkResult res = frames.Submit(ticket.SlotIndex);
        if (res != VK_SUCCESS)
        {
            Core::Log::Error("AvatarRenderer: submission of frame {} failed ({})", ticket.FrameNumber, static_cast<int>(res));
            if (auto cancelled = m_Synchronizer->Cancel(ticket); !cancelled)
                return cancelled;
            return Core::Err(Core::ErrorCode::SubmissionFailed);
        }

        m_Backend->GetSubmissions().Track(frames.GetFence(ticket.SlotIndex),
                                          [synchronizer = m_Synchronizer.get(), ticket]()
        {
            if (auto released = synchronizer->Release(ticket); !released)
            {
                Core::Log::Error("AvatarRenderer: frame {} completed but its slot was not in flight",
                                 ticket.FrameNumber);
            }
        });
        return Core::Ok();
    }
}
