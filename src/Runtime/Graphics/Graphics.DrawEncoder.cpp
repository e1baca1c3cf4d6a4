module;

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

#include "Core.Profiling.Macros.hpp"

module Graphics:DrawEncoder.Impl;

import :DrawEncoder;
import :PipelineLibrary;
import :MorphBufferPool;
import :ModelResidency;
import :GpuTypes;

import Core;
import RHI;
import Avatar;

namespace Graphics
{
    namespace
    {
        VkCompareOp ToVk(Avatar::CompareOp op)
        {
            return op == Avatar::CompareOp::LessOrEqual ? VK_COMPARE_OP_LESS_OR_EQUAL : VK_COMPARE_OP_LESS;
        }

        VkCullModeFlags ToVk(Avatar::CullMode mode)
        {
            return mode == Avatar::CullMode::Back ? VK_CULL_MODE_BACK_BIT : VK_CULL_MODE_NONE;
        }

        VkPrimitiveTopology ToVk(Avatar::Topology mode)
        {
            return mode == Avatar::Topology::TriangleStrip ? VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP
                                                           : VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        }

        void ApplyDrawState(VkCommandBuffer cmd, const Avatar::DrawState& state, Avatar::Topology mode)
        {
            vkCmdSetPrimitiveTopology(cmd, ToVk(mode));
            vkCmdSetCullMode(cmd, ToVk(state.Cull));
            vkCmdSetFrontFace(cmd, VK_FRONT_FACE_COUNTER_CLOCKWISE);
            vkCmdSetDepthTestEnable(cmd, state.DepthTest ? VK_TRUE : VK_FALSE);
            vkCmdSetDepthWriteEnable(cmd, state.DepthWrite ? VK_TRUE : VK_FALSE);
            vkCmdSetDepthCompareOp(cmd, ToVk(state.DepthCompare));

            vkCmdSetDepthBiasEnable(cmd, state.Bias.Enabled ? VK_TRUE : VK_FALSE);
            if (state.Bias.Enabled)
            {
                // Selector bias is "toward the viewer"; with a less-is-closer depth buffer that is negative
                vkCmdSetDepthBias(cmd, -state.Bias.Constant, -state.Bias.Clamp, -state.Bias.Slope);
            }
        }

        // Dev builds treat corrupt asset data as a programming error.
        void ReportDataError([[maybe_unused]] const std::string& message)
        {
#ifndef NDEBUG
            Core::Log::Error("DrawEncoder: {}", message);
            assert(false && "avatar data inconsistency");
#endif
        }
    }

    DrawEncoder::DrawEncoder(PipelineLibrary& pipelines, const MorphBufferPool& morphBuffers)
        : m_Pipelines(pipelines), m_MorphBuffers(morphBuffers)
    {
    }

    bool DrawEncoder::AcceptTopology(Avatar::Topology mode)
    {
        switch (mode)
        {
        case Avatar::Topology::Triangles:
        case Avatar::Topology::TriangleStrip:
            return true;
        case Avatar::Topology::Points:
            if (!m_WarnedPoints)
            {
                Core::Log::Warn("DrawEncoder: point primitives are not rendered");
                m_WarnedPoints = true;
            }
            return false;
        case Avatar::Topology::Lines:
        case Avatar::Topology::LineStrip:
            if (!m_WarnedLines)
            {
                Core::Log::Warn("DrawEncoder: line primitives are not rendered");
                m_WarnedLines = true;
            }
            return false;
        }
        return false;
    }

    Core::Result DrawEncoder::Encode(const DrawContext& ctx, Avatar::StrictValidator& validator)
    {
        PROFILE_SCOPE("DrawEncoder::Encode");

        m_LastDrawCount = 0;
        m_LastSkippedCount = 0;

        const Avatar::Model& model = *ctx.Model;
        const auto& meshes = model.GetMeshes();
        const auto& skins = model.GetSkins();
        VkPipeline boundPipeline = VK_NULL_HANDLE;

        for (const uint32_t itemIndex : ctx.Order)
        {
            const Avatar::RenderItem& item = ctx.Items[itemIndex];
            const Avatar::Mesh& mesh = meshes[item.MeshIndex];
            const Avatar::Primitive& prim = mesh.Primitives[item.PrimitiveIndexInMesh];

            if (!AcceptTopology(prim.Mode))
            {
                ++m_LastSkippedCount;
                continue;
            }

            const bool skinned = Avatar::IsSkinned(model, item);
            const Avatar::PipelineVariant variant = Avatar::SelectPipelineVariant(item, skinned, ctx.Toggles);

            RHI::GraphicsPipeline* pipeline = m_Pipelines.GetOrCreate(variant);
            if (!pipeline)
            {
                ++m_LastSkippedCount;
                auto handled = validator.HandleOnce(Avatar::ToString(variant),
                                                    {Avatar::StrictViolation::Kind::PipelineUnavailable,
                                                     std::format("{} for mesh '{}' primitive {}",
                                                                 Avatar::ToString(variant), mesh.Name,
                                                                 item.PrimitiveIndexInMesh)});
                if (!handled) return handled;
                continue;
            }

            const std::optional<uint32_t> maxIndex = prim.MaxIndexValue();
            if (maxIndex && *maxIndex >= prim.VertexCount())
            {
                ReportDataError(std::format("mesh '{}' primitive {} indexes vertex {} of {}",
                                            mesh.Name, item.PrimitiveIndexInMesh, *maxIndex, prim.VertexCount()));
            }

            Avatar::DrawValidationInput validation;
            validation.MeshName = mesh.Name;
            validation.PrimitiveIndex = item.PrimitiveIndexInMesh;
            validation.VertexCount = prim.VertexCount();
            validation.IndexCount = prim.IndexCount();
            validation.Indexed = prim.IsIndexed();
            validation.Mode = prim.Mode;
            validation.MaxIndexValue = maxIndex;

            if (auto valid = validator.ValidateDraw(validation); !valid)
                return valid;
            // Reported above; at Off and Warn the item is still unsafe to draw
            if (prim.VertexCount() == 0 || (maxIndex && *maxIndex >= prim.VertexCount()))
            {
                ++m_LastSkippedCount;
                continue;
            }

            const PrimitiveResidency* resident = ctx.Residency->Find(item.MeshIndex, item.PrimitiveIndexInMesh);
            if (!resident || !resident->HasGeometry() || (prim.IsIndexed() && !resident->Indices))
            {
                ++m_LastSkippedCount;
                auto handled = validator.Handle({Avatar::StrictViolation::Kind::MissingGpuBuffers,
                                                 std::format("mesh '{}' primitive {}", mesh.Name,
                                                             item.PrimitiveIndexInMesh)});
                if (!handled) return handled;
                continue;
            }

            uint32_t jointOffset = 0;
            if (variant.Skinned)
            {
                if (Avatar::NodeSkinOutOfRange(model, item))
                {
                    const std::string detail = std::format("node '{}' references skin {} of {}; using skin 0",
                                                           model.NodeName(item.NodeIndex),
                                                           model.NodeSkin(item.NodeIndex).value_or(0u), skins.size());
                    ReportDataError(detail);
                    if (auto handled = validator.Handle({Avatar::StrictViolation::Kind::SkinIndexOutOfRange, detail});
                        !handled)
                    {
                        return handled;
                    }
                }

                const uint32_t skinIndex = Avatar::ResolveSkinIndex(model, item).value_or(0u);
                const Avatar::Skin& skin = skins[skinIndex];
                jointOffset = skin.MatrixOffset;

                const uint32_t available = ctx.JointPaletteSize > jointOffset
                                               ? std::min(skin.JointCount(), ctx.JointPaletteSize - jointOffset)
                                               : 0u;
                if (const std::optional<uint32_t> maxJoint = prim.MaxJointIndex())
                {
                    if (*maxJoint >= available)
                    {
                        ReportDataError(std::format("mesh '{}' primitive {} uses joint {} but {} are available",
                                                    mesh.Name, item.PrimitiveIndexInMesh, *maxJoint, available));
                        ++m_LastSkippedCount;
                        auto handled = validator.ValidateJointPalette(mesh.Name, item.PrimitiveIndexInMesh,
                                                                      *maxJoint, available);
                        if (!handled) return handled;
                        continue;
                    }
                }
            }

            if (!validator.WillDraw())
            {
                ++m_LastSkippedCount;
                continue;
            }

            if (pipeline->GetHandle() != boundPipeline)
            {
                vkCmdBindPipeline(ctx.Cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline->GetHandle());
                boundPipeline = pipeline->GetHandle();
            }

            ApplyDrawState(ctx.Cmd, Avatar::SelectDrawState(item, ctx.Toggles), prim.Mode);

            const Avatar::PositionBinding positions =
                Avatar::ResolvePositionBinding(*ctx.MorphTable, item.MeshIndex, item.PrimitiveIndexInMesh);
            const RHI::VulkanBuffer* morphed = positions.UsesMorphedPositions()
                                                   ? m_MorphBuffers.Resolve(positions.MorphedBuffer)
                                                   : nullptr;

            DrawPushConstants push{};
            // The joint palette already carries the world transform of skinned meshes
            push.Model = variant.Skinned ? glm::mat4(1.0f) : model.NodeWorldMatrix(item.NodeIndex);
            push.VertexAddress = resident->Vertices->GetDeviceAddress();
            push.MorphedVertexAddress = morphed ? morphed->GetDeviceAddress() : ctx.PlaceholderAddress;
            push.MorphFlag = morphed ? positions.MorphFlag : 0u;
            push.JointMatrixAddress = variant.Skinned ? ctx.JointPaletteAddress : ctx.PlaceholderAddress;
            push.JointOffset = jointOffset;
            push.FrameUniformAddress = ctx.FrameUniformAddress;
            push.AlphaMode = static_cast<uint32_t>(item.GetAlphaMode());
            push.AlphaCutoff = item.Class.EffectiveAlphaCutoff;
            push.MaterialIndex = item.MaterialIndex && *item.MaterialIndex < model.GetMaterials().size()
                                     ? *item.MaterialIndex
                                     : ctx.Residency->GetDefaultMaterialIndex();

            vkCmdPushConstants(ctx.Cmd, pipeline->GetLayout(), VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT,
                               0, sizeof(push), &push);

            if (prim.IsIndexed())
            {
                vkCmdBindIndexBuffer(ctx.Cmd, resident->Indices->GetHandle(), 0, VK_INDEX_TYPE_UINT32);
                vkCmdDrawIndexed(ctx.Cmd, prim.IndexCount(), 1, 0, 0, 0);
            }
            else
            {
                vkCmdDraw(ctx.Cmd, prim.VertexCount(), 1, 0, 0);
            }
            ++m_LastDrawCount;
        }

        return Core::Ok();
    }
}
