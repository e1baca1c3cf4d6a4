module;

#include <array>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "RHI.Vulkan.hpp"

module Graphics:PipelineLibrary.Impl;

import :PipelineLibrary;
import :ShaderRegistry;
import :GpuTypes;

import Core;
import RHI;
import Avatar;

using namespace Core::Hash;

namespace Graphics
{
    PipelineLibrary::PipelineLibrary(std::shared_ptr<RHI::VulkanDevice> device,
                                     const ShaderRegistry& shaderRegistry,
                                     const Config& config)
        : m_Device(std::move(device)),
          m_ShaderRegistry(shaderRegistry),
          m_Config(config)
    {
    }

    PipelineLibrary::~PipelineLibrary()
    {
        std::lock_guard lock(m_Mutex);
        m_Pipelines.clear();
        m_MorphPipeline.reset();
    }

    void PipelineLibrary::BuildDefaults()
    {
        for (bool skinned : {false, true})
        {
            for (bool wireframe : {false, true})
            {
                for (bool blend : {false, true})
                {
                    // Wireframe ignores the alpha choice; one pipeline per skinning kind
                    if (wireframe && blend) continue;
                    (void)GetOrCreate(Avatar::PipelineVariant{skinned, blend, wireframe});
                }
            }
        }
        (void)GetMorphPipeline();

        Core::Log::Info("PipelineLibrary: {} pipelines ready, {} unavailable",
                        GetPipelineCount(), GetUnavailableCount());
    }

    RHI::GraphicsPipeline* PipelineLibrary::GetOrCreate(const Avatar::PipelineVariant& variant)
    {
        std::lock_guard lock(m_Mutex);
        return GetOrCreateLocked(variant);
    }

    RHI::GraphicsPipeline* PipelineLibrary::GetOrCreateLocked(const Avatar::PipelineVariant& variant)
    {
        const StringID id = PipelineVariantId(variant);

        if (auto it = m_Pipelines.find(id); it != m_Pipelines.end())
            return it->second.get();

        if (m_Unavailable.contains(id))
            return nullptr;

        auto pipeline = BuildVariant(variant);
        if (!pipeline)
        {
            Core::Log::Error("PipelineLibrary: variant {} unavailable", Avatar::ToString(variant));
            m_Unavailable.insert(id);
            return nullptr;
        }

        RHI::GraphicsPipeline* raw = pipeline.get();
        m_Pipelines.emplace(id, std::move(pipeline));
        return raw;
    }

    RHI::GraphicsPipeline* PipelineLibrary::TryGet(StringID id) const
    {
        std::lock_guard lock(m_Mutex);
        if (auto it = m_Pipelines.find(id); it != m_Pipelines.end())
            return it->second.get();
        return nullptr;
    }

    bool PipelineLibrary::Contains(StringID id) const
    {
        std::lock_guard lock(m_Mutex);
        return m_Pipelines.contains(id);
    }

    bool PipelineLibrary::IsUnavailable(StringID id) const
    {
        std::lock_guard lock(m_Mutex);
        return m_Unavailable.contains(id);
    }

    size_t PipelineLibrary::GetPipelineCount() const
    {
        std::lock_guard lock(m_Mutex);
        return m_Pipelines.size() + (m_MorphPipeline ? 1u : 0u);
    }

    size_t PipelineLibrary::GetUnavailableCount() const
    {
        std::lock_guard lock(m_Mutex);
        return m_Unavailable.size() + (m_MorphPipelineFailed ? 1u : 0u);
    }

    void PipelineLibrary::SetTargetFormats(VkFormat colorFormat, VkFormat depthFormat)
    {
        std::lock_guard lock(m_Mutex);
        if (colorFormat == m_Config.ColorFormat && depthFormat == m_Config.DepthFormat)
            return;

        Core::Log::Info("PipelineLibrary: target formats changed, dropping {} cached pipelines", m_Pipelines.size());
        m_Config.ColorFormat = colorFormat;
        m_Config.DepthFormat = depthFormat;
        // Destruction is deferred through the device, in-flight frames keep their pipelines
        m_Pipelines.clear();
        m_Unavailable.clear();
    }

    std::unique_ptr<RHI::GraphicsPipeline> PipelineLibrary::BuildVariant(const Avatar::PipelineVariant& variant)
    {
        if (variant.Wireframe && !m_Device->SupportsWireframe())
        {
            Core::Log::Warn("PipelineLibrary: device lacks fillModeNonSolid, wireframe disabled");
            return nullptr;
        }

        const StringID vertId = variant.Skinned ? kShader_AvatarVertSkinned : kShader_AvatarVert;
        const std::optional<std::string> vertPath = m_ShaderRegistry.Get(vertId);
        const std::optional<std::string> fragPath = m_ShaderRegistry.Get(kShader_AvatarFrag);
        if (!vertPath || !fragPath)
        {
            Core::Log::Error("PipelineLibrary: shader paths for {} are not registered", Avatar::ToString(variant));
            return nullptr;
        }

        RHI::ShaderModule vert(m_Device, *vertPath, RHI::ShaderStage::Vertex);
        RHI::ShaderModule frag(m_Device, *fragPath, RHI::ShaderStage::Fragment);
        if (!vert.IsValid() || !frag.IsValid())
            return nullptr;

        VkPushConstantRange pushConstant{};
        pushConstant.stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
        pushConstant.offset = 0;
        pushConstant.size = sizeof(DrawPushConstants);

        RHI::PipelineBuilder builder(m_Device);
        builder.SetShaders(&vert, &frag)
               .SetColorFormats({m_Config.ColorFormat})
               .SetDepthFormat(m_Config.DepthFormat)
               .AddPushConstantRange(pushConstant);

        if (variant.Wireframe)
            builder.SetPolygonMode(VK_POLYGON_MODE_LINE);
        else if (variant.Blend)
            builder.EnableAlphaBlending();

        auto result = builder.Build();
        if (!result)
        {
            Core::Log::Error("PipelineLibrary: failed to build {} (VkResult {})",
                             Avatar::ToString(variant), static_cast<int>(result.error()));
            return nullptr;
        }
        return std::move(*result);
    }

    RHI::ComputePipeline* PipelineLibrary::GetMorphPipeline()
    {
        std::lock_guard lock(m_Mutex);
        if (m_MorphPipeline || m_MorphPipelineFailed)
            return m_MorphPipeline.get();

        const std::optional<std::string> compPath = m_ShaderRegistry.Get(kShader_MorphComp);
        if (!compPath)
        {
            Core::Log::Error("PipelineLibrary: morph compute shader is not registered");
            m_MorphPipelineFailed = true;
            return nullptr;
        }

        RHI::ShaderModule comp(m_Device, *compPath, RHI::ShaderStage::Compute);
        if (!comp.IsValid())
        {
            m_MorphPipelineFailed = true;
            return nullptr;
        }

        VkPushConstantRange pushConstant{};
        pushConstant.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
        pushConstant.offset = 0;
        pushConstant.size = sizeof(MorphPushConstants);

        auto result = RHI::ComputePipelineBuilder(m_Device)
                          .SetShader(&comp)
                          .AddPushConstantRange(pushConstant)
                          .Build();
        if (!result)
        {
            Core::Log::Error("PipelineLibrary: failed to build morph compute pipeline (VkResult {})",
                             static_cast<int>(result.error()));
            m_MorphPipelineFailed = true;
            return nullptr;
        }

        m_MorphPipeline = std::move(*result);
        return m_MorphPipeline.get();
    }
}
