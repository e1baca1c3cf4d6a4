module;

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "RHI.Vulkan.hpp"

export module Graphics:PipelineLibrary;

import Core;
import RHI;
import Avatar;
import :ShaderRegistry;

export namespace Graphics
{
    using namespace Core::Hash;

    // Canonical pipeline IDs, one per selector variant.
    inline constexpr StringID kPipeline_Rigid_Opaque = "Pipeline.Rigid.Opaque"_id;
    inline constexpr StringID kPipeline_Rigid_Blend = "Pipeline.Rigid.Blend"_id;
    inline constexpr StringID kPipeline_Rigid_Wireframe = "Pipeline.Rigid.Wireframe"_id;
    inline constexpr StringID kPipeline_Skinned_Opaque = "Pipeline.Skinned.Opaque"_id;
    inline constexpr StringID kPipeline_Skinned_Blend = "Pipeline.Skinned.Blend"_id;
    inline constexpr StringID kPipeline_Skinned_Wireframe = "Pipeline.Skinned.Wireframe"_id;

    [[nodiscard]] constexpr StringID PipelineVariantId(const Avatar::PipelineVariant& variant)
    {
        if (variant.Skinned)
        {
            if (variant.Wireframe) return kPipeline_Skinned_Wireframe;
            return variant.Blend ? kPipeline_Skinned_Blend : kPipeline_Skinned_Opaque;
        }
        if (variant.Wireframe) return kPipeline_Rigid_Wireframe;
        return variant.Blend ? kPipeline_Rigid_Blend : kPipeline_Rigid_Opaque;
    }

    // Pipeline variant cache owned by the renderer.
    // Contract: get-or-create is serialized by one mutex; built entries are
    // immutable until the target formats change. A variant that fails to
    // build is remembered and reported once, not retried every frame.
    class PipelineLibrary
    {
    public:
        struct Config
        {
            VkFormat ColorFormat = VK_FORMAT_B8G8R8A8_UNORM;
            VkFormat DepthFormat = VK_FORMAT_D32_SFLOAT;
        };

        PipelineLibrary(std::shared_ptr<RHI::VulkanDevice> device,
                        const ShaderRegistry& shaderRegistry,
                        const Config& config);
        ~PipelineLibrary();

        PipelineLibrary(const PipelineLibrary&) = delete;
        PipelineLibrary& operator=(const PipelineLibrary&) = delete;

        // Builds every graphics variant and the morph compute pipeline up front.
        void BuildDefaults();

        // nullptr when the variant could not be built.
        [[nodiscard]] RHI::GraphicsPipeline* GetOrCreate(const Avatar::PipelineVariant& variant);
        [[nodiscard]] RHI::GraphicsPipeline* TryGet(StringID id) const;
        [[nodiscard]] bool Contains(StringID id) const;
        [[nodiscard]] bool IsUnavailable(StringID id) const;

        [[nodiscard]] RHI::ComputePipeline* GetMorphPipeline();

        // Drops every cached pipeline when the formats differ from the current ones.
        void SetTargetFormats(VkFormat colorFormat, VkFormat depthFormat);

        [[nodiscard]] const Config& GetConfig() const { return m_Config; }
        [[nodiscard]] size_t GetPipelineCount() const;
        [[nodiscard]] size_t GetUnavailableCount() const;

    private:
        std::shared_ptr<RHI::VulkanDevice> m_Device;
        const ShaderRegistry& m_ShaderRegistry;
        Config m_Config;

        mutable std::mutex m_Mutex;
        std::unordered_map<StringID, std::unique_ptr<RHI::GraphicsPipeline>> m_Pipelines;
        std::unordered_set<StringID> m_Unavailable;

        std::unique_ptr<RHI::ComputePipeline> m_MorphPipeline;
        bool m_MorphPipelineFailed = false;

        [[nodiscard]] RHI::GraphicsPipeline* GetOrCreateLocked(const Avatar::PipelineVariant& variant);
        [[nodiscard]] std::unique_ptr<RHI::GraphicsPipeline> BuildVariant(const Avatar::PipelineVariant& variant);
    };
}
