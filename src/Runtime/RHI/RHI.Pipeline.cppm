module;
#include <expected>
#include <memory>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Pipeline;

import :Device;
import :Shader;

export namespace RHI
{
    class GraphicsPipeline
    {
    public:
        GraphicsPipeline(std::shared_ptr<VulkanDevice> device, VkPipeline pipeline, VkPipelineLayout layout)
            : m_Device(std::move(device)), m_Pipeline(pipeline), m_Layout(layout)
        {
        }

        ~GraphicsPipeline();

        GraphicsPipeline(const GraphicsPipeline&) = delete;
        GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;

        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout; }

    private:
        std::shared_ptr<VulkanDevice> m_Device;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;
    };

    // Dynamic-rendering pipeline with vertex pulling (no vertex input state).
    // Viewport, scissor, cull mode, front face, depth test/write/compare,
    // depth bias and primitive topology (triangle class) are dynamic.
    class PipelineBuilder
    {
    public:
        explicit PipelineBuilder(std::shared_ptr<VulkanDevice> device);

        PipelineBuilder& SetShaders(ShaderModule* vert, ShaderModule* frag);
        PipelineBuilder& SetColorFormats(const std::vector<VkFormat>& formats);
        PipelineBuilder& SetDepthFormat(VkFormat format);
        PipelineBuilder& SetPolygonMode(VkPolygonMode mode);
        PipelineBuilder& EnableAlphaBlending();
        PipelineBuilder& AddPushConstantRange(VkPushConstantRange range);

        [[nodiscard]] std::expected<std::unique_ptr<GraphicsPipeline>, VkResult> Build();

    private:
        std::shared_ptr<VulkanDevice> m_Device;
        std::vector<VkPipelineShaderStageCreateInfo> m_ShaderStages;
        std::vector<VkFormat> m_ColorFormats;
        VkFormat m_DepthFormat = VK_FORMAT_UNDEFINED;
        VkPolygonMode m_PolygonMode = VK_POLYGON_MODE_FILL;
        bool m_BlendEnabled = false;
        std::vector<VkPushConstantRange> m_PushConstants;
    };
}
