module;
#include <array>
#include <expected>
#include <memory>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:Pipeline.Impl;
import :Pipeline;
import :Device;
import :Shader;

namespace RHI
{
    GraphicsPipeline::~GraphicsPipeline()
    {
        if (!m_Device) return;

        VkDevice logicalDevice = m_Device->GetLogicalDevice();
        if (m_Pipeline)
        {
            VkPipeline pipeline = m_Pipeline;
            m_Device->SafeDestroy([logicalDevice, pipeline]() { vkDestroyPipeline(logicalDevice, pipeline, nullptr); });
            m_Pipeline = VK_NULL_HANDLE;
        }
        if (m_Layout)
        {
            VkPipelineLayout layout = m_Layout;
            m_Device->SafeDestroy([logicalDevice, layout]() { vkDestroyPipelineLayout(logicalDevice, layout, nullptr); });
            m_Layout = VK_NULL_HANDLE;
        }
    }

    PipelineBuilder::PipelineBuilder(std::shared_ptr<VulkanDevice> device)
        : m_Device(std::move(device))
    {
    }

    PipelineBuilder& PipelineBuilder::SetShaders(ShaderModule* vert, ShaderModule* frag)
    {
        m_ShaderStages.clear();
        if (vert) m_ShaderStages.push_back(vert->GetStageInfo());
        if (frag) m_ShaderStages.push_back(frag->GetStageInfo());
        return *this;
    }

    PipelineBuilder& PipelineBuilder::SetColorFormats(const std::vector<VkFormat>& formats)
    {
        m_ColorFormats = formats;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::SetDepthFormat(VkFormat format)
    {
        m_DepthFormat = format;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::SetPolygonMode(VkPolygonMode mode)
    {
        m_PolygonMode = mode;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::EnableAlphaBlending()
    {
        m_BlendEnabled = true;
        return *this;
    }

    PipelineBuilder& PipelineBuilder::AddPushConstantRange(VkPushConstantRange range)
    {
        m_PushConstants.push_back(range);
        return *this;
    }

    std::expected<std::unique_ptr<GraphicsPipeline>, VkResult> PipelineBuilder::Build()
    {
        if (m_ShaderStages.size() != 2)
            return std::unexpected(VK_ERROR_INITIALIZATION_FAILED);
        for (const auto& stage : m_ShaderStages)
        {
            if (stage.module == VK_NULL_HANDLE)
                return std::unexpected(VK_ERROR_INITIALIZATION_FAILED);
        }

        VkPipelineLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
        // Buffer device addresses through push constants; no descriptor sets
        layoutInfo.pushConstantRangeCount = static_cast<uint32_t>(m_PushConstants.size());
        layoutInfo.pPushConstantRanges = m_PushConstants.data();

        VkPipelineLayout layout = VK_NULL_HANDLE;
        VkResult res = vkCreatePipelineLayout(m_Device->GetLogicalDevice(), &layoutInfo, nullptr, &layout);
        if (res != VK_SUCCESS) return std::unexpected(res);

        // Vertices are pulled through buffer device addresses
        VkPipelineVertexInputStateCreateInfo vertexInput{};
        vertexInput.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;

        VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
        inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        inputAssembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

        VkPipelineViewportStateCreateInfo viewportState{};
        viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        viewportState.viewportCount = 1;
        viewportState.scissorCount = 1;

        VkPipelineRasterizationStateCreateInfo rasterizer{};
        rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rasterizer.polygonMode = m_PolygonMode;
        rasterizer.lineWidth = 1.0f;
        rasterizer.cullMode = VK_CULL_MODE_BACK_BIT;
        rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;

        VkPipelineMultisampleStateCreateInfo multisampling{};
        multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

        VkPipelineDepthStencilStateCreateInfo depthStencil{};
        depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        depthStencil.depthTestEnable = VK_TRUE;
        depthStencil.depthWriteEnable = VK_TRUE;
        depthStencil.depthCompareOp = VK_COMPARE_OP_LESS;

        std::vector<VkPipelineColorBlendAttachmentState> blendAttachments(m_ColorFormats.size());
        for (auto& attachment : blendAttachments)
        {
            attachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                                        VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
            attachment.blendEnable = m_BlendEnabled ? VK_TRUE : VK_FALSE;
            attachment.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
            attachment.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            attachment.colorBlendOp = VK_BLEND_OP_ADD;
            attachment.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
            attachment.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            attachment.alphaBlendOp = VK_BLEND_OP_ADD;
        }

        VkPipelineColorBlendStateCreateInfo colorBlending{};
        colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        colorBlending.attachmentCount = static_cast<uint32_t>(blendAttachments.size());
        colorBlending.pAttachments = blendAttachments.data();

        constexpr std::array dynamicStates = {
            VK_DYNAMIC_STATE_VIEWPORT,
            VK_DYNAMIC_STATE_SCISSOR,
            VK_DYNAMIC_STATE_CULL_MODE,
            VK_DYNAMIC_STATE_FRONT_FACE,
            VK_DYNAMIC_STATE_PRIMITIVE_TOPOLOGY,
            VK_DYNAMIC_STATE_DEPTH_TEST_ENABLE,
            VK_DYNAMIC_STATE_DEPTH_WRITE_ENABLE,
            VK_DYNAMIC_STATE_DEPTH_COMPARE_OP,
            VK_DYNAMIC_STATE_DEPTH_BIAS,
            VK_DYNAMIC_STATE_DEPTH_BIAS_ENABLE,
        };

        VkPipelineDynamicStateCreateInfo dynamicState{};
        dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dynamicState.dynamicStateCount = static_cast<uint32_t>(dynamicStates.size());
        dynamicState.pDynamicStates = dynamicStates.data();

        VkPipelineRenderingCreateInfo renderingInfo{};
        renderingInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
        renderingInfo.colorAttachmentCount = static_cast<uint32_t>(m_ColorFormats.size());
        renderingInfo.pColorAttachmentFormats = m_ColorFormats.data();
        renderingInfo.depthAttachmentFormat = m_DepthFormat;

        VkGraphicsPipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        pipelineInfo.pNext = &renderingInfo;
        pipelineInfo.stageCount = static_cast<uint32_t>(m_ShaderStages.size());
        pipelineInfo.pStages = m_ShaderStages.data();
        pipelineInfo.pVertexInputState = &vertexInput;
        pipelineInfo.pInputAssemblyState = &inputAssembly;
        pipelineInfo.pViewportState = &viewportState;
        pipelineInfo.pRasterizationState = &rasterizer;
        pipelineInfo.pMultisampleState = &multisampling;
        pipelineInfo.pDepthStencilState = &depthStencil;
        pipelineInfo.pColorBlendState = &colorBlending;
        pipelineInfo.pDynamicState = &dynamicState;
        pipelineInfo.layout = layout;

        VkPipeline pipeline = VK_NULL_HANDLE;
        res = vkCreateGraphicsPipelines(m_Device->GetLogicalDevice(), VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline);
        if (res != VK_SUCCESS)
        {
            vkDestroyPipelineLayout(m_Device->GetLogicalDevice(), layout, nullptr);
            return std::unexpected(res);
        }

        return std::make_unique<GraphicsPipeline>(m_Device, pipeline, layout);
    }
}
