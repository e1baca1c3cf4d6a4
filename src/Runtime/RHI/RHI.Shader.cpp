module;
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:Shader.Impl;
import :Shader;
import :Device;
import Core;

namespace RHI
{
    ShaderModule::ShaderModule(std::shared_ptr<VulkanDevice> device, const std::string& filepath, ShaderStage stage)
        : m_Device(std::move(device)), m_Stage(stage)
    {
        const std::vector<uint32_t> code = ReadFile(filepath);
        if (code.empty()) return;

        VkShaderModuleCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        createInfo.codeSize = code.size() * sizeof(uint32_t);
        createInfo.pCode = code.data();

        if (vkCreateShaderModule(m_Device->GetLogicalDevice(), &createInfo, nullptr, &m_Module) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create shader module: {}", filepath);
            m_Module = VK_NULL_HANDLE;
        }
    }

    ShaderModule::~ShaderModule()
    {
        // Pipelines keep their own copy of the code; immediate destruction is fine
        if (m_Module) vkDestroyShaderModule(m_Device->GetLogicalDevice(), m_Module, nullptr);
    }

    VkPipelineShaderStageCreateInfo ShaderModule::GetStageInfo() const
    {
        VkPipelineShaderStageCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        switch (m_Stage)
        {
        case ShaderStage::Vertex:   info.stage = VK_SHADER_STAGE_VERTEX_BIT; break;
        case ShaderStage::Fragment: info.stage = VK_SHADER_STAGE_FRAGMENT_BIT; break;
        case ShaderStage::Compute:  info.stage = VK_SHADER_STAGE_COMPUTE_BIT; break;
        }
        info.module = m_Module;
        info.pName = "main";
        return info;
    }

    std::vector<uint32_t> ShaderModule::ReadFile(const std::string& filename)
    {
        std::ifstream file(filename, std::ios::ate | std::ios::binary);
        if (!file.is_open())
        {
            Core::Log::Error("Failed to open shader file: {}", filename);
            return {};
        }

        const auto fileSize = static_cast<size_t>(file.tellg());
        if (fileSize == 0 || fileSize % sizeof(uint32_t) != 0)
        {
            Core::Log::Error("Shader file {} is not valid SPIR-V ({} bytes)", filename, fileSize);
            return {};
        }

        std::vector<uint32_t> buffer(fileSize / sizeof(uint32_t));
        file.seekg(0);
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(fileSize));
        return buffer;
    }
}
