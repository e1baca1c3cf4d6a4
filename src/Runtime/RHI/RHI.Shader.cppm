module;
#include <memory>
#include <string>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Shader;

import :Device;

export namespace RHI
{
    enum class ShaderStage
    {
        Vertex,
        Fragment,
        Compute
    };

    // SPIR-V module loaded from disk. A missing or malformed file leaves the
    // module invalid; pipelines built from it are reported unavailable.
    class ShaderModule
    {
    public:
        ShaderModule(std::shared_ptr<VulkanDevice> device, const std::string& filepath, ShaderStage stage);
        ~ShaderModule();

        ShaderModule(const ShaderModule&) = delete;
        ShaderModule& operator=(const ShaderModule&) = delete;

        [[nodiscard]] bool IsValid() const { return m_Module != VK_NULL_HANDLE; }
        [[nodiscard]] VkShaderModule GetHandle() const { return m_Module; }
        [[nodiscard]] ShaderStage GetStage() const { return m_Stage; }
        [[nodiscard]] VkPipelineShaderStageCreateInfo GetStageInfo() const;

    private:
        std::shared_ptr<VulkanDevice> m_Device;
        VkShaderModule m_Module = VK_NULL_HANDLE;
        ShaderStage m_Stage;

        static std::vector<uint32_t> ReadFile(const std::string& filename);
    };
}
