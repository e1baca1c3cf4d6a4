module;

#include <memory>
#include <string_view>
#include "RHI.Vulkan.hpp"

export module RHI:Context;

import Core;

export namespace RHI
{
    struct ContextConfig
    {
        std::string_view AppName = "Marionette";
        bool EnableValidation = true;
    };

    // Headless Vulkan 1.3 instance. The renderer draws into caller-provided
    // images, so no surface extensions are requested.
    class VulkanContext
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<VulkanContext>> Create(const ContextConfig& config);
        ~VulkanContext();

        VulkanContext(const VulkanContext&) = delete;
        VulkanContext& operator=(const VulkanContext&) = delete;

        [[nodiscard]] VkInstance GetInstance() const { return m_Instance; }
        [[nodiscard]] bool HasValidation() const { return m_DebugMessenger != VK_NULL_HANDLE; }

    private:
        VulkanContext() = default;

        VkInstance m_Instance = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT m_DebugMessenger = VK_NULL_HANDLE;

        VkResult CreateInstance(const ContextConfig& config);
        void SetupDebugMessenger();
    };
}
