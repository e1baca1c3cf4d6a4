module;

#include <cstring>
#include <memory>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:Context.Impl;
import :Context;
import Core;

namespace RHI
{
    namespace
    {
        constexpr const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";

        VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
            VkDebugUtilsMessageTypeFlagsEXT,
            const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
            void*)
        {
            if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
                Core::Log::Error("[Vulkan Validation]: {}", pCallbackData->pMessage);
            else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
                Core::Log::Warn("[Vulkan Validation]: {}", pCallbackData->pMessage);
            return VK_FALSE;
        }

        VkDebugUtilsMessengerCreateInfoEXT MakeMessengerInfo()
        {
            VkDebugUtilsMessengerCreateInfoEXT info{};
            info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
            info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                   VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
            info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                               VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                               VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
            info.pfnUserCallback = DebugCallback;
            return info;
        }

        bool IsValidationLayerAvailable()
        {
            uint32_t count = 0;
            vkEnumerateInstanceLayerProperties(&count, nullptr);
            std::vector<VkLayerProperties> layers(count);
            vkEnumerateInstanceLayerProperties(&count, layers.data());
            for (const auto& layer : layers)
            {
                if (std::strcmp(layer.layerName, kValidationLayer) == 0) return true;
            }
            return false;
        }
    }

    Core::Expected<std::unique_ptr<VulkanContext>> VulkanContext::Create(const ContextConfig& config)
    {
        if (volkInitialize() != VK_SUCCESS)
        {
            Core::Log::Error("Failed to initialize Volk! Is a Vulkan loader installed?");
            return Core::Err<std::unique_ptr<VulkanContext>>(Core::ErrorCode::DeviceLost);
        }

        std::unique_ptr<VulkanContext> context(new VulkanContext());
        if (VkResult result = context->CreateInstance(config); result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create Vulkan instance (VkResult {})", static_cast<int>(result));
            return Core::Err<std::unique_ptr<VulkanContext>>(Core::ErrorCode::DeviceLost);
        }

        volkLoadInstance(context->m_Instance);

        if (config.EnableValidation)
            context->SetupDebugMessenger();

        Core::Log::Info("Vulkan instance initialized (validation {}).", context->HasValidation() ? "on" : "off");
        return context;
    }

    VulkanContext::~VulkanContext()
    {
        if (m_DebugMessenger != VK_NULL_HANDLE)
            vkDestroyDebugUtilsMessengerEXT(m_Instance, m_DebugMessenger, nullptr);
        if (m_Instance != VK_NULL_HANDLE)
            vkDestroyInstance(m_Instance, nullptr);
    }

    VkResult VulkanContext::CreateInstance(const ContextConfig& config)
    {
        VkApplicationInfo appInfo{};
        appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
        appInfo.pApplicationName = config.AppName.data();
        appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.pEngineName = "Marionette";
        appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.apiVersion = VK_API_VERSION_1_3;

        const bool validation = config.EnableValidation && IsValidationLayerAvailable();
        if (config.EnableValidation && !validation)
            Core::Log::Warn("Validation requested but {} is not installed", kValidationLayer);

        std::vector<const char*> extensions;
        if (validation)
            extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);

        VkInstanceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
        createInfo.pApplicationInfo = &appInfo;
        createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
        createInfo.ppEnabledExtensionNames = extensions.data();

        VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo = MakeMessengerInfo();
        if (validation)
        {
            createInfo.enabledLayerCount = 1;
            createInfo.ppEnabledLayerNames = &kValidationLayer;
            // Covers vkCreateInstance / vkDestroyInstance themselves
            createInfo.pNext = &debugCreateInfo;
        }

        return vkCreateInstance(&createInfo, nullptr, &m_Instance);
    }

    void VulkanContext::SetupDebugMessenger()
    {
        if (!vkCreateDebugUtilsMessengerEXT) return;

        VkDebugUtilsMessengerCreateInfoEXT createInfo = MakeMessengerInfo();
        if (vkCreateDebugUtilsMessengerEXT(m_Instance, &createInfo, nullptr, &m_DebugMessenger) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to set up debug messenger!");
            m_DebugMessenger = VK_NULL_HANDLE;
        }
    }
}
