module;
#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:Device.Impl;
import :Device;
import :Context;
import Core;

namespace RHI
{
    VulkanDevice::VulkanDevice(VulkanContext& context, uint32_t framesInFlight)
        : m_DeletionQueues(std::max(1u, framesInFlight))
    {
        PickPhysicalDevice(context.GetInstance());
        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            m_IsValid = false;
            return;
        }

        CreateLogicalDevice(context);
    }

    VulkanDevice::~VulkanDevice()
    {
        if (m_Device) vkDeviceWaitIdle(m_Device);

        {
            std::lock_guard lock(m_DeletionMutex);
            for (auto& queue : m_DeletionQueues)
            {
                for (auto& fn : queue) fn();
                queue.clear();
            }
        }

        if (m_Allocator) vmaDestroyAllocator(m_Allocator);
        if (m_Device) vkDestroyDevice(m_Device, nullptr);
    }

    VkResult VulkanDevice::SubmitToGraphicsQueue(const VkSubmitInfo& submitInfo, VkFence fence)
    {
        std::scoped_lock lock(m_QueueMutex);
        return vkQueueSubmit(m_GraphicsQueue, 1, &submitInfo, fence);
    }

    void VulkanDevice::FlushDeletionQueue(uint32_t frameSlot)
    {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard lock(m_DeletionMutex);
            m_CurrentFrameSlot = frameSlot % static_cast<uint32_t>(m_DeletionQueues.size());
            pending.swap(m_DeletionQueues[m_CurrentFrameSlot]);
        }
        for (auto& fn : pending) fn();
    }

    void VulkanDevice::SafeDestroy(std::function<void()>&& deleteFn)
    {
        std::lock_guard lock(m_DeletionMutex);
        m_DeletionQueues[m_CurrentFrameSlot].push_back(std::move(deleteFn));
    }

    void VulkanDevice::PickPhysicalDevice(VkInstance instance)
    {
        uint32_t deviceCount = 0;
        vkEnumeratePhysicalDevices(instance, &deviceCount, nullptr);
        if (deviceCount == 0)
        {
            Core::Log::Error("Failed to find GPUs with Vulkan support!");
            return;
        }

        std::vector<VkPhysicalDevice> devices(deviceCount);
        vkEnumeratePhysicalDevices(instance, &deviceCount, devices.data());

        for (const auto& device : devices)
        {
            if (IsDeviceSuitable(device))
            {
                m_PhysicalDevice = device;
                break;
            }
        }

        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            Core::Log::Error("Failed to find a suitable GPU! Checked {} devices.", deviceCount);
            return;
        }

        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(m_PhysicalDevice, &props);
        Core::Log::Info("Selected GPU: {}", props.deviceName);
    }

    bool VulkanDevice::IsDeviceSuitable(VkPhysicalDevice device)
    {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(device, &props);

        if (props.apiVersion < VK_API_VERSION_1_3)
        {
            Core::Log::Warn("GPU '{}' rejected: Vulkan 1.3 required.", props.deviceName);
            return false;
        }

        VkPhysicalDeviceVulkan13Features features13{};
        features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;

        VkPhysicalDeviceVulkan12Features features12{};
        features12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
        features12.pNext = &features13;

        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features12;
        vkGetPhysicalDeviceFeatures2(device, &features2);

        if (!FindQueueFamilies(device).IsComplete())
        {
            Core::Log::Warn("GPU '{}' rejected: No graphics+compute queue.", props.deviceName);
            return false;
        }
        if (!features13.dynamicRendering || !features13.synchronization2)
        {
            Core::Log::Warn("GPU '{}' rejected: dynamic rendering or synchronization2 missing.", props.deviceName);
            return false;
        }
        if (!features12.bufferDeviceAddress)
        {
            Core::Log::Warn("GPU '{}' rejected: buffer device address missing.", props.deviceName);
            return false;
        }
        return true;
    }

    QueueFamilyIndices VulkanDevice::FindQueueFamilies(VkPhysicalDevice device) const
    {
        QueueFamilyIndices indices;
        uint32_t queueFamilyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);

        std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

        // Morph compute and drawing share one queue so submission order orders them
        constexpr VkQueueFlags required = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT;
        for (uint32_t i = 0; i < queueFamilyCount; ++i)
        {
            if ((queueFamilies[i].queueFlags & required) == required)
            {
                indices.GraphicsFamily = i;
                break;
            }
        }
        return indices;
    }

    void VulkanDevice::CreateLogicalDevice(VulkanContext& context)
    {
        m_Indices = FindQueueFamilies(m_PhysicalDevice);

        float queuePriority = 1.0f;
        VkDeviceQueueCreateInfo queueCreateInfo{};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = m_Indices.GraphicsFamily.value();
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;

        VkPhysicalDeviceFeatures supported{};
        vkGetPhysicalDeviceFeatures(m_PhysicalDevice, &supported);
        m_SupportsWireframe = supported.fillModeNonSolid == VK_TRUE;

        VkPhysicalDeviceVulkan13Features features13{};
        features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
        features13.dynamicRendering = VK_TRUE;
        features13.synchronization2 = VK_TRUE;

        VkPhysicalDeviceVulkan12Features features12{};
        features12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
        features12.pNext = &features13;
        features12.bufferDeviceAddress = VK_TRUE;

        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features12;
        features2.features.fillModeNonSolid = supported.fillModeNonSolid;

        VkDeviceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.pNext = &features2;
        createInfo.queueCreateInfoCount = 1;
        createInfo.pQueueCreateInfos = &queueCreateInfo;

        if (vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create logical device!");
            m_IsValid = false;
            return;
        }

        volkLoadDevice(m_Device);

        VmaVulkanFunctions vulkanFunctions = {};
        vulkanFunctions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
        vulkanFunctions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.flags = VMA_ALLOCATOR_CREATE_BUFFER_DEVICE_ADDRESS_BIT;
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
        allocatorInfo.physicalDevice = m_PhysicalDevice;
        allocatorInfo.device = m_Device;
        allocatorInfo.instance = context.GetInstance();
        allocatorInfo.pVulkanFunctions = &vulkanFunctions;

        if (vmaCreateAllocator(&allocatorInfo, &m_Allocator) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create VMA allocator!");
            m_IsValid = false;
            return;
        }

        vkGetDeviceQueue(m_Device, m_Indices.GraphicsFamily.value(), 0, &m_GraphicsQueue);
    }
}
