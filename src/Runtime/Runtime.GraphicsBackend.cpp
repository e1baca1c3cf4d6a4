module;
#include <memory>
#include "RHI.Vulkan.hpp"

module Runtime:GraphicsBackend.Impl;
import :GraphicsBackend;

import Core;
import RHI;

namespace Runtime
{
    Core::Expected<std::unique_ptr<GraphicsBackend>> GraphicsBackend::Create(const GraphicsBackendConfig& config)
    {
        Core::Log::Info("GraphicsBackend: Initializing...");
        std::unique_ptr<GraphicsBackend> backend(new GraphicsBackend());

        // 1. Vulkan Context
        auto context = RHI::VulkanContext::Create({config.AppName, config.EnableValidation});
        if (!context)
            return std::unexpected(context.error());
        backend->m_Context = std::move(*context);

        // 2. Device
        backend->m_Device = std::make_shared<RHI::VulkanDevice>(*backend->m_Context, config.FramesInFlight);
        if (!backend->m_Device->IsValid())
        {
            Core::Log::Error("GraphicsBackend: no usable Vulkan 1.3 device");
            return std::unexpected(Core::ErrorCode::DeviceLost);
        }

        // 3. Command recording and completion tracking
        backend->m_Frames = std::make_unique<RHI::FrameContextRing>(backend->m_Device, config.FramesInFlight);
        if (!backend->m_Frames->IsValid())
            return std::unexpected(Core::ErrorCode::OutOfDeviceMemory);

        backend->m_Submissions = std::make_unique<RHI::SubmissionTracker>(backend->m_Device);

        Core::Log::Info("GraphicsBackend: Initialization complete.");
        return backend;
    }

    GraphicsBackend::~GraphicsBackend()
    {
        WaitIdle();

        m_Submissions.reset();
        m_Frames.reset();
        // Deferred destruction queues are flushed by the device destructor
        m_Device.reset();
        m_Context.reset();

        Core::Log::Info("GraphicsBackend: Shutdown complete.");
    }

    void GraphicsBackend::WaitIdle()
    {
        if (m_Submissions) m_Submissions->WaitIdle();
        if (m_Device && m_Device->GetLogicalDevice())
            vkDeviceWaitIdle(m_Device->GetLogicalDevice());
    }
}
