module;
#include <cstdint>
#include <memory>
#include <string>

export module Runtime:GraphicsBackend;

import Core;
import RHI;

export namespace Runtime
{
    struct GraphicsBackendConfig
    {
        std::string AppName = "Marionette";
        bool EnableValidation = false;
        uint32_t FramesInFlight = 3;
    };

    // Owns the headless Vulkan context, the device, the per-slot command
    // recording ring and the submission tracker. Encapsulates construction and
    // destruction order so the renderer does not manage GPU lifetimes itself.
    class GraphicsBackend
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<GraphicsBackend>> Create(const GraphicsBackendConfig& config);
        ~GraphicsBackend();

        GraphicsBackend(const GraphicsBackend&) = delete;
        GraphicsBackend& operator=(const GraphicsBackend&) = delete;
        GraphicsBackend(GraphicsBackend&&) = delete;
        GraphicsBackend& operator=(GraphicsBackend&&) = delete;

        [[nodiscard]] RHI::VulkanContext& GetContext() const { return *m_Context; }
        [[nodiscard]] std::shared_ptr<RHI::VulkanDevice> GetDevice() const { return m_Device; }
        [[nodiscard]] RHI::FrameContextRing& GetFrames() const { return *m_Frames; }
        [[nodiscard]] RHI::SubmissionTracker& GetSubmissions() const { return *m_Submissions; }

        // Drains the tracker and the device before teardown or a model swap.
        void WaitIdle();

    private:
        GraphicsBackend() = default;

        std::unique_ptr<RHI::VulkanContext> m_Context;
        std::shared_ptr<RHI::VulkanDevice> m_Device;
        std::unique_ptr<RHI::FrameContextRing> m_Frames;
        std::unique_ptr<RHI::SubmissionTracker> m_Submissions;
    };
}
