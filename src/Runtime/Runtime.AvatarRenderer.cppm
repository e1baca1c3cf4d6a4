module;
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

export module Runtime:AvatarRenderer;

import Core;
import RHI;
import Avatar;
import Graphics;
import :RendererConfig;
import :GraphicsBackend;

export namespace Runtime
{
    // Caller-owned images the frame is rendered into. The depth attachment is
    // optional; without it the pipelines are built with no depth format.
    struct RenderTarget
    {
        VkImage ColorImage = VK_NULL_HANDLE;
        VkImageView ColorView = VK_NULL_HANDLE;
        VkFormat ColorFormat = VK_FORMAT_B8G8R8A8_UNORM;
        VkImageLayout ColorInitialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        VkImageLayout ColorFinalLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

        VkImage DepthImage = VK_NULL_HANDLE;
        VkImageView DepthView = VK_NULL_HANDLE;
        VkFormat DepthFormat = VK_FORMAT_D32_SFLOAT;

        VkExtent2D Extent{0, 0};
        glm::vec4 ClearColor{0.0f, 0.0f, 0.0f, 0.0f};
    };

    struct FrameInputs
    {
        glm::mat4 View{1.0f};
        glm::mat4 Projection{1.0f};
        std::span<const glm::vec4> LightDirections; // xyz toward the light, w intensity
        std::span<const glm::mat4> JointMatrices;   // Packed per Avatar::Model::PackJointPalette
    };

    struct FrameStats
    {
        uint64_t FrameNumber = 0;
        uint32_t ItemCount = 0;
        uint32_t SelectedCount = 0;
        uint32_t DrawCalls = 0;
        uint32_t SkippedItems = 0;
        uint32_t MorphDispatches = 0;
    };

    // Composition root of the avatar renderer and its per-frame entry point.
    class AvatarRenderer
    {
    public:
        [[nodiscard]] static Core::Expected<std::unique_ptr<AvatarRenderer>> Create(const RendererConfig& config);
        ~AvatarRenderer();

        AvatarRenderer(const AvatarRenderer&) = delete;
        AvatarRenderer& operator=(const AvatarRenderer&) = delete;

        // Uploads the model's static buffers and drops the classified item cache.
        [[nodiscard]] Core::Result LoadModel(std::shared_ptr<Avatar::Model> model);

        [[nodiscard]] Core::Result DrawFrame(const RenderTarget& target, const FrameInputs& inputs);

        void WaitIdle();

        // Debug toggles and strict level take effect on the next frame.
        // MaxFramesInFlight and the shader directory are fixed at creation.
        void SetConfig(const RendererConfig& config);
        [[nodiscard]] const RendererConfig& GetConfig() const { return m_Config; }

        [[nodiscard]] const FrameStats& GetLastFrameStats() const { return m_LastStats; }
        [[nodiscard]] const std::vector<Avatar::StrictViolation>& GetLastFrameViolations() const
        {
            return m_Validator.GetFrameViolations();
        }
        [[nodiscard]] const Avatar::FrameSynchronizer& GetSynchronizer() const { return *m_Synchronizer; }
        [[nodiscard]] Graphics::PipelineLibrary& GetPipelineLibrary() const { return *m_Pipelines; }
        [[nodiscard]] GraphicsBackend& GetBackend() const { return *m_Backend; }

    private:
        explicit AvatarRenderer(const RendererConfig& config);

        RendererConfig m_Config;

        // Declared first so it is destroyed last
        std::unique_ptr<GraphicsBackend> m_Backend;

        Graphics::ShaderRegistry m_ShaderRegistry;
        std::unique_ptr<Graphics::PipelineLibrary> m_Pipelines;
        std::unique_ptr<Graphics::ModelResidency> m_Residency;
        std::unique_ptr<Graphics::MorphBufferPool> m_MorphBuffers;
        std::unique_ptr<Graphics::FrameResourceRing> m_FrameResources;
        std::unique_ptr<Graphics::MorphComputeDispatcher> m_MorphDispatcher;
        std::unique_ptr<Graphics::DrawEncoder> m_Encoder;

        std::unique_ptr<Avatar::FrameSynchronizer> m_Synchronizer;
        Avatar::StrictValidator m_Validator;

        std::shared_ptr<Avatar::Model> m_Model;
        FrameStats m_LastStats;

        [[nodiscard]] Core::Result EncodeFrame(VkCommandBuffer cmd, const Avatar::FrameTicket& ticket,
                                               const RenderTarget& target, const FrameInputs& inputs);
        [[nodiscard]] Core::Result Submit(const Avatar::FrameTicket& ticket);
    };
}
