module;

#include <cstdint>
#include <span>

#include "RHI.Vulkan.hpp"

export module Graphics:DrawEncoder;

import Core;
import RHI;
import Avatar;
import :PipelineLibrary;
import :MorphBufferPool;
import :ModelResidency;

export namespace Graphics
{
    struct DrawContext
    {
        VkCommandBuffer Cmd = VK_NULL_HANDLE;
        const Avatar::Model* Model = nullptr;
        std::span<const Avatar::RenderItem> Items;
        std::span<const uint32_t> Order; // Sorted and selected indices into Items
        const Avatar::MorphBufferTable* MorphTable = nullptr;
        const ModelResidency* Residency = nullptr;
        uint64_t FrameUniformAddress = 0;
        uint64_t JointPaletteAddress = 0;
        uint32_t JointPaletteSize = 0; // Matrices supplied this frame
        uint64_t PlaceholderAddress = 0;
        Avatar::SelectorToggles Toggles;
    };

    // Issues one draw per ordered item inside an open dynamic-rendering pass.
    // Items that cannot be drawn are skipped and reported to the validator;
    // a failing validator stops the loop and its error is returned.
    class DrawEncoder
    {
    public:
        DrawEncoder(PipelineLibrary& pipelines, const MorphBufferPool& morphBuffers);

        [[nodiscard]] Core::Result Encode(const DrawContext& ctx, Avatar::StrictValidator& validator);

        [[nodiscard]] uint32_t GetLastDrawCount() const { return m_LastDrawCount; }
        [[nodiscard]] uint32_t GetLastSkippedCount() const { return m_LastSkippedCount; }

    private:
        PipelineLibrary& m_Pipelines;
        const MorphBufferPool& m_MorphBuffers;

        uint32_t m_LastDrawCount = 0;
        uint32_t m_LastSkippedCount = 0;
        bool m_WarnedPoints = false;
        bool m_WarnedLines = false;

        [[nodiscard]] bool AcceptTopology(Avatar::Topology mode);
    };
}
