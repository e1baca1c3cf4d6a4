module;
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>

module Avatar:StrictValidator.Impl;
import :StrictValidator;
import :Types;
import Core;

namespace Avatar
{
    std::string_view ToString(StrictViolation::Kind kind)
    {
        switch (kind)
        {
        case StrictViolation::Kind::PipelineUnavailable:    return "PipelineUnavailable";
        case StrictViolation::Kind::ZeroVertexCount:        return "ZeroVertexCount";
        case StrictViolation::Kind::ZeroIndexCount:         return "ZeroIndexCount";
        case StrictViolation::Kind::IndexOutOfBounds:       return "IndexOutOfBounds";
        case StrictViolation::Kind::IncompleteTriangleList: return "IncompleteTriangleList";
        case StrictViolation::Kind::JointPaletteTooSmall:   return "JointPaletteTooSmall";
        case StrictViolation::Kind::SkinIndexOutOfRange:    return "SkinIndexOutOfRange";
        case StrictViolation::Kind::MissingGpuBuffers:      return "MissingGpuBuffers";
        case StrictViolation::Kind::NoDrawCalls:            return "NoDrawCalls";
        }
        return "Unknown";
    }

    StrictValidator::StrictValidator(const Config& config) : m_Config(config)
    {
    }

    void StrictValidator::BeginFrame()
    {
        m_DrawCallCount = 0;
        m_FrameViolations.clear();
    }

    Core::Result StrictValidator::Handle(StrictViolation violation)
    {
        return Apply(std::move(violation), true);
    }

    Core::Result StrictValidator::HandleOnce(std::string_view onceKey, StrictViolation violation)
    {
        const bool firstTime = m_LoggedKeys.emplace(onceKey).second;
        return Apply(std::move(violation), firstTime);
    }

    Core::Result StrictValidator::Apply(StrictViolation violation, bool log)
    {
        switch (m_Config.Level)
        {
        case StrictLevel::Off:
            if (log) Core::Log::Debug("StrictValidator: {} ({})", ToString(violation.Type), violation.Detail);
            return Core::Ok();
        case StrictLevel::Warn:
            if (log) Core::Log::Warn("StrictValidator: {} ({})", ToString(violation.Type), violation.Detail);
            m_FrameViolations.push_back(std::move(violation));
            return Core::Ok();
        case StrictLevel::Fail:
            if (log) Core::Log::Error("StrictValidator: {} ({})", ToString(violation.Type), violation.Detail);
            m_FrameViolations.push_back(std::move(violation));
            return Core::Err(Core::ErrorCode::StrictValidationFailed);
        }
        return Core::Ok();
    }

    bool StrictValidator::WillDraw()
    {
        const uint32_t drawIndex = m_DrawCallCount++;

        if (m_Config.DrawUntil && drawIndex >= *m_Config.DrawUntil)
            return false;

        if (m_Config.DrawOnlyIndex && drawIndex != *m_Config.DrawOnlyIndex)
            return false;

        return true;
    }

    Core::Result StrictValidator::ValidateDraw(const DrawValidationInput& input)
    {
        if (input.VertexCount == 0)
        {
            return Handle({StrictViolation::Kind::ZeroVertexCount,
                           std::format("mesh '{}' primitive {}", input.MeshName, input.PrimitiveIndex)});
        }

        if (input.Indexed && input.IndexCount == 0)
        {
            return Handle({StrictViolation::Kind::ZeroIndexCount,
                           std::format("mesh '{}' primitive {}", input.MeshName, input.PrimitiveIndex)});
        }

        if (input.MaxIndexValue && *input.MaxIndexValue >= input.VertexCount)
        {
            return Handle({StrictViolation::Kind::IndexOutOfBounds,
                           std::format("mesh '{}' primitive {}: index {} >= vertex count {}",
                                       input.MeshName, input.PrimitiveIndex, *input.MaxIndexValue, input.VertexCount)});
        }

        const uint32_t elementCount = input.Indexed ? input.IndexCount : input.VertexCount;
        if (input.Mode == Topology::Triangles && elementCount % 3 != 0)
        {
            return Handle({StrictViolation::Kind::IncompleteTriangleList,
                           std::format("mesh '{}' primitive {}: {} elements", input.MeshName, input.PrimitiveIndex,
                                       elementCount)});
        }

        return Core::Ok();
    }

    Core::Result StrictValidator::ValidateJointPalette(std::string_view meshName, uint32_t primitiveIndex,
                                                       uint32_t maxJointIndex, uint32_t paletteJointCount)
    {
        if (maxJointIndex < paletteJointCount)
            return Core::Ok();

        return Handle({StrictViolation::Kind::JointPaletteTooSmall,
                       std::format("mesh '{}' primitive {}: joint index {} but skin has {} joints",
                                   meshName, primitiveIndex, maxJointIndex, paletteJointCount)});
    }

    Core::Result StrictValidator::EndFrame()
    {
        if (m_Config.Level != StrictLevel::Off && m_DrawCallCount == 0)
            return Handle({StrictViolation::Kind::NoDrawCalls, "frame encoded without draw calls"});
        return Core::Ok();
    }
}
