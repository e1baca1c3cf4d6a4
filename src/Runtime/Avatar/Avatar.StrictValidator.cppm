module;
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

export module Avatar:StrictValidator;

import :Types;
import Core;

export namespace Avatar
{
    enum class StrictLevel : uint8_t
    {
        Off,  // Log only
        Warn, // Log and record for the frame, keep rendering
        Fail  // Log and fail on the first violation
    };

    struct StrictViolation
    {
        enum class Kind : uint8_t
        {
            PipelineUnavailable,
            ZeroVertexCount,
            ZeroIndexCount,
            IndexOutOfBounds,
            IncompleteTriangleList,
            JointPaletteTooSmall,
            SkinIndexOutOfRange,
            MissingGpuBuffers,
            NoDrawCalls
        };

        Kind Type;
        std::string Detail;
    };

    [[nodiscard]] std::string_view ToString(StrictViolation::Kind kind);

    struct DrawValidationInput
    {
        std::string_view MeshName;
        uint32_t PrimitiveIndex = 0;
        uint32_t VertexCount = 0;
        uint32_t IndexCount = 0;
        bool Indexed = false;
        Topology Mode = Topology::Triangles;
        std::optional<uint32_t> MaxIndexValue;
    };

    // Per-frame validation and debug draw gating. Single-threaded: owned by the
    // encoding thread.
    class StrictValidator
    {
    public:
        struct Config
        {
            StrictLevel Level = StrictLevel::Off;
            std::optional<uint32_t> DrawUntil;     // Draw only the first N draw calls
            std::optional<uint32_t> DrawOnlyIndex; // Draw only the draw call with this 0-based index
        };

        explicit StrictValidator(const Config& config = {});

        void BeginFrame();

        // Applies the strict level. Fails only at StrictLevel::Fail.
        [[nodiscard]] Core::Result Handle(StrictViolation violation);

        // As Handle, but the message is logged only the first time `onceKey` is
        // seen over the validator's lifetime. The violation is still recorded
        // (and still fails at StrictLevel::Fail) every frame.
        [[nodiscard]] Core::Result HandleOnce(std::string_view onceKey, StrictViolation violation);

        // Counts a draw attempt and reports whether the debug gates let it through.
        [[nodiscard]] bool WillDraw();

        [[nodiscard]] Core::Result ValidateDraw(const DrawValidationInput& input);
        [[nodiscard]] Core::Result ValidateJointPalette(std::string_view meshName, uint32_t primitiveIndex,
                                                        uint32_t maxJointIndex, uint32_t paletteJointCount);

        // Reports NoDrawCalls when strict validation is on and nothing was attempted.
        [[nodiscard]] Core::Result EndFrame();

        [[nodiscard]] const std::vector<StrictViolation>& GetFrameViolations() const { return m_FrameViolations; }
        [[nodiscard]] bool HasViolations() const { return !m_FrameViolations.empty(); }
        [[nodiscard]] uint32_t GetDrawCallCount() const { return m_DrawCallCount; }
        [[nodiscard]] StrictLevel GetLevel() const { return m_Config.Level; }

    private:
        Config m_Config;
        uint32_t m_DrawCallCount = 0;
        std::vector<StrictViolation> m_FrameViolations;
        std::unordered_set<std::string> m_LoggedKeys;

        [[nodiscard]] Core::Result Apply(StrictViolation violation, bool log);
    };
}
