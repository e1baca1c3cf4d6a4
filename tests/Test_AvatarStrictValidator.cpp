#include <gtest/gtest.h>
#include <cstdint>
#include <optional>

import Avatar;
import Core;

using Avatar::StrictLevel;
using Avatar::StrictValidator;
using Avatar::StrictViolation;

namespace
{
    Avatar::DrawValidationInput Triangles(uint32_t vertices, uint32_t indices, uint32_t maxIndex)
    {
        Avatar::DrawValidationInput input;
        input.MeshName = "Mesh";
        input.VertexCount = vertices;
        input.IndexCount = indices;
        input.Indexed = indices > 0;
        input.MaxIndexValue = indices > 0 ? std::optional<uint32_t>(maxIndex) : std::nullopt;
        return input;
    }
}

// -----------------------------------------------------------------------------
// Strict levels
// -----------------------------------------------------------------------------

TEST(AvatarStrictValidator, OffLogsButNeverRecords)
{
    StrictValidator validator({.Level = StrictLevel::Off});
    validator.BeginFrame();

    EXPECT_TRUE(validator.ValidateDraw(Triangles(0, 0, 0)).has_value());
    EXPECT_FALSE(validator.HasViolations());
    EXPECT_TRUE(validator.EndFrame().has_value());
}

TEST(AvatarStrictValidator, WarnRecordsAndContinues)
{
    Core::Log::ScopedCapture capture;
    StrictValidator validator({.Level = StrictLevel::Warn});
    validator.BeginFrame();

    EXPECT_TRUE(validator.ValidateDraw(Triangles(3, 3, 5)).has_value());
    ASSERT_EQ(validator.GetFrameViolations().size(), 1u);
    EXPECT_EQ(validator.GetFrameViolations()[0].Type, StrictViolation::Kind::IndexOutOfBounds);
    EXPECT_TRUE(capture.Contains("IndexOutOfBounds"));
}

TEST(AvatarStrictValidator, FailReturnsStrictValidationFailed)
{
    StrictValidator validator({.Level = StrictLevel::Fail});
    validator.BeginFrame();

    const auto result = validator.Handle({StrictViolation::Kind::PipelineUnavailable, "Rigid.Wireframe"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::StrictValidationFailed);
    EXPECT_TRUE(validator.HasViolations());
}

TEST(AvatarStrictValidator, HandleOnceLogsFirstOccurrenceButRecordsEveryFrame)
{
    Core::Log::ScopedCapture capture;
    StrictValidator validator({.Level = StrictLevel::Warn});

    for (int frame = 0; frame < 3; ++frame)
    {
        validator.BeginFrame();
        for (int item = 0; item < 2; ++item)
        {
            EXPECT_TRUE(validator.HandleOnce("Skinned.Blend",
                                             {StrictViolation::Kind::PipelineUnavailable, "Skinned.Blend"}).has_value());
        }
        EXPECT_EQ(validator.GetFrameViolations().size(), 2u);
    }
    (void)validator.HandleOnce("Rigid.Opaque", {StrictViolation::Kind::PipelineUnavailable, "Rigid.Opaque"});

    EXPECT_EQ(capture.Count(Core::Log::Level::Warning), 2u);
}

TEST(AvatarStrictValidator, HandleOnceStillFailsWhenStrict)
{
    StrictValidator validator({.Level = StrictLevel::Fail});
    validator.BeginFrame();
    (void)validator.HandleOnce("Rigid.Blend", {StrictViolation::Kind::PipelineUnavailable, "first"});

    const auto repeat = validator.HandleOnce("Rigid.Blend", {StrictViolation::Kind::PipelineUnavailable, "again"});
    ASSERT_FALSE(repeat.has_value());
    EXPECT_EQ(repeat.error(), Core::ErrorCode::StrictValidationFailed);
}

TEST(AvatarStrictValidator, BeginFrameClearsViolations)
{
    StrictValidator validator({.Level = StrictLevel::Warn});
    validator.BeginFrame();
    (void)validator.ValidateDraw(Triangles(0, 0, 0));
    ASSERT_TRUE(validator.HasViolations());

    validator.BeginFrame();
    EXPECT_FALSE(validator.HasViolations());
    EXPECT_EQ(validator.GetDrawCallCount(), 0u);
}

// -----------------------------------------------------------------------------
// Draw checks
// -----------------------------------------------------------------------------

TEST(AvatarStrictValidator, DetectsEachDrawViolation)
{
    struct Case
    {
        Avatar::DrawValidationInput Input;
        StrictViolation::Kind Expected;
    };

    Avatar::DrawValidationInput zeroIndex = Triangles(3, 0, 0);
    zeroIndex.Indexed = true;

    const Case cases[] = {
        {Triangles(0, 3, 0), StrictViolation::Kind::ZeroVertexCount},
        {zeroIndex, StrictViolation::Kind::ZeroIndexCount},
        {Triangles(3, 3, 3), StrictViolation::Kind::IndexOutOfBounds},
        {Triangles(3, 4, 2), StrictViolation::Kind::IncompleteTriangleList},
        {Triangles(4, 0, 0), StrictViolation::Kind::IncompleteTriangleList},
    };

    for (const Case& tc : cases)
    {
        StrictValidator validator({.Level = StrictLevel::Warn});
        validator.BeginFrame();
        (void)validator.ValidateDraw(tc.Input);
        ASSERT_EQ(validator.GetFrameViolations().size(), 1u) << Avatar::ToString(tc.Expected);
        EXPECT_EQ(validator.GetFrameViolations()[0].Type, tc.Expected) << Avatar::ToString(tc.Expected);
    }
}

TEST(AvatarStrictValidator, StripsSkipTriangleMultipleCheck)
{
    StrictValidator validator({.Level = StrictLevel::Warn});
    validator.BeginFrame();

    Avatar::DrawValidationInput strip = Triangles(4, 4, 3);
    strip.Mode = Avatar::Topology::TriangleStrip;
    EXPECT_TRUE(validator.ValidateDraw(strip).has_value());
    EXPECT_FALSE(validator.HasViolations());
}

TEST(AvatarStrictValidator, JointPaletteTooSmall)
{
    StrictValidator validator({.Level = StrictLevel::Warn});
    validator.BeginFrame();

    (void)validator.ValidateJointPalette("Body", 0, 3, 4);
    EXPECT_FALSE(validator.HasViolations());

    (void)validator.ValidateJointPalette("Body", 0, 4, 4);
    ASSERT_TRUE(validator.HasViolations());
    EXPECT_EQ(validator.GetFrameViolations()[0].Type, StrictViolation::Kind::JointPaletteTooSmall);
}

TEST(AvatarStrictValidator, NoDrawCallsReportedWhenStrict)
{
    StrictValidator warn({.Level = StrictLevel::Warn});
    warn.BeginFrame();
    EXPECT_TRUE(warn.EndFrame().has_value());
    ASSERT_TRUE(warn.HasViolations());
    EXPECT_EQ(warn.GetFrameViolations()[0].Type, StrictViolation::Kind::NoDrawCalls);

    StrictValidator fail({.Level = StrictLevel::Fail});
    fail.BeginFrame();
    (void)fail.WillDraw();
    EXPECT_TRUE(fail.EndFrame().has_value());
}

// -----------------------------------------------------------------------------
// Draw gating
// -----------------------------------------------------------------------------

TEST(AvatarStrictValidator, DrawUntilLimitsDrawCalls)
{
    StrictValidator validator({.DrawUntil = 2u});
    validator.BeginFrame();

    EXPECT_TRUE(validator.WillDraw());
    EXPECT_TRUE(validator.WillDraw());
    EXPECT_FALSE(validator.WillDraw());
    EXPECT_EQ(validator.GetDrawCallCount(), 3u);
}

TEST(AvatarStrictValidator, DrawOnlyIndexIsZeroBased)
{
    StrictValidator validator({.DrawOnlyIndex = 1u});
    validator.BeginFrame();

    EXPECT_FALSE(validator.WillDraw());
    EXPECT_TRUE(validator.WillDraw());
    EXPECT_FALSE(validator.WillDraw());
}
