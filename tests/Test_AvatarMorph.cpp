#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

import Avatar;

#include "AvatarTestBuilders.h"

namespace
{
    // Mesh 0: static prop. Mesh 1: two primitives, the second with `targets` morph targets.
    std::unique_ptr<Avatar::Model> MakeMorphModel(uint32_t targets)
    {
        auto model = std::make_unique<Avatar::Model>("Morph");

        Avatar::Mesh prop;
        prop.Primitives.push_back(MakeTrianglePrimitive());
        model->SetNodeMesh(model->AddNode("Prop"), model->AddMesh(std::move(prop)));

        Avatar::Mesh face;
        face.Name = "Face";
        face.Primitives.push_back(MakeTrianglePrimitive());
        face.Primitives.push_back(MakeTrianglePrimitive());
        AddMorphTargets(face.Primitives[1], targets);
        model->SetNodeMesh(model->AddNode("Face"), model->AddMesh(std::move(face)));
        return model;
    }
}

TEST(AvatarMorph, KeyPacksMeshAndPrimitive)
{
    static_assert(Avatar::MakeMorphKey(1, 0) == (uint64_t{1} << 32));
    EXPECT_NE(Avatar::MakeMorphKey(1, 2), Avatar::MakeMorphKey(2, 1));
}

TEST(AvatarMorph, AllWeightsAtOrBelowEpsilon_SkipsCompute)
{
    auto model = MakeMorphModel(4);
    model->GetMeshes()[1].MorphWeights = {0.0f, 0.001f, 0.0005f, 0.0f};

    EXPECT_FALSE(Avatar::IsMorphComputeRequired(*model));
    const auto plan = Avatar::PlanMorphDispatch(*model);
    EXPECT_FALSE(plan.ComputeRequired);
    EXPECT_TRUE(plan.Dispatches.empty());
}

TEST(AvatarMorph, OneActiveWeight_DispatchesUnderStableKey)
{
    auto model = MakeMorphModel(4);
    model->GetMeshes()[1].MorphWeights = {0.0f, 0.0f, 0.75f};

    const auto plan = Avatar::PlanMorphDispatch(*model);
    ASSERT_TRUE(plan.ComputeRequired);
    ASSERT_EQ(plan.Dispatches.size(), 1u);

    const auto& d = plan.Dispatches[0];
    EXPECT_EQ(d.Key, Avatar::MakeMorphKey(1, 1));
    EXPECT_EQ(d.MeshIndex, 1u);
    EXPECT_EQ(d.PrimitiveIndexInMesh, 1u);
    EXPECT_EQ(d.VertexCount, 3u);
    EXPECT_EQ(d.TargetCount, 4u);
    ASSERT_EQ(d.ActiveTargets.size(), 1u);
    EXPECT_EQ(d.ActiveTargets[0], 2u);
    EXPECT_FLOAT_EQ(d.ActiveWeights[0], 0.75f);
}

TEST(AvatarMorph, ManyTargetsForceComputeEvenWhenIdle)
{
    auto model = MakeMorphModel(Avatar::MorphConstants::kMaxDirectTargets + 1);

    EXPECT_TRUE(Avatar::IsMorphComputeRequired(*model));
    const auto plan = Avatar::PlanMorphDispatch(*model);
    EXPECT_TRUE(plan.ComputeRequired);
    EXPECT_TRUE(plan.Dispatches.empty());
    EXPECT_EQ(plan.SkippedPrimitives, 1u);
}

TEST(AvatarMorph, DisabledMorphsProduceEmptyPlan)
{
    auto model = MakeMorphModel(2);
    model->GetMeshes()[1].MorphWeights = {1.0f, 1.0f};

    const auto plan = Avatar::PlanMorphDispatch(*model, true);
    EXPECT_FALSE(plan.ComputeRequired);
    EXPECT_TRUE(plan.Dispatches.empty());
}

TEST(AvatarMorph, MissingWeightsCountAsZero)
{
    auto model = MakeMorphModel(3);
    model->GetMeshes()[1].MorphWeights = {0.5f}; // Targets 1 and 2 have no weight entry

    const auto plan = Avatar::PlanMorphDispatch(*model);
    ASSERT_EQ(plan.Dispatches.size(), 1u);
    EXPECT_EQ(plan.Dispatches[0].ActiveTargets, (std::vector<uint32_t>{0}));
}

// -----------------------------------------------------------------------------
// GPU packing
// -----------------------------------------------------------------------------

TEST(AvatarMorph, BasePacksPositionAndNormalPerVertex)
{
    Avatar::Primitive prim = MakeTrianglePrimitive();
    prim.Vertices[1].Normal = {0.0f, 0.0f, 1.0f};

    const auto base = Avatar::PackMorphBase(prim);
    ASSERT_EQ(base.size(), 3u * Avatar::kMorphVec4PerVertex);
    EXPECT_EQ(base[2], glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
    EXPECT_EQ(base[3], glm::vec4(0.0f, 0.0f, 1.0f, 0.0f));
}

TEST(AvatarMorph, DeltasCarryNormalsTargetMajor)
{
    Avatar::Primitive prim = MakeTrianglePrimitive();
    AddMorphTargets(prim, 2);
    prim.MorphTargets[1].NormalDeltas = {glm::vec3(0.5f, 0.0f, 0.0f), glm::vec3(0.0f, 0.5f, 0.0f)};

    const auto deltas = Avatar::PackMorphDeltas(prim);
    ASSERT_EQ(deltas.size(), 2u * 3u * Avatar::kMorphVec4PerVertex);

    // Target 0 has no normal deltas
    EXPECT_EQ(deltas[0], glm::vec4(0.0f, 1.0f, 0.0f, 0.0f));
    EXPECT_EQ(deltas[1], glm::vec4(0.0f));

    // Target 1 starts after three vertex pairs; its short normal array pads with zero
    const size_t t1 = 3u * Avatar::kMorphVec4PerVertex;
    EXPECT_EQ(deltas[t1 + 0], glm::vec4(0.0f, 2.0f, 0.0f, 0.0f));
    EXPECT_EQ(deltas[t1 + 1], glm::vec4(0.5f, 0.0f, 0.0f, 0.0f));
    EXPECT_EQ(deltas[t1 + 3], glm::vec4(0.0f, 0.5f, 0.0f, 0.0f));
    EXPECT_EQ(deltas[t1 + 5], glm::vec4(0.0f));
}

// -----------------------------------------------------------------------------
// Buffer table and position binding
// -----------------------------------------------------------------------------

TEST(AvatarMorph, AbsentKey_FallsBackToStaticPositions)
{
    Avatar::MorphBufferTable table;
    const auto binding = Avatar::ResolvePositionBinding(table, 1, 1);

    EXPECT_EQ(binding.Source, Avatar::PositionSource::Static);
    EXPECT_EQ(binding.MorphFlag, 0u);
    EXPECT_FALSE(binding.MorphedBuffer.IsValid());
    EXPECT_FALSE(binding.UsesMorphedPositions());
}

TEST(AvatarMorph, PublishedKey_BindsMorphedBuffer)
{
    Avatar::MorphBufferTable table;
    const Avatar::MorphBufferHandle handle(3, 1);
    table.Publish(Avatar::MakeMorphKey(1, 1), handle);

    const auto binding = Avatar::ResolvePositionBinding(table, 1, 1);
    EXPECT_TRUE(binding.UsesMorphedPositions());
    EXPECT_EQ(binding.MorphFlag, 1u);
    EXPECT_EQ(binding.MorphedBuffer, handle);

    // Neighbouring primitive of the same mesh stays static
    EXPECT_FALSE(Avatar::ResolvePositionBinding(table, 1, 0).UsesMorphedPositions());

    table.Clear();
    EXPECT_TRUE(table.Empty());
    EXPECT_FALSE(Avatar::ResolvePositionBinding(table, 1, 1).UsesMorphedPositions());
}
