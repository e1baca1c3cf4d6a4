#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/registry.hpp>

import Avatar;
import ECS;

#include "AvatarTestBuilders.h"

// -----------------------------------------------------------------------------
// Primitive queries
// -----------------------------------------------------------------------------

TEST(AvatarModel, Primitive_MaxIndexValue)
{
    Avatar::Primitive prim = MakeTrianglePrimitive();
    prim.Indices = {0, 2, 1, 2};
    ASSERT_TRUE(prim.MaxIndexValue().has_value());
    EXPECT_EQ(*prim.MaxIndexValue(), 2u);

    prim.Indices.clear();
    EXPECT_FALSE(prim.IsIndexed());
    EXPECT_FALSE(prim.MaxIndexValue().has_value());
}

TEST(AvatarModel, Primitive_MaxJointIndexIgnoresZeroWeights)
{
    Avatar::Primitive prim = MakeTrianglePrimitive(std::nullopt, true);
    prim.Vertices[1].Joints = {3u, 9u, 0u, 0u};
    prim.Vertices[1].Weights = {0.5f, 0.0f, 0.5f, 0.0f};

    ASSERT_TRUE(prim.CarriesSkinning());
    EXPECT_EQ(prim.MaxJointIndex(), 3u);
}

TEST(AvatarModel, Primitive_UnskinnedHasNoJointIndex)
{
    const Avatar::Primitive prim = MakeTrianglePrimitive();
    EXPECT_FALSE(prim.CarriesSkinning());
    EXPECT_FALSE(prim.MaxJointIndex().has_value());
}

TEST(AvatarModel, Mesh_MorphWeightBeyondVectorIsZero)
{
    Avatar::Mesh mesh;
    mesh.MorphWeights = {0.25f};
    EXPECT_FLOAT_EQ(mesh.MorphWeight(0), 0.25f);
    EXPECT_FLOAT_EQ(mesh.MorphWeight(5), 0.0f);
}

// -----------------------------------------------------------------------------
// Node graph
// -----------------------------------------------------------------------------

TEST(AvatarModel, NodesKeepCreationOrderAndNames)
{
    Avatar::Model model("Test");
    const uint32_t a = model.AddNode("Hips");
    const uint32_t b = model.AddNode("Spine", a);

    EXPECT_EQ(a, 0u);
    EXPECT_EQ(b, 1u);
    EXPECT_EQ(model.NodeCount(), 2u);
    EXPECT_EQ(model.NodeName(1), "Spine");
    EXPECT_FALSE(model.NodeMesh(0).has_value());
    EXPECT_FALSE(model.NodeSkin(0).has_value());
}

TEST(AvatarModel, WorldTransformsComposeDownTheHierarchy)
{
    Avatar::Model model;
    const uint32_t root = model.AddNode("Root");
    const uint32_t child = model.AddNode("Child", root);
    const uint32_t grandchild = model.AddNode("Grandchild", child);

    model.SetLocalTransform(root, {1.0f, 0.0f, 0.0f});
    model.SetLocalTransform(child, {0.0f, 2.0f, 0.0f});
    model.SetLocalMatrix(grandchild, glm::mat4(1.0f));
    model.UpdateWorldTransforms();

    const glm::vec3 childPos(model.NodeWorldMatrix(child)[3]);
    const glm::vec3 leafPos(model.NodeWorldMatrix(grandchild)[3]);
    EXPECT_FLOAT_EQ(childPos.x, 1.0f);
    EXPECT_FLOAT_EQ(childPos.y, 2.0f);
    EXPECT_FLOAT_EQ(leafPos.x, 1.0f);
    EXPECT_FLOAT_EQ(leafPos.y, 2.0f);
}

TEST(AvatarModel, NodesAreLinkedIntoTheSceneHierarchy)
{
    Avatar::Model model;
    const uint32_t root = model.AddNode("Root");
    const uint32_t left = model.AddNode("Left", root);
    const uint32_t right = model.AddNode("Right", root);

    const auto& reg = model.GetScene().GetRegistry();
    const auto& rootLinks = reg.get<ECS::Components::Hierarchy::Component>(model.NodeEntity(root));
    EXPECT_EQ(rootLinks.ChildCount, 2u);
    EXPECT_EQ(rootLinks.FirstChild, model.NodeEntity(right));
    EXPECT_EQ(reg.get<ECS::Components::Hierarchy::Component>(model.NodeEntity(right)).NextSibling,
              model.NodeEntity(left));
    EXPECT_EQ(reg.get<ECS::Components::Hierarchy::Component>(model.NodeEntity(left)).Parent,
              model.NodeEntity(root));
    EXPECT_EQ(reg.get<ECS::Components::NameTag::Component>(model.NodeEntity(left)).Name, "Left");
}

TEST(AvatarModel, ParentRotationAndScaleApplyToChildren)
{
    Avatar::Model model;
    const uint32_t root = model.AddNode("Root");
    const uint32_t child = model.AddNode("Child", root);

    const glm::quat quarterTurnY = glm::angleAxis(glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    model.SetLocalTransform(root, glm::vec3(0.0f), quarterTurnY, glm::vec3(2.0f));
    model.SetLocalTransform(child, {1.0f, 0.0f, 0.0f});
    model.UpdateWorldTransforms();

    // +X rotated a quarter turn about Y lands on -Z, then doubled
    const glm::vec3 pos(model.NodeWorldMatrix(child)[3]);
    EXPECT_NEAR(pos.x, 0.0f, 1e-5f);
    EXPECT_NEAR(pos.z, -2.0f, 1e-5f);
}

TEST(AvatarModel, RawLocalMatrixOverridesUntilTransformIsSetAgain)
{
    Avatar::Model model;
    const uint32_t node = model.AddNode("Node");
    model.SetLocalTransform(node, {1.0f, 0.0f, 0.0f});
    model.SetLocalMatrix(node, glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 5.0f, 0.0f)));
    model.UpdateWorldTransforms();
    EXPECT_FLOAT_EQ(model.NodeWorldMatrix(node)[3].x, 0.0f);
    EXPECT_FLOAT_EQ(model.NodeWorldMatrix(node)[3].y, 5.0f);

    model.SetLocalTransform(node, {1.0f, 0.0f, 0.0f});
    model.UpdateWorldTransforms();
    EXPECT_FLOAT_EQ(model.NodeWorldMatrix(node)[3].x, 1.0f);
    EXPECT_FLOAT_EQ(model.NodeWorldMatrix(node)[3].y, 0.0f);
}

TEST(AvatarModel, UpdateRecomputesNodesEditedDirectlyInTheRegistry)
{
    Avatar::Model model;
    const uint32_t root = model.AddNode("Root");
    const uint32_t child = model.AddNode("Child", root);
    model.UpdateWorldTransforms();

    // Animation writes locals without tagging them dirty; a full update still sees it
    auto& reg = model.GetScene().GetRegistry();
    reg.get<ECS::Components::Transform::Component>(model.NodeEntity(root)).Position = {0.0f, 0.0f, 4.0f};
    model.UpdateWorldTransforms();

    EXPECT_FLOAT_EQ(model.NodeWorldMatrix(child)[3].z, 4.0f);
}

TEST(AvatarModel, ForwardParentReferenceLeavesNodeAtRoot)
{
    Avatar::Model model;
    const uint32_t node = model.AddNode("Orphan", 5u);
    model.SetLocalTransform(node, {0.0f, 0.0f, 3.0f});
    model.UpdateWorldTransforms();

    EXPECT_FLOAT_EQ(model.NodeWorldMatrix(node)[3].z, 3.0f);
}

TEST(AvatarModel, FindMaterialRejectsMissingIndices)
{
    Avatar::Model model;
    model.AddMaterial(MakeMaterial("Only"));

    ASSERT_NE(model.FindMaterial(0u), nullptr);
    EXPECT_EQ(model.FindMaterial(0u)->Name, "Only");
    EXPECT_EQ(model.FindMaterial(1u), nullptr);
    EXPECT_EQ(model.FindMaterial(std::nullopt), nullptr);
}

// -----------------------------------------------------------------------------
// Joint palette
// -----------------------------------------------------------------------------

TEST(AvatarModel, PackJointPalette_LaysSkinsOutContiguously)
{
    Avatar::Model model;
    for (uint32_t i = 0; i < 5; ++i)
        model.AddNode("Joint" + std::to_string(i));

    Avatar::Skin first;
    first.JointNodes = {0, 1, 2};
    Avatar::Skin second;
    second.JointNodes = {3, 4};
    model.AddSkin(first);
    model.AddSkin(second);

    EXPECT_EQ(model.PackJointPalette(), 5u);
    EXPECT_EQ(model.GetJointPaletteSize(), 5u);

    const auto& skins = model.GetSkins();
    EXPECT_EQ(skins[0].MatrixOffset, 0u);
    EXPECT_EQ(skins[1].MatrixOffset, 3u);
    EXPECT_EQ(skins[1].ByteOffset, 3u * sizeof(glm::mat4));
}

TEST(AvatarModel, PackJointPalette_EmptyWithoutSkins)
{
    Avatar::Model model;
    EXPECT_EQ(model.PackJointPalette(), 0u);
}
