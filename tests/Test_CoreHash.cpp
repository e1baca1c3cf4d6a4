#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <unordered_set>

import Core;

using namespace Core::Hash;

// -----------------------------------------------------------------------------
// HashString (FNV-1a)
// -----------------------------------------------------------------------------

TEST(CoreHash, HashString_EmptyIsOffsetBasis)
{
    EXPECT_EQ(HashString(""), 2166136261u);
}

TEST(CoreHash, HashString_KnownVector)
{
    // FNV-1a 32-bit of "a"
    EXPECT_EQ(HashString("a"), 0xE40C292Cu);
}

TEST(CoreHash, HashString_CaseSensitive)
{
    EXPECT_NE(HashString("Pipeline.Rigid.Opaque"), HashString("pipeline.rigid.opaque"));
}

TEST(CoreHash, HashString_Constexpr)
{
    constexpr uint32_t h = HashString("Shader.Morph.Comp");
    static_assert(h != 0);
    EXPECT_EQ(h, HashString("Shader.Morph.Comp"));
}

// -----------------------------------------------------------------------------
// StringID
// -----------------------------------------------------------------------------

TEST(CoreHash, StringID_DefaultIsInvalid)
{
    StringID id;
    EXPECT_FALSE(id.IsValid());
    EXPECT_EQ(id.Value, 0u);
}

TEST(CoreHash, StringID_LiteralMatchesHash)
{
    constexpr StringID id = "Pipeline.Skinned.Blend"_id;
    EXPECT_TRUE(id.IsValid());
    EXPECT_EQ(id.Value, HashString("Pipeline.Skinned.Blend"));
    EXPECT_EQ(id, StringID("Pipeline.Skinned.Blend"));
}

TEST(CoreHash, StringID_ComparisonIgnoresDebugString)
{
    const std::string runtime = "Pipeline.Rigid.Wireframe";
    StringID fromRuntime(runtime.c_str());
    StringID fromLiteral = "Pipeline.Rigid.Wireframe"_id;

    EXPECT_EQ(fromRuntime, fromLiteral);
    EXPECT_TRUE((fromRuntime <=> fromLiteral) == 0);
}

TEST(CoreHash, StringID_PipelineVariantNamesDistinct)
{
    const std::unordered_set<StringID> ids = {
        "Pipeline.Rigid.Opaque"_id, "Pipeline.Rigid.Blend"_id, "Pipeline.Rigid.Wireframe"_id,
        "Pipeline.Skinned.Opaque"_id, "Pipeline.Skinned.Blend"_id, "Pipeline.Skinned.Wireframe"_id,
        "Pipeline.Morph"_id, "Shader.Avatar.Vert"_id, "Shader.Avatar.Frag"_id};

    EXPECT_EQ(ids.size(), 9u);
}

TEST(CoreHash, StringID_UnorderedMapKey)
{
    std::unordered_map<StringID, int> registry;
    registry["Shader.Avatar.Vert"_id] = 1;
    registry["Shader.Avatar.Frag"_id] = 2;
    registry["Shader.Avatar.Vert"_id] = 3;

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry["Shader.Avatar.Vert"_id], 3);
}

// -----------------------------------------------------------------------------
// U64Hash
// -----------------------------------------------------------------------------

TEST(CoreHash, U64Hash_DistinguishesHighAndLowHalves)
{
    U64Hash hasher;
    const uint64_t meshOneFirstPrim = uint64_t{1} << 32;
    const uint64_t meshZeroSecondPrim = 1;

    EXPECT_NE(hasher(meshOneFirstPrim), hasher(meshZeroSecondPrim));
    EXPECT_NE(hasher(1ull), hasher(std::numeric_limits<uint64_t>::max()));
}

TEST(CoreHash, U64Hash_InUnorderedMap)
{
    std::unordered_map<uint64_t, std::string, U64Hash> map;
    map[(uint64_t{3} << 32) | 2] = "Face.2";
    map[(uint64_t{2} << 32) | 3] = "Hair.3";

    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map[(uint64_t{3} << 32) | 2], "Face.2");
}
