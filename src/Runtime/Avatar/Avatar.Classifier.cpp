module;
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

module Avatar:Classifier.Impl;
import :Classifier;
import :Types;
import :Model;
import :RenderItem;
import Core;

namespace Avatar
{
    namespace
    {
        constexpr std::array kBodyLikeTokens = {
            std::string_view{"body"}, std::string_view{"skin"}, std::string_view{"cloth"},
            std::string_view{"tops"}, std::string_view{"bottoms"}, std::string_view{"skirt"},
            std::string_view{"shorts"}, std::string_view{"pants"}, std::string_view{"lace"},
            std::string_view{"collar"}, std::string_view{"ribbon"}, std::string_view{"frill"},
            std::string_view{"ruffle"}};

        constexpr std::array kTransparentZWriteTokens = {
            std::string_view{"lace"}, std::string_view{"collar"}, std::string_view{"ribbon"},
            std::string_view{"frill"}, std::string_view{"ruffle"}};

        constexpr std::array kClothingTokens = {
            std::string_view{"cloth"}, std::string_view{"tops"}, std::string_view{"bottoms"},
            std::string_view{"skirt"}, std::string_view{"shorts"}, std::string_view{"pants"}};

        std::string ToLower(std::string_view s)
        {
            std::string out(s);
            std::ranges::transform(out, out.begin(), [](unsigned char c)
            {
                return static_cast<char>(std::tolower(c));
            });
            return out;
        }

        bool Contains(std::string_view haystack, std::string_view needle)
        {
            return haystack.find(needle) != std::string_view::npos;
        }

        template <size_t N>
        bool ContainsAny(std::string_view haystack, const std::array<std::string_view, N>& needles)
        {
            return std::ranges::any_of(needles, [haystack](std::string_view n) { return Contains(haystack, n); });
        }

        // Most specific rule first
        std::optional<RenderCategory> MatchCategory(std::string_view name)
        {
            if (Contains(name, "body")) return RenderCategory::Body;
            if (ContainsAny(name, kTransparentZWriteTokens)) return RenderCategory::TransparentZWrite;
            if (ContainsAny(name, kClothingTokens)) return RenderCategory::Clothing;
            if (Contains(name, "mouth") || Contains(name, "lip")) return RenderCategory::FaceOverlay;
            if (Contains(name, "skin")) return RenderCategory::Skin;
            if (Contains(name, "brow")) return RenderCategory::Eyebrow;
            if (Contains(name, "line") || Contains(name, "lash")) return RenderCategory::Eyeline;
            if (Contains(name, "highlight") || Contains(name, "catchlight")) return RenderCategory::Highlight;
            if (Contains(name, "eye")) return RenderCategory::Eye;
            // Bare "face" only after every face part had a chance (FaceBrow, FaceEyeline)
            if (Contains(name, "face")) return RenderCategory::Skin;
            return std::nullopt;
        }

        uint32_t BucketFor(RenderCategory category)
        {
            switch (category)
            {
            case RenderCategory::Body:              return Bucket::kBody;
            case RenderCategory::TransparentZWrite: return Bucket::kTransparentZWrite;
            case RenderCategory::Clothing:          return Bucket::kClothing;
            case RenderCategory::FaceOverlay:       return Bucket::kFaceOverlay;
            case RenderCategory::Skin:              return Bucket::kSkin;
            case RenderCategory::Eyebrow:           return Bucket::kEyebrow;
            case RenderCategory::Eyeline:           return Bucket::kEyeline;
            case RenderCategory::Highlight:         return Bucket::kHighlight;
            case RenderCategory::Eye:               return Bucket::kEye;
            }
            return Bucket::kOpaque;
        }

        uint32_t BucketFor(AlphaMode mode)
        {
            switch (mode)
            {
            case AlphaMode::Opaque: return Bucket::kOpaque;
            case AlphaMode::Mask:   return Bucket::kMask;
            case AlphaMode::Blend:  return Bucket::kBlend;
            }
            return Bucket::kOpaque;
        }
    }

    Classification ClassifyPrimitive(const ClassificationInput& input)
    {
        const std::array names = {ToLower(input.MaterialName), ToLower(input.NodeName), ToLower(input.MeshName)};

        Classification result;
        result.RenderQueue = input.RenderQueue;
        result.EffectiveAlphaMode = input.DeclaredAlphaMode;
        result.EffectiveAlphaCutoff = input.DeclaredAlphaCutoff;
        result.EffectiveDoubleSided = input.DeclaredDoubleSided;

        result.IsFaceRelated = std::ranges::any_of(names, [](const std::string& n)
        {
            return Contains(n, "face") || Contains(n, "eye");
        });
        result.IsBodyLike = std::ranges::any_of(names, [](const std::string& n)
        {
            return ContainsAny(n, kBodyLikeTokens);
        });

        if (result.IsFaceRelated || result.IsBodyLike)
        {
            std::optional<RenderCategory> category;
            for (const std::string& name : names)
            {
                category = MatchCategory(name);
                if (category) break;
            }
            result.Category = category.value_or(RenderCategory::Skin);
            result.Bucket = BucketFor(*result.Category);
        }

        if (result.Category)
        {
            const RenderCategory category = *result.Category;

            if ((category == RenderCategory::Body || category == RenderCategory::Skin) &&
                input.DeclaredAlphaMode == AlphaMode::Mask && !result.IsFaceRelated)
            {
                result.EffectiveAlphaMode = AlphaMode::Opaque;
            }

            if (category == RenderCategory::Eye)
                result.EffectiveAlphaMode = AlphaMode::Opaque;
            else if (category == RenderCategory::Highlight)
                result.EffectiveAlphaMode = AlphaMode::Blend;

            if (category == RenderCategory::Skin)
                result.EffectiveAlphaCutoff = std::max(ClassifierDefaults::kMinSkinAlphaCutoff, input.DeclaredAlphaCutoff);
        }
        else
        {
            result.Bucket = BucketFor(result.EffectiveAlphaMode);
        }

        if (result.IsFaceRelated)
            result.EffectiveDoubleSided = true;

        return result;
    }

    std::vector<RenderItem> BuildRenderItems(const Model& model)
    {
        std::vector<RenderItem> items;
        const auto& meshes = model.GetMeshes();

        for (uint32_t nodeIndex = 0; nodeIndex < model.NodeCount(); ++nodeIndex)
        {
            const std::optional<uint32_t> meshIndex = model.NodeMesh(nodeIndex);
            if (!meshIndex) continue;

            if (*meshIndex >= meshes.size())
            {
                Core::Log::Warn("Classifier: node {} ('{}') references mesh {} but the model has {} meshes",
                                nodeIndex, model.NodeName(nodeIndex), *meshIndex, meshes.size());
                continue;
            }

            const Mesh& mesh = meshes[*meshIndex];
            for (uint32_t primIndex = 0; primIndex < mesh.Primitives.size(); ++primIndex)
            {
                const Primitive& primitive = mesh.Primitives[primIndex];
                const Material* material = model.FindMaterial(primitive.MaterialIndex);

                RenderItem item;
                item.NodeIndex = nodeIndex;
                item.MeshIndex = *meshIndex;
                item.PrimitiveIndexInMesh = primIndex;
                item.StableIndex = static_cast<uint32_t>(items.size());
                item.MaterialIndex = material ? primitive.MaterialIndex : std::nullopt;
                item.MaterialName = material ? material->Name : std::string(ClassifierDefaults::kUnnamedMaterial);
                item.DeclaredAlphaMode = material ? material->Mode : AlphaMode::Opaque;
                item.DeclaredAlphaCutoff = material ? material->AlphaCutoff : ClassifierDefaults::kAlphaCutoff;
                item.DeclaredDoubleSided = material ? material->DoubleSided : false;

                item.Class = ClassifyPrimitive({
                    .MaterialName = item.MaterialName,
                    .NodeName = model.NodeName(nodeIndex),
                    .MeshName = mesh.Name,
                    .DeclaredAlphaMode = item.DeclaredAlphaMode,
                    .DeclaredAlphaCutoff = item.DeclaredAlphaCutoff,
                    .DeclaredDoubleSided = item.DeclaredDoubleSided,
                    .RenderQueue = material ? material->RenderQueue : RenderQueue::kGeometry,
                });

                items.push_back(std::move(item));
            }
        }

        return items;
    }

    void LogClassification(const Model& model, std::span<const RenderItem> items)
    {
        Core::Log::Debug("Classifier: '{}' -> {} render items", model.GetName(), items.size());
        for (const RenderItem& item : items)
        {
            Core::Log::Debug("  [{:3}] node {:3} mesh {:3}.{} material '{}' category {} bucket {} queue {} alpha {} -> {}{}",
                             item.StableIndex, item.NodeIndex, item.MeshIndex, item.PrimitiveIndexInMesh,
                             item.MaterialName,
                             item.Class.Category ? ToString(*item.Class.Category) : std::string_view{"-"},
                             item.Class.Bucket, item.Class.RenderQueue,
                             ToString(item.DeclaredAlphaMode), ToString(item.Class.EffectiveAlphaMode),
                             item.Class.EffectiveDoubleSided ? " double-sided" : "");
        }
    }
}
