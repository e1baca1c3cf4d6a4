module;
#include <cstdint>
#include <string_view>

export module Avatar:Types;

export namespace Avatar
{
    enum class AlphaMode : uint8_t
    {
        Opaque,
        Mask,
        Blend
    };

    enum class Topology : uint8_t
    {
        Points,
        Lines,
        LineStrip,
        Triangles,
        TriangleStrip
    };

    // Semantic layer of a cosmetic primitive. Uncategorized items carry no value.
    enum class RenderCategory : uint8_t
    {
        Body,
        TransparentZWrite,
        Clothing,
        FaceOverlay,
        Skin,
        Eyebrow,
        Eyeline,
        Highlight,
        Eye
    };

    namespace RenderQueue
    {
        inline constexpr int32_t kGeometry = 2000;
        inline constexpr int32_t kAlphaTest = 2450;
        // Queues at or above this sort back-to-front
        inline constexpr int32_t kTransparent = 2500;
    }

    namespace Bucket
    {
        inline constexpr uint32_t kOpaque = 0;
        inline constexpr uint32_t kBody = 0;
        inline constexpr uint32_t kSkin = 1;
        inline constexpr uint32_t kFaceOverlay = 2;
        inline constexpr uint32_t kEyebrow = 2;
        inline constexpr uint32_t kEyeline = 3;
        inline constexpr uint32_t kMask = 4;
        inline constexpr uint32_t kEye = 5;
        inline constexpr uint32_t kHighlight = 6;
        inline constexpr uint32_t kBlend = 7;
        inline constexpr uint32_t kClothing = 8;
        inline constexpr uint32_t kTransparentZWrite = 8;
    }

    constexpr std::string_view ToString(AlphaMode mode)
    {
        switch (mode)
        {
        case AlphaMode::Opaque: return "OPAQUE";
        case AlphaMode::Mask:   return "MASK";
        case AlphaMode::Blend:  return "BLEND";
        }
        return "UNKNOWN";
    }

    constexpr std::string_view ToString(RenderCategory category)
    {
        switch (category)
        {
        case RenderCategory::Body:              return "body";
        case RenderCategory::TransparentZWrite: return "transparentZWrite";
        case RenderCategory::Clothing:          return "clothing";
        case RenderCategory::FaceOverlay:       return "faceOverlay";
        case RenderCategory::Skin:              return "skin";
        case RenderCategory::Eyebrow:           return "eyebrow";
        case RenderCategory::Eyeline:           return "eyeline";
        case RenderCategory::Highlight:         return "highlight";
        case RenderCategory::Eye:               return "eye";
        }
        return "unknown";
    }
}
