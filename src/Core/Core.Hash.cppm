module;
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

export module Core:Hash;

export namespace Core::Hash
{
    // FNV-1a Hash
    constexpr uint32_t HashString(std::string_view str)
    {
        uint32_t hash = 2166136261u;
        for (char c : str)
        {
            hash ^= static_cast<uint8_t>(c);
            hash *= 16777619u;
        }
        return hash;
    }

    // Compile-time identifier for pipelines and shaders ("Pipeline.Rigid.Opaque"_id).
    struct StringID
    {
        uint32_t Value;
#ifndef NDEBUG
        const char* DebugString = nullptr; // Points at the literal; only set from literals.
#endif

        constexpr StringID() : Value(0)
        {
        }

        constexpr explicit StringID(uint32_t v) : Value(v)
        {
        }

        constexpr StringID(const char* str) : Value(HashString(str))
#ifndef NDEBUG
            , DebugString(str)
#endif
        {
        }

        constexpr StringID(const char* str, size_t len) : Value(HashString(std::string_view(str, len)))
#ifndef NDEBUG
            , DebugString(str)
#endif
        {
        }

        [[nodiscard]] constexpr bool IsValid() const { return Value != 0; }

        // Ordering and equality only look at Value
        constexpr auto operator<=>(const StringID& other) const { return Value <=> other.Value; }
        constexpr bool operator==(const StringID& other) const { return Value == other.Value; }
    };

    constexpr StringID operator""_id(const char* str, size_t len)
    {
        return {str, len};
    }

    struct U64Hash
    {
        size_t operator()(uint64_t v) const { return std::hash<uint64_t>{}(v); }
    };
}

// The hash specialization must live in std.
template <>
struct std::hash<Core::Hash::StringID>
{
    std::size_t operator()(const Core::Hash::StringID& id) const noexcept
    {
        return std::hash<uint32_t>{}(id.Value);
    }
};
