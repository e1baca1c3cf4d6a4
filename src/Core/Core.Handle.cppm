module;
#include <cstdint>
#include <limits>
#include <functional>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - Type-safe generational handle
    // -------------------------------------------------------------------------
    // The Tag parameter keeps handles of different resource kinds apart:
    //
    //   struct MorphBufferTag {};
    //   using MorphBufferHandle = Core::StrongHandle<MorphBufferTag>;
    //
    // Handles are plain values. They can be copied into GPU completion
    // continuations without keeping the referenced resource alive.
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            uint64_t val = (static_cast<uint64_t>(h.Generation) << 32) | h.Index;

            // MurmurHash3 finalizer
            val ^= val >> 33;
            val *= 0xff51afd7ed558ccd;
            val ^= val >> 33;
            val *= 0xc4ceb9fe1a85ec53;
            val ^= val >> 33;

            return static_cast<std::size_t>(val);
        }
    };
}
