module;
#include <cstdint>
#include <limits>
#include <functional>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - generational handle, typed by a tag so that a buffer
    // handle can never be passed where a pipeline handle is expected:
    //
    //   struct BufferTag {};
    //   using BufferHandle = Core::StrongHandle<BufferTag>;
    //
    // Two handles compare equal only if both slot index and generation match,
    // so a recycled slot is a different identity.
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
