module;
#include <type_traits>

export module Graphics:SlimeAsset;

export namespace Graphics
{
    // Simulation parameters shared with the compute shader. Layout matches the
    // shader's storage buffer element: one float plus 12 bytes of padding.
    struct SlimeParams
    {
        float Value = 0.0f;
        float Padding0 = 0.0f;
        float Padding1 = 0.0f;
        float Padding2 = 0.0f;
    };

    static_assert(sizeof(SlimeParams) == 16, "SlimeParams must match the 16-byte GPU element.");
    static_assert(std::is_standard_layout_v<SlimeParams>);
    static_assert(std::is_trivially_copyable_v<SlimeParams>);
}
