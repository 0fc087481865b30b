module;
#include <cstdint>
#include <string>
#include <vector>

export module Graphics:ShaderAsset;

export namespace Graphics
{
    inline constexpr uint32_t kSpirvMagic = 0x07230203u;

    // Compiled SPIR-V module as loaded from disk. The entry point is chosen
    // by the pipeline request, not stored here.
    struct ShaderSource
    {
        std::vector<uint32_t> SpirV;
        std::string Path;
    };
}
