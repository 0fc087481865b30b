module;
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

module Graphics:Importers.SPIRV.Impl;
import :Importers.SPIRV;
import :IORegistry;
import :AssetErrors;
import :ShaderAsset;
import Core;

namespace Graphics
{
    namespace
    {
        static constexpr std::string_view s_Extensions[] = { ".spv" };

        // Magic, version, generator, bound, schema.
        static constexpr size_t kHeaderWords = 5;
    }

    std::span<const std::string_view> SpirvLoader::Extensions() const
    {
        return s_Extensions;
    }

    std::expected<ImportResult, AssetError> SpirvLoader::Load(
        std::span<const std::byte> data,
        const LoadContext& ctx)
    {
        if (data.size() % sizeof(uint32_t) != 0 || data.size() < kHeaderWords * sizeof(uint32_t))
        {
            Core::Log::Error("SpirvLoader: '{}' is not a whole number of SPIR-V words ({} bytes)",
                             ctx.SourcePath, data.size());
            return std::unexpected(AssetError::InvalidData);
        }

        ShaderSource shader;
        shader.Path = std::string(ctx.SourcePath);
        shader.SpirV.resize(data.size() / sizeof(uint32_t));
        std::memcpy(shader.SpirV.data(), data.data(), data.size());

        if (shader.SpirV[0] != kSpirvMagic)
        {
            Core::Log::Error("SpirvLoader: '{}' has a bad magic number (0x{:08x})", ctx.SourcePath, shader.SpirV[0]);
            return std::unexpected(AssetError::InvalidData);
        }

        return ImportResult{std::move(shader)};
    }
}
