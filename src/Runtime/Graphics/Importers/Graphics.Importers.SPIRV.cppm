module;
#include <cstddef>
#include <expected>
#include <span>
#include <string_view>

export module Graphics:Importers.SPIRV;

import :IORegistry;
import :AssetErrors;

export namespace Graphics
{
    class SpirvLoader final : public IAssetLoader
    {
    public:
        ~SpirvLoader() override;

        [[nodiscard]] std::string_view FormatName() const override { return "SPIR-V Binary"; }
        [[nodiscard]] std::span<const std::string_view> Extensions() const override;

        [[nodiscard]] std::expected<ImportResult, AssetError> Load(
            std::span<const std::byte> data,
            const LoadContext& ctx) override;
    };
}
