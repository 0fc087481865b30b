module;
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module Graphics:Exporters.Slime;

import :IORegistry;
import :AssetErrors;
import :SlimeAsset;

export namespace Graphics
{
    // "(value: <v>)\n" with the shortest text that parses back to the same float.
    [[nodiscard]] std::string EncodeSlime(const SlimeParams& params);

    class SlimeExporter final : public IAssetExporter
    {
    public:
        ~SlimeExporter() override;

        [[nodiscard]] std::string_view FormatName() const override { return "Slime Parameters"; }
        [[nodiscard]] std::span<const std::string_view> Extensions() const override;

        [[nodiscard]] std::expected<std::vector<std::byte>, AssetError> Export(
            const ExportPayload& payload) override;
    };
}
