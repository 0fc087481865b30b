module;
#include <cstddef>
#include <expected>
#include <span>
#include <string_view>

export module Graphics:Importers.Slime;

import :IORegistry;
import :AssetErrors;
import :SlimeAsset;

export namespace Graphics
{
    // Text form of SlimeParams, a RON struct:
    //   Slime(value: 0.5)   or   (value: 0.5)
    // Whitespace and comments may appear between tokens and a trailing comma
    // is allowed. `value` is required and finite. `_padding0..2` are accepted
    // and ignored. Anything else is DecodeFailed.
    [[nodiscard]] std::expected<SlimeParams, AssetError> DecodeSlime(std::string_view text);

    class SlimeLoader final : public IAssetLoader
    {
    public:
        ~SlimeLoader() override;

        [[nodiscard]] std::string_view FormatName() const override { return "Slime Parameters"; }
        [[nodiscard]] std::span<const std::string_view> Extensions() const override;

        [[nodiscard]] std::expected<ImportResult, AssetError> Load(
            std::span<const std::byte> data,
            const LoadContext& ctx) override;
    };
}
