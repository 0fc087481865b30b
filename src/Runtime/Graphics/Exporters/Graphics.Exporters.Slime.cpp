module;
#include <charconv>
#include <cmath>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

module Graphics:Exporters.Slime.Impl;
import :Exporters.Slime;
import :IORegistry;
import :AssetErrors;
import :SlimeAsset;

namespace Graphics
{
    namespace
    {
        static constexpr std::string_view s_Extensions[] = { ".slime" };

        void AppendString(std::vector<std::byte>& out, std::string_view s)
        {
            const auto* ptr = reinterpret_cast<const std::byte*>(s.data());
            out.insert(out.end(), ptr, ptr + s.size());
        }
    }

    std::string EncodeSlime(const SlimeParams& params)
    {
        // Shortest round-trip representation of a float fits in 16 chars.
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), params.Value);

        std::string out = "(value: ";
        out.append(buf, ec == std::errc{} ? ptr : buf);
        out += ")\n";
        return out;
    }

    std::span<const std::string_view> SlimeExporter::Extensions() const
    {
        return s_Extensions;
    }

    std::expected<std::vector<std::byte>, AssetError> SlimeExporter::Export(const ExportPayload& payload)
    {
        const auto* params = std::get_if<SlimeParams>(&payload);
        if (!params || !std::isfinite(params->Value))
            return std::unexpected(AssetError::InvalidData);

        std::vector<std::byte> out;
        AppendString(out, EncodeSlime(*params));
        return out;
    }
}
