module;
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

module Graphics:IORegistry.Impl;
import :IORegistry;
import :AssetErrors;
import :Importers.Slime;
import :Importers.SPIRV;
import :Exporters.Slime;
import Core;

namespace Graphics
{
    namespace
    {
        std::string ToLowerStr(std::string_view sv)
        {
            std::string s(sv);
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        template <typename TMap>
        typename TMap::mapped_type FindByExtension(const TMap& map, std::string_view extension)
        {
            auto it = map.find(ToLowerStr(extension));
            if (it != map.end())
                return it->second;
            return nullptr;
        }
    }

    bool IORegistry::RegisterLoader(std::unique_ptr<IAssetLoader> loader)
    {
        if (!loader) return false;

        bool anyRegistered = false;
        for (auto ext : loader->Extensions())
        {
            std::string key = ToLowerStr(ext);
            if (m_LoadersByExt.contains(key))
            {
                Core::Log::Warn("IORegistry: Extension '{}' already registered, skipping", key);
                continue;
            }
            m_LoadersByExt[key] = loader.get();
            anyRegistered = true;
        }

        if (anyRegistered)
        {
            Core::Log::Debug("IORegistry: registered loader '{}'", loader->FormatName());
            m_Loaders.push_back(std::move(loader));
        }
        return anyRegistered;
    }

    bool IORegistry::RegisterExporter(std::unique_ptr<IAssetExporter> exporter)
    {
        if (!exporter) return false;

        bool anyRegistered = false;
        for (auto ext : exporter->Extensions())
        {
            std::string key = ToLowerStr(ext);
            if (m_ExportersByExt.contains(key))
            {
                Core::Log::Warn("IORegistry: Exporter extension '{}' already registered, skipping", key);
                continue;
            }
            m_ExportersByExt[key] = exporter.get();
            anyRegistered = true;
        }

        if (anyRegistered)
        {
            m_Exporters.push_back(std::move(exporter));
        }
        return anyRegistered;
    }

    IAssetLoader* IORegistry::FindLoader(std::string_view extension) const
    {
        return FindByExtension(m_LoadersByExt, extension);
    }

    IAssetExporter* IORegistry::FindExporter(std::string_view extension) const
    {
        return FindByExtension(m_ExportersByExt, extension);
    }

    bool IORegistry::CanImport(std::string_view extension) const
    {
        return FindLoader(extension) != nullptr;
    }

    std::vector<std::string_view> IORegistry::GetSupportedImportExtensions() const
    {
        std::vector<std::string_view> result;
        result.reserve(m_LoadersByExt.size());
        for (const auto& [ext, _] : m_LoadersByExt)
            result.emplace_back(ext);
        return result;
    }

    std::expected<ImportResult, AssetError> IORegistry::Import(
        const std::string& filepath,
        Core::IO::IIOBackend& backend) const
    {
        namespace fs = std::filesystem;

        fs::path fsPath(filepath);
        auto* loader = FindLoader(fsPath.extension().string());
        if (!loader)
            return std::unexpected(AssetError::UnsupportedFormat);

        Core::IO::IORequest req;
        req.Path = filepath;
        auto readResult = backend.Read(req);
        if (!readResult)
            return std::unexpected(AssetErrorFromCore(readResult.error()));

        std::string baseDir = fsPath.parent_path().string();

        LoadContext ctx;
        ctx.SourcePath = filepath;
        ctx.BasePath = baseDir;
        ctx.Backend = &backend;

        return loader->Load(readResult->Data, ctx);
    }

    std::expected<void, AssetError> IORegistry::Export(
        const std::string& filepath,
        const ExportPayload& payload,
        Core::IO::IIOBackend& backend) const
    {
        auto* exporter = FindExporter(std::filesystem::path(filepath).extension().string());
        if (!exporter)
            return std::unexpected(AssetError::UnsupportedFormat);

        auto bytes = exporter->Export(payload);
        if (!bytes)
            return std::unexpected(bytes.error());

        Core::IO::IORequest req;
        req.Path = filepath;
        if (auto written = backend.Write(req, *bytes); !written)
        {
            Core::Log::Error("IORegistry: failed to write '{}' ({})", filepath,
                             Core::ErrorCodeToString(written.error()));
            return std::unexpected(AssetErrorFromCore(written.error()));
        }
        return {};
    }

    void RegisterBuiltinLoaders(IORegistry& registry)
    {
        registry.RegisterLoader(std::make_unique<SpirvLoader>());
    }

    // Key functions for the loader vtables, emitted in the TU that sees every
    // loader partition.
    SlimeLoader::~SlimeLoader() = default;
    SpirvLoader::~SpirvLoader() = default;
    SlimeExporter::~SlimeExporter() = default;
}
