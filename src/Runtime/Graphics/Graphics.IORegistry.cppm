module;
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

export module Graphics:IORegistry;

import Core;
import :AssetErrors;
import :SlimeAsset;
import :ShaderAsset;

export namespace Graphics
{
    // --- Load Context (everything the loader needs, no I/O ownership) ---
    struct LoadContext
    {
        std::string_view SourcePath;       // Original file path (for error messages)
        std::string_view BasePath;         // Directory containing the file
        Core::IO::IIOBackend* Backend = nullptr;
    };

    // --- Import Result (one CPU asset per file) ---
    using ImportResult = std::variant<SlimeParams, ShaderSource>;

    // --- Export Payload ---
    using ExportPayload = std::variant<SlimeParams>;

    // --- Loader Base Class ---
    // Loaders are pure transforms: bytes -> CPU object.
    // They NEVER open files. They receive bytes from the I/O backend.
    class IAssetLoader
    {
    public:
        virtual ~IAssetLoader() = default;

        [[nodiscard]] virtual std::string_view FormatName() const = 0;
        [[nodiscard]] virtual std::span<const std::string_view> Extensions() const = 0;

        [[nodiscard]] virtual std::expected<ImportResult, AssetError> Load(
            std::span<const std::byte> data,
            const LoadContext& ctx) = 0;
    };

    // --- Exporter Base Class ---
    class IAssetExporter
    {
    public:
        virtual ~IAssetExporter() = default;

        [[nodiscard]] virtual std::string_view FormatName() const = 0;
        [[nodiscard]] virtual std::span<const std::string_view> Extensions() const = 0;

        // InvalidData when the payload holds a type this format cannot carry.
        [[nodiscard]] virtual std::expected<std::vector<std::byte>, AssetError> Export(
            const ExportPayload& payload) = 0;
    };

    // --- Registry ---
    // Non-copyable, non-movable subsystem. Cold-path, main-thread registration;
    // lookups and Import() are safe from workers once registration is done.
    class IORegistry
    {
    public:
        IORegistry() = default;
        ~IORegistry() = default;

        IORegistry(const IORegistry&) = delete;
        IORegistry& operator=(const IORegistry&) = delete;
        IORegistry(IORegistry&&) = delete;
        IORegistry& operator=(IORegistry&&) = delete;

        bool RegisterLoader(std::unique_ptr<IAssetLoader> loader);
        bool RegisterExporter(std::unique_ptr<IAssetExporter> exporter);

        [[nodiscard]] IAssetLoader* FindLoader(std::string_view extension) const;
        [[nodiscard]] IAssetExporter* FindExporter(std::string_view extension) const;
        [[nodiscard]] bool CanImport(std::string_view extension) const;
        [[nodiscard]] std::vector<std::string_view> GetSupportedImportExtensions() const;

        // Convenience: read bytes via backend, find loader by extension, decode.
        [[nodiscard]] std::expected<ImportResult, AssetError> Import(
            const std::string& filepath,
            Core::IO::IIOBackend& backend) const;

        // Encode with the exporter registered for the path's extension and write it out.
        [[nodiscard]] std::expected<void, AssetError> Export(
            const std::string& filepath,
            const ExportPayload& payload,
            Core::IO::IIOBackend& backend) const;

    private:
        std::unordered_map<std::string, IAssetLoader*> m_LoadersByExt;
        std::vector<std::unique_ptr<IAssetLoader>> m_Loaders;
        std::unordered_map<std::string, IAssetExporter*> m_ExportersByExt;
        std::vector<std::unique_ptr<IAssetExporter>> m_Exporters;
    };

    // Registers the loaders every app needs (SPIR-V shaders).
    void RegisterBuiltinLoaders(IORegistry& registry);
}
