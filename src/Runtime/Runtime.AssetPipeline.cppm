module;
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <variant>

export module Runtime.AssetPipeline;

import Core;
import Graphics;

export namespace Runtime
{
    // Owns the asset-management subsystem: the importer registry, the byte
    // source and the AssetManager the decoded assets are published into.
    class AssetPipeline
    {
    public:
        explicit AssetPipeline(std::unique_ptr<Core::IO::IIOBackend> backend = nullptr);
        ~AssetPipeline();

        // Non-copyable, non-movable (loader tasks capture this).
        AssetPipeline(const AssetPipeline&) = delete;
        AssetPipeline& operator=(const AssetPipeline&) = delete;
        AssetPipeline(AssetPipeline&&) = delete;
        AssetPipeline& operator=(AssetPipeline&&) = delete;

        // --- Accessors ---
        [[nodiscard]] Core::Assets::AssetManager& GetAssetManager() { return m_AssetManager; }
        [[nodiscard]] const Core::Assets::AssetManager& GetAssetManager() const { return m_AssetManager; }
        [[nodiscard]] Graphics::IORegistry& GetRegistry() { return m_Registry; }
        [[nodiscard]] Core::IO::IIOBackend& GetIOBackend() { return *m_Backend; }

        // Reads and decodes on a scheduler worker. The asset becomes Ready
        // with a T, or Failed when reading, decoding or the type check fails.
        template <typename T>
        Core::Assets::AssetHandle Load(const std::string& path)
        {
            return m_AssetManager.Load<T>(path, [this](const std::string& source) -> std::shared_ptr<T>
            {
                auto imported = m_Registry.Import(source, *m_Backend);
                if (!imported)
                {
                    Core::Log::Error("AssetPipeline: import of '{}' failed ({})", source,
                                     Graphics::AssetErrorToString(imported.error()));
                    return nullptr;
                }

                auto* value = std::get_if<T>(&*imported);
                if (!value)
                {
                    Core::Log::Error("AssetPipeline: '{}' decoded to an unexpected asset type", source);
                    return nullptr;
                }
                return std::make_shared<T>(std::move(*value));
            });
        }

        // Encodes with the exporter registered for the path's extension.
        [[nodiscard]] std::expected<void, Graphics::AssetError> Save(const std::string& path,
                                                                     const Graphics::ExportPayload& payload);

    private:
        Graphics::IORegistry m_Registry;
        std::unique_ptr<Core::IO::IIOBackend> m_Backend;

        // Core asset database.
        Core::Assets::AssetManager m_AssetManager;
    };
}
