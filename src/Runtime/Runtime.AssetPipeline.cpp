module;
#include <expected>
#include <memory>
#include <string>
#include <utility>

module Runtime.AssetPipeline;

import Core;
import Graphics;

namespace Runtime
{
    AssetPipeline::AssetPipeline(std::unique_ptr<Core::IO::IIOBackend> backend)
        : m_Backend(std::move(backend))
    {
        if (!m_Backend)
            m_Backend = std::make_unique<Core::IO::FileIOBackend>();

        Graphics::RegisterBuiltinLoaders(m_Registry);
        Core::Log::Info("AssetPipeline: Initialized.");
    }

    AssetPipeline::~AssetPipeline()
    {
        // Loader tasks reference m_Registry and m_Backend.
        Core::Tasks::Scheduler::WaitForAll();
        m_AssetManager.Clear();
        Core::Log::Info("AssetPipeline: Shutdown.");
    }

    std::expected<void, Graphics::AssetError> AssetPipeline::Save(const std::string& path,
                                                                  const Graphics::ExportPayload& payload)
    {
        auto result = m_Registry.Export(path, payload, *m_Backend);
        if (!result)
        {
            Core::Log::Error("AssetPipeline: export of '{}' failed ({})", path,
                             Graphics::AssetErrorToString(result.error()));
        }
        return result;
    }
}
