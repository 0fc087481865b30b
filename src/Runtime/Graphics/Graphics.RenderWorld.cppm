module;
#include <cstdint>
#include <optional>

export module Graphics:RenderWorld;

import Core;
import RHI;
import :PipelineCache;
import :Slime;

export namespace Graphics
{
    // Render-side state rebuilt from the main world every frame. Extract
    // writes ActiveSlime, prepare fills Slimes and compiles pipelines, queue
    // publishes SlimeGroup; graph nodes only read.
    class RenderWorld
    {
    public:
        RenderWorld(RHI::IDevice& device, Core::Assets::AssetManager& assets);
        ~RenderWorld();

        RenderWorld(const RenderWorld&) = delete;
        RenderWorld& operator=(const RenderWorld&) = delete;

        [[nodiscard]] RHI::IDevice& GetDevice() const { return m_Device; }
        [[nodiscard]] Core::Assets::AssetManager& GetAssets() const { return m_Assets; }
        [[nodiscard]] uint64_t GetFrameIndex() const { return m_FrameIndex; }
        void SetFrameIndex(uint64_t frameIndex) { m_FrameIndex = frameIndex; }

        // Releases every GPU object owned through this world. Idempotent.
        void ReleaseGpuResources();

    private:
        RHI::IDevice& m_Device;
        Core::Assets::AssetManager& m_Assets;
        uint64_t m_FrameIndex = 0;

        // A bind group never outlives the buffer it was built from.
        void OnSlimeReleased(const GpuSlime& slime, RHI::IDevice& device);

    public:
        PipelineCache Pipelines;

        std::optional<SlimeHandle> ActiveSlime;
        SlimeRenderAssets Slimes;
        SlimePipeline SlimePipe;
        std::optional<SlimeBindGroup> SlimeGroup;
    };
}
